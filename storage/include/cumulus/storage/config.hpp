#ifndef CUMULUS_STORAGE_CONFIG_HPP
#define CUMULUS_STORAGE_CONFIG_HPP

#include <optional>
#include <string>

#include <cereal/external/rapidjson/fwd.h>

namespace cumulus::storage {

  enum class Type { LOCALHOST = 0, AWS_S3 };

  Type deserialize(const std::string& backend);

  std::string serialize(Type type);

} // namespace cumulus::storage

namespace cumulus::storage::config {

  struct Localhost {
    static constexpr char DEFAULT_STORAGE_ROOT[] = "/tmp/cumulus-storage";

    std::string storage_root;

    void load(const rapidjson::Value& obj);
    void set_defaults();
  };

  struct AWSS3 {
    std::string endpoint;
    std::string region;

    // Credentials are optional - the SDK falls back to its own provider chain.
    std::optional<std::string> access_key_id;
    std::optional<std::string> secret_access_key;

    void load(const rapidjson::Value& obj);
    void set_defaults();
  };

  struct Storage {

    Type backend;
    std::string bucket;

    Localhost localhost;
    AWSS3 aws_s3;

    void set_defaults();
  };

  /**
   * @brief Extracts the storage settings out of the full orchestrator configuration.
   *
   * The configuration keeps the backend choice and the bucket in the "cumulus" section,
   * while each backend has its own top-level section.
   */
  Storage extract_storage_config(const rapidjson::Value& config);

  Storage extract_storage_config(const std::string& config_json);

} // namespace cumulus::storage::config

#endif
