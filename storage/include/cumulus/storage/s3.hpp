#ifndef CUMULUS_STORAGE_S3_HPP
#define CUMULUS_STORAGE_S3_HPP

#include <cumulus/storage/storage.hpp>

#if defined(WITH_AWS_DEPLOYMENT)

#include <optional>

#include <aws/core/Aws.h>
#include <aws/s3/S3Client.h>

namespace cumulus::storage {

  struct S3Storage : ObjectStorage {

    struct S3API {
      Aws::SDKOptions _s3_options;

      S3API();
      ~S3API();
    };

    static constexpr int MAX_CONNECTIONS = 16;

    S3Storage(const config::AWSS3& cfg, std::string bucket);
    ~S3Storage() override = default;

    void put(const std::string& key, const std::string& data) override;

    std::string get(const std::string& key, std::optional<ByteRange> range = std::nullopt) override;

    std::vector<std::string> list(const std::string& prefix) override;

    using ObjectStorage::remove;
    void remove(const std::string& key) override;
    void remove(const std::vector<std::string>& keys) override;

    static std::optional<S3API> api;

  private:
    std::optional<Aws::S3::S3Client> _s3_client;
  };

} // namespace cumulus::storage

#endif

#endif
