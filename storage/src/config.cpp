#include <cumulus/storage/config.hpp>

#include <cumulus/common/exceptions.hpp>

#include <cereal/external/rapidjson/document.h>

#include <fmt/format.h>

namespace cumulus::storage {

  Type deserialize(const std::string& backend)
  {
    if (backend == "localhost") {
      return Type::LOCALHOST;
    } else if (backend == "aws_s3") {
      return Type::AWS_S3;
    }
    throw common::InvalidConfigurationError{fmt::format("Unknown storage backend {}", backend)};
  }

  std::string serialize(Type type)
  {
    switch (type) {
    case Type::LOCALHOST:
      return "localhost";
    case Type::AWS_S3:
      return "aws_s3";
    }
    return "";
  }

} // namespace cumulus::storage

namespace cumulus::storage::config {

  static std::optional<std::string> get_string(const rapidjson::Value& obj, const char* name)
  {
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd() || it->value.IsNull()) {
      return std::nullopt;
    }
    if (!it->value.IsString()) {
      throw common::InvalidConfigurationError{fmt::format("Field {} must be a string", name)};
    }
    return std::string{it->value.GetString(), it->value.GetStringLength()};
  }

  void Localhost::load(const rapidjson::Value& obj)
  {
    storage_root = get_string(obj, "storage_root").value_or(DEFAULT_STORAGE_ROOT);
  }

  void Localhost::set_defaults()
  {
    storage_root = DEFAULT_STORAGE_ROOT;
  }

  void AWSS3::load(const rapidjson::Value& obj)
  {
    endpoint = get_string(obj, "endpoint").value_or("");
    region = get_string(obj, "region").value_or("");
    access_key_id = get_string(obj, "access_key_id");
    secret_access_key = get_string(obj, "secret_access_key");

    if (access_key_id.has_value() != secret_access_key.has_value()) {
      throw common::InvalidConfigurationError{
          "AWS S3 credentials require both access_key_id and secret_access_key"};
    }
  }

  void AWSS3::set_defaults()
  {
    endpoint = "";
    region = "";
    access_key_id.reset();
    secret_access_key.reset();
  }

  void Storage::set_defaults()
  {
    backend = Type::LOCALHOST;
    bucket = "";
    localhost.set_defaults();
    aws_s3.set_defaults();
  }

  Storage extract_storage_config(const rapidjson::Value& config)
  {
    if (!config.IsObject()) {
      throw common::InvalidConfigurationError{"Configuration must be a JSON object"};
    }

    auto section = config.FindMember("cumulus");
    if (section == config.MemberEnd() || !section->value.IsObject()) {
      throw common::InvalidConfigurationError{"Configuration has no cumulus section"};
    }

    Storage cfg;
    cfg.set_defaults();

    cfg.backend = deserialize(get_string(section->value, "storage_backend").value_or("localhost"));

    auto bucket = get_string(section->value, "storage_bucket");
    if (!bucket.has_value() || bucket->empty()) {
      throw common::InvalidConfigurationError{"Configuration has no storage bucket"};
    }
    cfg.bucket = std::move(bucket.value());

    std::string backend_name = serialize(cfg.backend);
    auto backend_section = config.FindMember(backend_name.c_str());
    bool present = backend_section != config.MemberEnd() && backend_section->value.IsObject();

    if (cfg.backend == Type::LOCALHOST && present) {
      cfg.localhost.load(backend_section->value);
    } else if (cfg.backend == Type::AWS_S3) {
      if (!present) {
        throw common::InvalidConfigurationError{"Configuration has no aws_s3 section"};
      }
      cfg.aws_s3.load(backend_section->value);
    }

    return cfg;
  }

  Storage extract_storage_config(const std::string& config_json)
  {
    rapidjson::Document doc;
    doc.Parse(config_json.c_str(), config_json.length());
    if (doc.HasParseError()) {
      throw common::InvalidJSON{"Could not parse the orchestrator configuration"};
    }
    return extract_storage_config(doc);
  }

} // namespace cumulus::storage::config
