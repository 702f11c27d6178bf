#include <cumulus/storage/storage.hpp>

#include <cumulus/common/exceptions.hpp>
#include <cumulus/storage/local.hpp>
#include <cumulus/storage/s3.hpp>

#include <spdlog/spdlog.h>

namespace cumulus::storage {

  std::unique_ptr<ObjectStorage> ObjectStorage::construct(const config::Storage& cfg)
  {
    if (cfg.backend == Type::LOCALHOST) {
      return std::make_unique<LocalStorage>(cfg.localhost.storage_root, cfg.bucket);
    }
#if defined(WITH_AWS_DEPLOYMENT)
    if (cfg.backend == Type::AWS_S3) {
      return std::make_unique<S3Storage>(cfg.aws_s3, cfg.bucket);
    }
#endif
    throw common::InvalidConfigurationError{
        fmt::format("Storage backend {} is not supported in this build", serialize(cfg.backend))};
  }

} // namespace cumulus::storage
