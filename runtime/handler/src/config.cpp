#include <cumulus/runtime/handler/config.hpp>

#include <cumulus/common/exceptions.hpp>
#include <cumulus/common/util.hpp>

#include <cstdlib>
#include <filesystem>

#include <cereal/archives/json.hpp>
#include <fmt/format.h>

#include <unistd.h>

namespace cumulus::runtime::config {

  void Handler::load(cereal::JSONInputArchive& archive)
  {
    common::util::cereal_load_optional(archive, "runner-path", runner_path);
    common::util::cereal_load_optional(archive, "scratch-root", scratch_root);
    common::util::cereal_load_optional(archive, "store-status", store_status);
    common::util::cereal_load_optional(archive, "verbose", verbose);
  }

  void Handler::load_env()
  {
    char* value = std::getenv("STORE_STATUS");
    if (value) {
      store_status = common::util::strtobool(value);
    }

    value = std::getenv("CUMULUS_RUNNER_PATH");
    if (value) {
      runner_path = value;
    }

    value = std::getenv("CUMULUS_SCRATCH_DIR");
    if (value) {
      scratch_root = value;
    }
  }

  void Handler::set_defaults()
  {
    // Linux specific
    runner_path =
        (std::filesystem::canonical("/proc/self/exe").parent_path() / DEFAULT_RUNNER_NAME).string();
    scratch_root = fmt::format("{}{}", DEFAULT_SCRATCH_PREFIX, getpid());
    store_status = true;
    verbose = false;
  }

  Handler Handler::deserialize(std::istream& json_config)
  {
    Handler cfg;
    cfg.set_defaults();

    cereal::JSONInputArchive archive_in(json_config);
    cfg.load(archive_in);

    return cfg;
  }

} // namespace cumulus::runtime::config
