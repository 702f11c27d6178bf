#ifndef CUMULUS_RUNTIME_HANDLER_CONFIG_HPP
#define CUMULUS_RUNTIME_HANDLER_CONFIG_HPP

#include <istream>
#include <string>

namespace cereal {
  class JSONInputArchive;
} // namespace cereal

namespace cumulus::runtime::config {

  struct Handler {

    static constexpr char DEFAULT_RUNNER_NAME[] = "cumulus_jobrunner";
    static constexpr char DEFAULT_SCRATCH_PREFIX[] = "/tmp/cumulus-";

    // Location of the task runner executable.
    std::string runner_path;

    // Holds the stats file, the startup payload, the modules and the runner's work directory.
    std::string scratch_root;

    bool store_status;
    bool verbose;

    void load(cereal::JSONInputArchive& archive);
    void load_env();
    void set_defaults();

    static Handler deserialize(std::istream&);
  };

} // namespace cumulus::runtime::config

#endif
