#ifndef CUMULUS_RUNTIME_RUNNER_HPP
#define CUMULUS_RUNTIME_RUNNER_HPP

#include <cumulus/storage/storage.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <cereal/cereal.hpp>
#include <cereal/types/string.hpp>

namespace cumulus::runtime::jobrunner {

  /**
   * @brief Startup payload of the task runner. The supervisor writes it before spawning the
   * runner and passes its location on the command line.
   */
  struct Config {

    // Full orchestrator configuration as JSON; the runner needs its storage settings.
    std::string orchestrator_config;

    std::string executor_id;
    std::string job_id;
    std::string call_id;

    std::string func_key;
    std::string data_key;
    std::optional<storage::ByteRange> data_byte_range;
    std::string output_key;

    std::string log_level;

    std::string stats_filename;
    std::string module_path;

    void write(const std::filesystem::path& path) const;

    static Config read(const std::filesystem::path& path);

    template <typename Ar>
    void save(Ar& archive) const
    {
      archive(CEREAL_NVP(orchestrator_config));
      archive(CEREAL_NVP(executor_id));
      archive(CEREAL_NVP(job_id));
      archive(CEREAL_NVP(call_id));
      archive(CEREAL_NVP(func_key));
      archive(CEREAL_NVP(data_key));

      bool has_range = data_byte_range.has_value();
      archive(cereal::make_nvp("has_byte_range", has_range));
      uint64_t first = has_range ? data_byte_range->first : 0;
      uint64_t last = has_range ? data_byte_range->last : 0;
      archive(cereal::make_nvp("byte_range_first", first));
      archive(cereal::make_nvp("byte_range_last", last));

      archive(CEREAL_NVP(output_key));
      archive(CEREAL_NVP(log_level));
      archive(CEREAL_NVP(stats_filename));
      archive(CEREAL_NVP(module_path));
    }

    template <typename Ar>
    void load(Ar& archive)
    {
      archive(CEREAL_NVP(orchestrator_config));
      archive(CEREAL_NVP(executor_id));
      archive(CEREAL_NVP(job_id));
      archive(CEREAL_NVP(call_id));
      archive(CEREAL_NVP(func_key));
      archive(CEREAL_NVP(data_key));

      bool has_range{};
      uint64_t first{}, last{};
      archive(cereal::make_nvp("has_byte_range", has_range));
      archive(cereal::make_nvp("byte_range_first", first));
      archive(cereal::make_nvp("byte_range_last", last));
      if (has_range) {
        data_byte_range = storage::ByteRange{first, last};
      }

      archive(CEREAL_NVP(output_key));
      archive(CEREAL_NVP(log_level));
      archive(CEREAL_NVP(stats_filename));
      archive(CEREAL_NVP(module_path));
    }
  };

  /**
   * @brief The single message a runner pushes on its result pipe once the stats file is
   * complete.
   */
  struct CompletionToken {

    static constexpr uint32_t MAGIC = 0x434d4c53;

    uint32_t magic = MAGIC;

    // Blocks until the token is written.
    static void send(int fd);

    // Non-blocking; false when the pipe holds no complete token.
    static bool receive(int fd);
  };

} // namespace cumulus::runtime::jobrunner

#endif
