#ifndef CUMULUS_RUNTIME_STATS_HPP
#define CUMULUS_RUNTIME_STATS_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <cereal/cereal.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/variant.hpp>
#include <cereal/types/vector.hpp>

namespace cumulus::runtime {

  // Sub-invocation spawned by a user function.
  struct FutureRecord {
    std::string executor_id;
    std::string job_id;
    std::string call_id;

    bool operator==(const FutureRecord& other) const
    {
      return executor_id == other.executor_id && job_id == other.job_id &&
             call_id == other.call_id;
    }

    template <typename Ar>
    void serialize(Ar& archive)
    {
      archive(CEREAL_NVP(executor_id));
      archive(CEREAL_NVP(job_id));
      archive(CEREAL_NVP(call_id));
    }
  };

  struct StatEntry {

    // Tagged value: timing and resource numbers, free text, flags and the futures list.
    using Value = std::variant<double, std::string, bool, std::vector<FutureRecord>>;

    std::string key;
    Value value;

    template <typename Ar>
    void serialize(Ar& archive)
    {
      archive(CEREAL_NVP(key));
      archive(CEREAL_NVP(value));
    }
  };

  /**
   * @brief Contents of the task runner stats file - the only data the isolated runner hands
   * back to the supervisor.
   *
   * Special keys carry a fixed type: "exception", "exc_pickle_fail" and "result" are flags,
   * "new_futures" is a futures list, "exc_info" is text.
   */
  struct RunnerStats {

    static constexpr std::string_view EXCEPTION = "exception";
    static constexpr std::string_view EXC_PICKLE_FAIL = "exc_pickle_fail";
    static constexpr std::string_view EXC_INFO = "exc_info";
    static constexpr std::string_view RESULT = "result";
    static constexpr std::string_view NEW_FUTURES = "new_futures";

    std::vector<StatEntry> entries;

    void add(std::string_view key, double value);
    void add(std::string_view key, std::string value);
    void add(std::string_view key, const char* value);
    void add(std::string_view key, bool value);
    void add(std::string_view key, std::vector<FutureRecord> value);

    // Last value stored under the key; later entries override earlier ones.
    const StatEntry::Value* find(std::string_view key) const;

    /**
     * @throws StatsFormatError when a special key holds a value of the wrong type
     */
    void validate() const;

    // Writes the whole document and closes the file before returning.
    void write(const std::filesystem::path& path) const;

    /**
     * @throws StatsFormatError when the file cannot be parsed or fails validation
     */
    static RunnerStats read(const std::filesystem::path& path);

    template <typename Ar>
    void serialize(Ar& archive)
    {
      archive(cereal::make_nvp("stats", entries));
    }
  };

} // namespace cumulus::runtime

#endif
