#ifndef CUMULUS_RUNTIME_STATUS_HPP
#define CUMULUS_RUNTIME_STATUS_HPP

#include <cumulus/runtime/stats.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cumulus::runtime {

  struct JobEvent;

  /**
   * @brief Outcome of one invocation; produced exactly once, whatever happens.
   */
  struct StatusRecord {

    using StatValue = std::variant<double, std::string>;

    bool exception = false;
    double host_submit_time{};
    double start_time{};
    double end_time{};

    std::string call_id;
    std::string job_id;
    std::string executor_id;

    // setup_time, exec_time and whatever the task runner reported.
    std::map<std::string, StatValue> stats;

    std::optional<bool> result;
    std::optional<std::vector<FutureRecord>> new_futures;
    std::optional<bool> exc_pickle_fail;
    std::optional<std::string> exc_info;

    static StatusRecord create(const JobEvent& event, double start_time);

    void merge(const RunnerStats& runner_stats);

    std::optional<double> number(const std::string& key) const;

    std::optional<std::string> text(const std::string& key) const;

    std::string serialize() const;

    static StatusRecord deserialize(const std::string& json);

    // Fields that runner stats can never override.
    static bool is_reserved(std::string_view key);
  };

} // namespace cumulus::runtime

#endif
