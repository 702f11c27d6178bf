#include <cumulus/runtime/stats.hpp>

#include <cumulus/common/exceptions.hpp>

#include <fstream>

#include <cereal/archives/json.hpp>
#include <fmt/format.h>

namespace cumulus::runtime {

  void RunnerStats::add(std::string_view key, double value)
  {
    entries.push_back(StatEntry{std::string{key}, value});
  }

  void RunnerStats::add(std::string_view key, std::string value)
  {
    entries.push_back(StatEntry{std::string{key}, std::move(value)});
  }

  void RunnerStats::add(std::string_view key, const char* value)
  {
    add(key, std::string{value});
  }

  void RunnerStats::add(std::string_view key, bool value)
  {
    entries.push_back(StatEntry{std::string{key}, value});
  }

  void RunnerStats::add(std::string_view key, std::vector<FutureRecord> value)
  {
    entries.push_back(StatEntry{std::string{key}, std::move(value)});
  }

  const StatEntry::Value* RunnerStats::find(std::string_view key) const
  {
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
      if (it->key == key) {
        return &it->value;
      }
    }
    return nullptr;
  }

  void RunnerStats::validate() const
  {
    for (const auto& entry : entries) {

      if (entry.key.empty()) {
        throw common::StatsFormatError{"Stats entry without a key"};
      }

      bool valid = true;
      if (entry.key == EXCEPTION || entry.key == EXC_PICKLE_FAIL || entry.key == RESULT) {
        valid = std::holds_alternative<bool>(entry.value);
      } else if (entry.key == NEW_FUTURES) {
        valid = std::holds_alternative<std::vector<FutureRecord>>(entry.value);
      } else if (entry.key == EXC_INFO) {
        valid = std::holds_alternative<std::string>(entry.value);
      } else {
        valid = std::holds_alternative<double>(entry.value) ||
                std::holds_alternative<std::string>(entry.value);
      }

      if (!valid) {
        throw common::StatsFormatError{
            fmt::format("Stats entry {} has an unexpected type", entry.key)};
      }
    }
  }

  void RunnerStats::write(const std::filesystem::path& path) const
  {
    std::ofstream out{path, std::ios::out | std::ios::trunc};
    if (!out.is_open()) {
      throw common::CumulusException{fmt::format("Could not open stats file {}", path.string())};
    }

    {
      cereal::JSONOutputArchive archive_out{out};
      archive_out(cereal::make_nvp("stats", entries));
    }

    out.close();
    if (!out) {
      throw common::CumulusException{fmt::format("Could not write stats file {}", path.string())};
    }
  }

  RunnerStats RunnerStats::read(const std::filesystem::path& path)
  {
    std::ifstream in{path};
    if (!in.is_open()) {
      throw common::StatsFormatError{fmt::format("Could not open stats file {}", path.string())};
    }

    RunnerStats stats;
    try {
      cereal::JSONInputArchive archive_in{in};
      archive_in(cereal::make_nvp("stats", stats.entries));
    } catch (cereal::Exception& exc) {
      throw common::StatsFormatError{
          fmt::format("Could not parse stats file {}, reason: {}", path.string(), exc.what())};
    }

    stats.validate();
    return stats;
  }

} // namespace cumulus::runtime
