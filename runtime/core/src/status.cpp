#include <cumulus/runtime/status.hpp>

#include <cumulus/common/exceptions.hpp>
#include <cumulus/runtime/job.hpp>

#include <array>
#include <algorithm>

#include <cereal/external/rapidjson/document.h>
#include <cereal/external/rapidjson/stringbuffer.h>
#include <cereal/external/rapidjson/writer.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace cumulus::runtime {

  template <class... Ts>
  struct overloaded : Ts... {
    using Ts::operator()...;
  };
  template <class... Ts>
  overloaded(Ts...) -> overloaded<Ts...>;

  StatusRecord StatusRecord::create(const JobEvent& event, double start_time)
  {
    StatusRecord record;
    record.host_submit_time = event.host_submit_time;
    record.start_time = start_time;
    record.call_id = event.call_id;
    record.job_id = event.job_id;
    record.executor_id = event.executor_id;
    return record;
  }

  bool StatusRecord::is_reserved(std::string_view key)
  {
    static constexpr std::array<std::string_view, 7> RESERVED = {
        "host_submit_time", "start_time", "end_time", "call_id", "job_id", "executor_id", ""};
    return std::find(RESERVED.begin(), RESERVED.end(), key) != RESERVED.end();
  }

  void StatusRecord::merge(const RunnerStats& runner_stats)
  {
    for (const auto& entry : runner_stats.entries) {

      if (is_reserved(entry.key)) {
        spdlog::warn("Ignoring task runner stat {} - the name is reserved", entry.key);
        continue;
      }

      std::visit(
          overloaded{
              [&](bool val) {
                if (entry.key == RunnerStats::EXCEPTION) {
                  exception = val;
                } else if (entry.key == RunnerStats::EXC_PICKLE_FAIL) {
                  exc_pickle_fail = val;
                } else if (entry.key == RunnerStats::RESULT) {
                  result = val;
                }
              },
              [&](const std::vector<FutureRecord>& val) { new_futures = val; },
              [&](double val) { stats[entry.key] = val; },
              [&](const std::string& val) {
                if (entry.key == RunnerStats::EXC_INFO) {
                  exc_info = val;
                } else {
                  stats[entry.key] = val;
                }
              }},
          entry.value
      );
    }
  }

  std::optional<double> StatusRecord::number(const std::string& key) const
  {
    auto it = stats.find(key);
    if (it == stats.end() || !std::holds_alternative<double>(it->second)) {
      return std::nullopt;
    }
    return std::get<double>(it->second);
  }

  std::optional<std::string> StatusRecord::text(const std::string& key) const
  {
    auto it = stats.find(key);
    if (it == stats.end() || !std::holds_alternative<std::string>(it->second)) {
      return std::nullopt;
    }
    return std::get<std::string>(it->second);
  }

  std::string StatusRecord::serialize() const
  {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer{buffer};

    auto write_string = [&writer](const std::string& val) {
      writer.String(val.c_str(), val.length());
    };

    writer.StartObject();
    writer.Key("exception");
    writer.Bool(exception);
    writer.Key("host_submit_time");
    writer.Double(host_submit_time);
    writer.Key("start_time");
    writer.Double(start_time);
    writer.Key("end_time");
    writer.Double(end_time);
    writer.Key("call_id");
    write_string(call_id);
    writer.Key("job_id");
    write_string(job_id);
    writer.Key("executor_id");
    write_string(executor_id);

    for (const auto& [key, value] : stats) {
      writer.Key(key.c_str(), key.length());
      std::visit(
          overloaded{
              [&](double val) { writer.Double(val); },
              [&](const std::string& val) { write_string(val); }},
          value
      );
    }

    if (result.has_value()) {
      writer.Key("result");
      writer.Bool(result.value());
    }
    if (new_futures.has_value()) {
      writer.Key("new_futures");
      writer.StartArray();
      for (const auto& future : new_futures.value()) {
        writer.StartObject();
        writer.Key("executor_id");
        write_string(future.executor_id);
        writer.Key("job_id");
        write_string(future.job_id);
        writer.Key("call_id");
        write_string(future.call_id);
        writer.EndObject();
      }
      writer.EndArray();
    }
    if (exc_pickle_fail.has_value()) {
      writer.Key("exc_pickle_fail");
      writer.Bool(exc_pickle_fail.value());
    }
    if (exc_info.has_value()) {
      writer.Key("exc_info");
      write_string(exc_info.value());
    }

    writer.EndObject();

    return std::string{buffer.GetString(), buffer.GetSize()};
  }

  StatusRecord StatusRecord::deserialize(const std::string& json)
  {
    rapidjson::Document doc;
    doc.Parse(json.c_str(), json.length());
    if (doc.HasParseError() || !doc.IsObject()) {
      throw common::InvalidJSON{"Status record is not a valid JSON object"};
    }

    auto string_of = [](const rapidjson::Value& val, std::string_view name) {
      if (!val.IsString()) {
        throw common::InvalidJSON{fmt::format("Status field {} must be a string", name)};
      }
      return std::string{val.GetString(), val.GetStringLength()};
    };
    auto bool_of = [](const rapidjson::Value& val, std::string_view name) {
      if (!val.IsBool()) {
        throw common::InvalidJSON{fmt::format("Status field {} must be a boolean", name)};
      }
      return val.GetBool();
    };

    StatusRecord record;
    bool has_exception = false;

    for (const auto& member : doc.GetObject()) {

      std::string key{member.name.GetString(), member.name.GetStringLength()};
      const auto& val = member.value;

      if (key == "exception") {
        record.exception = bool_of(val, key);
        has_exception = true;
      } else if (key == "host_submit_time" || key == "start_time" || key == "end_time") {
        if (!val.IsNumber()) {
          throw common::InvalidJSON{fmt::format("Status field {} must be a number", key)};
        }
        double& field = key == "host_submit_time" ? record.host_submit_time
                        : key == "start_time"     ? record.start_time
                                                  : record.end_time;
        field = val.GetDouble();
      } else if (key == "call_id") {
        record.call_id = string_of(val, key);
      } else if (key == "job_id") {
        record.job_id = string_of(val, key);
      } else if (key == "executor_id") {
        record.executor_id = string_of(val, key);
      } else if (key == "result") {
        record.result = bool_of(val, key);
      } else if (key == "exc_pickle_fail") {
        record.exc_pickle_fail = bool_of(val, key);
      } else if (key == "exc_info") {
        record.exc_info = string_of(val, key);
      } else if (key == "new_futures") {
        if (!val.IsArray()) {
          throw common::InvalidJSON{"Status field new_futures must be an array"};
        }
        std::vector<FutureRecord> futures;
        for (const auto& future : val.GetArray()) {
          if (!future.IsObject() || !future.HasMember("executor_id") ||
              !future.HasMember("job_id") || !future.HasMember("call_id")) {
            throw common::InvalidJSON{"Malformed entry of new_futures"};
          }
          futures.push_back(FutureRecord{
              string_of(future["executor_id"], "executor_id"), string_of(future["job_id"], "job_id"),
              string_of(future["call_id"], "call_id")});
        }
        record.new_futures = std::move(futures);
      } else if (val.IsNumber()) {
        record.stats[key] = val.GetDouble();
      } else if (val.IsString()) {
        record.stats[key] = string_of(val, key);
      } else {
        throw common::InvalidJSON{fmt::format("Status field {} has an unsupported type", key)};
      }
    }

    if (!has_exception) {
      throw common::InvalidJSON{"Status record has no exception field"};
    }

    return record;
  }

} // namespace cumulus::runtime
