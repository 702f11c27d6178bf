#include <cumulus/runtime/job.hpp>

#include <cumulus/common/exceptions.hpp>

#include <cmath>

#include <cereal/external/rapidjson/document.h>
#include <cereal/external/rapidjson/istreamwrapper.h>
#include <cereal/external/rapidjson/stringbuffer.h>
#include <cereal/external/rapidjson/writer.h>

#include <fmt/format.h>

namespace cumulus::runtime {

  namespace {

    const rapidjson::Value& required(const rapidjson::Value& obj, const char* name)
    {
      auto it = obj.FindMember(name);
      if (it == obj.MemberEnd()) {
        throw common::InvalidJSON{fmt::format("Job event is missing the field {}", name)};
      }
      return it->value;
    }

    std::string required_string(const rapidjson::Value& obj, const char* name)
    {
      const auto& val = required(obj, name);
      if (!val.IsString()) {
        throw common::InvalidJSON{fmt::format("Field {} of the job event must be a string", name)};
      }
      return std::string{val.GetString(), val.GetStringLength()};
    }

    double required_number(const rapidjson::Value& obj, const char* name)
    {
      const auto& val = required(obj, name);
      if (!val.IsNumber()) {
        throw common::InvalidJSON{fmt::format("Field {} of the job event must be a number", name)};
      }
      return val.GetDouble();
    }

    std::optional<storage::ByteRange> byte_range(const rapidjson::Value& val)
    {
      if (val.IsNull()) {
        return std::nullopt;
      }
      if (!val.IsArray() || val.Size() != 2 || !val[0].IsUint64() || !val[1].IsUint64()) {
        throw common::InvalidJSON{"Field data_byte_range must be null or a pair of offsets"};
      }
      storage::ByteRange range{val[0].GetUint64(), val[1].GetUint64()};
      if (range.first > range.last) {
        throw common::InvalidJSON{
            fmt::format("Invalid data_byte_range [{}, {}]", range.first, range.last)};
      }
      return range;
    }

    std::string to_string(const rapidjson::Value& val)
    {
      rapidjson::StringBuffer buffer;
      rapidjson::Writer<rapidjson::StringBuffer> writer{buffer};
      val.Accept(writer);
      return std::string{buffer.GetString(), buffer.GetSize()};
    }

    JobEvent parse(rapidjson::Document& doc)
    {
      if (doc.HasParseError() || !doc.IsObject()) {
        throw common::InvalidJSON{"Job event is not a valid JSON object"};
      }

      JobEvent event;
      event.executor_id = required_string(doc, "executor_id");
      event.job_id = required_string(doc, "job_id");
      event.call_id = required_string(doc, "call_id");

      const auto& config = required(doc, "config");
      if (!config.IsObject()) {
        throw common::InvalidJSON{"Field config of the job event must be an object"};
      }
      event.config = to_string(config);

      event.func_key = required_string(doc, "func_key");
      event.data_key = required_string(doc, "data_key");
      event.data_byte_range = byte_range(required(doc, "data_byte_range"));
      event.output_key = required_string(doc, "output_key");
      event.status_key = required_string(doc, "status_key");
      event.log_level = required_string(doc, "log_level");
      event.host_submit_time = required_number(doc, "host_submit_time");
      event.version = required_string(doc, "cumulus_version");

      auto it = doc.FindMember("execution_timeout");
      if (it != doc.MemberEnd() && !it->value.IsNull()) {
        if (!it->value.IsNumber()) {
          throw common::InvalidJSON{"Field execution_timeout must be a number"};
        }
        double timeout = it->value.GetDouble();
        if (!std::isfinite(timeout) || timeout <= 0 || timeout > JobEvent::MAX_EXECUTION_TIMEOUT) {
          throw common::InvalidJSON{fmt::format(
              "Field execution_timeout must be a positive number of at most {} seconds, got {}",
              JobEvent::MAX_EXECUTION_TIMEOUT, timeout
          )};
        }
        event.execution_timeout = timeout;
      }

      it = doc.FindMember("extra_env");
      if (it != doc.MemberEnd() && !it->value.IsNull()) {
        if (!it->value.IsObject()) {
          throw common::InvalidJSON{"Field extra_env must be an object"};
        }
        for (const auto& var : it->value.GetObject()) {
          if (!var.value.IsString()) {
            throw common::InvalidJSON{
                fmt::format("Environment variable {} must be a string", var.name.GetString())};
          }
          event.extra_env.emplace(var.name.GetString(), var.value.GetString());
        }
      }

      return event;
    }

  } // namespace

  std::string JobEvent::invocation_key() const
  {
    return fmt::format("{}/{}/{}", executor_id, job_id, call_id);
  }

  std::string JobEvent::serialize() const
  {
    rapidjson::Document config_doc;
    config_doc.Parse(config.c_str(), config.length());
    if (config_doc.HasParseError()) {
      throw common::InvalidJSON{"Job event carries an invalid configuration"};
    }

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer{buffer};

    writer.StartObject();
    writer.Key("executor_id");
    writer.String(executor_id.c_str(), executor_id.length());
    writer.Key("job_id");
    writer.String(job_id.c_str(), job_id.length());
    writer.Key("call_id");
    writer.String(call_id.c_str(), call_id.length());
    writer.Key("config");
    config_doc.Accept(writer);
    writer.Key("func_key");
    writer.String(func_key.c_str(), func_key.length());
    writer.Key("data_key");
    writer.String(data_key.c_str(), data_key.length());
    writer.Key("data_byte_range");
    if (data_byte_range.has_value()) {
      writer.StartArray();
      writer.Uint64(data_byte_range->first);
      writer.Uint64(data_byte_range->last);
      writer.EndArray();
    } else {
      writer.Null();
    }
    writer.Key("output_key");
    writer.String(output_key.c_str(), output_key.length());
    writer.Key("status_key");
    writer.String(status_key.c_str(), status_key.length());
    writer.Key("log_level");
    writer.String(log_level.c_str(), log_level.length());
    writer.Key("execution_timeout");
    writer.Double(execution_timeout);
    writer.Key("extra_env");
    writer.StartObject();
    for (const auto& [name, value] : extra_env) {
      writer.Key(name.c_str(), name.length());
      writer.String(value.c_str(), value.length());
    }
    writer.EndObject();
    writer.Key("host_submit_time");
    writer.Double(host_submit_time);
    writer.Key("cumulus_version");
    writer.String(version.c_str(), version.length());
    writer.EndObject();

    return std::string{buffer.GetString(), buffer.GetSize()};
  }

  JobEvent JobEvent::deserialize(std::istream& in)
  {
    rapidjson::Document doc;
    rapidjson::IStreamWrapper wrapper{in};
    doc.ParseStream(wrapper);
    return parse(doc);
  }

  JobEvent JobEvent::deserialize(const std::string& json)
  {
    rapidjson::Document doc;
    doc.Parse(json.c_str(), json.length());
    return parse(doc);
  }

  ExecutionConfig ExecutionConfig::extract(const std::string& config_json)
  {
    rapidjson::Document doc;
    doc.Parse(config_json.c_str(), config_json.length());
    if (doc.HasParseError() || !doc.IsObject()) {
      throw common::InvalidJSON{"Could not parse the orchestrator configuration"};
    }

    ExecutionConfig cfg;

    auto section = doc.FindMember("cumulus");
    if (section != doc.MemberEnd() && section->value.IsObject()) {

      auto it = section->value.FindMember("rabbitmq_monitor");
      if (it != section->value.MemberEnd() && it->value.IsBool()) {
        cfg.rabbitmq_monitor = it->value.GetBool();
      }

      it = section->value.FindMember("runtime_memory");
      if (it != section->value.MemberEnd() && it->value.IsNumber()) {
        cfg.runtime_memory = static_cast<long>(it->value.GetDouble());
      }
    }

    auto rabbitmq = doc.FindMember("rabbitmq");
    if (rabbitmq != doc.MemberEnd() && rabbitmq->value.IsObject()) {
      auto it = rabbitmq->value.FindMember("amqp_url");
      if (it != rabbitmq->value.MemberEnd() && it->value.IsString()) {
        cfg.amqp_url = it->value.GetString();
      }
    }

    if (cfg.rabbitmq_monitor && cfg.amqp_url.empty()) {
      throw common::InvalidConfigurationError{"RabbitMQ monitoring requires rabbitmq.amqp_url"};
    }

    return cfg;
  }

} // namespace cumulus::runtime
