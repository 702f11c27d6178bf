#include <cumulus/common/util.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cmath>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace cumulus::common::util {

  void traceback()
  {
    void* array[10];
    size_t size = backtrace(array, 10);
    char** trace = backtrace_symbols(array, size);
    for (size_t i = 0; i < size; ++i)
      spdlog::warn("Traceback {}: {}", i, trace[i]);
    free(trace);
  }

  std::shared_ptr<spdlog::logger> create_logger(std::string_view name)
  {
    // Registered loggers follow every later spdlog::set_level.
    if (auto logger = spdlog::get(std::string{name}); logger) {
      return logger;
    }

    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_st>();
    auto logger = std::make_shared<spdlog::logger>(std::string{name}, sink);
    logger->set_pattern("[%H:%M:%S:%f] [%n] [P %P] [T %t] [%l] %v ");
    logger->set_level(spdlog::get_level());
    spdlog::register_logger(logger);
    return logger;
  }

  static std::string lowercase(std::string_view value)
  {
    std::string result{value};
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
      return std::tolower(c);
    });
    return result;
  }

  bool strtobool(std::string_view value)
  {
    std::string val = lowercase(value);
    if (val == "y" || val == "yes" || val == "t" || val == "true" || val == "on" || val == "1") {
      return true;
    }
    if (val == "n" || val == "no" || val == "f" || val == "false" || val == "off" || val == "0") {
      return false;
    }
    throw InvalidConfigurationError{fmt::format("Invalid truth value {}", value)};
  }

  std::string sizeof_fmt(double num)
  {
    static constexpr std::array<std::string_view, 8> UNITS = {"",   "Ki", "Mi", "Gi",
                                                              "Ti", "Pi", "Ei", "Zi"};
    for (auto unit : UNITS) {
      if (std::abs(num) < 1024.0) {
        return fmt::format("{:.1f}{}B", num, unit);
      }
      num /= 1024.0;
    }
    return fmt::format("{:.1f}YiB", num);
  }

  double round_to(double value, int digits)
  {
    double factor = std::pow(10.0, digits);
    return std::round(value * factor) / factor;
  }

  double timestamp()
  {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::duration<double>>(now).count();
  }

  void set_log_level(std::string_view level)
  {
    std::string val = lowercase(level);
    if (val == "debug") {
      spdlog::set_level(spdlog::level::debug);
    } else if (val == "info") {
      spdlog::set_level(spdlog::level::info);
    } else if (val == "warning" || val == "warn") {
      spdlog::set_level(spdlog::level::warn);
    } else if (val == "error") {
      spdlog::set_level(spdlog::level::err);
    } else if (val == "critical") {
      spdlog::set_level(spdlog::level::critical);
    } else {
      spdlog::warn("Unknown log level {}, keeping {}", level,
                   spdlog::level::to_string_view(spdlog::get_level()));
    }
  }

} // namespace cumulus::common::util
