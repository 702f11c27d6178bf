#ifndef CUMULUS_COMMON_UTIL_HPP
#define CUMULUS_COMMON_UTIL_HPP

#include <cumulus/common/exceptions.hpp>

#include <cerrno>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>

#include <execinfo.h>

#include <cereal/archives/json.hpp>
#include <spdlog/spdlog.h>

namespace cumulus::common::util {

  void traceback();

  std::shared_ptr<spdlog::logger> create_logger(std::string_view name);

  /**
   * @brief Parses a truthy/falsy string: y, yes, t, true, on, 1 and n, no, f, false, off, 0.
   * Comparison is case-insensitive.
   *
   * @throws InvalidConfigurationError for any other value
   */
  bool strtobool(std::string_view value);

  // Human-readable size, e.g. "1.5KiB".
  std::string sizeof_fmt(double num);

  double round_to(double value, int digits);

  // Wall-clock time in seconds since the epoch.
  double timestamp();

  // Maps DEBUG, INFO, WARNING, ERROR and CRITICAL onto the global spdlog level.
  void set_log_level(std::string_view level);

  template <typename U>
  bool expect_zero(U&& u)
  {
    if (u) {
      spdlog::error("Expected zero, found: {}, errno {}, message {}", u, errno, strerror(errno));
      traceback();
      return false;
    }
    return true;
  }

  template <typename U>
  bool expect_other(U&& u, int val)
  {
    if (u == val) {
      spdlog::error(
          "Expected value other than {}, found: {}, errno {}, message {}", val, u, errno,
          strerror(errno)
      );
      traceback();
      return false;
    }
    return true;
  }

  // Converts a failed POSIX call into an exception carrying errno.
  template <typename U>
  U check_posix(U&& ret, std::string_view call)
  {
    if (ret == -1) {
      throw CumulusException{fmt::format("{} failed, errno {}, reason {}", call, errno, strerror(errno))};
    }
    return ret;
  }

  // Loads the named value when present; a missing value keeps its current contents.
  template <typename T>
  void cereal_load_optional(cereal::JSONInputArchive& archive, const char* name, T& obj)
  {
    // Unfortunately, Cereal does not allow to skip non-existing objects easily.
    // There is also no separate exception type for this.
    try {
      archive(cereal::make_nvp(name, obj));
    } catch (cereal::Exception& exc) {

      // Catch non existing object
      if (std::string_view{exc.what()}.find(fmt::format("({}) not found", name)) ==
          std::string::npos) {
        throw common::InvalidConfigurationError(
            fmt::format("Could not parse configuration of {}, reason: {}", name, exc.what())
        );
      }
      archive.setNextName(nullptr);
    }
  }

} // namespace cumulus::common::util

#endif
