#ifndef CUMULUS_COMMON_EXCEPTIONS_HPP
#define CUMULUS_COMMON_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace cumulus::common {

  struct CumulusException : std::runtime_error {

    CumulusException(const std::string& msg) : std::runtime_error(msg) {}
  };

  struct InvalidConfigurationError : CumulusException {

    InvalidConfigurationError(const std::string& msg) : CumulusException(msg) {}
  };

  struct InvalidJSON : CumulusException {

    InvalidJSON(const std::string& msg) : CumulusException(msg) {}
  };

  struct ObjectDoesNotExist : CumulusException {

    ObjectDoesNotExist(const std::string& name) : CumulusException(name) {}
  };

  struct StorageError : CumulusException {

    StorageError(const std::string& msg) : CumulusException(msg) {}
  };

  struct StatsFormatError : CumulusException {

    StatsFormatError(const std::string& msg) : CumulusException(msg) {}
  };

  /**
   * @brief Fatal condition of a single invocation. The tag classifies the failure for the
   * orchestrator; the arguments are free-form details attached to the status record.
   */
  struct InvocationFailure : CumulusException {

    enum class Tag { WRONGVERSION, OUTATIME, OUTOFMEMORY };

    InvocationFailure(Tag tag, const std::string& msg, std::vector<std::string> args = {})
        : CumulusException(msg), _tag(tag), _args(std::move(args))
    {
    }

    Tag tag() const
    {
      return _tag;
    }

    const std::vector<std::string>& args() const
    {
      return _args;
    }

    static std::string_view tag_name(Tag tag)
    {
      switch (tag) {
      case Tag::WRONGVERSION:
        return "WRONGVERSION";
      case Tag::OUTATIME:
        return "OUTATIME";
      case Tag::OUTOFMEMORY:
        return "OUTOFMEMORY";
      }
      return "";
    }

  private:
    Tag _tag;
    std::vector<std::string> _args;
  };

} // namespace cumulus::common

#endif
