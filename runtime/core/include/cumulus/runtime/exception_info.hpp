#ifndef CUMULUS_RUNTIME_EXCEPTION_INFO_HPP
#define CUMULUS_RUNTIME_EXCEPTION_INFO_HPP

#include <exception>
#include <string>
#include <vector>

#include <cereal/cereal.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>

namespace cumulus::runtime {

  /**
   * @brief Structured trace of a failed invocation, stored as the exc_info field.
   */
  struct ExceptionInfo {

    // Demangled type of the exception.
    std::string type;

    // Failure tag (WRONGVERSION, OUTATIME, OUTOFMEMORY) or empty.
    std::string tag;

    std::string message;

    std::vector<std::string> args;

    static ExceptionInfo from_exception(const std::exception& exc);

    // Describes the exception currently being handled; works for non-std exceptions too.
    static ExceptionInfo from_current_exception();

    std::string to_json() const;

    static ExceptionInfo from_json(const std::string& data);

    template <typename Ar>
    void serialize(Ar& archive)
    {
      archive(CEREAL_NVP(type));
      archive(CEREAL_NVP(tag));
      archive(CEREAL_NVP(message));
      archive(CEREAL_NVP(args));
    }
  };

} // namespace cumulus::runtime

#endif
