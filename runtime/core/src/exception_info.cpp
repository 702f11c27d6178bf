#include <cumulus/runtime/exception_info.hpp>

#include <cumulus/common/exceptions.hpp>

#include <cstdlib>
#include <memory>
#include <sstream>
#include <typeinfo>

#include <cereal/archives/json.hpp>
#include <cxxabi.h>

namespace cumulus::runtime {

  static std::string demangle(const char* name)
  {
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> demangled{
        abi::__cxa_demangle(name, nullptr, nullptr, &status), &std::free};
    return status == 0 && demangled ? std::string{demangled.get()} : std::string{name};
  }

  ExceptionInfo ExceptionInfo::from_exception(const std::exception& exc)
  {
    ExceptionInfo info;
    info.type = demangle(typeid(exc).name());
    info.message = exc.what();

    if (auto* failure = dynamic_cast<const common::InvocationFailure*>(&exc)) {
      info.tag = common::InvocationFailure::tag_name(failure->tag());
      info.args = failure->args();
    }

    return info;
  }

  ExceptionInfo ExceptionInfo::from_current_exception()
  {
    ExceptionInfo info;
    std::type_info* type = abi::__cxa_current_exception_type();
    info.type = type != nullptr ? demangle(type->name()) : "unknown";
    info.message = "Exception of a type that cannot be serialized";
    return info;
  }

  std::string ExceptionInfo::to_json() const
  {
    std::stringstream out;
    {
      cereal::JSONOutputArchive archive_out{out, cereal::JSONOutputArchive::Options::NoIndent()};
      archive_out(cereal::make_nvp("exception", *this));
    }
    return out.str();
  }

  ExceptionInfo ExceptionInfo::from_json(const std::string& data)
  {
    ExceptionInfo info;
    std::stringstream in{data};
    cereal::JSONInputArchive archive_in{in};
    archive_in(cereal::make_nvp("exception", info));
    return info;
  }

} // namespace cumulus::runtime
