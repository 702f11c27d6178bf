#ifndef CUMULUS_FUNCTION_INVOCATION_HPP
#define CUMULUS_FUNCTION_INVOCATION_HPP

#include <string>

namespace cumulus::function {

  struct Invocation {

    Invocation() = default;

    std::string executor_id;

    std::string job_id;

    std::string call_id;

    // Input slice fetched from data_key.
    std::string data;
  };

} // namespace cumulus::function

#endif
