#ifndef CUMULUS_COMMON_VERSION_HPP
#define CUMULUS_COMMON_VERSION_HPP

#include <string_view>

namespace cumulus::common {

  // Must match the tag the orchestrator stamps into every job event.
  static constexpr std::string_view VERSION = "0.4.1";

} // namespace cumulus::common

#endif
