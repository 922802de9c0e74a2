#pragma once

#include <string>

namespace tidelink::core {

/// @brief Returns the current time formatted as ISO8601 UTC.
std::string NowIso8601();
/// @brief Returns a UTC ISO8601 timestamp offset from now by delta seconds.
std::string NowIso8601WithOffsetSeconds(int delta_seconds);
/// @brief True when an ISO8601 UTC timestamp lies in the past.
bool IsPastIso8601(const std::string& timestamp);

}  // namespace tidelink::core
