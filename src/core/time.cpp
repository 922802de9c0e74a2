#include "tidelink/core/time.h"

#include <Poco/DateTimeFormat.h>
#include <Poco/DateTimeFormatter.h>
#include <Poco/Timespan.h>
#include <Poco/Timestamp.h>

namespace tidelink::core {

std::string NowIso8601() {
    return Poco::DateTimeFormatter::format(Poco::Timestamp(), Poco::DateTimeFormat::ISO8601_FORMAT);
}

std::string NowIso8601WithOffsetSeconds(int delta_seconds) {
    Poco::Timestamp ts;
    ts += Poco::Timespan(delta_seconds, 0);
    return Poco::DateTimeFormatter::format(ts, Poco::DateTimeFormat::ISO8601_FORMAT);
}

bool IsPastIso8601(const std::string& timestamp) {
    // All stored timestamps share the UTC ISO8601 layout, so they order lexicographically.
    return timestamp < NowIso8601();
}

}  // namespace tidelink::core
