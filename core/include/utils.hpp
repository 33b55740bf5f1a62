#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>

namespace core {
namespace utils {

    // Format a Timestamp as ISO 8601 UTC, e.g. "2024-01-02T13:00:00Z"
    std::string timestampToString(const Timestamp& ts);

    // Parse "YYYY-MM-DD" (midnight UTC) or "YYYY-MM-DDTHH:MM:SS[.fff](Z|+HH:MM|-HH:MM)"
    Timestamp stringToTimestamp(const std::string& iso_string);

    // Timeframe helpers ("1m", "5m", "15m", "30m", "1h", "4h", "1d")
    int timeframeToMinutes(Timeframe timeframe);
    std::string timeframeToString(Timeframe timeframe);
    Timeframe timeframeFromString(const std::string& timeframe_str);

    std::string sideToString(TradeSide side);
    TradeSide sideFromString(const std::string& side_str);

} // namespace utils
} // namespace core
