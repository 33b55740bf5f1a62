#pragma once // Use #pragma once for include guards (common practice)

#include <string>
#include <vector>
#include <chrono> // For timestamps

namespace core {

    // Using system_clock for time points, all timestamps are treated as UTC
    using Timestamp = std::chrono::system_clock::time_point;


    // One OHLCV sample. A series is ascending by timestamp with no duplicates.
    struct Candle {
        Timestamp timestamp;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        long long volume = 0; // Use long long for potentially large volumes

        bool operator<(const Candle& other) const {
            return timestamp < other.timestamp;
        }
    };

    // Direction of a simulated position
    enum class TradeSide {
        Buy,  // Long: take-profit above entry, stop-loss below
        Sell  // Short: mirrored
    };

    // Bar timeframes supported by the bar store and the simulator
    enum class Timeframe {
        M1,
        M5,
        M15,
        M30,
        H1,
        H4,
        D1
    };

    // Basic TimeSeries concept
    template<typename T>
    using TimeSeries = std::vector<T>; // Simple alias for now

} // namespace core
