#pragma once

#include <string>
#include <vector>

#include <sqlite3.h> // Standard C header

#include "datatypes.hpp" // Keep core types

namespace data {

// SQLite-backed OHLCV store, the bar supply of the command-line runner.
// Timestamps are stored as ISO-8601 UTC text, so text order is time order.
class DatabaseManager {
public:
    explicit DatabaseManager(const std::string& db_path); // ":memory:" for an in-memory store
    ~DatabaseManager();

    // Owns a raw sqlite3 handle: neither copyable nor movable
    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const;

    // Creates ohlcv_candles and its index if missing
    bool initializeSchema();

    bool executeSQL(const std::string& sql);

    // INSERT OR IGNORE in one transaction; duplicates (symbol, timeframe, timestamp) are skipped
    bool saveCandles(const core::TimeSeries<core::Candle>& candles,
                     const std::string& symbol,
                     const std::string& timeframe);

    // Candles in [start_time, end_time], ascending. Throws core::DataLoadException.
    core::TimeSeries<core::Candle> queryCandles(
        const std::string& symbol,
        const std::string& timeframe,
        core::Timestamp start_time,
        core::Timestamp end_time);

private:
    std::string database_path_;
    sqlite3* db_ = nullptr; // SQLite database connection handle
    bool connected_ = false;
};

} // namespace data
