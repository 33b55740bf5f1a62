#include "database_manager.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp" // For timestampToString/stringToTimestamp
#include <cstring>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace data
{

    DatabaseManager::DatabaseManager(const std::string &db_path)
        : database_path_(db_path), db_(nullptr), connected_(false)
    {
        core::logging::getLogger()->debug("DatabaseManager (SQLite) created for path: {}", db_path);
    }

    DatabaseManager::~DatabaseManager()
    {
        disconnect(); // Ensure disconnection
    }

    bool DatabaseManager::connect()
    {
        if (connected_)
        {
            core::logging::getLogger()->warn("Already connected to SQLite database {}.", database_path_);
            return true;
        }

        core::logging::getLogger()->info("Connecting to SQLite database: {}", database_path_);

        // SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE: Open for reading/writing, create if not exists
        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                 nullptr);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("Cannot open SQLite database '{}': {}", database_path_,
                                              db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
            sqlite3_close(db_); // Close handle even if open failed (as per docs)
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        core::logging::getLogger()->info("Successfully connected to SQLite database: {}", database_path_);
        return true;
    }

    void DatabaseManager::disconnect()
    {
        if (!connected_)
        {
            return;
        }
        core::logging::getLogger()->debug("Disconnecting from SQLite database: {}", database_path_);
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK)
        {
            // This usually happens if prepared statements are not finalized
            core::logging::getLogger()->error("Error disconnecting from SQLite database: {}", sqlite3_errmsg(db_));
        }
        db_ = nullptr;
        connected_ = false;
    }

    bool DatabaseManager::isConnected() const
    {
        return connected_ && (db_ != nullptr);
    }

    bool DatabaseManager::executeSQL(const std::string &sql)
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot execute SQL: Not connected to database.");
            return false;
        }

        core::logging::getLogger()->trace("Executing SQL (SQLite): {}", sql);

        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("SQL error: {}", error_msg ? error_msg : sqlite3_errstr(rc));
            sqlite3_free(error_msg); // Must free error message memory
            return false;
        }
        return true;
    }

    bool DatabaseManager::initializeSchema()
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot initialize schema: Not connected to database.");
            return false;
        }
        core::logging::getLogger()->info("Initializing SQLite database schema if needed...");

        const std::string create_candles_sql = R"(
        CREATE TABLE IF NOT EXISTS ohlcv_candles (
            symbol TEXT NOT NULL,
            timeframe TEXT NOT NULL,
            timestamp TEXT NOT NULL, -- ISO8601 UTC, e.g. 2024-01-02T13:00:00Z
            open REAL NOT NULL,
            high REAL NOT NULL,
            low REAL NOT NULL,
            close REAL NOT NULL,
            volume INTEGER NOT NULL DEFAULT 0,
            PRIMARY KEY (symbol, timeframe, timestamp)
        );
    )";
        const std::string create_candles_index_sql = R"(
        CREATE INDEX IF NOT EXISTS idx_ohlcv_candles_timestamp
        ON ohlcv_candles (symbol, timeframe, timestamp);
     )";

        bool success = executeSQL(create_candles_sql);
        success = success && executeSQL(create_candles_index_sql);

        if (success)
        {
            core::logging::getLogger()->info("SQLite database schema initialization check complete.");
        }
        else
        {
            core::logging::getLogger()->error("SQLite database schema initialization failed.");
        }
        return success;
    }

    core::TimeSeries<core::Candle> DatabaseManager::queryCandles(
        const std::string& symbol,
        const std::string& timeframe,
        core::Timestamp start_time,
        core::Timestamp end_time)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected()) {
            throw core::DataLoadException("Cannot query candles: Not connected to database.");
        }

        std::string start_str = core::utils::timestampToString(start_time);
        std::string end_str = core::utils::timestampToString(end_time);

        logger->debug("Querying candles for {} ({}) between '{}' and '{}'", symbol, timeframe, start_str, end_str);

        const char* sql = R"(
            SELECT timestamp, open, high, low, close, volume
            FROM ohlcv_candles
            WHERE symbol = ?
              AND timeframe = ?
              AND timestamp >= ?
              AND timestamp <= ?
            ORDER BY timestamp ASC;
        )";

        sqlite3_stmt *stmt = nullptr; // Prepared statement handle
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            std::string message = fmt::format("Failed to prepare candle query [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt); // Finalize even if prepare failed
            throw core::DataLoadException(message);
        }

        // Bind parameters (1-based); SQLITE_TRANSIENT because the strings are locals
        sqlite3_bind_text(stmt, 1, symbol.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, timeframe.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, start_str.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, end_str.c_str(), -1, SQLITE_TRANSIENT);

        core::TimeSeries<core::Candle> candles;
        int row_count = 0;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            row_count++;
            const unsigned char *ts_text = sqlite3_column_text(stmt, 0);
            if (!ts_text) {
                logger->warn("NULL timestamp found in query result (row {}), skipping row.", row_count);
                continue;
            }

            core::Candle candle;
            try {
                candle.timestamp = core::utils::stringToTimestamp(reinterpret_cast<const char*>(ts_text));
            } catch (const std::runtime_error& e) {
                std::string message = fmt::format("Malformed timestamp in row {}: {}", row_count, e.what());
                sqlite3_finalize(stmt);
                throw core::DataLoadException(message);
            }
            candle.open = sqlite3_column_double(stmt, 1);
            candle.high = sqlite3_column_double(stmt, 2);
            candle.low = sqlite3_column_double(stmt, 3);
            candle.close = sqlite3_column_double(stmt, 4);
            candle.volume = sqlite3_column_int64(stmt, 5);
            candles.push_back(candle);
        }

        if (rc != SQLITE_DONE) {
            std::string message = fmt::format("Error stepping through candle query [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            throw core::DataLoadException(message);
        }

        sqlite3_finalize(stmt);
        logger->debug("Loaded {} candles for {} ({}).", candles.size(), symbol, timeframe);
        return candles;
    }

    bool DatabaseManager::saveCandles(const core::TimeSeries<core::Candle> &candles,
                                      const std::string &symbol,
                                      const std::string &timeframe)
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot save candles: Not connected to database.");
            return false;
        }
        if (candles.empty())
        {
            core::logging::getLogger()->debug("No candles provided to save for {} ({}).", symbol, timeframe);
            return true; // Nothing to do, report success
        }

        const char *sql = R"(
INSERT OR IGNORE INTO ohlcv_candles
(symbol, timeframe, timestamp, open, high, low, close, volume)
VALUES (?, ?, ?, ?, ?, ?, ?, ?);
)";

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("Failed to prepare INSERT statement [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return false;
        }

        // Begin transaction for efficiency
        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            core::logging::getLogger()->error("Failed to begin transaction for saving candles.");
            sqlite3_finalize(stmt);
            return false;
        }

        bool success = true;
        int saved_count = 0;
        for (const auto &candle : candles)
        {
            std::string timestamp_str = core::utils::timestampToString(candle.timestamp);
            sqlite3_bind_text(stmt, 1, symbol.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, timeframe.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 3, timestamp_str.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(stmt, 4, candle.open);
            sqlite3_bind_double(stmt, 5, candle.high);
            sqlite3_bind_double(stmt, 6, candle.low);
            sqlite3_bind_double(stmt, 7, candle.close);
            sqlite3_bind_int64(stmt, 8, candle.volume);

            rc = sqlite3_step(stmt);
            if (rc != SQLITE_DONE)
            {
                core::logging::getLogger()->error("Failed to execute insert step [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break; // Exit loop on first error
            }
            if (sqlite3_changes(db_) > 0)
            {
                saved_count++;
            }

            rc = sqlite3_reset(stmt);
            if (rc != SQLITE_OK)
            {
                core::logging::getLogger()->error("Failed to reset prepared statement [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
        }

        // Finalize the statement BEFORE commit/rollback
        sqlite3_finalize(stmt);

        if (success)
        {
            if (!executeSQL("COMMIT;"))
            {
                core::logging::getLogger()->error("Failed to COMMIT transaction for saving candles.");
                if (!executeSQL("ROLLBACK;"))
                {
                    core::logging::getLogger()->error("ROLLBACK after failed COMMIT also failed.");
                }
                return false;
            }
            core::logging::getLogger()->info("Saved {} new candles (duplicates ignored) for {} ({}).", saved_count, symbol, timeframe);
            return true;
        }

        if (!executeSQL("ROLLBACK;"))
        {
            core::logging::getLogger()->error("Failed to ROLLBACK transaction for saving candles.");
        }
        core::logging::getLogger()->warn("Transaction rolled back due to error during candle save for {} ({}).", symbol, timeframe);
        return false;
    }

} // namespace data
