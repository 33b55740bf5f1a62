#include "utils.hpp"
#include <iomanip>    // For std::put_time, std::get_time
#include <sstream>    // For string streams
#include <string>
#include <stdexcept>  // For std::runtime_error, std::invalid_argument
#include <cmath>      // For std::pow
#include <cctype>     // For std::isdigit, std::tolower
#include <algorithm>  // For std::transform
#include <ctime>

namespace core {
namespace utils {

    Timestamp stringToTimestamp(const std::string& iso_string) {
        std::tm tm = {};
        std::istringstream ss(iso_string);

        // 1. Date-only form is midnight UTC
        if (iso_string.size() == 10) {
            ss >> std::get_time(&tm, "%Y-%m-%d");
            if (ss.fail()) {
                throw std::runtime_error("Failed to parse date: " + iso_string);
            }
        } else {
            ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
            if (ss.fail()) {
                throw std::runtime_error("Failed to parse timestamp (date/time part): " + iso_string);
            }
        }

        // 2. Manually parse optional fractional seconds
        double fractional_seconds = 0.0;
        if (ss.peek() == '.') {
            ss.ignore(); // consume '.'
            std::string digits;
            while (std::isdigit(ss.peek()) && digits.size() < 9) {
                digits += static_cast<char>(ss.get());
            }
            while (std::isdigit(ss.peek())) {
                ss.ignore();
            }
            if (!digits.empty()) {
                fractional_seconds = std::stod(digits) / std::pow(10.0, static_cast<double>(digits.length()));
            }
        }

        // 3. Timezone offset (+HH:MM, -HH:MM or Z). Missing offset means UTC.
        std::chrono::seconds offset_duration(0);
        char sign_or_z = 0;
        if (ss >> sign_or_z) {
            if (sign_or_z == 'Z') {
                offset_duration = std::chrono::seconds(0);
            } else if (sign_or_z == '+' || sign_or_z == '-') {
                int offset_h = 0;
                int offset_m = 0;
                char colon = ' ';
                if (!(ss >> std::setw(2) >> offset_h >> colon >> std::setw(2) >> offset_m) || colon != ':') {
                     throw std::runtime_error("Failed to parse timestamp (timezone offset HH:MM): " + iso_string);
                }
                offset_duration = std::chrono::hours(offset_h) + std::chrono::minutes(offset_m);
                if (sign_or_z == '-') {
                    offset_duration *= -1;
                }
            } else {
                throw std::runtime_error("Invalid timezone indicator '" + std::string(1, sign_or_z) + "' in timestamp: " + iso_string);
            }
        }

        // 4. timegm interprets struct tm as UTC (_mkgmtime on Windows)
        #ifdef _WIN32
            time_t tt = _mkgmtime(&tm);
        #else
            time_t tt = timegm(&tm);
        #endif
        if (tt == static_cast<time_t>(-1)) {
             throw std::runtime_error("Failed to convert parsed date/time to UTC epoch seconds: " + iso_string);
        }

        auto base_tp_utc = std::chrono::system_clock::from_time_t(tt);
        base_tp_utc += std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(fractional_seconds));

        // 2024-01-01T09:00:00+09:00 is 2024-01-01T00:00:00Z
        return base_tp_utc - offset_duration;
    }

    std::string timestampToString(const Timestamp& ts) {
        auto tt = std::chrono::system_clock::to_time_t(ts);

        std::tm time_tm;
        #ifdef _WIN32
            gmtime_s(&time_tm, &tt);
        #else
            gmtime_r(&tt, &time_tm);
        #endif

        // Fixed-width format so that TEXT comparison in the bar store orders chronologically
        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%dT%H:%M:%S") << 'Z';
        return oss.str();
    }

    int timeframeToMinutes(Timeframe timeframe) {
        switch (timeframe) {
            case Timeframe::M1:  return 1;
            case Timeframe::M5:  return 5;
            case Timeframe::M15: return 15;
            case Timeframe::M30: return 30;
            case Timeframe::H1:  return 60;
            case Timeframe::H4:  return 240;
            case Timeframe::D1:  return 1440;
        }
        return 0;
    }

    std::string timeframeToString(Timeframe timeframe) {
        switch (timeframe) {
            case Timeframe::M1:  return "1m";
            case Timeframe::M5:  return "5m";
            case Timeframe::M15: return "15m";
            case Timeframe::M30: return "30m";
            case Timeframe::H1:  return "1h";
            case Timeframe::H4:  return "4h";
            case Timeframe::D1:  return "1d";
        }
        return "unknown";
    }

    Timeframe timeframeFromString(const std::string& timeframe_str) {
        if (timeframe_str == "1m") return Timeframe::M1;
        if (timeframe_str == "5m") return Timeframe::M5;
        if (timeframe_str == "15m") return Timeframe::M15;
        if (timeframe_str == "30m") return Timeframe::M30;
        if (timeframe_str == "1h") return Timeframe::H1;
        if (timeframe_str == "4h") return Timeframe::H4;
        if (timeframe_str == "1d") return Timeframe::D1;
        throw std::invalid_argument("Unknown timeframe string: " + timeframe_str);
    }

    std::string sideToString(TradeSide side) {
        return side == TradeSide::Buy ? "buy" : "sell";
    }

    TradeSide sideFromString(const std::string& side_str) {
        std::string lower_str = side_str;
        std::transform(lower_str.begin(), lower_str.end(), lower_str.begin(),
            [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        if (lower_str == "buy" || lower_str == "long") return TradeSide::Buy;
        if (lower_str == "sell" || lower_str == "short") return TradeSide::Sell;
        throw std::invalid_argument("Unknown trade side string: " + side_str);
    }

} // namespace utils
} // namespace core
