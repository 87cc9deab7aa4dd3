// include/backfolio/core/time_utils.hpp

#pragma once

#include <time.h>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <optional>
#include <string>
#include "backfolio/core/types.hpp"

namespace backfolio {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 *
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Thread-safe wrapper for gmtime
 *
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Get current time as a string with specified format
 *
 * @param format Format string compatible with strftime
 * @param use_local_time If true, uses local time, otherwise GMT
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    std::tm result;

    if (use_local_time) {
        safe_localtime(&now_c, &result);
    } else {
        safe_gmtime(&now_c, &result);
    }

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

/**
 * @brief Format a timestamp in UTC with a strftime pattern
 */
inline std::string format_timestamp(const Timestamp& ts, const char* format = "%Y-%m-%d %H:%M:%S") {
    auto tt = std::chrono::system_clock::to_time_t(ts);
    std::tm result;
    safe_gmtime(&tt, &result);

    char buffer[64];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

/**
 * @brief Format a timestamp as an ISO date (YYYY-MM-DD, UTC)
 */
inline std::string format_date(const Timestamp& ts) {
    return format_timestamp(ts, "%Y-%m-%d");
}

/**
 * @brief Days since 1970-01-01 for a civil date (proleptic Gregorian)
 */
inline long long days_from_civil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

/**
 * @brief Build a UTC timestamp from calendar fields
 */
inline Timestamp make_timestamp(int year, int month, int day, int hour = 0, int minute = 0,
                                int second = 0) {
    long long days = days_from_civil(year, static_cast<unsigned>(month),
                                     static_cast<unsigned>(day));
    long long secs = days * 86400LL + hour * 3600LL + minute * 60LL + second;
    return Timestamp(std::chrono::seconds(secs));
}

/**
 * @brief Parse "YYYY-MM-DD" or "YYYY-MM-DD HH:MM:SS" (UTC)
 * @return The timestamp, or std::nullopt when the text is malformed
 */
inline std::optional<Timestamp> parse_timestamp(const std::string& text) {
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    const char* format =
        text.find('T') != std::string::npos ? "%d-%d-%dT%d:%d:%d" : "%d-%d-%d %d:%d:%d";
    int matched = std::sscanf(text.c_str(), format, &y, &mo, &d, &h, &mi, &s);
    if (matched != 3 && matched != 6) {
        return std::nullopt;
    }
    if (mo < 1 || mo > 12 || d < 1 || d > 31 || h < 0 || h > 23 || mi < 0 || mi > 59 ||
        s < 0 || s > 60) {
        return std::nullopt;
    }
    return make_timestamp(y, mo, d, h, mi, s);
}

/**
 * @brief Whole calendar days from one timestamp's UTC date to another's
 */
inline int days_between(const Timestamp& from, const Timestamp& to) {
    auto day_index = [](const Timestamp& ts) {
        auto secs =
            std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
        long long days = secs / 86400;
        if (secs % 86400 < 0) {
            --days;
        }
        return days;
    };
    return static_cast<int>(day_index(to) - day_index(from));
}

}  // namespace core
}  // namespace backfolio
