// include/quanttrade/core/time_utils.hpp

#pragma once

#include <time.h>
#include <chrono>
#include <ctime>
#include <string>
#include "quanttrade/core/error.hpp"
#include "quanttrade/core/types.hpp"

namespace quanttrade {
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
 * @return Formatted time string
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
 * @brief Calendar date in the proleptic Gregorian calendar
 */
struct CivilDate {
    int year{1970};
    unsigned month{1};  // 1-12
    unsigned day{1};    // 1-31
};

/**
 * @brief Days since 1970-01-01 for a civil date
 */
long long days_from_civil(int year, unsigned month, unsigned day);

/**
 * @brief Civil date for a count of days since 1970-01-01
 */
CivilDate civil_from_days(long long days);

/**
 * @brief Number of days in the given month
 */
unsigned days_in_month(int year, unsigned month);

/**
 * @brief Midnight UTC time point of a calendar date
 */
Timestamp make_date(int year, unsigned month, unsigned day);

/**
 * @brief Days since 1970-01-01 for a time point (floored to the UTC day)
 */
long long days_since_epoch(const Timestamp& ts);

/**
 * @brief Civil date of a time point (UTC)
 */
CivilDate to_civil(const Timestamp& ts);

/**
 * @brief Parse a "YYYY-MM-DD" date (anything after the tenth character is ignored)
 * @return Midnight UTC of that date, or INVALID_ARGUMENT
 */
Result<Timestamp> parse_date(const std::string& text);

/**
 * @brief Format a time point as "YYYY-MM-DD" (UTC)
 */
std::string format_date(const Timestamp& ts);

/**
 * @brief Format a time point as ISO-8601 "YYYY-MM-DDTHH:MM:SSZ" (UTC)
 */
std::string format_iso8601(const Timestamp& ts);

/**
 * @brief Add calendar months, clamping the day to the end of the target month
 */
Timestamp add_months(const Timestamp& ts, int months);

/**
 * @brief Elapsed time between two time points in fractional days
 */
double days_between(const Timestamp& from, const Timestamp& to);

/**
 * @brief "YYYY-MM" key of a time point
 */
std::string month_key(const Timestamp& ts);

/**
 * @brief "YYYY" key of a time point
 */
std::string year_key(const Timestamp& ts);

/**
 * @brief Monday-based week number since the epoch, stable across year boundaries
 */
long long week_index(const Timestamp& ts);

}  // namespace core
}  // namespace quanttrade
