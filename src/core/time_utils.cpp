// src/core/time_utils.cpp

#include "quanttrade/core/time_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace quanttrade {
namespace core {

namespace {

constexpr long long SECONDS_PER_DAY = 86400;

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

long long floor_div(long long a, long long b) {
    long long q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

}  // anonymous namespace

// Howard Hinnant's days_from_civil / civil_from_days algorithms
long long days_from_civil(int year, unsigned month, unsigned day) {
    long long y = static_cast<long long>(year) - (month <= 2 ? 1 : 0);
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

CivilDate civil_from_days(long long days) {
    days += 719468;
    const long long era = (days >= 0 ? days : days - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(days - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long y = static_cast<long long>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;

    CivilDate date;
    date.year = static_cast<int>(y + (m <= 2 ? 1 : 0));
    date.month = m;
    date.day = d;
    return date;
}

unsigned days_in_month(int year, unsigned month) {
    static const unsigned lengths[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return lengths[(month - 1) % 12];
}

Timestamp make_date(int year, unsigned month, unsigned day) {
    return Timestamp(std::chrono::seconds(days_from_civil(year, month, day) * SECONDS_PER_DAY));
}

long long days_since_epoch(const Timestamp& ts) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
    return floor_div(secs, SECONDS_PER_DAY);
}

CivilDate to_civil(const Timestamp& ts) {
    return civil_from_days(days_since_epoch(ts));
}

Result<Timestamp> parse_date(const std::string& text) {
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT,
                                     "Invalid date '" + text + "', expected YYYY-MM-DD",
                                     "TimeUtils");
    }
    for (size_t i : {0u, 1u, 2u, 3u, 5u, 6u, 8u, 9u}) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT,
                                         "Invalid date '" + text + "', expected YYYY-MM-DD",
                                         "TimeUtils");
        }
    }

    int year = std::stoi(text.substr(0, 4));
    unsigned month = static_cast<unsigned>(std::stoi(text.substr(5, 2)));
    unsigned day = static_cast<unsigned>(std::stoi(text.substr(8, 2)));

    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT,
                                     "Date out of range: " + text, "TimeUtils");
    }

    return make_date(year, month, day);
}

std::string format_date(const Timestamp& ts) {
    CivilDate date = to_civil(ts);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", date.year, date.month, date.day);
    return std::string(buffer);
}

std::string format_iso8601(const Timestamp& ts) {
    auto time_t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm;
    safe_gmtime(&time_t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

Timestamp add_months(const Timestamp& ts, int months) {
    long long days = days_since_epoch(ts);
    auto time_of_day = ts - Timestamp(std::chrono::seconds(days * SECONDS_PER_DAY));

    CivilDate date = civil_from_days(days);
    long long month_index = static_cast<long long>(date.year) * 12 + (date.month - 1) + months;
    int year = static_cast<int>(floor_div(month_index, 12));
    unsigned month = static_cast<unsigned>(month_index - static_cast<long long>(year) * 12) + 1;
    unsigned day = std::min(date.day, days_in_month(year, month));

    return make_date(year, month, day) + time_of_day;
}

double days_between(const Timestamp& from, const Timestamp& to) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(to - from).count();
    return static_cast<double>(secs) / static_cast<double>(SECONDS_PER_DAY);
}

std::string month_key(const Timestamp& ts) {
    CivilDate date = to_civil(ts);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u", date.year, date.month);
    return std::string(buffer);
}

std::string year_key(const Timestamp& ts) {
    CivilDate date = to_civil(ts);
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "%04d", date.year);
    return std::string(buffer);
}

long long week_index(const Timestamp& ts) {
    // 1970-01-01 was a Thursday; shift so weeks start on Monday
    return floor_div(days_since_epoch(ts) + 3, 7);
}

}  // namespace core
}  // namespace quanttrade
