#pragma once

#include <time.h>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>
#include "gold_rotation/core/error.hpp"
#include "gold_rotation/core/types.hpp"

namespace gold_rotation {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
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

// ---------------------------------------------------------------------------
// Calendar dates. A date is the Timestamp of 00:00 UTC on that day, so two
// bars on the same calendar day always compare equal regardless of the
// timezone the upstream feed reported them in.
// ---------------------------------------------------------------------------

/**
 * @brief Calendar fields of a date
 */
struct CivilDate {
    int year;
    unsigned month;    // 1..12
    unsigned day;      // 1..31
    unsigned weekday;  // 0 = Sunday .. 6 = Saturday
};

/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian date
 */
int64_t days_from_civil(int year, unsigned month, unsigned day);

/**
 * @brief Build the date for year/month/day
 * @throws EngineError(INVALID_ARGUMENT) if the fields do not name a real day
 */
Timestamp make_date(int year, unsigned month, unsigned day);

/**
 * @brief Date for a count of days since 1970-01-01
 */
Timestamp date_from_days(int64_t days);

/**
 * @brief Days since 1970-01-01 of the calendar day containing ts (UTC)
 */
int64_t days_since_epoch(Timestamp ts);

/**
 * @brief Drop the time-of-day component
 */
Timestamp truncate_to_day(Timestamp ts);

/**
 * @brief Calendar fields for a date
 */
CivilDate to_civil(Timestamp ts);

/**
 * @brief Whole days from a to b (negative when b precedes a)
 */
int64_t days_between(Timestamp a, Timestamp b);

/**
 * @brief Format a date as YYYY-MM-DD
 */
std::string format_date(Timestamp ts);

/**
 * @brief Format a date as YYYYMMDD (query-string form used by quote APIs)
 */
std::string format_compact_date(Timestamp ts);

/**
 * @brief Parse a calendar date, discarding any time-of-day or UTC offset
 *
 * Accepts YYYY-MM-DD, YYYY/MM/DD and YYYYMMDD, optionally followed by 'T' or
 * a space and a time, with an optional trailing 'Z' or +HH:MM offset. The
 * wall-clock date as written is kept.
 *
 * @return The date, or INVALID_DATA if the text is not a date
 */
Result<Timestamp> parse_date(const std::string& text);

/**
 * @brief Today's calendar date in local time
 */
Timestamp today();

}  // namespace core
}  // namespace gold_rotation
