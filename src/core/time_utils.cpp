// src/core/time_utils.cpp

#include "gold_rotation/core/time_utils.hpp"
#include <cctype>
#include <cstdio>

namespace gold_rotation {
namespace core {

namespace {

constexpr int64_t kSecondsPerDay = 86400;

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned days_in_month(int year, unsigned month) {
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return kDays[month - 1];
}

bool all_digits(const std::string& text, size_t pos, size_t len) {
    if (pos + len > text.size()) {
        return false;
    }
    for (size_t i = pos; i < pos + len; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace

int64_t days_from_civil(int year, unsigned month, unsigned day) {
    const int64_t y = static_cast<int64_t>(year) - (month <= 2 ? 1 : 0);
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t mp = month > 2 ? month - 3 : month + 9;
    const int64_t doy = (153 * mp + 2) / 5 + day - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

Timestamp make_date(int year, unsigned month, unsigned day) {
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
        throw EngineError(ErrorCode::INVALID_ARGUMENT,
                          "Invalid calendar date: " + std::to_string(year) + "-" +
                              std::to_string(month) + "-" + std::to_string(day),
                          "TimeUtils");
    }
    return date_from_days(days_from_civil(year, month, day));
}

Timestamp date_from_days(int64_t days) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::seconds(days * kSecondsPerDay)));
}

int64_t days_since_epoch(Timestamp ts) {
    const int64_t secs =
        std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
    int64_t days = secs / kSecondsPerDay;
    if (secs % kSecondsPerDay < 0) {
        --days;
    }
    return days;
}

Timestamp truncate_to_day(Timestamp ts) {
    return date_from_days(days_since_epoch(ts));
}

CivilDate to_civil(Timestamp ts) {
    int64_t z = days_since_epoch(ts);
    const unsigned weekday =
        static_cast<unsigned>(z >= -4 ? (z + 4) % 7 : (z + 5) % 7 + 6);

    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    const unsigned day = static_cast<unsigned>(doy - (153 * mp + 2) / 5 + 1);
    const unsigned month = static_cast<unsigned>(mp < 10 ? mp + 3 : mp - 9);
    const int year = static_cast<int>(yoe + era * 400 + (month <= 2 ? 1 : 0));

    return CivilDate{year, month, day, weekday};
}

int64_t days_between(Timestamp a, Timestamp b) {
    return days_since_epoch(b) - days_since_epoch(a);
}

std::string format_date(Timestamp ts) {
    CivilDate civil = to_civil(ts);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", civil.year, civil.month, civil.day);
    return std::string(buffer);
}

std::string format_compact_date(Timestamp ts) {
    CivilDate civil = to_civil(ts);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d%02u%02u", civil.year, civil.month, civil.day);
    return std::string(buffer);
}

Result<Timestamp> parse_date(const std::string& text) {
    size_t first = text.find_first_not_of(" \t\r\n\"");
    if (first == std::string::npos) {
        return make_error<Timestamp>(ErrorCode::INVALID_DATA, "Empty date string", "TimeUtils");
    }
    size_t last = text.find_first_of("T \t\r\n\"", first);
    std::string date_part = text.substr(first, last == std::string::npos ? std::string::npos
                                                                          : last - first);

    int year = 0;
    unsigned month = 0;
    unsigned day = 0;

    if (date_part.size() == 10 && all_digits(date_part, 0, 4) && all_digits(date_part, 5, 2) &&
        all_digits(date_part, 8, 2) && (date_part[4] == '-' || date_part[4] == '/') &&
        date_part[7] == date_part[4]) {
        year = std::stoi(date_part.substr(0, 4));
        month = static_cast<unsigned>(std::stoi(date_part.substr(5, 2)));
        day = static_cast<unsigned>(std::stoi(date_part.substr(8, 2)));
    } else if (date_part.size() == 8 && all_digits(date_part, 0, 8)) {
        year = std::stoi(date_part.substr(0, 4));
        month = static_cast<unsigned>(std::stoi(date_part.substr(4, 2)));
        day = static_cast<unsigned>(std::stoi(date_part.substr(6, 2)));
    } else {
        return make_error<Timestamp>(ErrorCode::INVALID_DATA,
                                     "Unrecognized date format: " + text, "TimeUtils");
    }

    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
        return make_error<Timestamp>(ErrorCode::INVALID_DATA, "Date out of range: " + text,
                                     "TimeUtils");
    }
    return date_from_days(days_from_civil(year, month, day));
}

Timestamp today() {
    auto now_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local;
    if (safe_localtime(&now_c, &local) == nullptr) {
        return truncate_to_day(std::chrono::system_clock::now());
    }
    return make_date(local.tm_year + 1900, static_cast<unsigned>(local.tm_mon + 1),
                     static_cast<unsigned>(local.tm_mday));
}

}  // namespace core
}  // namespace gold_rotation
