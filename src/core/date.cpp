#include "ledger_ngin/core/date.hpp"
#include <array>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace ledger_ngin {

namespace {

constexpr long long kSecondsPerDay = 86400;

const std::array<const char*, 12> kMonthNames = {
    "January", "February", "March",     "April",   "May",      "June",
    "July",    "August",   "September", "October", "November", "December"};

}  // namespace

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    switch (month) {
        case 1:
        case 3:
        case 5:
        case 7:
        case 8:
        case 10:
        case 12:
            return 31;
        case 4:
        case 6:
        case 9:
        case 11:
            return 30;
        case 2:
            return is_leap_year(year) ? 29 : 28;
        default:
            return 0;
    }
}

bool is_valid_date(const Date& date) {
    return date.month >= 1 && date.month <= 12 && date.day >= 1 &&
           date.day <= days_in_month(date.year, date.month);
}

// Era-based conversion; valid for the whole proleptic Gregorian range we care about.
long long days_from_civil(const Date& date) {
    long long y = date.year;
    const unsigned m = static_cast<unsigned>(date.month);
    const unsigned d = static_cast<unsigned>(date.day);
    y -= m <= 2 ? 1 : 0;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

Date civil_from_days(long long days) {
    days += 719468;
    const long long era = (days >= 0 ? days : days - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(days - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long y = static_cast<long long>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return Date(static_cast<int>(y + (m <= 2 ? 1 : 0)), static_cast<int>(m),
                static_cast<int>(d));
}

Date date_from_timestamp(const Timestamp& ts) {
    const long long seconds =
        std::chrono::floor<std::chrono::seconds>(ts.time_since_epoch()).count();
    long long days = seconds / kSecondsPerDay;
    if (seconds % kSecondsPerDay < 0) {
        --days;
    }
    return civil_from_days(days);
}

Timestamp start_of_day(const Date& date) {
    return Timestamp(std::chrono::seconds(days_from_civil(date) * kSecondsPerDay));
}

Timestamp end_of_day(const Date& date) {
    return start_of_day(add_days(date, 1)) - Timestamp::duration(1);
}

Date add_days(const Date& date, long long days) {
    return civil_from_days(days_from_civil(date) + days);
}

std::string to_string(const Date& date) {
    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(4) << date.year << "-" << std::setw(2) << date.month
       << "-" << std::setw(2) << date.day;
    return ss.str();
}

Result<Date> parse_date(const std::string& text) {
    int y = 0;
    int m = 0;
    int d = 0;
    char trailing = '\0';
    if (text.size() != 10 ||
        std::sscanf(text.c_str(), "%4d-%2d-%2d%c", &y, &m, &d, &trailing) != 3) {
        return make_error<Date>(ErrorCode::CONVERSION_ERROR,
                                "Expected a YYYY-MM-DD date, got '" + text + "'", "Date");
    }
    Date date(y, m, d);
    if (!is_valid_date(date)) {
        return make_error<Date>(ErrorCode::CONVERSION_ERROR, "Invalid calendar date: " + text,
                                "Date");
    }
    return Result<Date>(date);
}

std::string month_name(int month) {
    if (month < 1 || month > 12) {
        return "";
    }
    return kMonthNames[static_cast<size_t>(month - 1)];
}

std::string month_abbreviation(int month) {
    return month_name(month).substr(0, 3);
}

}  // namespace ledger_ngin
