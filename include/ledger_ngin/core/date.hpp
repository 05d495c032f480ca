// include/ledger_ngin/core/date.hpp
#pragma once

#include <string>
#include "ledger_ngin/core/error.hpp"
#include "ledger_ngin/core/types.hpp"

namespace ledger_ngin {

/**
 * @brief Proleptic Gregorian calendar date
 *
 * Transactions are bucketed into days in UTC. Months are 1-based.
 */
struct Date {
    int year{1970};
    int month{1};
    int day{1};

    Date() = default;
    Date(int y, int m, int d) : year(y), month(m), day(d) {}

    bool operator==(const Date& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const Date& other) const {
        return !(*this == other);
    }
    bool operator<(const Date& other) const {
        if (year != other.year)
            return year < other.year;
        if (month != other.month)
            return month < other.month;
        return day < other.day;
    }
    bool operator<=(const Date& other) const {
        return !(other < *this);
    }
    bool operator>(const Date& other) const {
        return other < *this;
    }
    bool operator>=(const Date& other) const {
        return !(*this < other);
    }
};

bool is_leap_year(int year);

/**
 * @brief Number of days in a month, or 0 for an invalid month
 */
int days_in_month(int year, int month);

bool is_valid_date(const Date& date);

/**
 * @brief Days since 1970-01-01 for a civil date
 */
long long days_from_civil(const Date& date);

/**
 * @brief Civil date for a count of days since 1970-01-01
 */
Date civil_from_days(long long days);

/**
 * @brief UTC calendar date of a timestamp
 */
Date date_from_timestamp(const Timestamp& ts);

/**
 * @brief 00:00:00 UTC of the given date
 */
Timestamp start_of_day(const Date& date);

/**
 * @brief Last representable instant of the given date (23:59:59.999... UTC)
 */
Timestamp end_of_day(const Date& date);

Date add_days(const Date& date, long long days);

/**
 * @brief ISO-8601 representation (YYYY-MM-DD)
 */
std::string to_string(const Date& date);

/**
 * @brief Parse an ISO-8601 date (YYYY-MM-DD)
 */
Result<Date> parse_date(const std::string& text);

/**
 * @brief English month name ("January"), empty for an invalid month
 */
std::string month_name(int month);

/**
 * @brief Short English month name ("Jan"), empty for an invalid month
 */
std::string month_abbreviation(int month);

}  // namespace ledger_ngin
