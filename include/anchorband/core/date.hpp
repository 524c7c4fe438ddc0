#pragma once
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>

namespace anchorband::core {

// Calendar date without time zone. Ordering follows the calendar.
struct Date {
    int year = 1970;
    int month = 1;
    int day = 1;

    Date() = default;
    Date(int y, int m, int d);

    // Accepts YYYY-MM-DD, YYYYMMDD and either form followed by a time part
    static std::optional<Date> parse(const std::string& text);
    static Date from_days(int64_t days_since_epoch);
    static Date today();

    int64_t days_since_epoch() const;
    Date add_days(int64_t days) const;

    std::string to_iso() const;   // 2024-01-05
    std::string to_mmdd() const;  // 01/05

    static bool is_valid(int y, int m, int d);
};

// b - a in calendar days
int64_t days_between(const Date& a, const Date& b);

bool operator==(const Date& a, const Date& b);
bool operator!=(const Date& a, const Date& b);
bool operator<(const Date& a, const Date& b);
bool operator<=(const Date& a, const Date& b);
bool operator>(const Date& a, const Date& b);
bool operator>=(const Date& a, const Date& b);

std::ostream& operator<<(std::ostream& os, const Date& date);

} // namespace anchorband::core
