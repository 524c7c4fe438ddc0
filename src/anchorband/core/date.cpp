#include <anchorband/core/date.hpp>
#include <chrono>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace anchorband::core {

namespace {

int days_in_month(int y, int m) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2) {
        bool leap = (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
        return leap ? 29 : 28;
    }
    return days[m - 1];
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

} // namespace

Date::Date(int y, int m, int d) : year(y), month(m), day(d) {}

bool Date::is_valid(int y, int m, int d) {
    if (y < 1 || m < 1 || m > 12 || d < 1) {
        return false;
    }
    return d <= days_in_month(y, m);
}

std::optional<Date> Date::parse(const std::string& raw) {
    auto first = raw.find_first_not_of(" \t\"");
    if (first == std::string::npos) {
        return std::nullopt;
    }
    std::string text = raw.substr(first);

    int y = 0;
    int m = 0;
    int d = 0;
    size_t consumed = 0;

    if (all_digits(text, 0, 4) && text.size() >= 10 && text[4] == '-' && text[7] == '-'
        && all_digits(text, 5, 2) && all_digits(text, 8, 2)) {
        y = std::stoi(text.substr(0, 4));
        m = std::stoi(text.substr(5, 2));
        d = std::stoi(text.substr(8, 2));
        consumed = 10;
    } else if (all_digits(text, 0, 8)) {
        y = std::stoi(text.substr(0, 4));
        m = std::stoi(text.substr(4, 2));
        d = std::stoi(text.substr(6, 2));
        consumed = 8;
    } else {
        return std::nullopt;
    }

    // Anything after the date must be a time part
    if (consumed < text.size()) {
        char sep = text[consumed];
        if (sep != 'T' && sep != ' ' && sep != '"') {
            return std::nullopt;
        }
    }

    if (!is_valid(y, m, d)) {
        return std::nullopt;
    }
    return Date(y, m, d);
}

// Civil-from-days / days-from-civil, proleptic Gregorian
int64_t Date::days_since_epoch() const {
    int64_t y = year - (month <= 2 ? 1 : 0);
    int64_t era = (y >= 0 ? y : y - 399) / 400;
    int64_t yoe = y - era * 400;
    int64_t mp = (month + 9) % 12;
    int64_t doy = (153 * mp + 2) / 5 + day - 1;
    int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

Date Date::from_days(int64_t z) {
    z += 719468;
    int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    int64_t doe = z - era * 146097;
    int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    int64_t y = yoe + era * 400;
    int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    int64_t mp = (5 * doy + 2) / 153;
    int64_t d = doy - (153 * mp + 2) / 5 + 1;
    int64_t m = mp < 10 ? mp + 3 : mp - 9;
    return Date(static_cast<int>(m <= 2 ? y + 1 : y), static_cast<int>(m), static_cast<int>(d));
}

Date Date::today() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local_tm{};
    localtime_r(&now, &local_tm);
    return Date(local_tm.tm_year + 1900, local_tm.tm_mon + 1, local_tm.tm_mday);
}

Date Date::add_days(int64_t days) const {
    return from_days(days_since_epoch() + days);
}

std::string Date::to_iso() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << year << '-'
        << std::setw(2) << month << '-' << std::setw(2) << day;
    return oss.str();
}

std::string Date::to_mmdd() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << month << '/' << std::setw(2) << day;
    return oss.str();
}

int64_t days_between(const Date& a, const Date& b) {
    return b.days_since_epoch() - a.days_since_epoch();
}

bool operator==(const Date& a, const Date& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}

bool operator!=(const Date& a, const Date& b) { return !(a == b); }

bool operator<(const Date& a, const Date& b) {
    if (a.year != b.year) return a.year < b.year;
    if (a.month != b.month) return a.month < b.month;
    return a.day < b.day;
}

bool operator<=(const Date& a, const Date& b) { return !(b < a); }
bool operator>(const Date& a, const Date& b) { return b < a; }
bool operator>=(const Date& a, const Date& b) { return !(a < b); }

std::ostream& operator<<(std::ostream& os, const Date& date) {
    return os << date.to_iso();
}

} // namespace anchorband::core
