#pragma once
#include <anchorband/core/date.hpp>
#include <string>
#include <vector>

namespace anchorband {
namespace earnings {

struct CalendarRow {
    std::string symbol;
};

// Earnings calendar collaborator. Implementations may throw on transport or
// parse failures; callers treat any failure as an empty answer.
class CalendarSource {
public:
    virtual ~CalendarSource() = default;

    // Every company reporting on `date`
    virtual std::vector<CalendarRow> earnings_on(const core::Date& date) = 0;

    // Past report dates for one symbol, used when the date scan comes up short
    virtual std::vector<core::Date> earnings_history(const std::string& symbol, int limit) = 0;
};

} // namespace earnings
} // namespace anchorband
