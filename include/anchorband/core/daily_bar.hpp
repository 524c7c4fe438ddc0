#pragma once
#include <anchorband/core/date.hpp>
#include <cstddef>
#include <optional>
#include <vector>

namespace anchorband::core {

struct DailyBar {
    Date date;
    double open;
    double high;
    double low;
    double close;
    double volume;

    DailyBar();

    DailyBar(const Date& d, double o, double h, double l, double c, double v);

    // (open + high + low + close) / 4
    double typical_price() const;
};

using BarSeries = std::vector<DailyBar>;

// Sorts ascending by date and keeps the first row seen for a duplicated date
BarSeries normalize_series(BarSeries bars);

// Index of the bar dated exactly `anchor`, if any
std::optional<size_t> find_anchor_index(const BarSeries& bars, const Date& anchor);

} // namespace anchorband::core
