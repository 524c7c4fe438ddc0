#include <anchorband/core/daily_bar.hpp>
#include <algorithm>

namespace anchorband::core {

DailyBar::DailyBar()
    : open(0.0), high(0.0), low(0.0), close(0.0), volume(0.0) {}

DailyBar::DailyBar(const Date& d, double o, double h, double l, double c, double v)
    : date(d), open(o), high(h), low(l), close(c), volume(v) {}

double DailyBar::typical_price() const {
    return (open + high + low + close) / 4.0;
}

BarSeries normalize_series(BarSeries bars) {
    std::stable_sort(bars.begin(), bars.end(),
                     [](const DailyBar& a, const DailyBar& b) { return a.date < b.date; });

    auto last = std::unique(bars.begin(), bars.end(),
                            [](const DailyBar& a, const DailyBar& b) { return a.date == b.date; });
    bars.erase(last, bars.end());
    return bars;
}

std::optional<size_t> find_anchor_index(const BarSeries& bars, const Date& anchor) {
    for (size_t i = 0; i < bars.size(); ++i) {
        if (bars[i].date == anchor) {
            return i;
        }
    }
    return std::nullopt;
}

} // namespace anchorband::core
