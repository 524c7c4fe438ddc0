#include <anchorband/core/bounce.hpp>
#include <cmath>

namespace anchorband::core {

namespace {

bool pattern_inputs_valid(const BarSeries& bars, double level, const std::optional<double>& atr,
                          const BounceParameters& params) {
    if (!atr || !std::isfinite(*atr) || *atr <= 0.0 || !std::isfinite(level)) {
        return false;
    }
    if (params.atr_length < 0) {
        return false;
    }
    return bars.size() >= static_cast<size_t>(params.atr_length) + 3;
}

} // namespace

bool bounce_up(const BarSeries& bars, double level, std::optional<double> atr,
               const BounceParameters& params) {
    if (!pattern_inputs_valid(bars, level, atr, params)) {
        return false;
    }

    double eps = params.atr_mult * *atr;
    double push = params.atr_mult * *atr;

    const DailyBar& b = bars[bars.size() - 2];
    const DailyBar& c = bars[bars.size() - 1];

    bool touched = b.low <= level + eps;
    bool reclaimed = b.close >= level;
    bool confirmed = c.close > b.close && c.close >= level + push;
    return touched && reclaimed && confirmed;
}

bool bounce_down(const BarSeries& bars, double level, std::optional<double> atr,
                 const BounceParameters& params) {
    if (!pattern_inputs_valid(bars, level, atr, params)) {
        return false;
    }

    double eps = params.atr_mult * *atr;
    double push = params.atr_mult * *atr;

    const DailyBar& b = bars[bars.size() - 2];
    const DailyBar& c = bars[bars.size() - 1];

    bool touched = b.high >= level - eps;
    bool rejected = b.close <= level;
    bool confirmed = c.close < b.close && c.close <= level - push;
    return touched && rejected && confirmed;
}

} // namespace anchorband::core
