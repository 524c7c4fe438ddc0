#include <anchorband/core/atr.hpp>
#include <algorithm>
#include <cmath>

namespace anchorband::core {

std::optional<double> compute_atr(const BarSeries& bars, int length) {
    if (length <= 0 || bars.size() < static_cast<size_t>(length) + 1) {
        return std::nullopt;
    }

    // Only the trailing window contributes; TR for bar i needs bar i-1
    size_t first = bars.size() - static_cast<size_t>(length);
    double true_range_sum = 0.0;
    for (size_t i = first; i < bars.size(); ++i) {
        double prev_close = bars[i - 1].close;
        double true_range = std::max({bars[i].high - bars[i].low,
                                      std::abs(bars[i].high - prev_close),
                                      std::abs(bars[i].low - prev_close)});
        true_range_sum += true_range;
    }

    double atr = true_range_sum / length;
    if (!std::isfinite(atr) || atr <= 0.0) {
        return std::nullopt;
    }
    return atr;
}

} // namespace anchorband::core
