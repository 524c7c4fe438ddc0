#pragma once
#include <anchorband/core/atr.hpp>
#include <anchorband/core/daily_bar.hpp>
#include <optional>

namespace anchorband::core {

struct BounceParameters {
    int atr_length = kDefaultAtrLength;
    double atr_mult = 0.05;  // touch tolerance and confirmation push, in ATRs
};

// Three-bar pattern on the last bars A, B, C (A unused):
//   B.low <= level + eps, B.close >= level, C.close > B.close, C.close >= level + push
bool bounce_up(const BarSeries& bars, double level, std::optional<double> atr,
               const BounceParameters& params = BounceParameters());

// Mirror of bounce_up: B.high touches from below, B.close rejects, C confirms lower
bool bounce_down(const BarSeries& bars, double level, std::optional<double> atr,
                 const BounceParameters& params = BounceParameters());

} // namespace anchorband::core
