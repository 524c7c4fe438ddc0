#pragma once
#include <anchorband/core/daily_bar.hpp>
#include <optional>

namespace anchorband::core {

inline constexpr int kDefaultAtrLength = 20;

// Simple average of the trailing `length` True Range values.
// nullopt with fewer than length + 1 bars or a non-positive result.
std::optional<double> compute_atr(const BarSeries& bars, int length = kDefaultAtrLength);

} // namespace anchorband::core
