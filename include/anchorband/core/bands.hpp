#pragma once
#include <anchorband/core/daily_bar.hpp>
#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace anchorband::core {

enum class BandLevel {
    VWAP,
    UPPER_1,
    UPPER_2,
    UPPER_3,
    LOWER_1,
    LOWER_2,
    LOWER_3
};

inline constexpr std::array<BandLevel, 7> kAllLevels = {
    BandLevel::VWAP,
    BandLevel::UPPER_1, BandLevel::LOWER_1,
    BandLevel::UPPER_2, BandLevel::LOWER_2,
    BandLevel::UPPER_3, BandLevel::LOWER_3
};

std::string level_name(BandLevel level);

// UPPER_k / LOWER_k for k in 1..3
BandLevel upper_band(int k);
BandLevel lower_band(int k);

// Anchored VWAP with +/-1/2/3 standard deviation bands
struct Bands {
    double vwap = 0.0;
    double stdev = 0.0;
    double upper_1 = 0.0;
    double upper_2 = 0.0;
    double upper_3 = 0.0;
    double lower_1 = 0.0;
    double lower_2 = 0.0;
    double lower_3 = 0.0;

    Bands() = default;
    Bands(double vwap_value, double stdev_value);

    double level(BandLevel which) const;
};

// Single forward pass from anchor_index to the end of the series.
// Variance accumulates against the running VWAP at each bar, not the final one.
// Bars with volume <= 0 are skipped. Returns nullopt when no volume accumulated
// or the anchor lies past the end of the series.
std::optional<Bands> compute_bands(const BarSeries& bars, size_t anchor_index);

} // namespace anchorband::core
