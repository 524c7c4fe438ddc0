#include <anchorband/core/bands.hpp>
#include <cmath>
#include <stdexcept>

namespace anchorband::core {

std::string level_name(BandLevel level) {
    switch (level) {
        case BandLevel::VWAP:    return "VWAP";
        case BandLevel::UPPER_1: return "UPPER_1";
        case BandLevel::UPPER_2: return "UPPER_2";
        case BandLevel::UPPER_3: return "UPPER_3";
        case BandLevel::LOWER_1: return "LOWER_1";
        case BandLevel::LOWER_2: return "LOWER_2";
        case BandLevel::LOWER_3: return "LOWER_3";
    }
    return "VWAP";
}

BandLevel upper_band(int k) {
    switch (k) {
        case 1: return BandLevel::UPPER_1;
        case 2: return BandLevel::UPPER_2;
        case 3: return BandLevel::UPPER_3;
        default: throw std::out_of_range("band multiple must be 1, 2 or 3");
    }
}

BandLevel lower_band(int k) {
    switch (k) {
        case 1: return BandLevel::LOWER_1;
        case 2: return BandLevel::LOWER_2;
        case 3: return BandLevel::LOWER_3;
        default: throw std::out_of_range("band multiple must be 1, 2 or 3");
    }
}

Bands::Bands(double vwap_value, double stdev_value)
    : vwap(vwap_value),
      stdev(stdev_value),
      upper_1(vwap_value + stdev_value),
      upper_2(vwap_value + 2.0 * stdev_value),
      upper_3(vwap_value + 3.0 * stdev_value),
      lower_1(vwap_value - stdev_value),
      lower_2(vwap_value - 2.0 * stdev_value),
      lower_3(vwap_value - 3.0 * stdev_value) {}

double Bands::level(BandLevel which) const {
    switch (which) {
        case BandLevel::VWAP:    return vwap;
        case BandLevel::UPPER_1: return upper_1;
        case BandLevel::UPPER_2: return upper_2;
        case BandLevel::UPPER_3: return upper_3;
        case BandLevel::LOWER_1: return lower_1;
        case BandLevel::LOWER_2: return lower_2;
        case BandLevel::LOWER_3: return lower_3;
    }
    return vwap;
}

std::optional<Bands> compute_bands(const BarSeries& bars, size_t anchor_index) {
    double cum_volume = 0.0;
    double cum_vp = 0.0;
    double cum_sd = 0.0;

    for (size_t i = anchor_index; i < bars.size(); ++i) {
        const DailyBar& bar = bars[i];
        if (!(bar.volume > 0.0)) {
            continue;
        }
        double tp = bar.typical_price();
        cum_volume += bar.volume;
        cum_vp += tp * bar.volume;
        double running_vwap = cum_vp / cum_volume;
        double deviation = tp - running_vwap;
        cum_sd += deviation * deviation * bar.volume;
    }

    if (cum_volume == 0.0) {
        return std::nullopt;
    }

    double vwap = cum_vp / cum_volume;
    double stdev = std::sqrt(cum_sd / cum_volume);
    if (!std::isfinite(vwap) || !std::isfinite(stdev)) {
        return std::nullopt;
    }
    return Bands(vwap, stdev);
}

} // namespace anchorband::core
