#include <anchorband/signal/signal_classifier.hpp>
#include <anchorband/core/atr.hpp>
#include <algorithm>
#include <cmath>
#include <set>

namespace anchorband::signal {

using core::AnchorRole;
using core::BandLevel;
using core::Side;
using core::SignalCategory;

AnchorSelection select_anchors(const std::vector<core::Date>& anchors,
                               const core::Date& today,
                               int recent_days) {
    AnchorSelection selection;
    if (anchors.empty()) {
        return selection;
    }

    const core::Date& latest = anchors[0];
    if (core::days_between(latest, today) > recent_days) {
        selection.current = latest;
        if (anchors.size() > 1) {
            selection.previous = anchors[1];
        }
        return selection;
    }

    selection.promoted = true;
    if (anchors.size() > 1) {
        selection.current = anchors[1];
    }
    return selection;
}

SignalClassifier::SignalClassifier(ClassifierConfiguration config) : config_(config) {}

std::vector<core::Signal> SignalClassifier::classify(const std::string& symbol,
                                                     const core::BarSeries& bars,
                                                     const core::Bands& bands,
                                                     AnchorRole role,
                                                     const SymbolSides& sides) const {
    std::vector<core::Signal> signals;
    if (bars.empty() || (!sides.is_long && !sides.is_short)) {
        return signals;
    }

    if (role == AnchorRole::CURRENT) {
        add_tiers(symbol, bars, bands, sides, signals);
        add_vwap_touches(symbol, bars, bands, sides, signals);
    }
    add_crossings(symbol, bars, bands, role, sides, signals);
    add_bounces(symbol, bars, bands, role, sides, signals);
    return signals;
}

std::optional<std::vector<core::Signal>> SignalClassifier::classify_anchor(const std::string& symbol,
                                                                           const core::BarSeries& bars,
                                                                           size_t anchor_index,
                                                                           AnchorRole role,
                                                                           const SymbolSides& sides) const {
    auto bands = core::compute_bands(bars, anchor_index);
    if (!bands) {
        return std::nullopt;
    }
    return classify(symbol, bars, *bands, role, sides);
}

void SignalClassifier::add_tiers(const std::string& symbol, const core::BarSeries& bars,
                                 const core::Bands& bands, const SymbolSides& sides,
                                 std::vector<core::Signal>& out) const {
    const core::DailyBar& last = bars.back();
    const std::string date = last.date.to_mmdd();
    const double close = last.close;

    if (sides.is_long) {
        if (close > bands.upper_3) {
            out.emplace_back(symbol, date, "UPPER_3", Side::LONG, SignalCategory::TIER3);
        } else if (close > bands.upper_2) {
            out.emplace_back(symbol, date, "UPPER_2", Side::LONG, SignalCategory::TIER2);
        } else if (close > bands.upper_1) {
            out.emplace_back(symbol, date, "UPPER_1", Side::LONG, SignalCategory::TIER1);
        }
    }

    if (sides.is_short) {
        if (close < bands.lower_3) {
            out.emplace_back(symbol, date, "LOWER_3", Side::SHORT, SignalCategory::TIER3);
        } else if (close < bands.lower_2) {
            out.emplace_back(symbol, date, "LOWER_2", Side::SHORT, SignalCategory::TIER2);
        } else if (close < bands.lower_1) {
            out.emplace_back(symbol, date, "LOWER_1", Side::SHORT, SignalCategory::TIER1);
        }
    }
}

void SignalClassifier::add_vwap_touches(const std::string& symbol, const core::BarSeries& bars,
                                        const core::Bands& bands, const SymbolSides& sides,
                                        std::vector<core::Signal>& out) const {
    // Last two distinct calendar dates, ascending
    std::set<core::Date> distinct;
    for (const auto& bar : bars) {
        distinct.insert(bar.date);
    }
    std::vector<core::Date> recent(distinct.begin(), distinct.end());
    if (recent.size() > 2) {
        recent.erase(recent.begin(), recent.end() - 2);
    }

    const Side side = sides.is_long ? Side::LONG : Side::SHORT;
    for (const auto& day : recent) {
        std::set<BandLevel> touched;
        for (const auto& bar : bars) {
            if (bar.date != day) {
                continue;
            }
            for (BandLevel level : core::kAllLevels) {
                double value = bands.level(level);
                if (std::isfinite(value) && bar.low <= value && value <= bar.high) {
                    touched.insert(level);
                }
            }
        }

        // Days touching VWAP and both first bands are not reported
        if (touched.count(BandLevel::VWAP) && touched.count(BandLevel::UPPER_1)
            && touched.count(BandLevel::LOWER_1)) {
            continue;
        }
        if (touched.count(BandLevel::VWAP)) {
            out.emplace_back(symbol, day.to_mmdd(), "VWAP", side, SignalCategory::VWAP_CROSS);
        }
    }
}

void SignalClassifier::add_crossings(const std::string& symbol, const core::BarSeries& bars,
                                     const core::Bands& bands, AnchorRole role, const SymbolSides& sides,
                                     std::vector<core::Signal>& out) const {
    if (bars.size() < 2) {
        return;
    }

    const bool previous = role == AnchorRole::PREVIOUS;
    const std::string prefix = previous ? "PREV_" : "";
    const std::string date = bars.back().date.to_mmdd();
    const double prev_close = bars[bars.size() - 2].close;
    const double curr_close = bars.back().close;

    if (sides.is_long) {
        for (int k = 1; k <= 3; ++k) {
            double level = bands.level(core::upper_band(k));
            if (std::isfinite(level) && prev_close <= level && level < curr_close) {
                out.emplace_back(symbol, date, prefix + "CROSS_UP_UPPER_" + std::to_string(k), Side::LONG,
                                 previous ? SignalCategory::PREV_CROSS_UP : SignalCategory::CROSS_UP);
            }
        }
    }

    if (sides.is_short) {
        for (int k = 1; k <= 3; ++k) {
            double level = bands.level(core::lower_band(k));
            if (std::isfinite(level) && prev_close >= level && level > curr_close) {
                out.emplace_back(symbol, date, prefix + "CROSS_DOWN_LOWER_" + std::to_string(k), Side::SHORT,
                                 previous ? SignalCategory::PREV_CROSS_DOWN : SignalCategory::CROSS_DOWN);
            }
        }
    }
}

void SignalClassifier::add_bounces(const std::string& symbol, const core::BarSeries& bars,
                                   const core::Bands& bands, AnchorRole role, const SymbolSides& sides,
                                   std::vector<core::Signal>& out) const {
    const auto& params = config_.bounce;
    if (bars.size() < static_cast<size_t>(params.atr_length) + 3) {
        return;
    }

    auto atr = core::compute_atr(bars, params.atr_length);
    if (!atr) {
        return;
    }

    const std::string date = bars.back().date.to_mmdd();

    if (role == AnchorRole::PREVIOUS) {
        if (sides.is_long && core::bounce_up(bars, bands.upper_1, atr, params)) {
            out.emplace_back(symbol, date, "PREV_BOUNCE_UPPER_1", Side::LONG, SignalCategory::PREV_BOUNCE_LONG);
        }
        if (sides.is_short && core::bounce_down(bars, bands.lower_1, atr, params)) {
            out.emplace_back(symbol, date, "PREV_BOUNCE_LOWER_1", Side::SHORT, SignalCategory::PREV_BOUNCE_SHORT);
        }
        return;
    }

    static const BandLevel long_levels[] = {
        BandLevel::LOWER_2, BandLevel::LOWER_1, BandLevel::VWAP, BandLevel::UPPER_1
    };
    static const BandLevel short_levels[] = {
        BandLevel::UPPER_2, BandLevel::UPPER_1, BandLevel::VWAP, BandLevel::LOWER_1
    };

    if (sides.is_long) {
        for (BandLevel level : long_levels) {
            if (core::bounce_up(bars, bands.level(level), atr, params)) {
                out.emplace_back(symbol, date, "BOUNCE_" + core::level_name(level), Side::LONG,
                                 SignalCategory::BOUNCE);
            }
        }
    }

    if (sides.is_short) {
        for (BandLevel level : short_levels) {
            if (core::bounce_down(bars, bands.level(level), atr, params)) {
                out.emplace_back(symbol, date, "BOUNCE_" + core::level_name(level), Side::SHORT,
                                 SignalCategory::BOUNCE);
            }
        }
    }
}

} // namespace anchorband::signal
