#include <anchorband/runner/run_orchestrator.hpp>
#include <anchorband/earnings/anchor_cache.hpp>
#include <anchorband/earnings/anchor_resolver.hpp>
#include <anchorband/signal/signal_classifier.hpp>
#include <anchorband/signal/signal_log.hpp>
#include <anchorband/utils/logger.hpp>
#include <algorithm>
#include <cstdint>
#include <chrono>
#include <exception>
#include <sstream>
#include <thread>
#include <utility>

namespace anchorband::runner {

namespace {

const char* side_label(bool is_long, bool is_short) {
    if (is_long) {
        return "LONG";
    }
    return is_short ? "SHORT" : "NA";
}

const core::SignalCategory kAllCategories[] = {
    core::SignalCategory::TIER3,
    core::SignalCategory::TIER2,
    core::SignalCategory::TIER1,
    core::SignalCategory::VWAP_CROSS,
    core::SignalCategory::CROSS_UP,
    core::SignalCategory::CROSS_DOWN,
    core::SignalCategory::BOUNCE,
    core::SignalCategory::PREV_BOUNCE_LONG,
    core::SignalCategory::PREV_BOUNCE_SHORT,
    core::SignalCategory::PREV_CROSS_UP,
    core::SignalCategory::PREV_CROSS_DOWN
};

} // namespace

RunOrchestrator::RunOrchestrator(RunnerConfiguration config,
                                 data::BarSource& bars,
                                 earnings::CalendarSource& calendar,
                                 Clock clock)
    : config_(std::move(config)),
      bars_(bars),
      calendar_(calendar),
      clock_(clock ? std::move(clock) : Clock([]() { return core::Date::today(); })) {}

RunSummary RunOrchestrator::run_once() {
    RunSummary summary;
    book_.clear();

    Watchlist watchlist(load_tickers(config_.longs_file), load_tickers(config_.shorts_file));
    std::vector<std::string> symbols = watchlist.symbols();
    if (symbols.empty()) {
        throw TickerListError("No symbols found in " + config_.longs_file + " or " + config_.shorts_file);
    }
    summary.symbols = symbols.size();

    const core::Date today = clock_();

    earnings::AnchorCache cache(config_.cache_file);
    cache.load();

    earnings::AnchorResolver resolver(calendar_, config_.resolver);
    earnings::SymbolDates anchors = resolver.resolve_all(symbols, cache, today);

    for (const auto& symbol : symbols) {
        bool analyzed = false;
        try {
            analyzed = process_symbol(symbol, watchlist, anchors[symbol], today);
        } catch (const std::exception& e) {
            utils::Logger::error() << symbol << ": " << e.what() << utils::Logger::endl;
        }
        if (analyzed) {
            ++summary.analyzed;
        } else {
            ++summary.skipped;
        }
    }

    summary.signals = book_.total();

    signal::SignalLogWriter writer(config_.output_file);
    summary.log_written = writer.write(book_);
    summary.cache_saved = cache.save();

    log_summary(summary);
    utils::Logger::info() << "Run complete. Log: " << config_.output_file << ", Cache: " << config_.cache_file
                          << utils::Logger::endl;
    return summary;
}

bool RunOrchestrator::process_symbol(const std::string& symbol,
                                     const Watchlist& watchlist,
                                     const std::vector<core::Date>& anchors,
                                     const core::Date& today) {
    signal::SymbolSides sides;
    sides.is_long = watchlist.is_long(symbol);
    sides.is_short = watchlist.is_short(symbol);
    utils::Logger::info() << "-> Processing " << symbol << " (" << side_label(sides.is_long, sides.is_short) << ")"
                          << utils::Logger::endl;

    if (anchors.empty()) {
        utils::Logger::warn() << "No earnings anchors for " << symbol << utils::Logger::endl;
        return false;
    }

    signal::AnchorSelection selection = signal::select_anchors(anchors, today, config_.recent_days);
    if (selection.promoted) {
        utils::Logger::info() << symbol << ": skipping most recent earnings " << anchors.front()
                              << " (<=" << config_.recent_days << "d); using previous anchor"
                              << utils::Logger::endl;
    }

    std::vector<std::pair<core::Date, core::AnchorRole>> relevant;
    if (selection.current) {
        relevant.emplace_back(*selection.current, core::AnchorRole::CURRENT);
    }
    if (selection.previous) {
        relevant.emplace_back(*selection.previous, core::AnchorRole::PREVIOUS);
    }
    if (relevant.empty()) {
        utils::Logger::warn() << symbol << ": no eligible anchors after recency filter" << utils::Logger::endl;
        return false;
    }

    core::Date earliest = relevant.front().first;
    for (const auto& entry : relevant) {
        earliest = std::min(earliest, entry.first);
    }
    const int atr_length = config_.classifier.bounce.atr_length;
    const int lookback = static_cast<int>(
        std::max<int64_t>(atr_length + 3, core::days_between(earliest, today) + 3));

    core::BarSeries bars;
    try {
        bars = core::normalize_series(bars_.fetch_daily_bars(symbol, lookback));
    } catch (const std::exception& e) {
        utils::Logger::warn() << "Bar request failed for " << symbol << ": " << e.what() << utils::Logger::endl;
        return false;
    }
    if (bars.empty()) {
        utils::Logger::warn() << "No price data for " << symbol << utils::Logger::endl;
        return false;
    }

    signal::SignalClassifier classifier(config_.classifier);
    bool analyzed = false;

    for (const auto& [anchor, role] : relevant) {
        auto index = core::find_anchor_index(bars, anchor);
        if (!index) {
            utils::Logger::warn() << symbol << ": no candle on earnings date " << anchor << utils::Logger::endl;
            continue;
        }
        if (bars.size() - *index < 3) {
            utils::Logger::warn() << symbol << ": not enough bars after anchor " << anchor << utils::Logger::endl;
            continue;
        }

        auto signals = classifier.classify_anchor(symbol, bars, *index, role, sides);
        if (!signals) {
            utils::Logger::warn() << symbol << ": bands undefined for anchor " << anchor << utils::Logger::endl;
            continue;
        }

        if (utils::Logger::level() == utils::LogLevel::DEBUG) {
            for (const auto& s : *signals) {
                utils::Logger::debug() << "   " << s.to_line() << " [" << core::category_name(s.category) << "]"
                                       << utils::Logger::endl;
            }
            utils::Logger::debug() << symbol << ": " << signals->size() << " signals from "
                                   << (role == core::AnchorRole::CURRENT ? "current" : "previous") << " anchor "
                                   << anchor << utils::Logger::endl;
        }
        book_.add_all(*signals);
        analyzed = true;
    }

    return analyzed;
}

void RunOrchestrator::log_summary(const RunSummary& summary) const {
    std::ostringstream counts;
    bool first = true;
    for (auto category : kAllCategories) {
        size_t n = book_.count(category);
        if (n == 0) {
            continue;
        }
        counts << (first ? "" : ", ") << core::category_name(category) << "=" << n;
        first = false;
    }

    utils::Logger::info() << "Run summary: " << summary.symbols << " symbols, " << summary.analyzed
                          << " analyzed, " << summary.skipped << " skipped, " << summary.signals << " signals"
                          << (first ? "" : " (" + counts.str() + ")") << utils::Logger::endl;
}

void RunOrchestrator::run_loop(const std::atomic<bool>& stop) {
    using clock = std::chrono::steady_clock;

    while (!stop) {
        try {
            run_once();
        } catch (const TickerListError& e) {
            utils::Logger::error() << "Run aborted: " << e.what() << utils::Logger::endl;
        } catch (const std::exception& e) {
            utils::Logger::error() << "Run failed: " << e.what() << utils::Logger::endl;
        }

        if (stop) {
            break;
        }

        utils::Logger::info() << "Sleeping " << (config_.fetch_interval.count() / 60) << "m" << utils::Logger::endl;
        const auto wake = clock::now() + config_.fetch_interval;
        while (!stop && clock::now() < wake) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(wake - clock::now());
            std::this_thread::sleep_for(std::min(remaining, std::chrono::milliseconds(200)));
        }
    }

    utils::Logger::info() << "Stop requested; leaving run loop" << utils::Logger::endl;
}

} // namespace anchorband::runner
