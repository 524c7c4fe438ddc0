#pragma once
#include <anchorband/core/date.hpp>
#include <anchorband/data/bar_source.hpp>
#include <anchorband/earnings/calendar_source.hpp>
#include <anchorband/runner/runner_config.hpp>
#include <anchorband/runner/ticker_list.hpp>
#include <anchorband/signal/signal_book.hpp>
#include <atomic>
#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace anchorband {
namespace runner {

// Neither ticker list produced a symbol
class TickerListError : public std::runtime_error {
public:
    explicit TickerListError(const std::string& what) : std::runtime_error(what) {}
};

struct RunSummary {
    size_t symbols = 0;
    size_t analyzed = 0;   // symbols with at least one anchor classified
    size_t skipped = 0;
    size_t signals = 0;
    bool log_written = false;
    bool cache_saved = false;
};

class RunOrchestrator {
public:
    using Clock = std::function<core::Date()>;

    RunOrchestrator(RunnerConfiguration config,
                    data::BarSource& bars,
                    earnings::CalendarSource& calendar,
                    Clock clock = Clock());

    // One full pass over the watchlist. Throws TickerListError when both lists are empty.
    RunSummary run_once();

    // run_once() every fetch_interval until `stop` is set. Failed runs are
    // logged and retried on the next interval.
    void run_loop(const std::atomic<bool>& stop);

    // Signals from the most recent run
    const signal::SignalBook& book() const { return book_; }

    const RunnerConfiguration& config() const { return config_; }

private:
    // true when at least one anchor of `symbol` was classified
    bool process_symbol(const std::string& symbol,
                        const Watchlist& watchlist,
                        const std::vector<core::Date>& anchors,
                        const core::Date& today);

    void log_summary(const RunSummary& summary) const;

    RunnerConfiguration config_;
    data::BarSource& bars_;
    earnings::CalendarSource& calendar_;
    Clock clock_;
    signal::SignalBook book_;
};

} // namespace runner
} // namespace anchorband
