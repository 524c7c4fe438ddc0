#pragma once
#include <anchorband/core/date.hpp>
#include <anchorband/earnings/anchor_cache.hpp>
#include <anchorband/earnings/calendar_source.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace anchorband::earnings {

struct ResolverConfiguration {
    size_t min_count = 2;
    int max_lookback_days = 250;
    std::chrono::milliseconds throttle{1000};
    int fallback_history_limit = 8;
};

using SymbolDates = std::map<std::string, std::vector<core::Date>>;

class AnchorResolver {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    AnchorResolver(CalendarSource& source, ResolverConfiguration config);
    AnchorResolver(CalendarSource& source, ResolverConfiguration config, Sleeper sleeper);

    // Walks back day by day from `today` asking the calendar who reported.
    // Stops once every symbol holds min_count dates or the lookback is spent.
    SymbolDates collect_calendar_dates(const std::vector<std::string>& symbols, const core::Date& today);

    // Cache, then scanned candidates, then the per-symbol history fallback.
    // Rewrites the cache entry whenever anything was found.
    std::vector<core::Date> resolve(const std::string& symbol,
                                    AnchorCache& cache,
                                    const std::vector<core::Date>& candidates,
                                    const core::Date& today);

    // Scans the calendar only for symbols the cache cannot already serve
    SymbolDates resolve_all(const std::vector<std::string>& symbols,
                            AnchorCache& cache,
                            const core::Date& today);

    const ResolverConfiguration& config() const { return config_; }

private:
    std::vector<CalendarRow> fetch_rows(const core::Date& date);
    std::vector<core::Date> fetch_history(const std::string& symbol);
    void throttle();

    CalendarSource& source_;
    ResolverConfiguration config_;
    Sleeper sleeper_;
    bool requested_before_ = false;
};

} // namespace anchorband::earnings
