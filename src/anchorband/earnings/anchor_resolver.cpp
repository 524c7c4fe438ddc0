#include <anchorband/earnings/anchor_resolver.hpp>
#include <anchorband/utils/logger.hpp>
#include <algorithm>
#include <cctype>
#include <exception>
#include <functional>
#include <thread>

namespace anchorband::earnings {

namespace {

std::string upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

} // namespace

AnchorResolver::AnchorResolver(CalendarSource& source, ResolverConfiguration config)
    : AnchorResolver(source, config, [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {}

AnchorResolver::AnchorResolver(CalendarSource& source, ResolverConfiguration config, Sleeper sleeper)
    : source_(source), config_(config), sleeper_(std::move(sleeper)) {}

void AnchorResolver::throttle() {
    if (requested_before_ && config_.throttle.count() > 0 && sleeper_) {
        sleeper_(config_.throttle);
    }
    requested_before_ = true;
}

std::vector<CalendarRow> AnchorResolver::fetch_rows(const core::Date& date) {
    throttle();
    try {
        return source_.earnings_on(date);
    } catch (const std::exception& e) {
        utils::Logger::warn() << "Failed to fetch earnings for " << date << ": " << e.what() << utils::Logger::endl;
        return {};
    }
}

std::vector<core::Date> AnchorResolver::fetch_history(const std::string& symbol) {
    try {
        return source_.earnings_history(symbol, config_.fallback_history_limit);
    } catch (const std::exception& e) {
        utils::Logger::warn() << "Earnings history lookup failed for " << symbol << ": " << e.what()
                              << utils::Logger::endl;
        return {};
    }
}

SymbolDates AnchorResolver::collect_calendar_dates(const std::vector<std::string>& symbols,
                                                   const core::Date& today) {
    SymbolDates results;
    for (const auto& s : symbols) {
        results[upper(s)];
    }
    if (results.empty()) {
        return results;
    }

    for (int delta = 0; delta < config_.max_lookback_days; ++delta) {
        core::Date query_date = today.add_days(-delta);
        if (delta % 15 == 0) {
            utils::Logger::debug() << "Checking " << query_date << " (back " << delta << " days)" << utils::Logger::endl;
        }

        std::vector<CalendarRow> rows = fetch_rows(query_date);
        for (const auto& row : rows) {
            auto it = results.find(upper(row.symbol));
            if (it == results.end()) {
                continue;
            }
            auto& dates = it->second;
            if (std::find(dates.begin(), dates.end(), query_date) == dates.end()) {
                dates.push_back(query_date);
            }
        }

        bool all_found = std::all_of(results.begin(), results.end(),
            [this](const auto& entry) { return entry.second.size() >= config_.min_count; });
        if (all_found) {
            utils::Logger::info() << "Collected " << config_.min_count << "+ dates for all symbols after "
                                  << (delta + 1) << " days; stopping scan" << utils::Logger::endl;
            break;
        }
    }

    for (auto& [symbol, dates] : results) {
        dates.erase(std::remove_if(dates.begin(), dates.end(),
                                   [&today](const core::Date& d) { return d > today; }),
                    dates.end());
        std::sort(dates.begin(), dates.end(), std::greater<core::Date>());
    }
    return results;
}

std::vector<core::Date> AnchorResolver::resolve(const std::string& symbol,
                                                AnchorCache& cache,
                                                const std::vector<core::Date>& candidates,
                                                const core::Date& today) {
    AnchorSet merged = cache.get(symbol).up_to(today);

    std::vector<core::Date> past_candidates;
    for (const auto& d : candidates) {
        if (d <= today) {
            past_candidates.push_back(d);
        }
    }
    merged = merged.merged_with(past_candidates);

    if (merged.size() < config_.min_count) {
        std::vector<core::Date> history;
        for (const auto& d : fetch_history(symbol)) {
            if (d <= today) {
                history.push_back(d);
            }
        }
        if (!history.empty()) {
            utils::Logger::debug() << symbol << ": history fallback returned " << history.size() << " dates"
                                   << utils::Logger::endl;
        }
        merged = merged.merged_with(history);
    }

    if (!merged.empty()) {
        cache.put(symbol, merged);
    }

    return merged.most_recent(config_.min_count);
}

SymbolDates AnchorResolver::resolve_all(const std::vector<std::string>& symbols,
                                        AnchorCache& cache,
                                        const core::Date& today) {
    std::vector<std::string> missing;
    for (const auto& s : symbols) {
        if (!cache.contains(s)) {
            utils::Logger::debug() << s << ": no cached anchors" << utils::Logger::endl;
            missing.push_back(s);
        } else if (cache.get(s).up_to(today).size() < config_.min_count) {
            utils::Logger::debug() << s << ": fewer than " << config_.min_count << " cached anchors"
                                   << utils::Logger::endl;
            missing.push_back(s);
        }
    }

    SymbolDates scanned;
    if (!missing.empty()) {
        utils::Logger::info() << "Fetching calendar earnings for " << missing.size() << " symbols" << utils::Logger::endl;
        scanned = collect_calendar_dates(missing, today);
    }

    SymbolDates anchors;
    for (const auto& s : symbols) {
        auto it = scanned.find(upper(s));
        static const std::vector<core::Date> none;
        anchors[s] = resolve(s, cache, it != scanned.end() ? it->second : none, today);
    }
    return anchors;
}

} // namespace anchorband::earnings
