#include <anchorband/data/gateway_sources.hpp>
#include <anchorband/utils/logger.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <optional>

namespace anchorband::data {

namespace {

std::optional<double> number_field(const nlohmann::json& row, const char* key) {
    auto it = row.find(key);
    if (it == row.end()) {
        return std::nullopt;
    }
    if (it->is_number()) {
        double value = it->get<double>();
        if (std::isfinite(value)) {
            return value;
        }
        return std::nullopt;
    }
    if (it->is_string()) {
        double value = 0.0;
        try {
            value = std::stod(it->get<std::string>());
        } catch (const std::exception&) {
            return std::nullopt;
        }
        if (std::isfinite(value)) {
            return value;
        }
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<core::Date> date_field(const nlohmann::json& value) {
    if (value.is_string()) {
        return core::Date::parse(value.get<std::string>());
    }
    if (value.is_number_integer()) {
        return core::Date::parse(std::to_string(value.get<int64_t>()));
    }
    return std::nullopt;
}

} // namespace

GatewayBarSource::GatewayBarSource(GatewayClient& client) : client_(client) {}

core::BarSeries GatewayBarSource::parse_bar_rows(const nlohmann::json& rows) {
    core::BarSeries bars;
    if (!rows.is_array()) {
        return bars;
    }

    size_t skipped = 0;
    for (const auto& row : rows) {
        if (!row.is_object() || !row.contains("date")) {
            ++skipped;
            continue;
        }
        auto date = date_field(row["date"]);
        auto open = number_field(row, "open");
        auto high = number_field(row, "high");
        auto low = number_field(row, "low");
        auto close = number_field(row, "close");
        auto volume = number_field(row, "volume");
        if (!date || !open || !high || !low || !close || !volume) {
            ++skipped;
            continue;
        }
        bars.emplace_back(*date, *open, *high, *low, *close, *volume);
    }

    if (skipped > 0) {
        utils::Logger::debug() << "Skipped " << skipped << " malformed bar rows" << utils::Logger::endl;
    }
    return core::normalize_series(std::move(bars));
}

core::BarSeries GatewayBarSource::fetch_daily_bars(const std::string& symbol, int lookback_days) {
    nlohmann::json params = {
        {"symbol", symbol},
        {"duration", GatewayClient::duration_for_days(lookback_days)},
        {"bar_size", "1 day"},
        {"what_to_show", "TRADES"},
        {"use_rth", true}
    };

    auto rows = client_.request("daily_bars", std::move(params));
    if (!rows) {
        utils::Logger::warn() << "No bars received for " << symbol << utils::Logger::endl;
        return {};
    }
    return parse_bar_rows(*rows);
}

GatewayCalendarSource::GatewayCalendarSource(GatewayClient& client) : client_(client) {}

std::vector<earnings::CalendarRow> GatewayCalendarSource::parse_calendar_rows(const nlohmann::json& rows) {
    std::vector<earnings::CalendarRow> result;
    if (!rows.is_array()) {
        return result;
    }
    for (const auto& row : rows) {
        std::string symbol;
        if (row.is_string()) {
            symbol = row.get<std::string>();
        } else if (row.is_object()) {
            auto it = row.find("symbol");
            if (it != row.end() && it->is_string()) {
                symbol = it->get<std::string>();
            }
        }
        if (symbol.empty()) {
            continue;
        }
        std::transform(symbol.begin(), symbol.end(), symbol.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        result.push_back(earnings::CalendarRow{symbol});
    }
    return result;
}

std::vector<core::Date> GatewayCalendarSource::parse_history_rows(const nlohmann::json& rows) {
    std::vector<core::Date> result;
    if (!rows.is_array()) {
        return result;
    }
    for (const auto& row : rows) {
        std::optional<core::Date> date;
        if (row.is_object()) {
            auto it = row.find("date");
            if (it != row.end()) {
                date = date_field(*it);
            }
        } else {
            date = date_field(row);
        }
        if (date) {
            result.push_back(*date);
        }
    }
    return result;
}

std::vector<earnings::CalendarRow> GatewayCalendarSource::earnings_on(const core::Date& date) {
    auto rows = client_.request("earnings_by_date", {{"date", date.to_iso()}});
    if (!rows) {
        return {};
    }
    return parse_calendar_rows(*rows);
}

std::vector<core::Date> GatewayCalendarSource::earnings_history(const std::string& symbol, int limit) {
    auto rows = client_.request("earnings_history", {{"symbol", symbol}, {"limit", limit}});
    if (!rows) {
        return {};
    }
    return parse_history_rows(*rows);
}

} // namespace anchorband::data
