#pragma once
#include <anchorband/data/bar_source.hpp>
#include <anchorband/data/gateway_client.hpp>
#include <anchorband/earnings/calendar_source.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace anchorband {
namespace data {

// Daily bars through the gateway. Gaps, timeouts and malformed rows all
// degrade to a shorter (possibly empty) series.
class GatewayBarSource : public BarSource {
public:
    explicit GatewayBarSource(GatewayClient& client);

    core::BarSeries fetch_daily_bars(const std::string& symbol, int lookback_days) override;

    // Rows look like {"date": "20240105", "open": .., "high": .., "low": .., "close": .., "volume": ..}
    static core::BarSeries parse_bar_rows(const nlohmann::json& rows);

private:
    GatewayClient& client_;
};

class GatewayCalendarSource : public earnings::CalendarSource {
public:
    explicit GatewayCalendarSource(GatewayClient& client);

    std::vector<earnings::CalendarRow> earnings_on(const core::Date& date) override;
    std::vector<core::Date> earnings_history(const std::string& symbol, int limit) override;

    // [{"symbol": "ABC"}, ...]
    static std::vector<earnings::CalendarRow> parse_calendar_rows(const nlohmann::json& rows);
    // [{"date": "2024-01-05"}, ...] or ["2024-01-05", ...]
    static std::vector<core::Date> parse_history_rows(const nlohmann::json& rows);

private:
    GatewayClient& client_;
};

} // namespace data
} // namespace anchorband
