#pragma once
#include <anchorband/core/daily_bar.hpp>
#include <string>

namespace anchorband {
namespace data {

// Daily OHLCV collaborator. "No data" and transient failures both come back
// as an empty series.
class BarSource {
public:
    virtual ~BarSource() = default;

    // Ascending daily bars covering at least the last `lookback_days` calendar days
    virtual core::BarSeries fetch_daily_bars(const std::string& symbol, int lookback_days) = 0;
};

} // namespace data
} // namespace anchorband
