#pragma once
#include <iosfwd>
#include <set>
#include <string>
#include <vector>

namespace anchorband {
namespace runner {

// One symbol per line, upper-cased. Blank lines and the TC2000 export header
// are skipped.
std::vector<std::string> load_tickers(std::istream& in);

// A missing file is an empty list, logged as a warning
std::vector<std::string> load_tickers(const std::string& path);

class Watchlist {
public:
    Watchlist() = default;
    Watchlist(const std::vector<std::string>& longs, const std::vector<std::string>& shorts);

    // Union of both lists, sorted and distinct
    std::vector<std::string> symbols() const;

    bool is_long(const std::string& symbol) const { return longs_.count(symbol) > 0; }
    bool is_short(const std::string& symbol) const { return shorts_.count(symbol) > 0; }
    bool empty() const { return longs_.empty() && shorts_.empty(); }

private:
    std::set<std::string> longs_;
    std::set<std::string> shorts_;
};

} // namespace runner
} // namespace anchorband
