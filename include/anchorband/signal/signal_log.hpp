#pragma once
#include <anchorband/core/date.hpp>
#include <anchorband/signal/signal_book.hpp>
#include <ctime>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace anchorband {
namespace signal {

// Renders a SignalBook in the plain-text layout the downstream watcher reads:
//
//   # CURRENT ANCHOR
//   ABC,01/05,UPPER_2,LONG
//   <blank line after each non-empty block>
//   ...
//   # PREVIOUS ANCHOR
//   ...
//   Run completed at 14:30:00
class SignalLogWriter {
public:
    explicit SignalLogWriter(std::string path);

    static std::string render(const SignalBook& book, const std::string& completed_at);

    // Writes to a sibling temporary file and renames it over `path`
    bool write(const SignalBook& book) const;
    bool write(const SignalBook& book, const std::string& completed_at) const;

    static std::string clock_time(std::time_t when);

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

struct ParsedSignal {
    std::string symbol;
    core::Date date;
    std::string label;
    std::string side;
};

// Reads a signal log back. Headers, blank lines and the completion line are
// skipped, as is any row without exactly four fields.
class SignalLogReader {
public:
    static std::vector<ParsedSignal> parse(std::istream& in, const core::Date& today);
    static std::vector<ParsedSignal> read_file(const std::string& path, const core::Date& today);

    // MM/DD in today's year, or the year before when that lands more than
    // three days after today
    static std::optional<core::Date> infer_year(const std::string& mmdd, const core::Date& today);
};

} // namespace signal
} // namespace anchorband
