#include <anchorband/signal/signal_log.hpp>
#include <anchorband/utils/logger.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>

namespace anchorband::signal {

namespace {

using core::SignalCategory;

// Current-anchor blocks first, then previous-anchor blocks
constexpr SignalCategory kBlockOrder[] = {
    SignalCategory::TIER3,
    SignalCategory::TIER2,
    SignalCategory::TIER1,
    SignalCategory::VWAP_CROSS,
    SignalCategory::CROSS_UP,
    SignalCategory::CROSS_DOWN,
    SignalCategory::BOUNCE,
    SignalCategory::PREV_BOUNCE_LONG,
    SignalCategory::PREV_BOUNCE_SHORT,
    SignalCategory::PREV_CROSS_UP,
    SignalCategory::PREV_CROSS_DOWN
};

const std::string kCompletionPrefix = "Run completed at";

void write_block(std::ostringstream& out, const SignalBook& book, SignalCategory category) {
    auto rows = book.rows(category);
    for (const auto& row : rows) {
        out << row.to_line() << '\n';
    }
    if (!rows.empty()) {
        out << '\n';
    }
}

std::string trim(const std::string& text) {
    size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

} // namespace

SignalLogWriter::SignalLogWriter(std::string path) : path_(std::move(path)) {}

std::string SignalLogWriter::render(const SignalBook& book, const std::string& completed_at) {
    std::ostringstream out;
    out << "# CURRENT ANCHOR\n";
    core::AnchorRole section = core::AnchorRole::CURRENT;
    for (auto category : kBlockOrder) {
        if (core::category_role(category) != section) {
            section = core::category_role(category);
            out << "# PREVIOUS ANCHOR\n";
        }
        write_block(out, book, category);
    }
    out << kCompletionPrefix << ' ' << completed_at << '\n';
    return out.str();
}

std::string SignalLogWriter::clock_time(std::time_t when) {
    std::tm tm_buf;
    localtime_r(&when, &tm_buf);
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%H:%M:%S");
    return ss.str();
}

bool SignalLogWriter::write(const SignalBook& book) const {
    return write(book, clock_time(std::time(nullptr)));
}

bool SignalLogWriter::write(const SignalBook& book, const std::string& completed_at) const {
    namespace fs = std::filesystem;

    fs::path target(path_);
    fs::path temp(path_ + ".tmp");
    std::error_code ec;

    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            utils::Logger::error() << "Cannot create directory for " << path_ << ": " << ec.message()
                                   << utils::Logger::endl;
            return false;
        }
    }

    {
        std::ofstream file(temp, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            utils::Logger::error() << "Failed to open " << temp.string() << " for writing" << utils::Logger::endl;
            return false;
        }
        file << render(book, completed_at);
        file.flush();
        if (!file) {
            utils::Logger::error() << "Failed writing " << temp.string() << utils::Logger::endl;
            return false;
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        utils::Logger::error() << "Failed to move " << temp.string() << " into place: " << ec.message()
                               << utils::Logger::endl;
        fs::remove(temp, ec);
        return false;
    }
    return true;
}

std::optional<core::Date> SignalLogReader::infer_year(const std::string& mmdd, const core::Date& today) {
    int month = 0;
    int day = 0;
    char slash = 0;
    std::istringstream ss(mmdd);
    if (!(ss >> month >> slash >> day) || slash != '/') {
        return std::nullopt;
    }
    ss >> std::ws;
    if (!ss.eof()) {
        return std::nullopt;
    }

    if (core::Date::is_valid(today.year, month, day)) {
        core::Date candidate(today.year, month, day);
        if (candidate <= today.add_days(3)) {
            return candidate;
        }
    }
    // Feb 29 may exist only in one of the two years
    if (core::Date::is_valid(today.year - 1, month, day)) {
        return core::Date(today.year - 1, month, day);
    }
    return std::nullopt;
}

std::vector<ParsedSignal> SignalLogReader::parse(std::istream& in, const core::Date& today) {
    std::vector<ParsedSignal> signals;
    std::string raw;
    while (std::getline(in, raw)) {
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#' || line.rfind(kCompletionPrefix, 0) == 0) {
            continue;
        }

        std::vector<std::string> parts;
        std::istringstream fields(line);
        std::string field;
        while (std::getline(fields, field, ',')) {
            parts.push_back(trim(field));
        }
        if (!line.empty() && line.back() == ',') {
            parts.emplace_back();
        }
        if (parts.size() != 4) {
            continue;
        }

        auto date = infer_year(parts[1], today);
        if (!date) {
            utils::Logger::warn() << "Bad date in line: " << line << utils::Logger::endl;
            continue;
        }
        signals.push_back(ParsedSignal{upper(parts[0]), *date, upper(parts[2]), upper(parts[3])});
    }
    return signals;
}

std::vector<ParsedSignal> SignalLogReader::read_file(const std::string& path, const core::Date& today) {
    std::ifstream file(path);
    if (!file.is_open()) {
        utils::Logger::error() << "Signals file not found: " << path << utils::Logger::endl;
        return {};
    }
    return parse(file, today);
}

} // namespace anchorband::signal
