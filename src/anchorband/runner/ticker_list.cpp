#include <anchorband/runner/ticker_list.hpp>
#include <anchorband/utils/logger.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>

namespace anchorband::runner {

namespace {

const std::string kExportHeader = "SYMBOLS FROM TC2000";

} // namespace

std::vector<std::string> load_tickers(std::istream& in) {
    std::vector<std::string> tickers;
    std::string line;
    while (std::getline(in, line)) {
        size_t first = line.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) {
            continue;
        }
        size_t last = line.find_last_not_of(" \t\r\n");
        std::string value = line.substr(first, last - first + 1);
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        if (value.rfind(kExportHeader, 0) == 0) {
            continue;
        }
        tickers.push_back(value);
    }
    return tickers;
}

std::vector<std::string> load_tickers(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        utils::Logger::warn() << "Ticker file not found: " << path << utils::Logger::endl;
        return {};
    }
    return load_tickers(file);
}

Watchlist::Watchlist(const std::vector<std::string>& longs, const std::vector<std::string>& shorts)
    : longs_(longs.begin(), longs.end()), shorts_(shorts.begin(), shorts.end()) {}

std::vector<std::string> Watchlist::symbols() const {
    std::set<std::string> all(longs_);
    all.insert(shorts_.begin(), shorts_.end());
    return std::vector<std::string>(all.begin(), all.end());
}

} // namespace anchorband::runner
