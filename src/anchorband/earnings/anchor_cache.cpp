#include <anchorband/earnings/anchor_cache.hpp>
#include <anchorband/utils/logger.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

namespace anchorband::earnings {

AnchorCache::AnchorCache(std::string path) : path_(std::move(path)) {}

bool AnchorCache::load() {
    entries_.clear();

    if (path_.empty() || !std::filesystem::exists(path_)) {
        utils::Logger::info() << "No earnings cache at " << path_ << ", starting empty" << utils::Logger::endl;
        return true;
    }

    std::ifstream file(path_);
    if (!file.is_open()) {
        utils::Logger::warn() << "Failed to open earnings cache " << path_ << utils::Logger::endl;
        return false;
    }

    try {
        nlohmann::json document = nlohmann::json::parse(file);
        entries_ = normalize_cache(document);
    } catch (const nlohmann::json::exception& e) {
        utils::Logger::warn() << "Earnings cache " << path_ << " is corrupt (" << e.what()
                              << "); starting with empty cache" << utils::Logger::endl;
        entries_.clear();
        return false;
    }

    utils::Logger::debug() << "Loaded " << entries_.size() << " cached anchor sets" << utils::Logger::endl;
    return true;
}

bool AnchorCache::save() const {
    if (path_.empty()) {
        return false;
    }

    std::filesystem::path target(path_);
    std::error_code ec;
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            utils::Logger::error() << "Cannot create cache directory " << target.parent_path().string()
                                   << ": " << ec.message() << utils::Logger::endl;
            return false;
        }
    }

    std::filesystem::path temp = target;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out.is_open()) {
            utils::Logger::error() << "Failed to write earnings cache " << temp.string() << utils::Logger::endl;
            return false;
        }
        out << serialize_cache(entries_).dump(2) << '\n';
        if (!out) {
            utils::Logger::error() << "Failed to write earnings cache " << temp.string() << utils::Logger::endl;
            return false;
        }
    }

    std::filesystem::rename(temp, target, ec);
    if (ec) {
        utils::Logger::error() << "Failed to replace earnings cache " << path_ << ": " << ec.message()
                               << utils::Logger::endl;
        return false;
    }
    return true;
}

AnchorSet AnchorCache::get(const std::string& symbol) const {
    auto it = entries_.find(symbol);
    return it != entries_.end() ? it->second : AnchorSet();
}

void AnchorCache::put(const std::string& symbol, const AnchorSet& set) {
    if (set.empty()) {
        return;
    }
    entries_[symbol] = set;
}

bool AnchorCache::contains(const std::string& symbol) const {
    return entries_.find(symbol) != entries_.end();
}

} // namespace anchorband::earnings
