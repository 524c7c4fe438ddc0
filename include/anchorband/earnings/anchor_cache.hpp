#pragma once
#include <anchorband/earnings/anchor_set.hpp>
#include <string>

namespace anchorband::earnings {

// Earnings dates persisted between runs as a JSON object keyed by symbol.
// A missing or corrupt file loads as an empty cache; the next save rewrites it
// in normalized form.
class AnchorCache {
public:
    AnchorCache() = default;
    explicit AnchorCache(std::string path);

    // false only when the file exists but could not be read or parsed
    bool load();
    bool save() const;

    AnchorSet get(const std::string& symbol) const;
    void put(const std::string& symbol, const AnchorSet& set);
    bool contains(const std::string& symbol) const;

    const AnchorSetMap& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    AnchorSetMap entries_;
};

} // namespace anchorband::earnings
