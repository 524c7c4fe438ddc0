#pragma once
#include <anchorband/core/date.hpp>
#include <nlohmann/json_fwd.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace anchorband::earnings {

// Distinct earnings report dates for one symbol, most recent first
class AnchorSet {
public:
    AnchorSet() = default;
    explicit AnchorSet(std::vector<core::Date> dates);

    const std::vector<core::Date>& dates() const { return dates_; }
    bool empty() const { return dates_.empty(); }
    size_t size() const { return dates_.size(); }

    std::optional<core::Date> current() const;
    std::optional<core::Date> previous() const;

    // Dates on or before `today`
    AnchorSet up_to(const core::Date& today) const;

    // Union with `more`, still distinct and descending
    AnchorSet merged_with(const std::vector<core::Date>& more) const;

    // The `count` most recent dates
    std::vector<core::Date> most_recent(size_t count) const;

private:
    std::vector<core::Date> dates_;
};

bool operator==(const AnchorSet& a, const AnchorSet& b);

using AnchorSetMap = std::map<std::string, AnchorSet>;

// Maps any persisted entry shape to an AnchorSet:
//   "2024-01-05"
//   ["2024-01-05", "2023-10-20"]
//   {"dates": [...]}
//   {"current": ..., "previous": ...}   (also "latest" / "prior")
// Values that do not parse as dates are dropped.
AnchorSet normalize_entry(const nlohmann::json& entry);

// {"current": ISO, "previous": ISO, "dates": [ISO...]}; previous only with two or
// more dates, dates only with more than two
nlohmann::json serialize_entry(const AnchorSet& set);

// Whole-file variants; a non-object document yields an empty map
AnchorSetMap normalize_cache(const nlohmann::json& document);
nlohmann::json serialize_cache(const AnchorSetMap& entries);

} // namespace anchorband::earnings
