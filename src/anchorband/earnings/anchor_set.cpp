#include <anchorband/earnings/anchor_set.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <functional>

namespace anchorband::earnings {

namespace {

std::vector<core::Date> sorted_distinct(std::vector<core::Date> dates) {
    std::sort(dates.begin(), dates.end(), std::greater<core::Date>());
    dates.erase(std::unique(dates.begin(), dates.end()), dates.end());
    return dates;
}

std::string value_as_text(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    // Older writers stored dates such as 20240105 as bare numbers
    if (value.is_number_integer() || value.is_number_unsigned()) {
        return value.dump();
    }
    return std::string();
}

} // namespace

AnchorSet::AnchorSet(std::vector<core::Date> dates) : dates_(sorted_distinct(std::move(dates))) {}

std::optional<core::Date> AnchorSet::current() const {
    if (dates_.empty()) {
        return std::nullopt;
    }
    return dates_[0];
}

std::optional<core::Date> AnchorSet::previous() const {
    if (dates_.size() < 2) {
        return std::nullopt;
    }
    return dates_[1];
}

AnchorSet AnchorSet::up_to(const core::Date& today) const {
    std::vector<core::Date> kept;
    for (const auto& d : dates_) {
        if (d <= today) {
            kept.push_back(d);
        }
    }
    return AnchorSet(std::move(kept));
}

AnchorSet AnchorSet::merged_with(const std::vector<core::Date>& more) const {
    std::vector<core::Date> all = dates_;
    all.insert(all.end(), more.begin(), more.end());
    return AnchorSet(std::move(all));
}

std::vector<core::Date> AnchorSet::most_recent(size_t count) const {
    size_t n = std::min(count, dates_.size());
    return std::vector<core::Date>(dates_.begin(), dates_.begin() + static_cast<std::ptrdiff_t>(n));
}

bool operator==(const AnchorSet& a, const AnchorSet& b) {
    return a.dates() == b.dates();
}

AnchorSet normalize_entry(const nlohmann::json& entry) {
    std::vector<std::string> values;

    if (entry.is_string()) {
        values.push_back(entry.get<std::string>());
    } else if (entry.is_array()) {
        for (const auto& v : entry) {
            values.push_back(value_as_text(v));
        }
    } else if (entry.is_object()) {
        auto dates_it = entry.find("dates");
        if (dates_it != entry.end() && dates_it->is_array()) {
            for (const auto& v : *dates_it) {
                values.push_back(value_as_text(v));
            }
        } else {
            for (const char* key : {"current", "previous", "latest", "prior"}) {
                auto it = entry.find(key);
                if (it != entry.end()) {
                    values.push_back(value_as_text(*it));
                }
            }
        }
    }

    std::vector<core::Date> dates;
    for (const auto& text : values) {
        if (auto d = core::Date::parse(text)) {
            dates.push_back(*d);
        }
    }
    return AnchorSet(std::move(dates));
}

nlohmann::json serialize_entry(const AnchorSet& set) {
    nlohmann::json payload = nlohmann::json::object();
    const auto& dates = set.dates();
    if (!dates.empty()) {
        payload["current"] = dates[0].to_iso();
    }
    if (dates.size() > 1) {
        payload["previous"] = dates[1].to_iso();
    }
    if (dates.size() > 2) {
        nlohmann::json all = nlohmann::json::array();
        for (const auto& d : dates) {
            all.push_back(d.to_iso());
        }
        payload["dates"] = all;
    }
    return payload;
}

AnchorSetMap normalize_cache(const nlohmann::json& document) {
    AnchorSetMap entries;
    if (!document.is_object()) {
        return entries;
    }
    for (auto it = document.begin(); it != document.end(); ++it) {
        AnchorSet set = normalize_entry(it.value());
        if (set.empty()) {
            continue;
        }
        entries[it.key()] = std::move(set);
    }
    return entries;
}

nlohmann::json serialize_cache(const AnchorSetMap& entries) {
    nlohmann::json document = nlohmann::json::object();
    for (const auto& [symbol, set] : entries) {
        if (set.empty()) {
            continue;
        }
        document[symbol] = serialize_entry(set);
    }
    return document;
}

} // namespace anchorband::earnings
