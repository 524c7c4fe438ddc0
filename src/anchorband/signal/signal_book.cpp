#include <anchorband/signal/signal_book.hpp>
#include <algorithm>

namespace anchorband::signal {

void SignalBook::add(const core::Signal& signal) {
    buckets_[static_cast<size_t>(signal.category)].push_back(signal);
}

void SignalBook::add_all(const std::vector<core::Signal>& signals) {
    for (const auto& s : signals) {
        add(s);
    }
}

std::vector<core::Signal> SignalBook::rows(core::SignalCategory category) const {
    std::vector<core::Signal> result = buckets_[static_cast<size_t>(category)];
    std::stable_partition(result.begin(), result.end(),
                          [](const core::Signal& s) { return s.side == core::Side::LONG; });
    return result;
}

size_t SignalBook::count(core::SignalCategory category) const {
    return buckets_[static_cast<size_t>(category)].size();
}

size_t SignalBook::total() const {
    size_t sum = 0;
    for (const auto& bucket : buckets_) {
        sum += bucket.size();
    }
    return sum;
}

void SignalBook::clear() {
    for (auto& bucket : buckets_) {
        bucket.clear();
    }
}

} // namespace anchorband::signal
