#pragma once
#include <anchorband/core/signal.hpp>
#include <array>
#include <cstddef>
#include <vector>

namespace anchorband {
namespace signal {

inline constexpr size_t kCategoryCount = 11;

// Signals from one run, bucketed by category
class SignalBook {
public:
    void add(const core::Signal& signal);
    void add_all(const std::vector<core::Signal>& signals);

    // LONG rows first, then SHORT; insertion order otherwise
    std::vector<core::Signal> rows(core::SignalCategory category) const;

    size_t count(core::SignalCategory category) const;
    size_t total() const;
    bool empty() const { return total() == 0; }
    void clear();

private:
    std::array<std::vector<core::Signal>, kCategoryCount> buckets_;
};

} // namespace signal
} // namespace anchorband
