#pragma once
#include <anchorband/core/bands.hpp>
#include <anchorband/core/bounce.hpp>
#include <anchorband/core/daily_bar.hpp>
#include <anchorband/core/date.hpp>
#include <anchorband/core/signal.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace anchorband {
namespace signal {

struct ClassifierConfiguration {
    core::BounceParameters bounce;
};

struct SymbolSides {
    bool is_long = false;
    bool is_short = false;
};

// Which anchors to evaluate this cycle
struct AnchorSelection {
    std::optional<core::Date> current;
    std::optional<core::Date> previous;
    bool promoted = false;  // latest report too fresh, previous date stands in as current
};

// `anchors` most recent first. An anchor no older than `recent_days` is too
// fresh to carry meaningful bands; the next date is used as current instead
// and the previous-anchor pass is skipped.
AnchorSelection select_anchors(const std::vector<core::Date>& anchors,
                               const core::Date& today,
                               int recent_days);

class SignalClassifier {
public:
    explicit SignalClassifier(ClassifierConfiguration config = ClassifierConfiguration());

    // All signals one anchor produces for `role`, in processing order
    std::vector<core::Signal> classify(const std::string& symbol,
                                       const core::BarSeries& bars,
                                       const core::Bands& bands,
                                       core::AnchorRole role,
                                       const SymbolSides& sides) const;

    // Computes bands from `anchor_index` first; nullopt when they are undefined
    std::optional<std::vector<core::Signal>> classify_anchor(const std::string& symbol,
                                                             const core::BarSeries& bars,
                                                             size_t anchor_index,
                                                             core::AnchorRole role,
                                                             const SymbolSides& sides) const;

    const ClassifierConfiguration& config() const { return config_; }

private:
    void add_tiers(const std::string& symbol, const core::BarSeries& bars, const core::Bands& bands,
                   const SymbolSides& sides, std::vector<core::Signal>& out) const;
    void add_vwap_touches(const std::string& symbol, const core::BarSeries& bars, const core::Bands& bands,
                          const SymbolSides& sides, std::vector<core::Signal>& out) const;
    void add_crossings(const std::string& symbol, const core::BarSeries& bars, const core::Bands& bands,
                       core::AnchorRole role, const SymbolSides& sides, std::vector<core::Signal>& out) const;
    void add_bounces(const std::string& symbol, const core::BarSeries& bars, const core::Bands& bands,
                     core::AnchorRole role, const SymbolSides& sides, std::vector<core::Signal>& out) const;

    ClassifierConfiguration config_;
};

} // namespace signal
} // namespace anchorband
