#include "anchorband/core/signal.hpp"

namespace anchorband::core {
    std::string side_name(Side side) {
        return side == Side::LONG ? "LONG" : "SHORT";
    }

    std::string category_name(SignalCategory category) {
        switch (category) {
            case SignalCategory::TIER3:             return "TIER3";
            case SignalCategory::TIER2:             return "TIER2";
            case SignalCategory::TIER1:             return "TIER1";
            case SignalCategory::VWAP_CROSS:        return "VWAP_CROSS";
            case SignalCategory::CROSS_UP:          return "CROSS_UP";
            case SignalCategory::CROSS_DOWN:        return "CROSS_DOWN";
            case SignalCategory::BOUNCE:            return "BOUNCE";
            case SignalCategory::PREV_BOUNCE_LONG:  return "PREV_BOUNCE_LONG";
            case SignalCategory::PREV_BOUNCE_SHORT: return "PREV_BOUNCE_SHORT";
            case SignalCategory::PREV_CROSS_UP:     return "PREV_CROSS_UP";
            case SignalCategory::PREV_CROSS_DOWN:   return "PREV_CROSS_DOWN";
        }
        return "UNKNOWN";
    }

    AnchorRole category_role(SignalCategory category) {
        switch (category) {
            case SignalCategory::PREV_BOUNCE_LONG:
            case SignalCategory::PREV_BOUNCE_SHORT:
            case SignalCategory::PREV_CROSS_UP:
            case SignalCategory::PREV_CROSS_DOWN:
                return AnchorRole::PREVIOUS;
            default:
                return AnchorRole::CURRENT;
        }
    }

    Signal::Signal() = default;

    Signal::Signal(const std::string& sym, const std::string& date, const std::string& lbl,
                   Side s, SignalCategory cat)
        : symbol(sym), display_date(date), label(lbl), side(s), category(cat) {
    }

    std::string Signal::to_line() const {
        return symbol + "," + display_date + "," + label + "," + side_name(side);
    }

    bool operator==(const Signal& a, const Signal& b) {
        return a.symbol == b.symbol && a.display_date == b.display_date && a.label == b.label
            && a.side == b.side && a.category == b.category;
    }
}
