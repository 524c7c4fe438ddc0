#pragma once
#include <string>

namespace anchorband::core {
    enum class Side {
        LONG,
        SHORT
    };

    enum class AnchorRole {
        CURRENT,
        PREVIOUS
    };

    // Output blocks, in the order they are written to the signal log
    enum class SignalCategory {
        TIER3,
        TIER2,
        TIER1,
        VWAP_CROSS,
        CROSS_UP,
        CROSS_DOWN,
        BOUNCE,
        PREV_BOUNCE_LONG,
        PREV_BOUNCE_SHORT,
        PREV_CROSS_UP,
        PREV_CROSS_DOWN
    };

    std::string side_name(Side side);
    std::string category_name(SignalCategory category);
    AnchorRole category_role(SignalCategory category);

    struct Signal {
        std::string symbol;
        std::string display_date;  // MM/DD
        std::string label;
        Side side = Side::LONG;
        SignalCategory category = SignalCategory::TIER1;

        Signal();
        Signal(const std::string& sym, const std::string& date, const std::string& lbl,
               Side s, SignalCategory cat);

        // SYMBOL,MM/DD,LABEL,SIDE
        std::string to_line() const;
    };

    bool operator==(const Signal& a, const Signal& b);
}

 // namespace anchorband::core
