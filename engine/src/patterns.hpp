#pragma once

#include "candle.hpp"
#include "types.hpp"
#include <optional>
#include <set>
#include <vector>

enum class PatternTag {
    Doji,
    Hammer,
    InvertedHammer,
    BullishEngulfing,
    BearishEngulfing,
    BullishPinbar,
    BearishPinbar
};

using PatternSet = std::set<PatternTag>;

const char* to_string(PatternTag tag);

class CandlePatterns {
public:
    // Patterns present on the latest bar (two-bar patterns need 2 bars)
    static PatternSet detect(const CandleSeries& series);

    static bool is_doji(const Candle& c);
    static bool is_hammer(const Candle& c);
    static bool is_inverted_hammer(const Candle& c);
    static bool is_bullish_engulfing(const Candle& prev, const Candle& cur);
    static bool is_bearish_engulfing(const Candle& prev, const Candle& cur);
    static bool is_bullish_pinbar(const Candle& c);
    static bool is_bearish_pinbar(const Candle& c);

    // Ordered priority list of patterns that support a position in `d`
    static const std::vector<PatternTag>& priority_for(Direction d);

    // First tag of priority_for(d) present in `patterns`
    static std::optional<PatternTag> first_match(const PatternSet& patterns, Direction d);
};
