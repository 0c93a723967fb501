#include "patterns.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {

struct Anatomy {
    double body;
    double range;
    double lower_shadow;
    double upper_shadow;
};

Anatomy anatomy(const Candle& c) {
    Anatomy a;
    a.body = std::abs(c.close - c.open);
    a.range = c.high - c.low;
    a.lower_shadow = std::min(c.open, c.close) - c.low;
    a.upper_shadow = c.high - std::max(c.open, c.close);
    return a;
}

} // namespace

const char* to_string(PatternTag tag) {
    switch (tag) {
        case PatternTag::Doji:             return "doji";
        case PatternTag::Hammer:           return "hammer";
        case PatternTag::InvertedHammer:   return "inverted_hammer";
        case PatternTag::BullishEngulfing: return "bullish_engulfing";
        case PatternTag::BearishEngulfing: return "bearish_engulfing";
        case PatternTag::BullishPinbar:    return "bullish_pinbar";
        case PatternTag::BearishPinbar:    return "bearish_pinbar";
    }
    return "unknown";
}

PatternSet CandlePatterns::detect(const CandleSeries& series) {
    PatternSet found;
    if (series.empty()) return found;

    const Candle& cur = series.back();

    if (is_doji(cur)) found.insert(PatternTag::Doji);
    if (is_hammer(cur)) found.insert(PatternTag::Hammer);
    if (is_inverted_hammer(cur)) found.insert(PatternTag::InvertedHammer);
    if (is_bullish_pinbar(cur)) found.insert(PatternTag::BullishPinbar);
    if (is_bearish_pinbar(cur)) found.insert(PatternTag::BearishPinbar);

    if (series.size() >= 2) {
        const Candle& prev = series[series.size() - 2];
        if (is_bullish_engulfing(prev, cur)) found.insert(PatternTag::BullishEngulfing);
        if (is_bearish_engulfing(prev, cur)) found.insert(PatternTag::BearishEngulfing);
    }

    return found;
}

bool CandlePatterns::is_doji(const Candle& c) {
    auto a = anatomy(c);
    return a.body <= a.range * 0.1;
}

bool CandlePatterns::is_hammer(const Candle& c) {
    auto a = anatomy(c);
    return a.lower_shadow >= a.body * 2.0 &&
           a.upper_shadow <= a.body * 0.5 &&
           a.body > 0;
}

bool CandlePatterns::is_inverted_hammer(const Candle& c) {
    auto a = anatomy(c);
    return a.upper_shadow >= a.body * 2.0 &&
           a.lower_shadow <= a.body * 0.5 &&
           a.body > 0;
}

bool CandlePatterns::is_bullish_engulfing(const Candle& prev, const Candle& cur) {
    bool prev_bearish = prev.close < prev.open;
    bool cur_bullish = cur.close > cur.open;
    bool engulfs = cur.open < prev.close && cur.close > prev.open;
    return prev_bearish && cur_bullish && engulfs;
}

bool CandlePatterns::is_bearish_engulfing(const Candle& prev, const Candle& cur) {
    bool prev_bullish = prev.close > prev.open;
    bool cur_bearish = cur.close < cur.open;
    bool engulfs = cur.open > prev.close && cur.close < prev.open;
    return prev_bullish && cur_bearish && engulfs;
}

// Pinbars need a non-zero range: on a flat bar every ratio test passes trivially
bool CandlePatterns::is_bullish_pinbar(const Candle& c) {
    auto a = anatomy(c);
    if (a.range <= 0) return false;
    return a.lower_shadow >= a.range * 0.6 &&
           a.body <= a.range * 0.3 &&
           a.upper_shadow <= a.range * 0.2;
}

bool CandlePatterns::is_bearish_pinbar(const Candle& c) {
    auto a = anatomy(c);
    if (a.range <= 0) return false;
    return a.upper_shadow >= a.range * 0.6 &&
           a.body <= a.range * 0.3 &&
           a.lower_shadow <= a.range * 0.2;
}

const std::vector<PatternTag>& CandlePatterns::priority_for(Direction d) {
    static const std::vector<PatternTag> bullish = {
        PatternTag::Hammer, PatternTag::BullishEngulfing, PatternTag::BullishPinbar
    };
    static const std::vector<PatternTag> bearish = {
        PatternTag::InvertedHammer, PatternTag::BearishEngulfing, PatternTag::BearishPinbar
    };

    if (d == Direction::Long) return bullish;
    if (d == Direction::Short) return bearish;
    throw std::invalid_argument("No pattern priority for direction none");
}

std::optional<PatternTag> CandlePatterns::first_match(const PatternSet& patterns, Direction d) {
    for (auto tag : priority_for(d)) {
        if (patterns.count(tag)) return tag;
    }
    return std::nullopt;
}
