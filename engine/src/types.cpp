#include "types.hpp"
#include "util.hpp"
#include <stdexcept>

const char* to_string(Direction d) {
    switch (d) {
        case Direction::Long:  return "long";
        case Direction::Short: return "short";
        default:               return "none";
    }
}

const char* to_string(Trend t) {
    switch (t) {
        case Trend::Bullish: return "bullish";
        case Trend::Bearish: return "bearish";
        default:             return "neutral";
    }
}

const char* to_string(ObvTrend t) {
    return t == ObvTrend::Rising ? "rising" : "falling";
}

Direction parse_direction(const std::string& text) {
    std::string lower = util::to_lower(text);
    if (lower == "long") return Direction::Long;
    if (lower == "short") return Direction::Short;
    if (lower == "none") return Direction::None;
    throw std::invalid_argument("Unknown direction: " + text);
}

Trend favoured_trend(Direction d) {
    if (d == Direction::Long) return Trend::Bullish;
    if (d == Direction::Short) return Trend::Bearish;
    throw std::invalid_argument("Direction none has no favoured trend");
}

Direction opposite(Direction d) {
    if (d == Direction::Long) return Direction::Short;
    if (d == Direction::Short) return Direction::Long;
    return Direction::None;
}
