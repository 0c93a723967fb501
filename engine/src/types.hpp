#pragma once

#include <string>

enum class Direction {
    Long,
    Short,
    None
};

enum class Trend {
    Bullish,
    Bearish,
    Neutral
};

enum class ObvTrend {
    Rising,
    Falling
};

const char* to_string(Direction d);
const char* to_string(Trend t);
const char* to_string(ObvTrend t);

// Accepts "long"/"short"/"none" in any case; throws std::invalid_argument otherwise
Direction parse_direction(const std::string& text);

// Trend that favours the given side; throws for Direction::None
Trend favoured_trend(Direction d);
Direction opposite(Direction d);
