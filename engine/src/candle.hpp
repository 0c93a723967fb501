#pragma once

#include <cstdint>
#include <string>
#include <vector>

// One fixed-duration OHLCV bar
struct Candle {
    int64_t timestamp_ms;
    double open;
    double high;
    double low;
    double close;
    double volume;
};

// Time-ordered window, oldest first
using CandleSeries = std::vector<Candle>;

struct SeriesCheck {
    bool ok;
    std::string reason;
};

// Strictly increasing timestamps, consistent OHLC, non-negative volume
SeriesCheck validate_series(const CandleSeries& series);

std::vector<double> closes(const CandleSeries& series);

// Extremes over the last n bars (whole series when shorter); 0 on empty input
double highest_high(const CandleSeries& series, size_t n);
double lowest_low(const CandleSeries& series, size_t n);
