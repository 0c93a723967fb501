#include "candle.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>

SeriesCheck validate_series(const CandleSeries& series) {
    for (size_t i = 0; i < series.size(); i++) {
        const auto& c = series[i];

        if (!std::isfinite(c.open) || !std::isfinite(c.high) ||
            !std::isfinite(c.low) || !std::isfinite(c.close) ||
            !std::isfinite(c.volume)) {
            return {false, fmt::format("non-finite value at bar {}", i)};
        }
        if (c.high < std::max({c.open, c.close, c.low})) {
            return {false, fmt::format("high below body at bar {}", i)};
        }
        if (c.low > std::min({c.open, c.close, c.high})) {
            return {false, fmt::format("low above body at bar {}", i)};
        }
        if (c.volume < 0) {
            return {false, fmt::format("negative volume at bar {}", i)};
        }
        if (i > 0 && c.timestamp_ms <= series[i - 1].timestamp_ms) {
            return {false, fmt::format("timestamp not increasing at bar {}", i)};
        }
    }

    return {true, ""};
}

std::vector<double> closes(const CandleSeries& series) {
    std::vector<double> out;
    out.reserve(series.size());
    for (const auto& c : series) out.push_back(c.close);
    return out;
}

double highest_high(const CandleSeries& series, size_t n) {
    if (series.empty()) return 0.0;
    size_t start = series.size() > n ? series.size() - n : 0;

    double high = series[start].high;
    for (size_t i = start; i < series.size(); i++) {
        high = std::max(high, series[i].high);
    }
    return high;
}

double lowest_low(const CandleSeries& series, size_t n) {
    if (series.empty()) return 0.0;
    size_t start = series.size() > n ? series.size() - n : 0;

    double low = series[start].low;
    for (size_t i = start; i < series.size(); i++) {
        low = std::min(low, series[i].low);
    }
    return low;
}
