#pragma once

#include "../src/candle.hpp"
#include "../src/snapshot.hpp"
#include <algorithm>
#include <vector>

inline Candle make_candle(int64_t ts, double open, double high, double low,
                          double close, double volume = 1000.0) {
    return Candle{ts, open, high, low, close, volume};
}

// Each bar opens at the previous close with a 0.5 wick either side
inline CandleSeries series_from_closes(const std::vector<double>& close_prices,
                                       double volume = 1000.0) {
    CandleSeries series;
    for (size_t i = 0; i < close_prices.size(); i++) {
        double close = close_prices[i];
        double open = i > 0 ? close_prices[i - 1] : close;
        series.push_back(make_candle(static_cast<int64_t>(i + 1) * 60000,
                                     open,
                                     std::max(open, close) + 0.5,
                                     std::min(open, close) - 0.5,
                                     close, volume));
    }
    return series;
}

inline std::vector<double> linear_closes(size_t n, double start, double step) {
    std::vector<double> out;
    for (size_t i = 0; i < n; i++) {
        out.push_back(start + step * static_cast<double>(i));
    }
    return out;
}

// Reflects every price through the pivot: p -> 2 * pivot - p, with high and low swapped
inline CandleSeries mirror_series(const CandleSeries& series, double pivot) {
    CandleSeries out;
    out.reserve(series.size());
    for (const auto& c : series) {
        out.push_back(make_candle(c.timestamp_ms, 2 * pivot - c.open, 2 * pivot - c.low,
                                  2 * pivot - c.high, 2 * pivot - c.close, c.volume));
    }
    return out;
}

inline IndicatorSnapshot snapshot_at(double price) {
    IndicatorSnapshot snap;
    snap.current_price = price;
    snap.bar_count = 100;
    return snap;
}
