#pragma once

#include "candle.hpp"
#include "types.hpp"
#include <optional>
#include <vector>

struct SupportResistance {
    double support;
    double resistance;
};

// Series-level indicator math. Every function is total: when the window is
// too short the result is std::nullopt (or false), never a zero default.
class Indicators {
public:
    // Wilder-smoothed RSI of the latest bar, clamped to [0,100]; needs period+1 closes
    static std::optional<double> rsi(const std::vector<double>& closes, size_t period);

    // EMA per bar, absent for the first period-1 bars
    static std::vector<std::optional<double>> ema_series(const std::vector<double>& closes,
                                                         size_t period);
    static std::optional<double> ema(const std::vector<double>& closes, size_t period);

    // Cumulative signed volume, starting at 0 on the first bar
    static std::vector<double> obv_series(const CandleSeries& series);
    static std::optional<ObvTrend> obv_trend(const CandleSeries& series);

    static std::vector<double> true_range(const CandleSeries& series);
    // Simple mean of the last `period` true ranges
    static std::optional<double> atr(const CandleSeries& series, size_t period);

    // Latest volume above multiplier x mean of the `lookback` bars before it
    static bool volume_spike(const CandleSeries& series, double multiplier, size_t lookback);

    // Fast vs slow EMA on the latest bar
    static std::optional<Trend> trend(const std::vector<double>& closes,
                                      size_t fast_period, size_t slow_period);

    static std::optional<SupportResistance> support_resistance(const CandleSeries& series,
                                                               size_t window);
};
