#pragma once

#include <algorithm>
#include <cstddef>
#include <vector>

// Tunables for the indicator engine, entry scorer and exit evaluator.
// Passed by value into every call; nothing reads the environment here.
struct EngineParams {
    // Indicators
    size_t rsi_short_period = 7;
    size_t rsi_long_period = 14;
    size_t ema_fast_period = 20;
    size_t ema_slow_period = 50;
    size_t atr_period = 14;
    double volume_spike_multiplier = 2.0;
    size_t volume_lookback = 20;
    size_t sr_window = 20;

    // Entry scoring
    double rsi_oversold = 30.0;
    double rsi_overbought = 70.0;
    double proximity_pct = 2.0;
    int min_signal_strength = 3;
    int max_signal_strength = 7;

    // Targets and stops
    size_t fibonacci_lookback = 20;
    std::vector<double> fibonacci_ratios = {0.382, 0.618, 1.0, 1.618};
    double atr_multiplier = 2.0;

    // Exit evaluation
    size_t take_profit_levels = 3;
    double stop_rsi_long_floor = 20.0;
    double stop_rsi_short_ceiling = 80.0;
    double reversal_rsi_overbought = 75.0;
    double reversal_rsi_oversold = 25.0;
    int reversal_vote_threshold = 2;
    double trailing_activation_pct = 1.0;
    size_t trailing_lookback = 10;
    double trailing_offset_pct = 0.5;

    // Reference asset
    size_t reference_min_bars = 50;
    double reference_rsi_bull_floor = 40.0;
    double reference_rsi_bear_ceiling = 60.0;

    // Bars needed for a complete snapshot
    size_t min_bars() const {
        return std::max({ema_slow_period, rsi_long_period + 1,
                         volume_lookback + 1, static_cast<size_t>(20)});
    }
};
