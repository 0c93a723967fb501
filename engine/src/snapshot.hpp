#pragma once

#include "candle.hpp"
#include "engine_params.hpp"
#include "indicators.hpp"
#include "patterns.hpp"
#include "types.hpp"
#include <optional>

// Indicator values for one timeframe at its latest bar. Any field may be
// absent when the window is too short; an empty snapshot means the window
// was rejected as malformed.
struct IndicatorSnapshot {
    std::optional<double> rsi_short;
    std::optional<double> rsi_long;
    std::optional<double> ema_fast;
    std::optional<double> ema_slow;
    std::optional<double> ema_fast_prev;
    std::optional<double> ema_slow_prev;
    std::optional<double> obv;
    std::optional<ObvTrend> obv_trend;
    std::optional<double> atr;
    std::optional<Trend> trend;
    bool volume_spike = false;
    PatternSet patterns;
    std::optional<double> support;
    std::optional<double> resistance;
    std::optional<double> range_high;
    std::optional<double> range_low;
    std::optional<double> current_price;
    std::optional<double> current_volume;
    size_t bar_count = 0;

    bool has_pattern(PatternTag tag) const { return patterns.count(tag) > 0; }
    bool empty() const { return !current_price.has_value(); }
};

class TechnicalAnalyzer {
public:
    // Never throws. Each indicator is computed on its own so one absence
    // does not hide the others.
    static IndicatorSnapshot analyze(const CandleSeries& series,
                                     const EngineParams& params = EngineParams());
};
