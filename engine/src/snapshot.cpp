#include "snapshot.hpp"
#include <spdlog/spdlog.h>

IndicatorSnapshot TechnicalAnalyzer::analyze(const CandleSeries& series,
                                             const EngineParams& params) {
    IndicatorSnapshot snap;

    if (series.empty()) return snap;

    auto check = validate_series(series);
    if (!check.ok) {
        spdlog::warn("Rejecting malformed candle series ({} bars): {}",
                     series.size(), check.reason);
        return snap;
    }

    const auto close_prices = closes(series);
    snap.bar_count = series.size();
    snap.current_price = series.back().close;
    snap.current_volume = series.back().volume;

    snap.rsi_short = Indicators::rsi(close_prices, params.rsi_short_period);
    snap.rsi_long = Indicators::rsi(close_prices, params.rsi_long_period);

    auto fast = Indicators::ema_series(close_prices, params.ema_fast_period);
    auto slow = Indicators::ema_series(close_prices, params.ema_slow_period);
    snap.ema_fast = fast.back();
    snap.ema_slow = slow.back();
    if (fast.size() >= 2) {
        snap.ema_fast_prev = fast[fast.size() - 2];
        snap.ema_slow_prev = slow[slow.size() - 2];
    }

    snap.trend = Indicators::trend(close_prices, params.ema_fast_period, params.ema_slow_period);

    auto obv = Indicators::obv_series(series);
    snap.obv = obv.back();
    snap.obv_trend = Indicators::obv_trend(series);

    snap.atr = Indicators::atr(series, params.atr_period);
    snap.volume_spike = Indicators::volume_spike(series, params.volume_spike_multiplier,
                                                 params.volume_lookback);
    snap.patterns = CandlePatterns::detect(series);

    if (auto sr = Indicators::support_resistance(series, params.sr_window)) {
        snap.support = sr->support;
        snap.resistance = sr->resistance;
    }

    snap.range_high = highest_high(series, params.fibonacci_lookback);
    snap.range_low = lowest_low(series, params.fibonacci_lookback);

    if (!snap.rsi_long || !snap.ema_slow || !snap.atr) {
        spdlog::debug("Partial snapshot: {} bars (rsi_long={}, ema_slow={}, atr={})",
                      series.size(), snap.rsi_long.has_value(),
                      snap.ema_slow.has_value(), snap.atr.has_value());
    }

    return snap;
}
