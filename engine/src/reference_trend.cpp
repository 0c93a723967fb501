#include "reference_trend.hpp"
#include "indicators.hpp"
#include <spdlog/spdlog.h>

ReferenceAssessment ReferenceTrend::assess(const CandleSeries& series,
                                           const EngineParams& params) {
    ReferenceAssessment result;

    if (series.size() < params.reference_min_bars) {
        result.description = "Neutral: not enough reference history";
        spdlog::debug("Reference trend: {} bars, need {}", series.size(), params.reference_min_bars);
        return result;
    }

    auto check = validate_series(series);
    if (!check.ok) {
        result.description = "Neutral: malformed reference series";
        spdlog::warn("Reference series rejected: {}", check.reason);
        return result;
    }

    const auto close_prices = closes(series);
    result.ema_trend = Indicators::trend(close_prices, params.ema_fast_period, params.ema_slow_period);
    result.rsi = Indicators::rsi(close_prices, params.rsi_long_period);

    // Missing RSI reads as mid-range
    const double rsi = result.rsi.value_or(50.0);

    if (result.ema_trend == Trend::Bullish && rsi > params.reference_rsi_bull_floor) {
        result.trend = Trend::Bullish;
        result.description = "Bullish: EMAs up, RSI confirms";
    } else if (result.ema_trend == Trend::Bearish && rsi < params.reference_rsi_bear_ceiling) {
        result.trend = Trend::Bearish;
        result.description = "Bearish: EMAs down, RSI confirms";
    } else {
        result.trend = Trend::Neutral;
        result.description = "Neutral: EMAs and RSI disagree";
    }

    spdlog::info("Reference trend: {} (EMA={}, RSI={:.1f})",
                 result.description,
                 result.ema_trend ? to_string(*result.ema_trend) : "n/a",
                 rsi);

    return result;
}
