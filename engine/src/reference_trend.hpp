#pragma once

#include "candle.hpp"
#include "engine_params.hpp"
#include "types.hpp"
#include <optional>
#include <string>

struct ReferenceAssessment {
    Trend trend = Trend::Neutral;
    std::optional<Trend> ema_trend;
    std::optional<double> rsi;
    std::string description;
};

// Trend of the benchmark asset that gates every other symbol.
// The EMA trend only counts when RSI confirms it.
class ReferenceTrend {
public:
    static ReferenceAssessment assess(const CandleSeries& series,
                                      const EngineParams& params = EngineParams());
};
