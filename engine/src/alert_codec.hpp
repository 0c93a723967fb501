#pragma once

#include "candle.hpp"
#include "entry_scorer.hpp"
#include "exit_evaluator.hpp"
#include <string>
#include <nlohmann/json.hpp>

// JSON wire format shared with the data and alerting collaborators
class AlertCodec {
public:
    // {"t","o","h","l","c","v"} object or [t, o, h, l, c, v] array
    static Candle candle_from_json(const nlohmann::json& raw);
    static CandleSeries series_from_json(const nlohmann::json& raw);

    // Throws std::invalid_argument on an unknown direction
    static Position position_from_json(const nlohmann::json& raw);

    static nlohmann::json targets_to_json(const FibonacciTargets& targets);
    static nlohmann::json signal_to_json(const std::string& symbol, const Signal& signal);
    static nlohmann::json exit_to_json(const Position& position, const ExitDecision& decision);
};
