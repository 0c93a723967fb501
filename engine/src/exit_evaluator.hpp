#pragma once

#include "candle.hpp"
#include "engine_params.hpp"
#include "entry_scorer.hpp"
#include "snapshot.hpp"
#include "types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Open position as tracked by the caller
struct Position {
    std::string symbol;
    Direction direction = Direction::None;
    double entry_price = 0.0;
    FibonacciTargets fibonacci_targets;
    int64_t opened_at_ms = 0;
};

enum class ExitType {
    TakeProfit,
    StopLoss,
    TrailingStop,
    Reversal,
    None
};

const char* to_string(ExitType t);

struct ExitDecision {
    bool should_exit = false;
    ExitType exit_type = ExitType::None;
    std::string reason;
    double profit_loss_pct = 0.0;
    std::optional<double> suggested_exit_price;
    std::optional<std::string> fibonacci_hit;
    std::vector<std::string> technical_signals;  // reversal votes, in check order
};

// Stateless: everything about the position is passed in on each call.
// Checks run take-profit, stop-loss, reversal, trailing-stop; first hit wins.
class ExitEvaluator {
public:
    explicit ExitEvaluator(const EngineParams& params = EngineParams());

    // Throws std::invalid_argument when position.direction is None
    ExitDecision evaluate_exit(const Position& position,
                               const IndicatorSnapshot& short_tf,
                               const IndicatorSnapshot& long_tf,
                               const CandleSeries& short_series) const;

    static double profit_pct(Direction d, double entry_price, double price);

private:
    EngineParams params_;

    std::optional<std::string> check_take_profit(const Position& position, double price) const;
    std::optional<std::string> check_stop_loss(const Position& position, double price,
                                               const IndicatorSnapshot& short_tf,
                                               const IndicatorSnapshot& long_tf,
                                               const CandleSeries& short_series) const;
    std::vector<std::string> reversal_signals(Direction d,
                                              const IndicatorSnapshot& short_tf,
                                              const IndicatorSnapshot& long_tf) const;
    std::optional<std::string> check_trailing_stop(Direction d, double price, double pnl_pct,
                                                   const CandleSeries& short_series) const;
};
