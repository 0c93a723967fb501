#pragma once

#include "engine_params.hpp"
#include "snapshot.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

struct FibonacciLevel {
    std::string name;   // "TP1".."TPn"
    double ratio;
    double price;
};

using FibonacciTargets = std::vector<FibonacciLevel>;

struct Signal {
    bool has_signal = false;
    Direction direction = Direction::None;
    int strength = 0;                    // 0..max_signal_strength
    std::vector<std::string> reasons;    // one line per rule hit, in rule order
    FibonacciTargets fibonacci_targets;
    std::optional<double> stop_loss;
    std::optional<double> price;

    // Context from the short timeframe, for the alert
    std::optional<double> rsi_short;
    std::optional<double> rsi_long;
    std::optional<double> obv;
    bool volume_spike = false;
    PatternSet patterns;
    Trend reference_trend = Trend::Neutral;

    // Raw rule counts before the strength cap
    int long_score = 0;
    int short_score = 0;

    bool valid = false;
};

struct SideScore {
    int score = 0;
    std::vector<std::string> reasons;
};

class EntryScorer {
public:
    explicit EntryScorer(const EngineParams& params = EngineParams());

    Signal score_entry(const IndicatorSnapshot& short_tf,
                       const IndicatorSnapshot& long_tf,
                       Trend reference_trend) const;

    // Rule tally for one side; throws std::invalid_argument for Direction::None
    SideScore score_side(Direction d,
                         const IndicatorSnapshot& short_tf,
                         const IndicatorSnapshot& long_tf,
                         Trend reference_trend) const;

private:
    EngineParams params_;
};

// Long: low + diff*ratio; short: high - diff*ratio. Throws for Direction::None.
FibonacciTargets fibonacci_targets(double high, double low, Direction d,
                                   const std::vector<double>& ratios);

// price -/+ atr*multiplier. Throws for Direction::None.
double atr_stop_loss(double price, double atr, double multiplier, Direction d);

// Gate before a signal may reach the alerting side
bool validate_signal_quality(const Signal& signal, const EngineParams& params = EngineParams());
