#include "entry_scorer.hpp"
#include <algorithm>
#include <stdexcept>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

EntryScorer::EntryScorer(const EngineParams& params)
    : params_(params) {}

SideScore EntryScorer::score_side(Direction d,
                                  const IndicatorSnapshot& short_tf,
                                  const IndicatorSnapshot& long_tf,
                                  Trend reference_trend) const {
    if (d == Direction::None) {
        throw std::invalid_argument("Cannot score direction none");
    }

    const bool is_long = (d == Direction::Long);
    const Trend wanted = favoured_trend(d);
    SideScore side;

    auto hit = [&side](std::string reason) {
        side.score++;
        side.reasons.push_back(std::move(reason));
    };

    auto in_zone = [&](const std::optional<double>& rsi) {
        if (!rsi) return false;
        return is_long ? *rsi < params_.rsi_oversold : *rsi > params_.rsi_overbought;
    };
    const char* zone = is_long ? "oversold" : "overbought";

    // 1. Reference asset agrees
    if (reference_trend == wanted) {
        hit(fmt::format("Reference trend {}", to_string(wanted)));
    }

    // 2-3. RSI extremes on the short timeframe
    if (in_zone(short_tf.rsi_short)) {
        hit(fmt::format("RSI {} {} ({:.1f})", params_.rsi_short_period, zone, *short_tf.rsi_short));
    }
    if (in_zone(short_tf.rsi_long)) {
        hit(fmt::format("RSI {} {} ({:.1f})", params_.rsi_long_period, zone, *short_tf.rsi_long));
    }

    // 4. EMA trend on the long timeframe
    if (long_tf.trend && *long_tf.trend == wanted) {
        hit(fmt::format("EMA trend {} (long timeframe)", to_string(wanted)));
    }

    // 5. OBV direction
    const ObvTrend wanted_obv = is_long ? ObvTrend::Rising : ObvTrend::Falling;
    if (short_tf.obv_trend && *short_tf.obv_trend == wanted_obv) {
        hit(fmt::format("OBV {}", to_string(wanted_obv)));
    }

    // 6. Volume spike, direction agnostic
    if (short_tf.volume_spike) {
        hit("Volume spike detected");
    }

    // 7. At most one candlestick pattern, first in priority order
    if (auto tag = CandlePatterns::first_match(short_tf.patterns, d)) {
        hit(fmt::format("Pattern {} detected", to_string(*tag)));
    }

    // 8. Price close to the long-timeframe level
    const double band = params_.proximity_pct / 100.0;
    if (short_tf.current_price) {
        double price = *short_tf.current_price;
        if (is_long && long_tf.support && price <= *long_tf.support * (1.0 + band)) {
            hit("Price near support");
        } else if (!is_long && long_tf.resistance && price >= *long_tf.resistance * (1.0 - band)) {
            hit("Price near resistance");
        }
    }

    return side;
}

Signal EntryScorer::score_entry(const IndicatorSnapshot& short_tf,
                                const IndicatorSnapshot& long_tf,
                                Trend reference_trend) const {
    Signal signal;
    signal.price = short_tf.current_price;
    signal.rsi_short = short_tf.rsi_short;
    signal.rsi_long = short_tf.rsi_long;
    signal.obv = short_tf.obv;
    signal.volume_spike = short_tf.volume_spike;
    signal.patterns = short_tf.patterns;
    signal.reference_trend = reference_trend;

    if (short_tf.empty() || long_tf.empty()) {
        return signal;
    }

    auto long_side = score_side(Direction::Long, short_tf, long_tf, reference_trend);
    auto short_side = score_side(Direction::Short, short_tf, long_tf, reference_trend);
    signal.long_score = long_side.score;
    signal.short_score = short_side.score;

    SideScore* winner = nullptr;
    if (long_side.score > short_side.score && long_side.score >= params_.min_signal_strength) {
        signal.direction = Direction::Long;
        winner = &long_side;
    } else if (short_side.score > long_side.score && short_side.score >= params_.min_signal_strength) {
        signal.direction = Direction::Short;
        winner = &short_side;
    }

    if (!winner) {
        spdlog::debug("No entry: long={} short={}", long_side.score, short_side.score);
        return signal;
    }

    signal.has_signal = true;
    // Eight rules can fire but strength is reported on a 0..7 scale
    signal.strength = std::min(winner->score, params_.max_signal_strength);
    signal.reasons = std::move(winner->reasons);

    if (long_tf.range_high && long_tf.range_low) {
        signal.fibonacci_targets = fibonacci_targets(*long_tf.range_high, *long_tf.range_low,
                                                     signal.direction, params_.fibonacci_ratios);
    }
    if (short_tf.current_price && short_tf.atr) {
        signal.stop_loss = atr_stop_loss(*short_tf.current_price, *short_tf.atr,
                                         params_.atr_multiplier, signal.direction);
    }

    signal.valid = validate_signal_quality(signal, params_);

    spdlog::debug("Entry {} strength {} (long={}, short={}, valid={})",
                  to_string(signal.direction), signal.strength,
                  signal.long_score, signal.short_score, signal.valid);

    return signal;
}

FibonacciTargets fibonacci_targets(double high, double low, Direction d,
                                   const std::vector<double>& ratios) {
    if (d == Direction::None) {
        throw std::invalid_argument("Fibonacci targets need a direction");
    }

    const double diff = high - low;
    FibonacciTargets targets;
    targets.reserve(ratios.size());

    for (size_t i = 0; i < ratios.size(); i++) {
        FibonacciLevel level;
        level.name = fmt::format("TP{}", i + 1);
        level.ratio = ratios[i];
        level.price = (d == Direction::Long) ? low + diff * ratios[i]
                                             : high - diff * ratios[i];
        targets.push_back(level);
    }

    return targets;
}

double atr_stop_loss(double price, double atr, double multiplier, Direction d) {
    if (d == Direction::Long) return price - atr * multiplier;
    if (d == Direction::Short) return price + atr * multiplier;
    throw std::invalid_argument("ATR stop needs a direction");
}

bool validate_signal_quality(const Signal& signal, const EngineParams& params) {
    if (signal.strength < params.min_signal_strength) return false;
    if (!signal.price || *signal.price <= 0) return false;
    if (!signal.stop_loss || *signal.stop_loss <= 0) return false;
    if (signal.fibonacci_targets.empty()) return false;

    return std::all_of(signal.fibonacci_targets.begin(), signal.fibonacci_targets.end(),
                       [](const FibonacciLevel& l) { return l.price > 0; });
}
