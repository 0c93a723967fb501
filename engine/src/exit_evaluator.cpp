#include "exit_evaluator.hpp"
#include <algorithm>
#include <stdexcept>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

const char* to_string(ExitType t) {
    switch (t) {
        case ExitType::TakeProfit:   return "take_profit";
        case ExitType::StopLoss:     return "stop_loss";
        case ExitType::TrailingStop: return "trailing_stop";
        case ExitType::Reversal:     return "reversal";
        default:                     return "none";
    }
}

ExitEvaluator::ExitEvaluator(const EngineParams& params)
    : params_(params) {}

double ExitEvaluator::profit_pct(Direction d, double entry_price, double price) {
    if (entry_price <= 0) return 0.0;
    if (d == Direction::Long) return ((price - entry_price) / entry_price) * 100.0;
    if (d == Direction::Short) return ((entry_price - price) / entry_price) * 100.0;
    throw std::invalid_argument("Profit needs a direction");
}

ExitDecision ExitEvaluator::evaluate_exit(const Position& position,
                                          const IndicatorSnapshot& short_tf,
                                          const IndicatorSnapshot& long_tf,
                                          const CandleSeries& short_series) const {
    if (position.direction == Direction::None) {
        throw std::invalid_argument("Position " + position.symbol + " has no direction");
    }

    ExitDecision decision;

    if (!short_tf.current_price || position.entry_price <= 0) {
        return decision;
    }

    const double price = *short_tf.current_price;
    decision.profit_loss_pct = profit_pct(position.direction, position.entry_price, price);
    decision.suggested_exit_price = price;

    if (auto level = check_take_profit(position, price)) {
        decision.should_exit = true;
        decision.exit_type = ExitType::TakeProfit;
        decision.fibonacci_hit = *level;
        decision.reason = fmt::format("Fibonacci {} reached", *level);
    } else if (auto stop = check_stop_loss(position, price, short_tf, long_tf, short_series)) {
        decision.should_exit = true;
        decision.exit_type = ExitType::StopLoss;
        decision.reason = *stop;
    } else {
        auto votes = reversal_signals(position.direction, short_tf, long_tf);
        if (static_cast<int>(votes.size()) >= params_.reversal_vote_threshold) {
            decision.should_exit = true;
            decision.exit_type = ExitType::Reversal;
            decision.reason = fmt::format("Reversal signals: {}", fmt::join(votes, ", "));
            decision.technical_signals = std::move(votes);
        } else if (auto trail = check_trailing_stop(position.direction, price,
                                                    decision.profit_loss_pct, short_series)) {
            decision.should_exit = true;
            decision.exit_type = ExitType::TrailingStop;
            decision.reason = *trail;
        }
    }

    if (decision.should_exit) {
        spdlog::info("Exit {} for {} {}: {} (P&L {:+.2f}%)",
                     to_string(decision.exit_type), to_string(position.direction),
                     position.symbol, decision.reason, decision.profit_loss_pct);
    }

    return decision;
}

std::optional<std::string> ExitEvaluator::check_take_profit(const Position& position,
                                                            double price) const {
    size_t levels = std::min(params_.take_profit_levels, position.fibonacci_targets.size());

    for (size_t i = 0; i < levels; i++) {
        const auto& level = position.fibonacci_targets[i];
        if (level.price <= 0) continue;

        bool reached = (position.direction == Direction::Long) ? price >= level.price
                                                               : price <= level.price;
        if (reached) return level.name;
    }

    return std::nullopt;
}

std::optional<std::string> ExitEvaluator::check_stop_loss(const Position& position, double price,
                                                          const IndicatorSnapshot& short_tf,
                                                          const IndicatorSnapshot& long_tf,
                                                          const CandleSeries& short_series) const {
    const bool is_long = (position.direction == Direction::Long);

    // a. Entry stop formula recomputed on the current close and ATR.
    // Only a zero ATR puts the level on the price itself.
    if (short_tf.atr) {
        double stop = atr_stop_loss(price, *short_tf.atr,
                                    params_.atr_multiplier, position.direction);
        if ((is_long && price <= stop) || (!is_long && price >= stop)) {
            return fmt::format("ATR stop loss hit: {:.6f}", stop);
        }
    }

    // b. Previous bar extreme broken
    if (short_series.size() >= 2) {
        const Candle& prev = short_series[short_series.size() - 2];
        if (is_long && price <= prev.low) {
            return fmt::format("Price broke previous candle low: {:.6f}", prev.low);
        }
        if (!is_long && price >= prev.high) {
            return fmt::format("Price broke previous candle high: {:.6f}", prev.high);
        }
    }

    // c. EMA cross against the position on the long timeframe
    if (long_tf.ema_fast && long_tf.ema_slow && long_tf.ema_fast_prev && long_tf.ema_slow_prev) {
        double fast = *long_tf.ema_fast, slow = *long_tf.ema_slow;
        double prev_fast = *long_tf.ema_fast_prev, prev_slow = *long_tf.ema_slow_prev;

        if (is_long && prev_fast > prev_slow && fast < slow) {
            return fmt::format("Bearish EMA cross ({} < {})",
                               params_.ema_fast_period, params_.ema_slow_period);
        }
        if (!is_long && prev_fast < prev_slow && fast > slow) {
            return fmt::format("Bullish EMA cross ({} > {})",
                               params_.ema_fast_period, params_.ema_slow_period);
        }
    }

    // d. RSI collapsed (long) or blew out (short)
    if (short_tf.rsi_long) {
        double rsi = *short_tf.rsi_long;
        if (is_long && rsi < params_.stop_rsi_long_floor) {
            return fmt::format("RSI extremely low: {:.1f}", rsi);
        }
        if (!is_long && rsi > params_.stop_rsi_short_ceiling) {
            return fmt::format("RSI extremely high: {:.1f}", rsi);
        }
    }

    return std::nullopt;
}

std::vector<std::string> ExitEvaluator::reversal_signals(Direction d,
                                                         const IndicatorSnapshot& short_tf,
                                                         const IndicatorSnapshot& long_tf) const {
    const bool is_long = (d == Direction::Long);
    std::vector<std::string> votes;

    const ObvTrend against_obv = is_long ? ObvTrend::Falling : ObvTrend::Rising;
    if (short_tf.obv_trend && *short_tf.obv_trend == against_obv) {
        votes.push_back(fmt::format("OBV diverging ({})", to_string(against_obv)));
    }

    if (auto tag = CandlePatterns::first_match(short_tf.patterns, opposite(d))) {
        votes.push_back(fmt::format("{} pattern: {}", is_long ? "Bearish" : "Bullish",
                                    to_string(*tag)));
    }

    if (short_tf.rsi_long) {
        double rsi = *short_tf.rsi_long;
        if (is_long && rsi > params_.reversal_rsi_overbought) {
            votes.push_back(fmt::format("RSI overbought: {:.1f}", rsi));
        } else if (!is_long && rsi < params_.reversal_rsi_oversold) {
            votes.push_back(fmt::format("RSI oversold: {:.1f}", rsi));
        }
    }

    const Trend against_trend = favoured_trend(opposite(d));
    if (long_tf.trend && *long_tf.trend == against_trend) {
        votes.push_back(fmt::format("Long timeframe trend {}", to_string(against_trend)));
    }

    return votes;
}

std::optional<std::string> ExitEvaluator::check_trailing_stop(Direction d, double price,
                                                              double pnl_pct,
                                                              const CandleSeries& short_series) const {
    if (pnl_pct <= params_.trailing_activation_pct || short_series.empty()) {
        return std::nullopt;
    }

    const double offset = params_.trailing_offset_pct / 100.0;
    const size_t lookback = std::min(params_.trailing_lookback, short_series.size());
    const size_t start = short_series.size() - lookback;

    if (d == Direction::Long) {
        double best_low = short_series[start].low;
        for (size_t i = start; i < short_series.size(); i++) {
            best_low = std::max(best_low, short_series[i].low);
        }
        double level = best_low * (1.0 - offset);
        if (price <= level) return fmt::format("Trailing stop triggered: {:.6f}", level);
    } else {
        double best_high = short_series[start].high;
        for (size_t i = start; i < short_series.size(); i++) {
            best_high = std::min(best_high, short_series[i].high);
        }
        double level = best_high * (1.0 + offset);
        if (price >= level) return fmt::format("Trailing stop triggered: {:.6f}", level);
    }

    return std::nullopt;
}
