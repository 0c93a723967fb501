#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/ranges.h>
#include <limits>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

std::size_t Config::get_env_size(const char* name, std::size_t default_val) {
    int val = get_env_int(name, static_cast<int>(default_val));
    if (val < 0) {
        spdlog::warn("Negative value {} for {}, using default {}", val, name, default_val);
        return default_val;
    }
    return static_cast<std::size_t>(val);
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
}

std::vector<double> Config::get_env_list(const char* name, const std::vector<double>& default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;

    std::vector<double> out;
    try {
        for (const auto& part : util::split(val, ',')) {
            if (!part.empty()) out.push_back(std::stod(part));
        }
    } catch (const std::exception&) {
        spdlog::warn("Invalid list for {}, using default", name);
        return default_val;
    }
    return out;
}

Config Config::from_env() {
    Config cfg;
    EngineParams defaults;

    cfg.service_name = get_env("SERVICE_NAME", "scalpscout");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    cfg.reference_symbol = util::normalize_symbol(get_env("REFERENCE_SYMBOL", "BTC_USDT"));
    cfg.max_symbols_per_cycle = get_env_int("MAX_SYMBOLS_PER_CYCLE", 20);
    for (double h : get_env_list("PRIORITY_HOURS", {0, 6, 13})) {
        cfg.priority_hours.push_back(static_cast<int>(h));
    }

    cfg.account_balance = get_env_double("ACCOUNT_BALANCE", 1000.0);
    cfg.position_size_percent = get_env_double("POSITION_SIZE_PERCENT", 1.0);
    cfg.min_position_size = get_env_double("MIN_POSITION_SIZE", 1.0);
    cfg.leverage = get_env_int("LEVERAGE", 7);

    auto& e = cfg.engine;
    e.rsi_short_period = get_env_size("RSI_PERIOD_SHORT", defaults.rsi_short_period);
    e.rsi_long_period = get_env_size("RSI_PERIOD_LONG", defaults.rsi_long_period);
    e.ema_fast_period = get_env_size("EMA_FAST", defaults.ema_fast_period);
    e.ema_slow_period = get_env_size("EMA_SLOW", defaults.ema_slow_period);
    e.atr_period = get_env_size("ATR_PERIOD", defaults.atr_period);
    e.volume_spike_multiplier = get_env_double("VOLUME_SPIKE_MULTIPLIER", defaults.volume_spike_multiplier);
    e.volume_lookback = get_env_size("VOLUME_LOOKBACK", defaults.volume_lookback);
    e.sr_window = get_env_size("SR_WINDOW", defaults.sr_window);

    e.rsi_oversold = get_env_double("RSI_OVERSOLD", defaults.rsi_oversold);
    e.rsi_overbought = get_env_double("RSI_OVERBOUGHT", defaults.rsi_overbought);
    e.proximity_pct = get_env_double("PROXIMITY_PCT", defaults.proximity_pct);
    e.min_signal_strength = get_env_int("MIN_SIGNAL_STRENGTH", defaults.min_signal_strength);

    e.fibonacci_lookback = get_env_size("FIBONACCI_LOOKBACK", defaults.fibonacci_lookback);
    e.fibonacci_ratios = get_env_list("FIBONACCI_RATIOS", defaults.fibonacci_ratios);
    e.atr_multiplier = get_env_double("ATR_MULTIPLIER", defaults.atr_multiplier);

    e.reversal_vote_threshold = get_env_int("REVERSAL_VOTE_THRESHOLD", defaults.reversal_vote_threshold);
    e.trailing_activation_pct = get_env_double("TRAILING_ACTIVATION_PCT", defaults.trailing_activation_pct);
    e.trailing_lookback = get_env_size("TRAILING_LOOKBACK", defaults.trailing_lookback);
    e.trailing_offset_pct = get_env_double("TRAILING_OFFSET_PCT", defaults.trailing_offset_pct);

    return cfg;
}

void Config::validate() const {
    const auto& e = engine;

    if (e.rsi_short_period == 0 || e.rsi_long_period == 0 || e.atr_period == 0 ||
        e.ema_fast_period == 0 || e.ema_slow_period == 0 || e.volume_lookback == 0) {
        throw std::runtime_error("Indicator periods must be positive");
    }
    const std::size_t max_window = static_cast<std::size_t>(std::numeric_limits<int>::max());
    for (std::size_t window : {e.rsi_short_period, e.rsi_long_period, e.ema_fast_period, e.ema_slow_period,
                               e.atr_period, e.volume_lookback, e.sr_window, e.fibonacci_lookback,
                               e.trailing_lookback}) {
        if (window > max_window) {
            throw std::runtime_error(fmt::format("Window length {} is out of range", window));
        }
    }
    if (e.ema_fast_period >= e.ema_slow_period) {
        throw std::runtime_error("EMA_FAST must be below EMA_SLOW");
    }
    if (e.rsi_oversold >= e.rsi_overbought) {
        throw std::runtime_error("RSI_OVERSOLD must be below RSI_OVERBOUGHT");
    }
    if (e.fibonacci_ratios.empty()) {
        throw std::runtime_error("FIBONACCI_RATIOS must not be empty");
    }
    if (e.min_signal_strength > e.max_signal_strength) {
        throw std::runtime_error("MIN_SIGNAL_STRENGTH above the maximum strength");
    }
    if (account_balance <= 0) {
        throw std::runtime_error("ACCOUNT_BALANCE must be positive");
    }
    if (max_symbols_per_cycle <= 0) {
        throw std::runtime_error("MAX_SYMBOLS_PER_CYCLE must be positive");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Reference: {}, max symbols per cycle: {}", reference_symbol, max_symbols_per_cycle);
    spdlog::info("  RSI {}/{} zones {}/{}, EMA {}/{}", e.rsi_short_period, e.rsi_long_period,
                 e.rsi_oversold, e.rsi_overbought, e.ema_fast_period, e.ema_slow_period);
    spdlog::info("  Fibonacci ratios: {}", fmt::join(e.fibonacci_ratios, ", "));
}
