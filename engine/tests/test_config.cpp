#include <catch2/catch_test_macros.hpp>
#include "../src/config.hpp"
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace {

// Sets an environment variable for the lifetime of the guard
struct EnvGuard {
    std::string name;
    EnvGuard(const std::string& n, const std::string& value) : name(n) {
        setenv(name.c_str(), value.c_str(), 1);
    }
    ~EnvGuard() { unsetenv(name.c_str()); }
};

} // namespace

TEST_CASE("Configuration from environment", "[config]") {
    SECTION("Defaults") {
        Config cfg = Config::from_env();
        REQUIRE(cfg.service_name == "scalpscout");
        REQUIRE(cfg.reference_symbol == "BTC_USDT");
        REQUIRE(cfg.max_symbols_per_cycle == 20);
        REQUIRE(cfg.priority_hours == std::vector<int>{0, 6, 13});
        REQUIRE(cfg.leverage == 7);
        REQUIRE(cfg.engine.rsi_short_period == 7);
        REQUIRE(cfg.engine.ema_slow_period == 50);
        REQUIRE(cfg.engine.fibonacci_ratios.size() == 4);
        REQUIRE_NOTHROW(cfg.validate());
    }

    SECTION("Overrides") {
        EnvGuard rsi("RSI_PERIOD_SHORT", "9");
        EnvGuard ratios("FIBONACCI_RATIOS", "0.5, 1.0");
        EnvGuard symbol("REFERENCE_SYMBOL", "eth/usdt");

        Config cfg = Config::from_env();
        REQUIRE(cfg.engine.rsi_short_period == 9);
        REQUIRE(cfg.engine.fibonacci_ratios == std::vector<double>{0.5, 1.0});
        REQUIRE(cfg.reference_symbol == "ETH_USDT");
    }

    SECTION("Invalid numbers keep the default") {
        EnvGuard fast("EMA_FAST", "twenty");
        EnvGuard balance("ACCOUNT_BALANCE", "lots");

        Config cfg = Config::from_env();
        REQUIRE(cfg.engine.ema_fast_period == 20);
        REQUIRE(cfg.account_balance == 1000.0);
    }

    SECTION("Negative window lengths keep the default") {
        EnvGuard lookback("VOLUME_LOOKBACK", "-1");
        EnvGuard trailing("TRAILING_LOOKBACK", "-10");

        Config cfg = Config::from_env();
        REQUIRE(cfg.engine.volume_lookback == 20);
        REQUIRE(cfg.engine.trailing_lookback == 10);
        REQUIRE_NOTHROW(cfg.validate());
    }
}

TEST_CASE("Configuration validation", "[config]") {
    Config cfg = Config::from_env();

    SECTION("Fast EMA must be below slow EMA") {
        cfg.engine.ema_fast_period = 50;
        REQUIRE_THROWS_AS(cfg.validate(), std::runtime_error);
    }

    SECTION("Oversold must be below overbought") {
        cfg.engine.rsi_oversold = 70.0;
        REQUIRE_THROWS_AS(cfg.validate(), std::runtime_error);
    }

    SECTION("Zero period") {
        cfg.engine.atr_period = 0;
        REQUIRE_THROWS_AS(cfg.validate(), std::runtime_error);
    }

    SECTION("Wrapped window length") {
        cfg.engine.volume_lookback = static_cast<size_t>(-1);
        REQUIRE_THROWS_AS(cfg.validate(), std::runtime_error);
    }

    SECTION("Window length above the int range") {
        cfg.engine.sr_window = static_cast<size_t>(std::numeric_limits<int>::max()) + 1;
        REQUIRE_THROWS_AS(cfg.validate(), std::runtime_error);
    }

    SECTION("Empty Fibonacci ratios") {
        cfg.engine.fibonacci_ratios.clear();
        REQUIRE_THROWS_AS(cfg.validate(), std::runtime_error);
    }

    SECTION("Non-positive balance") {
        cfg.account_balance = 0.0;
        REQUIRE_THROWS_AS(cfg.validate(), std::runtime_error);
    }
}
