#include <catch2/catch_test_macros.hpp>
#include "../src/formatter.hpp"

namespace {

bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

} // namespace

TEST_CASE("Entry alert", "[formatter]") {
    AlertFormatter formatter(7, 7);

    Signal signal;
    signal.has_signal = true;
    signal.direction = Direction::Long;
    signal.strength = 6;
    signal.price = 101.5;
    signal.stop_loss = 99.5;
    signal.rsi_short = 24.3;
    signal.rsi_long = 29.9;
    signal.reasons = {"RSI 7 oversold (24.3)", "OBV rising"};
    signal.fibonacci_targets = fibonacci_targets(110.0, 100.0, Direction::Long, {0.382, 0.618});
    signal.obv = 12345.6;

    auto alert = formatter.format_entry("SOL_USDT", signal, 10.0);

    REQUIRE_FALSE(alert.split_required);
    REQUIRE(alert.parts.size() == 1);
    REQUIRE(contains(alert.text, "LONG SOL_USDT"));
    REQUIRE(contains(alert.text, "<b>Strength:</b> 6/7"));
    REQUIRE(contains(alert.text, "<b>RSI:</b> 24.3 / 29.9"));
    REQUIRE(contains(alert.text, "TP1 (38.2%): $103.820000"));
    REQUIRE(contains(alert.text, "<b>Stop loss:</b> $99.500000"));
    REQUIRE(contains(alert.text, "<b>Leverage:</b> 7x"));
    REQUIRE(contains(alert.text, "$10.00 USDT"));
    REQUIRE(contains(alert.text, "<b>OBV:</b> 12346"));
    REQUIRE(contains(alert.text, "• OBV rising"));
    REQUIRE(contains(alert.text, " UTC</i>"));
}

TEST_CASE("Exit alert", "[formatter]") {
    AlertFormatter formatter;

    Position p;
    p.symbol = "ETH_USDT";
    p.direction = Direction::Short;
    p.entry_price = 3000.0;

    ExitDecision d;
    d.should_exit = true;
    d.exit_type = ExitType::TakeProfit;
    d.reason = "Fibonacci TP1 reached";
    d.profit_loss_pct = 2.5;
    d.suggested_exit_price = 2925.0;

    auto alert = formatter.format_exit(p, d);
    REQUIRE(contains(alert.text, "SHORT ETH_USDT"));
    REQUIRE(contains(alert.text, "Take Profit"));
    REQUIRE(contains(alert.text, "+2.50%"));
    REQUIRE(contains(alert.text, "Fibonacci TP1 reached"));
}

TEST_CASE("Free text is escaped for HTML", "[formatter]") {
    AlertFormatter formatter;

    SECTION("Entry reasons") {
        Signal signal;
        signal.direction = Direction::Short;
        signal.reasons = {"EMA 20 < EMA 50 & falling"};

        auto alert = formatter.format_entry("SOL_USDT", signal, 10.0);
        REQUIRE(contains(alert.text, "• EMA 20 &lt; EMA 50 &amp; falling"));
        REQUIRE_FALSE(contains(alert.text, "20 < EMA"));
        REQUIRE(contains(alert.text, "<b>OBV:</b> -"));
    }

    SECTION("Exit reason and symbol") {
        Position p;
        p.symbol = "<SOL>";
        p.direction = Direction::Long;
        p.entry_price = 100.0;

        ExitDecision d;
        d.should_exit = true;
        d.exit_type = ExitType::StopLoss;
        d.reason = "Bearish EMA cross (20 < 50)";

        auto alert = formatter.format_exit(p, d);
        REQUIRE(contains(alert.text, "<b>Reason:</b> Bearish EMA cross (20 &lt; 50)"));
        REQUIRE(contains(alert.text, "LONG &lt;SOL&gt;"));
        REQUIRE(contains(alert.text, "<b>P&amp;L:</b>"));
    }
}

TEST_CASE("Long messages are split", "[formatter]") {
    std::string text;
    for (int i = 0; i < 200; i++) {
        text += "• Line number " + std::to_string(i) + " with some padding text\n";
    }
    REQUIRE(text.size() > 4000);

    auto parts = AlertFormatter::split_if_needed(text);
    REQUIRE(parts.size() > 1);
    for (const auto& part : parts) {
        REQUIRE(part.size() <= 4000);
    }
    REQUIRE(contains(parts[1], "(continued)"));
    REQUIRE(contains(parts.back(), "Line number 199"));
}
