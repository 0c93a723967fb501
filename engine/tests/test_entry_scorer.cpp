#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/entry_scorer.hpp"
#include "fixtures.hpp"
#include <algorithm>
#include <stdexcept>

using Catch::Matchers::WithinAbs;

namespace {

// Every long rule fires: reference, both RSIs, EMA, OBV, volume, pattern, support
void bullish_setup(IndicatorSnapshot& short_tf, IndicatorSnapshot& long_tf) {
    short_tf = snapshot_at(100.0);
    short_tf.rsi_short = 25.0;
    short_tf.rsi_long = 28.0;
    short_tf.obv_trend = ObvTrend::Rising;
    short_tf.volume_spike = true;
    short_tf.patterns = {PatternTag::Hammer, PatternTag::BullishEngulfing, PatternTag::BullishPinbar};
    short_tf.atr = 1.0;

    long_tf = snapshot_at(100.0);
    long_tf.trend = Trend::Bullish;
    long_tf.support = 99.0;
    long_tf.resistance = 120.0;
    long_tf.range_high = 110.0;
    long_tf.range_low = 100.0;
}

// Mirror image of bullish_setup
void bearish_setup(IndicatorSnapshot& short_tf, IndicatorSnapshot& long_tf) {
    short_tf = snapshot_at(100.0);
    short_tf.rsi_short = 75.0;
    short_tf.rsi_long = 72.0;
    short_tf.obv_trend = ObvTrend::Falling;
    short_tf.volume_spike = true;
    short_tf.patterns = {PatternTag::InvertedHammer, PatternTag::BearishEngulfing, PatternTag::BearishPinbar};
    short_tf.atr = 1.0;

    long_tf = snapshot_at(100.0);
    long_tf.trend = Trend::Bearish;
    long_tf.support = 80.0;
    long_tf.resistance = 101.0;
    long_tf.range_high = 110.0;
    long_tf.range_low = 100.0;
}

int pattern_reasons(const std::vector<std::string>& reasons) {
    return static_cast<int>(std::count_if(reasons.begin(), reasons.end(), [](const std::string& r) {
        return r.rfind("Pattern ", 0) == 0;
    }));
}

} // namespace

TEST_CASE("Fibonacci targets", "[entry]") {
    std::vector<double> ratios = {0.382, 0.618, 1.0, 1.618};

    SECTION("Long projects up from the low") {
        auto targets = fibonacci_targets(110.0, 100.0, Direction::Long, ratios);
        REQUIRE(targets.size() == 4);
        REQUIRE(targets[0].name == "TP1");
        REQUIRE(targets[3].name == "TP4");
        REQUIRE_THAT(targets[0].price, WithinAbs(103.82, 1e-9));
        REQUIRE_THAT(targets[1].price, WithinAbs(106.18, 1e-9));
        REQUIRE_THAT(targets[2].price, WithinAbs(110.0, 1e-9));
        REQUIRE_THAT(targets[3].price, WithinAbs(116.18, 1e-9));
    }

    SECTION("Short projects down from the high") {
        auto targets = fibonacci_targets(110.0, 100.0, Direction::Short, ratios);
        REQUIRE_THAT(targets[0].price, WithinAbs(106.18, 1e-9));
        REQUIRE_THAT(targets[1].price, WithinAbs(103.82, 1e-9));
        REQUIRE_THAT(targets[2].price, WithinAbs(100.0, 1e-9));
        REQUIRE_THAT(targets[3].price, WithinAbs(93.82, 1e-9));
    }

    SECTION("Direction none throws") {
        REQUIRE_THROWS_AS(fibonacci_targets(110.0, 100.0, Direction::None, ratios), std::invalid_argument);
    }
}

TEST_CASE("ATR stop loss", "[entry]") {
    REQUIRE_THAT(atr_stop_loss(100.0, 2.0, 2.0, Direction::Long), WithinAbs(96.0, 1e-9));
    REQUIRE_THAT(atr_stop_loss(100.0, 2.0, 2.0, Direction::Short), WithinAbs(104.0, 1e-9));
    REQUIRE_THROWS_AS(atr_stop_loss(100.0, 2.0, 2.0, Direction::None), std::invalid_argument);
}

TEST_CASE("Signal quality gate", "[entry]") {
    Signal signal;
    signal.has_signal = true;
    signal.direction = Direction::Long;
    signal.strength = 3;
    signal.price = 50000.0;
    signal.stop_loss = 49000.0;
    signal.fibonacci_targets = fibonacci_targets(52000.0, 48000.0, Direction::Long, {0.382, 0.618});

    SECTION("Complete signal passes") {
        REQUIRE(validate_signal_quality(signal));
    }

    SECTION("Strength below minimum fails") {
        signal.strength = 2;
        REQUIRE_FALSE(validate_signal_quality(signal));
    }

    SECTION("Missing stop fails") {
        signal.stop_loss.reset();
        REQUIRE_FALSE(validate_signal_quality(signal));
    }

    SECTION("Non-positive stop fails") {
        signal.stop_loss = 0.0;
        REQUIRE_FALSE(validate_signal_quality(signal));
    }

    SECTION("No targets fails") {
        signal.fibonacci_targets.clear();
        REQUIRE_FALSE(validate_signal_quality(signal));
    }

    SECTION("Negative target fails") {
        signal.fibonacci_targets.back().price = -1.0;
        REQUIRE_FALSE(validate_signal_quality(signal));
    }
}

TEST_CASE("Entry scoring", "[entry]") {
    EntryScorer scorer;
    IndicatorSnapshot short_tf, long_tf;

    SECTION("All eight long rules fire but strength caps at seven") {
        bullish_setup(short_tf, long_tf);
        auto signal = scorer.score_entry(short_tf, long_tf, Trend::Bullish);

        REQUIRE(signal.has_signal);
        REQUIRE(signal.direction == Direction::Long);
        REQUIRE(signal.long_score == 8);
        REQUIRE(signal.short_score == 1);
        REQUIRE(signal.strength == 7);
        REQUIRE(signal.reasons.size() == 8);
        REQUIRE(signal.valid);

        REQUIRE(signal.reasons[0] == "Reference trend bullish");
        REQUIRE(signal.reasons[1] == "RSI 7 oversold (25.0)");
        REQUIRE(signal.reasons[2] == "RSI 14 oversold (28.0)");
        REQUIRE(signal.reasons[3] == "EMA trend bullish (long timeframe)");
        REQUIRE(signal.reasons[4] == "OBV rising");
        REQUIRE(signal.reasons[5] == "Volume spike detected");
        REQUIRE(signal.reasons[6] == "Pattern hammer detected");
        REQUIRE(signal.reasons[7] == "Price near support");
    }

    SECTION("Targets and stop come from the long window and short ATR") {
        bullish_setup(short_tf, long_tf);
        auto signal = scorer.score_entry(short_tf, long_tf, Trend::Bullish);

        REQUIRE_THAT(*signal.stop_loss, WithinAbs(98.0, 1e-9));
        REQUIRE(signal.fibonacci_targets.size() == 4);
        REQUIRE_THAT(signal.fibonacci_targets[0].price, WithinAbs(103.82, 1e-9));
        REQUIRE(*signal.price == 100.0);
    }

    SECTION("Only one pattern counts") {
        bullish_setup(short_tf, long_tf);
        auto side = scorer.score_side(Direction::Long, short_tf, long_tf, Trend::Bullish);
        REQUIRE(pattern_reasons(side.reasons) == 1);

        short_tf.patterns = {PatternTag::BullishPinbar, PatternTag::BullishEngulfing};
        side = scorer.score_side(Direction::Long, short_tf, long_tf, Trend::Bullish);
        REQUIRE(pattern_reasons(side.reasons) == 1);
        REQUIRE(std::find(side.reasons.begin(), side.reasons.end(),
                          "Pattern bullish_engulfing detected") != side.reasons.end());
    }

    SECTION("Mirrored inputs give the mirrored signal") {
        bullish_setup(short_tf, long_tf);
        auto up = scorer.score_entry(short_tf, long_tf, Trend::Bullish);

        bearish_setup(short_tf, long_tf);
        auto down = scorer.score_entry(short_tf, long_tf, Trend::Bearish);

        REQUIRE(down.direction == Direction::Short);
        REQUIRE(down.short_score == up.long_score);
        REQUIRE(down.long_score == up.short_score);
        REQUIRE(down.strength == up.strength);
        REQUIRE(down.reasons.back() == "Price near resistance");
        REQUIRE_THAT(*down.stop_loss, WithinAbs(102.0, 1e-9));
    }

    SECTION("Tie produces no signal") {
        short_tf = snapshot_at(100.0);
        short_tf.rsi_short = 25.0;
        short_tf.obv_trend = ObvTrend::Falling;
        short_tf.volume_spike = true;
        short_tf.patterns = {PatternTag::Hammer, PatternTag::InvertedHammer};
        short_tf.atr = 1.0;

        long_tf = snapshot_at(100.0);
        long_tf.trend = Trend::Bearish;
        long_tf.support = 99.0;
        long_tf.resistance = 120.0;

        auto signal = scorer.score_entry(short_tf, long_tf, Trend::Neutral);
        REQUIRE(signal.long_score == 4);
        REQUIRE(signal.short_score == 4);
        REQUIRE_FALSE(signal.has_signal);
        REQUIRE(signal.direction == Direction::None);
        REQUIRE(signal.strength == 0);
        REQUIRE(signal.reasons.empty());
    }

    SECTION("Below minimum strength produces no signal") {
        short_tf = snapshot_at(100.0);
        short_tf.rsi_short = 25.0;
        long_tf = snapshot_at(100.0);
        long_tf.support = 99.0;

        auto signal = scorer.score_entry(short_tf, long_tf, Trend::Neutral);
        REQUIRE(signal.long_score == 2);
        REQUIRE_FALSE(signal.has_signal);
    }

    SECTION("Minimum strength without an ATR is not valid") {
        short_tf = snapshot_at(100.0);
        short_tf.rsi_short = 25.0;
        short_tf.obv_trend = ObvTrend::Rising;
        long_tf = snapshot_at(100.0);
        long_tf.support = 99.0;
        long_tf.range_high = 110.0;
        long_tf.range_low = 100.0;

        auto signal = scorer.score_entry(short_tf, long_tf, Trend::Neutral);
        REQUIRE(signal.has_signal);
        REQUIRE(signal.strength == 3);
        REQUIRE_FALSE(signal.stop_loss.has_value());
        REQUIRE_FALSE(signal.valid);

        short_tf.atr = 0.5;
        signal = scorer.score_entry(short_tf, long_tf, Trend::Neutral);
        REQUIRE(signal.valid);
    }

    SECTION("Empty snapshot is scored as no signal") {
        bullish_setup(short_tf, long_tf);
        auto signal = scorer.score_entry(IndicatorSnapshot(), long_tf, Trend::Bullish);
        REQUIRE_FALSE(signal.has_signal);
        REQUIRE(signal.long_score == 0);
    }

    SECTION("Scoring side none throws") {
        bullish_setup(short_tf, long_tf);
        REQUIRE_THROWS_AS(scorer.score_side(Direction::None, short_tf, long_tf, Trend::Neutral),
                          std::invalid_argument);
    }

    SECTION("Thresholds are injectable") {
        EngineParams params;
        params.min_signal_strength = 2;
        EntryScorer lenient(params);

        short_tf = snapshot_at(100.0);
        short_tf.rsi_short = 25.0;
        long_tf = snapshot_at(100.0);
        long_tf.support = 99.0;

        REQUIRE(lenient.score_entry(short_tf, long_tf, Trend::Neutral).has_signal);
    }
}

TEST_CASE("Strength stays in range on real windows", "[entry]") {
    EntryScorer scorer;

    std::vector<std::vector<double>> shapes = {
        linear_closes(80, 100, 1),
        linear_closes(80, 200, -1),
        std::vector<double>(80, 50.0),
    };
    std::vector<double> zigzag;
    for (size_t i = 0; i < 80; i++) zigzag.push_back(100.0 + (i % 2 ? 3.0 : -3.0) + i * 0.1);
    shapes.push_back(zigzag);

    for (const auto& closes : shapes) {
        auto snap = TechnicalAnalyzer::analyze(series_from_closes(closes));
        for (Trend ref : {Trend::Bullish, Trend::Bearish, Trend::Neutral}) {
            auto signal = scorer.score_entry(snap, snap, ref);
            REQUIRE(signal.strength >= 0);
            REQUIRE(signal.strength <= 7);
            if (!signal.has_signal) {
                REQUIRE(signal.direction == Direction::None);
            }
        }
    }
}

namespace {

// Steady decline closed by a hammer on heavy volume at the bottom of the range
CandleSeries selloff_with_hammer() {
    auto series = series_from_closes(linear_closes(59, 180.0, -0.5));
    double prev = series.back().close;
    series.push_back(make_candle(series.back().timestamp_ms + 60000,
                                 prev, prev + 0.75, prev - 2.0, prev + 0.5, 5000.0));
    return series;
}

bool has_reason(const SideScore& side, const std::string& reason) {
    return std::find(side.reasons.begin(), side.reasons.end(), reason) != side.reasons.end();
}

} // namespace

TEST_CASE("Mirrored market scores the opposite side", "[entry][mirror]") {
    EntryScorer scorer;
    auto series = selloff_with_hammer();
    auto snap = TechnicalAnalyzer::analyze(series);

    SECTION("Reflection inside the proximity band") {
        auto mirrored = TechnicalAnalyzer::analyze(mirror_series(series, 200.0));
        REQUIRE(mirrored.has_pattern(PatternTag::InvertedHammer));
        REQUIRE(*mirrored.trend == Trend::Bullish);
        REQUIRE(*mirrored.resistance == 251.0);

        auto long_side = scorer.score_side(Direction::Long, snap, snap, Trend::Bullish);
        auto short_mirror = scorer.score_side(Direction::Short, mirrored, mirrored, Trend::Bearish);
        REQUIRE(long_side.score == 7);
        REQUIRE(short_mirror.score == long_side.score);
        REQUIRE(has_reason(short_mirror, "Price near resistance"));

        auto short_side = scorer.score_side(Direction::Short, snap, snap, Trend::Bullish);
        auto long_mirror = scorer.score_side(Direction::Long, mirrored, mirrored, Trend::Bearish);
        REQUIRE(short_side.score == 2);
        REQUIRE(long_mirror.score == short_side.score);

        auto signal = scorer.score_entry(snap, snap, Trend::Bullish);
        auto mirror_signal = scorer.score_entry(mirrored, mirrored, Trend::Bearish);
        REQUIRE(signal.direction == Direction::Long);
        REQUIRE(mirror_signal.direction == Direction::Short);
        REQUIRE(mirror_signal.strength == signal.strength);
        REQUIRE(*signal.obv == -53000.0);
        REQUIRE(*mirror_signal.obv == -53000.0);
    }

    SECTION("Proximity band is multiplicative") {
        // 151.5 is within 2% above support 149, but 48.5 is more than 2% below resistance 51
        auto mirrored = TechnicalAnalyzer::analyze(mirror_series(series, 100.0));
        REQUIRE(*mirrored.resistance == 51.0);
        REQUIRE(*mirrored.current_price == 48.5);

        auto long_side = scorer.score_side(Direction::Long, snap, snap, Trend::Bullish);
        auto short_mirror = scorer.score_side(Direction::Short, mirrored, mirrored, Trend::Bearish);
        REQUIRE(has_reason(long_side, "Price near support"));
        REQUIRE_FALSE(has_reason(short_mirror, "Price near resistance"));
        REQUIRE(short_mirror.score == long_side.score - 1);
    }

    SECTION("Unchanged close reads as falling OBV on both sides") {
        auto flat_end = series_from_closes(linear_closes(60, 180.0, -0.5));
        flat_end.back().close = flat_end[flat_end.size() - 2].close;
        flat_end.back().open = flat_end.back().close;
        flat_end.back().high = flat_end.back().close + 0.5;
        flat_end.back().low = flat_end.back().close - 0.5;

        auto original = TechnicalAnalyzer::analyze(flat_end);
        auto mirrored = TechnicalAnalyzer::analyze(mirror_series(flat_end, 200.0));
        REQUIRE(*original.obv_trend == ObvTrend::Falling);
        REQUIRE(*mirrored.obv_trend == ObvTrend::Falling);

        auto short_side = scorer.score_side(Direction::Short, original, original, Trend::Neutral);
        auto long_mirror = scorer.score_side(Direction::Long, mirrored, mirrored, Trend::Neutral);
        REQUIRE(has_reason(short_side, "OBV falling"));
        REQUIRE_FALSE(has_reason(long_mirror, "OBV rising"));
        REQUIRE(long_mirror.score == short_side.score - 1);
    }
}
