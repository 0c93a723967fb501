#include "alert_codec.hpp"
#include "util.hpp"
#include <stdexcept>

namespace {

template <typename T>
nlohmann::json optional_json(const std::optional<T>& value) {
    if (!value) return nullptr;
    return *value;
}

} // namespace

Candle AlertCodec::candle_from_json(const nlohmann::json& raw) {
    Candle c;

    if (raw.is_array()) {
        if (raw.size() < 6) {
            throw std::invalid_argument("Candle array needs 6 fields");
        }
        c.timestamp_ms = raw[0].get<int64_t>();
        c.open = raw[1].get<double>();
        c.high = raw[2].get<double>();
        c.low = raw[3].get<double>();
        c.close = raw[4].get<double>();
        c.volume = raw[5].get<double>();
        return c;
    }

    c.timestamp_ms = raw.at("t").get<int64_t>();
    c.open = raw.at("o").get<double>();
    c.high = raw.at("h").get<double>();
    c.low = raw.at("l").get<double>();
    c.close = raw.at("c").get<double>();
    c.volume = raw.value("v", 0.0);
    return c;
}

CandleSeries AlertCodec::series_from_json(const nlohmann::json& raw) {
    CandleSeries series;
    if (!raw.is_array()) return series;

    series.reserve(raw.size());
    for (const auto& item : raw) {
        series.push_back(candle_from_json(item));
    }
    return series;
}

Position AlertCodec::position_from_json(const nlohmann::json& raw) {
    Position p;
    p.symbol = util::normalize_symbol(raw.at("symbol").get<std::string>());
    p.direction = parse_direction(raw.at("direction").get<std::string>());
    p.entry_price = raw.at("entry_price").get<double>();
    p.opened_at_ms = raw.value("opened_at", static_cast<int64_t>(0));

    if (raw.contains("fibonacci_targets")) {
        const auto& targets = raw["fibonacci_targets"];
        if (targets.is_object()) {
            // Keys sort as TP1, TP2, ... which is level order
            for (const auto& item : targets.items()) {
                p.fibonacci_targets.push_back({item.key(), 0.0, item.value().get<double>()});
            }
        } else if (targets.is_array()) {
            for (const auto& level : targets) {
                p.fibonacci_targets.push_back({level.at("name").get<std::string>(),
                                               level.value("ratio", 0.0),
                                               level.at("price").get<double>()});
            }
        }
    }

    return p;
}

nlohmann::json AlertCodec::targets_to_json(const FibonacciTargets& targets) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& level : targets) {
        out[level.name] = level.price;
    }
    return out;
}

nlohmann::json AlertCodec::signal_to_json(const std::string& symbol, const Signal& signal) {
    nlohmann::json patterns = nlohmann::json::array();
    for (auto tag : signal.patterns) {
        patterns.push_back(to_string(tag));
    }

    return {
        {"type", "entry"},
        {"symbol", symbol},
        {"direction", to_string(signal.direction)},
        {"strength", signal.strength},
        {"reasons", signal.reasons},
        {"price", optional_json(signal.price)},
        {"stop_loss", optional_json(signal.stop_loss)},
        {"fibonacci_targets", targets_to_json(signal.fibonacci_targets)},
        {"rsi_short", optional_json(signal.rsi_short)},
        {"rsi_long", optional_json(signal.rsi_long)},
        {"obv", optional_json(signal.obv)},
        {"volume_spike", signal.volume_spike},
        {"patterns", patterns},
        {"reference_trend", to_string(signal.reference_trend)},
        {"long_score", signal.long_score},
        {"short_score", signal.short_score},
        {"valid", signal.valid},
        {"reason_hash", util::hash_reasons(signal.reasons)},
        {"ts", util::current_iso8601()}
    };
}

nlohmann::json AlertCodec::exit_to_json(const Position& position, const ExitDecision& decision) {
    return {
        {"type", "exit"},
        {"symbol", position.symbol},
        {"direction", to_string(position.direction)},
        {"entry_price", position.entry_price},
        {"should_exit", decision.should_exit},
        {"exit_type", to_string(decision.exit_type)},
        {"reason", decision.reason},
        {"profit_loss_pct", decision.profit_loss_pct},
        {"suggested_exit_price", optional_json(decision.suggested_exit_price)},
        {"fibonacci_hit", optional_json(decision.fibonacci_hit)},
        {"technical_signals", decision.technical_signals},
        {"ts", util::current_iso8601()}
    };
}
