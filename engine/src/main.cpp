#include "config.hpp"
#include "alert_codec.hpp"
#include "formatter.hpp"
#include "position_book.hpp"
#include "scanner.hpp"
#include "sizing.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <stdexcept>

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("scalpscout", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::info("Logging initialized at level: {}", log_level);
}

nlohmann::json load_batch(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open batch file " + path);
    }
    return nlohmann::json::parse(in);
}

MarketBatch batch_from_json(const nlohmann::json& doc) {
    MarketBatch batch;
    batch.reference = AlertCodec::series_from_json(doc.value("reference", nlohmann::json::array()));

    for (const auto& item : doc.value("symbols", nlohmann::json::array())) {
        SymbolWindows windows;
        windows.symbol = item.at("symbol").get<std::string>();
        windows.short_series = AlertCodec::series_from_json(item.value("short", nlohmann::json::array()));
        windows.long_series = AlertCodec::series_from_json(item.value("long", nlohmann::json::array()));
        batch.symbols.push_back(std::move(windows));
    }

    return batch;
}

void load_positions(const nlohmann::json& doc, PositionBook& book) {
    for (const auto& item : doc.value("positions", nlohmann::json::array())) {
        try {
            book.upsert(AlertCodec::position_from_json(item));
        } catch (const std::exception& e) {
            spdlog::error("Ignoring position {}: {}", item.dump(), e.what());
        }
    }
}

int main(int argc, char** argv) {
    try {
        Config config = Config::from_env();
        setup_logging(config.log_level);
        config.validate();

        if (argc < 2) {
            spdlog::error("Usage: {} <batch.json>", argv[0]);
            return 1;
        }

        spdlog::info("Starting {} (reference {})", config.service_name, config.reference_symbol);

        if (is_priority_hour(util::current_utc_hour(), config.priority_hours)) {
            spdlog::info("Priority hour {} UTC", util::current_utc_hour());
        }

        auto doc = load_batch(argv[1]);
        MarketBatch batch = batch_from_json(doc);
        PositionBook positions;
        load_positions(doc, positions);

        Scanner scanner(config);
        AlertFormatter formatter(config.leverage, config.engine.max_signal_strength);

        auto report = scanner.run_cycle(batch, positions);

        for (const auto& entry : report.entries) {
            std::cout << AlertCodec::signal_to_json(entry.symbol, entry.signal).dump() << std::endl;

            auto alert = formatter.format_entry(entry.symbol, entry.signal, entry.position_size);
            for (const auto& part : alert.parts) {
                spdlog::info("Alert:\n{}", part);
            }
        }

        for (const auto& candidate : report.exits) {
            if (!candidate.decision.should_exit) continue;

            std::cout << AlertCodec::exit_to_json(candidate.position, candidate.decision).dump() << std::endl;

            auto alert = formatter.format_exit(candidate.position, candidate.decision);
            for (const auto& part : alert.parts) {
                spdlog::info("Alert:\n{}", part);
            }
        }

        spdlog::info("{} finished: {} entries, {} exits",
                     config.service_name, report.entries.size(), report.exits.size());

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }

    return 0;
}
