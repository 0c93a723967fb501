#include "scanner.hpp"
#include "sizing.hpp"
#include "snapshot.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

Scanner::Scanner(const Config& config)
    : config_(config)
    , scorer_(config.engine)
    , evaluator_(config.engine)
{}

bool Scanner::has_enough_history(const SymbolWindows& windows) const {
    const size_t need = config_.engine.min_bars();
    return windows.short_series.size() >= need && windows.long_series.size() >= need;
}

CycleReport Scanner::run_cycle(const MarketBatch& batch, const PositionBook& positions) const {
    CycleReport report;
    report.reference = ReferenceTrend::assess(batch.reference, config_.engine);

    const double size = position_size(config_.account_balance,
                                      config_.position_size_percent,
                                      config_.min_position_size);

    size_t limit = config_.max_symbols_per_cycle > 0
                       ? static_cast<size_t>(config_.max_symbols_per_cycle)
                       : batch.symbols.size();

    for (const auto& windows : batch.symbols) {
        if (report.analyzed >= limit) {
            spdlog::debug("Cycle limit {} reached, {} left for next cycle",
                          limit, batch.symbols.size() - report.analyzed - report.skipped);
            break;
        }

        const std::string symbol = util::normalize_symbol(windows.symbol);

        try {
            if (!has_enough_history(windows)) {
                spdlog::debug("Skipping {}: {}/{} bars, need {}", symbol,
                              windows.short_series.size(), windows.long_series.size(),
                              config_.engine.min_bars());
                report.skipped++;
                continue;
            }

            auto short_tf = TechnicalAnalyzer::analyze(windows.short_series, config_.engine);
            auto long_tf = TechnicalAnalyzer::analyze(windows.long_series, config_.engine);
            report.analyzed++;

            if (auto position = positions.get(symbol)) {
                auto decision = evaluator_.evaluate_exit(*position, short_tf, long_tf,
                                                         windows.short_series);
                report.exits.push_back({*position, decision});
                continue;
            }

            auto signal = scorer_.score_entry(short_tf, long_tf, report.reference.trend);
            if (signal.has_signal && signal.valid) {
                spdlog::info("Entry signal {} {} strength {}/{}", to_string(signal.direction),
                             symbol, signal.strength, config_.engine.max_signal_strength);
                report.entries.push_back({symbol, signal, size});
            } else if (signal.has_signal) {
                spdlog::debug("Signal for {} failed quality gate", symbol);
            }

        } catch (const std::exception& e) {
            spdlog::error("Error analysing {}: {}", symbol, e.what());
        }
    }

    spdlog::info("Cycle done: reference {}, {} analysed, {} skipped, {} entries, {} exits evaluated",
                 to_string(report.reference.trend), report.analyzed, report.skipped,
                 report.entries.size(), report.exits.size());

    return report;
}
