#pragma once

#include "candle.hpp"
#include "config.hpp"
#include "entry_scorer.hpp"
#include "exit_evaluator.hpp"
#include "position_book.hpp"
#include "reference_trend.hpp"
#include <string>
#include <vector>

struct SymbolWindows {
    std::string symbol;
    CandleSeries short_series;
    CandleSeries long_series;
};

// Everything one cycle looks at, fetched by the caller
struct MarketBatch {
    CandleSeries reference;
    std::vector<SymbolWindows> symbols;
};

struct EntryCandidate {
    std::string symbol;
    Signal signal;
    double position_size;
};

struct ExitCandidate {
    Position position;
    ExitDecision decision;
};

struct CycleReport {
    ReferenceAssessment reference;
    std::vector<EntryCandidate> entries;   // has_signal && valid only
    std::vector<ExitCandidate> exits;      // every open position evaluated
    size_t analyzed = 0;
    size_t skipped = 0;
};

class Scanner {
public:
    explicit Scanner(const Config& config);

    CycleReport run_cycle(const MarketBatch& batch, const PositionBook& positions) const;

private:
    Config config_;
    EntryScorer scorer_;
    ExitEvaluator evaluator_;

    bool has_enough_history(const SymbolWindows& windows) const;
};
