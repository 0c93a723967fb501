#pragma once

#include "entry_scorer.hpp"
#include "exit_evaluator.hpp"
#include <string>
#include <vector>

struct FormattedAlert {
    std::string text;
    bool split_required;
    std::vector<std::string> parts;
};

// HTML alert text for manual traders
class AlertFormatter {
public:
    explicit AlertFormatter(int leverage = 7, int max_strength = 7);

    FormattedAlert format_entry(const std::string& symbol, const Signal& signal,
                                double position_size) const;
    FormattedAlert format_exit(const Position& position, const ExitDecision& decision) const;

    static std::vector<std::string> split_if_needed(const std::string& text);

private:
    int leverage_;
    int max_strength_;
    static constexpr size_t TELEGRAM_MAX_LENGTH = 4000;

    static FormattedAlert finish(const std::string& text);
};
