#include "formatter.hpp"
#include "util.hpp"
#include <cctype>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace {

std::string price_or_dash(const std::optional<double>& value) {
    return value ? fmt::format("${:.6f}", *value) : "-";
}

std::string rsi_or_dash(const std::optional<double>& value) {
    return value ? fmt::format("{:.1f}", *value) : "-";
}

std::string upper(const char* text) {
    std::string out(text);
    for (auto& ch : out) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    return out;
}

std::string exit_title(ExitType t) {
    switch (t) {
        case ExitType::TakeProfit:   return "Take Profit";
        case ExitType::StopLoss:     return "Stop Loss";
        case ExitType::TrailingStop: return "Trailing Stop";
        case ExitType::Reversal:     return "Reversal";
        default:                     return "None";
    }
}

} // namespace

AlertFormatter::AlertFormatter(int leverage, int max_strength)
    : leverage_(leverage), max_strength_(max_strength) {}

FormattedAlert AlertFormatter::format_entry(const std::string& symbol, const Signal& signal,
                                            double position_size) const {
    std::string direction = upper(to_string(signal.direction));

    std::vector<std::string> pattern_names;
    for (auto tag : signal.patterns) {
        pattern_names.push_back(to_string(tag));
    }
    std::string patterns = pattern_names.empty() ? "none" : fmt::format("{}", fmt::join(pattern_names, ", "));

    std::string msg = fmt::format("<b>ENTRY SIGNAL</b> {} {}\n\n", direction, util::escape_html(symbol));
    msg += fmt::format("<b>Price:</b> {}\n", price_or_dash(signal.price));
    msg += fmt::format("<b>RSI:</b> {} / {}\n", rsi_or_dash(signal.rsi_short), rsi_or_dash(signal.rsi_long));
    msg += fmt::format("<b>Reference trend:</b> {}\n", to_string(signal.reference_trend));
    msg += fmt::format("<b>OBV:</b> {}\n", signal.obv ? util::format_number(*signal.obv, 0) : "-");
    msg += fmt::format("<b>Volume spike:</b> {}\n", signal.volume_spike ? "yes" : "no");
    msg += fmt::format("<b>Patterns:</b> {}\n\n", patterns);

    msg += "<b>Fibonacci targets:</b>\n";
    for (const auto& level : signal.fibonacci_targets) {
        msg += fmt::format("• {} ({:.1f}%): ${:.6f}\n", level.name, level.ratio * 100.0, level.price);
    }

    msg += fmt::format("\n<b>Stop loss:</b> {}\n", price_or_dash(signal.stop_loss));
    msg += fmt::format("<b>Leverage:</b> {}x\n", leverage_);
    msg += fmt::format("<b>Position size:</b> ${:.2f} USDT\n", position_size);
    msg += fmt::format("<b>Strength:</b> {}/{}\n\n", signal.strength, max_strength_);

    msg += "<b>Reasons:</b>\n";
    for (const auto& reason : signal.reasons) {
        msg += "• " + util::escape_html(reason) + "\n";
    }

    msg += "\n<i>" + util::format_utc(util::current_timestamp_ms()) + "</i>";

    return finish(msg);
}

FormattedAlert AlertFormatter::format_exit(const Position& position,
                                           const ExitDecision& decision) const {
    std::string msg = fmt::format("<b>EXIT SIGNAL</b> {} {}\n\n",
                                  upper(to_string(position.direction)),
                                  util::escape_html(position.symbol));
    msg += fmt::format("<b>Entry price:</b> ${:.6f}\n", position.entry_price);
    msg += fmt::format("<b>Current price:</b> {}\n", price_or_dash(decision.suggested_exit_price));
    msg += fmt::format("<b>P&amp;L:</b> {:+.2f}%\n\n", decision.profit_loss_pct);
    msg += fmt::format("<b>Exit type:</b> {}\n", exit_title(decision.exit_type));
    msg += fmt::format("<b>Reason:</b> {}\n", util::escape_html(decision.reason));
    msg += "\n<i>" + util::format_utc(util::current_timestamp_ms()) + "</i>";

    return finish(msg);
}

FormattedAlert AlertFormatter::finish(const std::string& text) {
    FormattedAlert result;
    result.text = text;
    result.parts = split_if_needed(text);
    result.split_required = result.parts.size() > 1;
    return result;
}

std::vector<std::string> AlertFormatter::split_if_needed(const std::string& text) {
    std::vector<std::string> parts;

    if (text.length() <= TELEGRAM_MAX_LENGTH) {
        parts.push_back(text);
        return parts;
    }

    // Split at newlines; a single over-long line becomes its own part
    size_t pos = 0;
    std::string current_part;

    while (pos < text.length()) {
        size_t newline = text.find('\n', pos);
        if (newline == std::string::npos) newline = text.length() - 1;

        std::string line = text.substr(pos, newline - pos + 1);

        if (!current_part.empty() && current_part.length() + line.length() > TELEGRAM_MAX_LENGTH) {
            parts.push_back(current_part);
            current_part = "...(continued)\n\n";
        }
        current_part += line;

        pos = newline + 1;
    }

    if (!current_part.empty()) {
        parts.push_back(current_part);
    }

    return parts;
}
