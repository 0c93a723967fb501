#include "indicators.hpp"
#include <algorithm>
#include <cmath>

std::optional<double> Indicators::rsi(const std::vector<double>& closes, size_t period) {
    if (period == 0 || closes.size() <= period) return std::nullopt;

    const double alpha = 1.0 / static_cast<double>(period);

    // Seeded with the first change, then exponentially smoothed (alpha = 1/period)
    double first = closes[1] - closes[0];
    double avg_gain = std::max(first, 0.0);
    double avg_loss = std::max(-first, 0.0);

    for (size_t i = 2; i < closes.size(); i++) {
        double delta = closes[i] - closes[i - 1];
        avg_gain = (1.0 - alpha) * avg_gain + alpha * std::max(delta, 0.0);
        avg_loss = (1.0 - alpha) * avg_loss + alpha * std::max(-delta, 0.0);
    }

    if (avg_gain == 0.0 && avg_loss == 0.0) return 50.0; // Flat window
    if (avg_loss == 0.0) return 100.0;

    double rs = avg_gain / avg_loss;
    return std::clamp(100.0 - (100.0 / (1.0 + rs)), 0.0, 100.0);
}

std::vector<std::optional<double>> Indicators::ema_series(const std::vector<double>& closes,
                                                          size_t period) {
    std::vector<std::optional<double>> out(closes.size());
    if (period == 0 || closes.empty()) return out;

    const double k = 2.0 / (static_cast<double>(period) + 1.0);
    double e = closes[0];

    for (size_t i = 0; i < closes.size(); i++) {
        if (i > 0) e = closes[i] * k + e * (1.0 - k);
        if (i + 1 >= period) out[i] = e;
    }

    return out;
}

std::optional<double> Indicators::ema(const std::vector<double>& closes, size_t period) {
    if (period == 0 || closes.size() < period) return std::nullopt;
    return ema_series(closes, period).back();
}

std::vector<double> Indicators::obv_series(const CandleSeries& series) {
    std::vector<double> out;
    out.reserve(series.size());

    double obv = 0.0;
    for (size_t i = 0; i < series.size(); i++) {
        if (i > 0) {
            if (series[i].close > series[i - 1].close) {
                obv += series[i].volume;
            } else if (series[i].close < series[i - 1].close) {
                obv -= series[i].volume;
            }
        }
        out.push_back(obv);
    }

    return out;
}

std::optional<ObvTrend> Indicators::obv_trend(const CandleSeries& series) {
    if (series.size() < 2) return std::nullopt;

    auto obv = obv_series(series);
    // Tie counts as falling
    return obv[obv.size() - 1] > obv[obv.size() - 2] ? ObvTrend::Rising : ObvTrend::Falling;
}

std::vector<double> Indicators::true_range(const CandleSeries& series) {
    std::vector<double> out;
    out.reserve(series.size());

    for (size_t i = 0; i < series.size(); i++) {
        const auto& c = series[i];
        double tr = c.high - c.low;
        if (i > 0) {
            double prev_close = series[i - 1].close;
            tr = std::max({tr, std::abs(c.high - prev_close), std::abs(c.low - prev_close)});
        }
        out.push_back(tr);
    }

    return out;
}

std::optional<double> Indicators::atr(const CandleSeries& series, size_t period) {
    if (period == 0 || series.size() < period) return std::nullopt;

    auto tr = true_range(series);
    double sum = 0.0;
    for (size_t i = tr.size() - period; i < tr.size(); i++) {
        sum += tr[i];
    }
    return sum / static_cast<double>(period);
}

bool Indicators::volume_spike(const CandleSeries& series, double multiplier, size_t lookback) {
    if (lookback == 0 || series.size() <= lookback) return false;

    size_t last = series.size() - 1;
    double sum = 0.0;
    for (size_t i = last - lookback; i < last; i++) {
        sum += series[i].volume;
    }
    double avg = sum / static_cast<double>(lookback);

    return series[last].volume > avg * multiplier;
}

std::optional<Trend> Indicators::trend(const std::vector<double>& closes,
                                       size_t fast_period, size_t slow_period) {
    auto fast = ema(closes, fast_period);
    auto slow = ema(closes, slow_period);
    if (!fast || !slow) return std::nullopt;

    if (*fast > *slow) return Trend::Bullish;
    if (*fast < *slow) return Trend::Bearish;
    return Trend::Neutral;
}

std::optional<SupportResistance> Indicators::support_resistance(const CandleSeries& series,
                                                                size_t window) {
    if (series.empty()) return std::nullopt;

    const size_t n = series.size();

    // A centered window labelled at bar i spans [i - w + offset + 1, i + offset]
    // with offset = (w - 1) / 2. The latest fully covered label is n - 1 - offset,
    // whose window is exactly the last w bars. Shorter series use all bars.
    size_t span = (window > 0 && n >= window) ? window : n;

    SupportResistance sr;
    sr.support = lowest_low(series, span);
    sr.resistance = highest_high(series, span);
    return sr;
}
