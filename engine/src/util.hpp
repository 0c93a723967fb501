#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

namespace util {
    std::string current_iso8601();
    int64_t current_timestamp_ms();
    int current_utc_hour();

    // "YYYY-MM-DD HH:MM:SS UTC"; accepts seconds or milliseconds
    std::string format_utc(int64_t timestamp);

    std::vector<std::string> split(const std::string& str, char delim);
    std::string hash_reasons(const std::vector<std::string>& reasons);
    std::string to_lower(const std::string& str);

    // "btc/usdt" -> "BTC_USDT"
    std::string normalize_symbol(const std::string& symbol);
    std::string format_number(double value, int decimals);

    // Escapes &, < and > for Telegram HTML text
    std::string escape_html(const std::string& text);
}
