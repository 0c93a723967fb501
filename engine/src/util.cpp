#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <functional>
#include <iomanip>
#include <sstream>
#include <fmt/format.h>

namespace util {

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto itt = std::chrono::system_clock::to_time_t(now);
    std::ostringstream ss;
    ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
    return ss.str();
}

int64_t current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

int current_utc_hour() {
    auto itt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    return std::gmtime(&itt)->tm_hour;
}

std::string format_utc(int64_t timestamp) {
    // Anything past year 2286 in seconds is treated as milliseconds
    std::time_t secs = static_cast<std::time_t>(
        timestamp > 10000000000LL ? timestamp / 1000 : timestamp);
    std::ostringstream ss;
    ss << std::put_time(std::gmtime(&secs), "%Y-%m-%d %H:%M:%S UTC");
    return ss.str();
}

std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;
    while (std::getline(ss, token, delim)) {
        token.erase(0, token.find_first_not_of(" \t\n\r"));
        token.erase(token.find_last_not_of(" \t\n\r") + 1);
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

std::string hash_reasons(const std::vector<std::string>& reasons) {
    std::string combined;
    for (const auto& r : reasons) {
        combined += r + "|";
    }

    std::hash<std::string> hasher;
    size_t hash_val = hasher(combined);

    std::ostringstream ss;
    ss << std::hex << hash_val;
    return ss.str();
}

std::string to_lower(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string normalize_symbol(const std::string& symbol) {
    std::string out = symbol;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    std::replace(out.begin(), out.end(), '/', '_');
    return out;
}

std::string format_number(double value, int decimals) {
    return fmt::format("{:.{}f}", value, decimals);
}

std::string escape_html(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        switch (ch) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            default:  out += ch;
        }
    }
    return out;
}

} // namespace util
