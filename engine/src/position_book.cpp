#include "position_book.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

void PositionBook::upsert(const Position& position) {
    if (position.direction == Direction::None) {
        throw std::invalid_argument("Position " + position.symbol + " has no direction");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    positions_[position.symbol] = position;
    spdlog::debug("Tracking {} {} @ {}", to_string(position.direction),
                  position.symbol, position.entry_price);
}

bool PositionBook::remove(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_.erase(symbol) > 0;
}

std::optional<Position> PositionBook::get(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(symbol);
    if (it == positions_.end()) return std::nullopt;
    return it->second;
}

bool PositionBook::contains(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_.count(symbol) > 0;
}

std::vector<std::string> PositionBook::symbols() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& [symbol, _] : positions_) {
        out.push_back(symbol);
    }
    return out;
}

size_t PositionBook::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_.size();
}
