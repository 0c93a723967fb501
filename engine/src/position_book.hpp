#pragma once

#include "exit_evaluator.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Caller-owned registry of open positions keyed by symbol.
// The scorer and evaluator never see it; they get a Position by value.
class PositionBook {
public:
    void upsert(const Position& position);
    bool remove(const std::string& symbol);
    std::optional<Position> get(const std::string& symbol) const;
    bool contains(const std::string& symbol) const;

    std::vector<std::string> symbols() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Position> positions_;
};
