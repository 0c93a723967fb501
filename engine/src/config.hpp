#pragma once

#include "engine_params.hpp"
#include <string>
#include <vector>
#include <cstddef>
#include <cstdlib>

struct Config {
    // Service
    std::string service_name;
    std::string log_level;

    // Universe
    std::string reference_symbol;
    int max_symbols_per_cycle;
    std::vector<int> priority_hours;

    // Sizing (alert text only, nothing is executed)
    double account_balance;
    double position_size_percent;
    double min_position_size;
    int leverage;

    EngineParams engine;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static std::size_t get_env_size(const char* name, std::size_t default_val);
    static double get_env_double(const char* name, double default_val);
    static std::vector<double> get_env_list(const char* name, const std::vector<double>& default_val);
};
