#pragma once

#include <vector>

// max(balance * percent / 100, min_size)
double position_size(double balance, double percent, double min_size);

bool is_priority_hour(int hour, const std::vector<int>& priority_hours);
