#include "sizing.hpp"
#include <algorithm>

double position_size(double balance, double percent, double min_size) {
    return std::max(balance * (percent / 100.0), min_size);
}

bool is_priority_hour(int hour, const std::vector<int>& priority_hours) {
    return std::find(priority_hours.begin(), priority_hours.end(), hour) != priority_hours.end();
}
