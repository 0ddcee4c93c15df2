// IntervalUtils.hpp
#pragma once

#include "DataTypes.hpp"
#include <string>
#include <vector>

struct Interval {
    long long start = 0;
    int hours = 0;
};

// Parses "<start>/PTnHnMnS" (or "--" as separator). No duration gives 0 hours.
// Minutes and seconds are truncated into whole hours (M / 60, S / 360).
Interval parse_interval(const std::string& text);

// One reading per covered hour starting at the rounded start; a zero
// duration still yields a single reading.
std::vector<Reading> expand_interval(const std::string& feature, const std::string& valid_time, double value);
