#pragma once

#include <vector>
#include <utility>

namespace rg {

struct Aggregation {
    double min{};
    double avg{};
    double max{};
    double median{};   // mean of the two middle values for even counts
    std::vector<std::pair<int,double>> percentiles; // (p, value)
};

// Statistics of latency samples (ms); percentiles use nearest-rank over pctl (0..100)
Aggregation aggregate_times(const std::vector<double>& times, const std::vector<int>& pctl);

} // namespace rg
