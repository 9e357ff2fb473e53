#include "rg/aggregate.hpp"

#include <algorithm>
#include <numeric>

namespace rg {

Aggregation aggregate_times(const std::vector<double>& times, const std::vector<int>& pctl)
{
    Aggregation ag{};
    if (times.empty()) return ag;

    std::vector<double> sorted = times;
    std::ranges::sort(sorted);
    const size_t n = sorted.size();

    ag.min = sorted.front();
    ag.max = sorted.back();
    ag.avg = std::accumulate(sorted.begin(), sorted.end(), 0.0) / static_cast<double>(n);
    ag.median = (n % 2 == 1) ? sorted[n / 2] : (sorted[n / 2 - 1] + sorted[n / 2]) / 2.0;

    auto pct_value = [&](int p) -> double
    {
        int    pc = std::clamp(p, 0, 100);
        size_t rank = (static_cast<size_t>(pc) * n + 100 - 1) / 100; // ceil
        if (rank < 1) rank = 1;
        if (rank > n) rank = n;
        return sorted[rank - 1];
    };

    ag.percentiles.reserve(pctl.size());
    for (int p : pctl) ag.percentiles.emplace_back(p, pct_value(p));
    return ag;
}

} // namespace rg
