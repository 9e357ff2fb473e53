#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "rg/aggregate.hpp"
#include "rg/model.hpp"
#include "rg/probe_engine.hpp"

namespace rg
{
struct RankedProvider
{
    Provider              provider;
    std::optional<double> score_ms;   // median latency of successful probes
    double                success_rate{};
    bool                  reliable{};
    int                   attempts{};
    int                   successes{};
    Aggregation           stats;      // over successful probes, p90 included
};

// Ranks providers by median latency; unreliable providers go last.
class Benchmarker
{
public:
    Benchmarker(ProbeEngine &engine, double min_success_rate, std::chrono::milliseconds timeout);

    std::vector<RankedProvider> run(const std::vector<Provider> &providers,
                                    const std::vector<std::string> &domains,
                                    int samples_per_domain);

    // Pure ranking of already collected results. Order: reliable by score
    // ascending, then unreliable; ties and the unreliable block by id.
    static std::vector<RankedProvider> rank(const std::vector<Provider> &providers,
                                            const std::vector<ProbeResult> &results,
                                            double min_success_rate);

    static std::optional<RankedProvider> winner(const std::vector<RankedProvider> &ranking);

private:
    ProbeEngine &engine_;
    double min_success_rate_;
    std::chrono::milliseconds timeout_;
};
} // namespace rg
