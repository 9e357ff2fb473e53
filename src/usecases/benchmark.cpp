#include "rg/benchmark.hpp"

#include <algorithm>
#include <unordered_map>

#include "rg/logger.hpp"

namespace rg
{
Benchmarker::Benchmarker(ProbeEngine &engine,
                         const double min_success_rate,
                         const std::chrono::milliseconds timeout)
    : engine_(engine), min_success_rate_(min_success_rate), timeout_(timeout)
{
}

std::vector<RankedProvider> Benchmarker::rank(const std::vector<Provider> &providers,
                                              const std::vector<ProbeResult> &results,
                                              const double min_success_rate)
{
    struct Tally
    {
        int attempts{};
        std::vector<double> ok_ms;
    };
    std::unordered_map<std::string, Tally> by_provider;
    for (const auto &r : results)
    {
        auto &t = by_provider[r.provider_id];
        ++t.attempts;
        if (r.success) t.ok_ms.push_back(r.ms);
    }

    std::vector<RankedProvider> out;
    out.reserve(providers.size());
    for (const auto &p : providers)
    {
        RankedProvider rp{};
        rp.provider = p;
        if (auto it = by_provider.find(p.id); it != by_provider.end())
        {
            const Tally &t = it->second;
            rp.attempts = t.attempts;
            rp.successes = static_cast<int>(t.ok_ms.size());
            rp.success_rate = t.attempts > 0
                                  ? static_cast<double>(rp.successes) / static_cast<double>(t.attempts)
                                  : 0.0;
            if (!t.ok_ms.empty())
            {
                rp.stats = aggregate_times(t.ok_ms, {90});
                rp.score_ms = rp.stats.median;
            }
        }
        rp.reliable = rp.score_ms.has_value() && rp.success_rate >= min_success_rate;
        out.push_back(std::move(rp));
    }

    std::ranges::stable_sort(out, [](const RankedProvider &a, const RankedProvider &b)
    {
        if (a.reliable != b.reliable) return a.reliable;
        if (a.reliable && *a.score_ms != *b.score_ms) return *a.score_ms < *b.score_ms;
        return a.provider.id < b.provider.id;
    });
    return out;
}

std::optional<RankedProvider> Benchmarker::winner(const std::vector<RankedProvider> &ranking)
{
    if (ranking.empty() || !ranking.front().reliable) return std::nullopt;
    return ranking.front();
}

std::vector<RankedProvider> Benchmarker::run(const std::vector<Provider> &providers,
                                             const std::vector<std::string> &domains,
                                             const int samples_per_domain)
{
    RG_LOG_INFO("benchmark: " << providers.size() << " provider(s) x " << domains.size()
                << " domain(s) x " << samples_per_domain << " sample(s), concurrency "
                << engine_.concurrency());
    auto results = engine_.probe_all(providers, domains, samples_per_domain, timeout_);
    auto ranking = rank(providers, results, min_success_rate_);

    if (auto best = winner(ranking))
        RG_LOG_INFO("benchmark: fastest " << best->provider.display_name << " ("
                    << *best->score_ms << " ms median)");
    else
        RG_LOG_WARN("benchmark: no reliable provider; check the network connection");
    return ranking;
}
} // namespace rg
