#include "rg/probe_engine.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>

#include "rg/logger.hpp"

namespace rg
{
ProbeEngine::ProbeEngine(Prober &prober, const int concurrency)
    : prober_(prober), concurrency_(std::max(1, concurrency))
{
}

std::vector<ProbeResult> ProbeEngine::run(const std::vector<Job> &jobs,
                                          const std::chrono::milliseconds timeout)
{
    cancelled_.store(false);
    std::vector<ProbeResult> results(jobs.size());
    if (jobs.empty()) return results;

    auto do_one = [&](size_t i)
    {
        const Job &job = jobs[i];
        ProbeResult r{};
        if (cancelled_.load())
        {
            r.status = ProbeStatus::Cancelled;
            r.error = "cancelled";
        }
        else
        {
            try
            {
                r = prober_.resolve(job.target, job.domain, timeout);
            }
            catch (const std::exception &e)
            {
                r = ProbeResult{};
                r.status = ProbeStatus::Failed;
                r.error = e.what();
            }
        }
        r.provider_id = job.target.provider_id;
        r.target_domain = job.domain;
        r.success = r.status == ProbeStatus::Ok;
        // each slot is written by exactly one task
        results[i] = std::move(r);
    };

    // Workers pull the next job index; at most `workers` probes are in flight.
    std::atomic<size_t> next{0};
    std::mutex error_mtx;
    std::exception_ptr first_error;
    auto worker = [&]
    {
        for (size_t i = next.fetch_add(1); i < jobs.size(); i = next.fetch_add(1))
        {
            try
            {
                do_one(i);
            }
            catch (...)
            {
                std::lock_guard<std::mutex> lk(error_mtx);
                if (!first_error) first_error = std::current_exception();
            }
        }
    };

    const size_t workers = std::min<size_t>(static_cast<size_t>(concurrency_), jobs.size());
    if (workers <= 1)
    {
        worker();
    }
    else
    {
        std::vector<std::jthread> threads;
        threads.reserve(workers);
        for (size_t w = 0; w < workers; ++w) threads.emplace_back(worker);
    }
    if (first_error) std::rethrow_exception(first_error);

    const auto ok = std::ranges::count_if(results, &ProbeResult::success);
    RG_LOG_DEBUG("probe batch: " << ok << "/" << results.size() << " succeeded");
    return results;
}

std::vector<ProbeResult> ProbeEngine::probe(const Provider &provider,
                                            const std::vector<std::string> &domains,
                                            const std::chrono::milliseconds timeout,
                                            const int samples)
{
    std::vector<Job> jobs;
    const ProbeTarget target{provider.id, provider.addresses()};
    for (int s = 0; s < std::max(1, samples); ++s)
        for (const auto &d : domains) jobs.push_back({target, d});
    return run(jobs, timeout);
}

std::vector<ProbeResult> ProbeEngine::probe_all(const std::vector<Provider> &providers,
                                                const std::vector<std::string> &domains,
                                                const int samples,
                                                const std::chrono::milliseconds timeout)
{
    std::vector<Job> jobs;
    jobs.reserve(providers.size() * domains.size() * static_cast<size_t>(std::max(1, samples)));
    for (const auto &p : providers)
    {
        const ProbeTarget target{p.id, p.addresses()};
        for (int s = 0; s < std::max(1, samples); ++s)
            for (const auto &d : domains) jobs.push_back({target, d});
    }
    return run(jobs, timeout);
}

std::vector<ProbeResult> ProbeEngine::probe_system(const std::vector<std::string> &domains,
                                                   const std::chrono::milliseconds timeout)
{
    std::vector<Job> jobs;
    for (const auto &d : domains) jobs.push_back({ProbeTarget{}, d});
    return run(jobs, timeout);
}
} // namespace rg
