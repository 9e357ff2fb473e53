#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

#include "rg/model.hpp"
#include "rg/prober.hpp"

namespace rg
{
// Bounded-concurrency fan-out of probes across providers and domains.
class ProbeEngine
{
public:
    // At most `concurrency` probes are outstanding at any time.
    ProbeEngine(Prober &prober, int concurrency);

    // One probe per domain (x samples) against the provider's addresses.
    std::vector<ProbeResult> probe(const Provider &provider,
                                   const std::vector<std::string> &domains,
                                   std::chrono::milliseconds timeout,
                                   int samples = 1);

    // All providers in one pool; results grouped by provider in input order.
    std::vector<ProbeResult> probe_all(const std::vector<Provider> &providers,
                                       const std::vector<std::string> &domains,
                                       int samples,
                                       std::chrono::milliseconds timeout);

    // Through the resolver the OS actually uses.
    std::vector<ProbeResult> probe_system(const std::vector<std::string> &domains,
                                          std::chrono::milliseconds timeout);

    // Probes of the running batch not yet started complete as
    // ProbeStatus::Cancelled. The next batch starts uncancelled.
    void cancel() { cancelled_.store(true); }

    int concurrency() const { return concurrency_; }

private:
    struct Job
    {
        ProbeTarget target;
        std::string domain;
    };

    std::vector<ProbeResult> run(const std::vector<Job> &jobs, std::chrono::milliseconds timeout);

    Prober &prober_;
    int concurrency_;
    std::atomic<bool> cancelled_{false};
};
} // namespace rg
