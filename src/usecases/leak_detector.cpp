#include "rg/leak_detector.hpp"

#include <algorithm>

#include "rg/logger.hpp"
#include "rg/providers.hpp"

namespace rg
{
LeakDetector::LeakDetector(ProbeEngine &engine,
                           std::vector<std::string> test_domains,
                           std::vector<std::string> stub_addresses,
                           const std::chrono::milliseconds timeout)
    : engine_(engine),
      domains_(std::move(test_domains)),
      stubs_(std::move(stub_addresses)),
      timeout_(timeout)
{
}

LeakReport LeakDetector::evaluate(const Provider *expected, const std::vector<ProbeResult> &results) const
{
    LeakReport report{};
    report.attempted = static_cast<int>(results.size());
    if (expected) report.expected_address = expected->primary_address;

    std::string first_seen, first_match, first_leak;
    for (const auto &r : results)
    {
        if (!r.success) continue;
        ++report.succeeded;

        // answerfrom may carry a non-canonical textual form
        const std::string observed = normalize_ip(r.answered_by).value_or(r.answered_by);
        if (observed.empty()) continue;
        if (first_seen.empty()) first_seen = observed;

        if (std::ranges::find(stubs_, observed) != stubs_.end()) continue;
        if (!expected || expected->owns_address(observed))
        {
            if (first_match.empty()) first_match = observed;
        }
        else if (first_leak.empty())
        {
            first_leak = observed;
        }
    }

    report.leaked = !first_leak.empty();
    report.observed_address = report.leaked ? first_leak : !first_match.empty() ? first_match : first_seen;
    // only a local stub answered: the upstream it forwards to is not visible here
    report.via_stub = !first_seen.empty() && first_match.empty() && first_leak.empty();

    if (report.attempted > 0 && report.succeeded == report.attempted)
        report.connectivity = Connectivity::Excellent;
    else if (report.succeeded > 0)
        report.connectivity = Connectivity::Unstable;
    else
        report.connectivity = Connectivity::Disconnected;
    return report;
}

LeakReport LeakDetector::check(const Provider *expected)
{
    RG_LOG_INFO("leak check: " << domains_.size() << " domain(s) through the system resolver"
                << (expected ? ", expecting " + expected->display_name : std::string{}));
    const auto results = engine_.probe_system(domains_, timeout_);
    for (const auto &r : results)
    {
        RG_LOG_DEBUG("leak check: " << r.target_domain << " " << probe_status_str(r.status)
                     << " from " << (r.answered_by.empty() ? "-" : r.answered_by));
    }

    LeakReport report = evaluate(expected, results);
    if (report.leaked)
        RG_LOG_WARN("leak: answered by " << report.observed_address << ", expected "
                    << report.expected_address);
    RG_LOG_INFO("leak check: connectivity " << connectivity_str(report.connectivity) << " ("
                << report.succeeded << "/" << report.attempted << ")");
    return report;
}
} // namespace rg
