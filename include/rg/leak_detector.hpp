#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "rg/model.hpp"
#include "rg/probe_engine.hpp"

namespace rg
{
// Probes through the OS resolution path and compares the answering server
// with the provider that is supposed to be active.
class LeakDetector
{
public:
    LeakDetector(ProbeEngine &engine,
                 std::vector<std::string> test_domains,
                 std::vector<std::string> stub_addresses,
                 std::chrono::milliseconds timeout);

    // `expected` nullptr = DHCP/default: connectivity only, never a leak.
    LeakReport check(const Provider *expected);

    // Pure evaluation of collected system-path results.
    LeakReport evaluate(const Provider *expected, const std::vector<ProbeResult> &results) const;

private:
    ProbeEngine &engine_;
    std::vector<std::string> domains_;
    std::vector<std::string> stubs_;
    std::chrono::milliseconds timeout_;
};
} // namespace rg
