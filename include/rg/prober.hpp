#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "rg/model.hpp"

namespace rg
{
struct ProbeTarget
{
    std::string provider_id;
    // Queried in order; empty = the system resolver path (resolv.conf).
    std::vector<std::string> servers;
};

// One resolution attempt. Implementations never throw for network-level
// failures; those come back as a typed ProbeResult.
class Prober
{
public:
    virtual ~Prober() = default;

    virtual ProbeResult resolve(const ProbeTarget &target,
                                const std::string &domain,
                                std::chrono::milliseconds timeout) = 0;
};

// Share of `total` each of `servers` nameservers may wait, so that trying
// them in turn stays within `total`. Never below one millisecond.
std::chrono::milliseconds per_server_timeout(std::chrono::milliseconds total, std::size_t servers);

// Raw DNS A query via ldns. Each server is tried once, no retries.
class LdnsProber final : public Prober
{
public:
    // `resolv_conf` is read for the system path; empty = /etc/resolv.conf.
    explicit LdnsProber(std::string resolv_conf = {});

    ProbeResult resolve(const ProbeTarget &target,
                        const std::string &domain,
                        std::chrono::milliseconds timeout) override;

private:
    std::string resolv_conf_;
};
} // namespace rg
