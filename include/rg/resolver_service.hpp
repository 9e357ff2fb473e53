#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "rg/model.hpp"
#include "rg/privilege.hpp"

namespace rg
{
// Narrow control surface over the OS resolver service.
class ResolverService
{
public:
    virtual ~ResolverService() = default;

    // Installs (dot=true) or removes the encrypted-transport descriptor for
    // `provider` (nullptr = none). Throws Error on failure.
    virtual void apply_transport(const Provider *provider, bool dot) = 0;

    // Best effort; failures are logged.
    virtual void flush_caches() = 0;

    // Ask the network manager to rewrite the resolver file from DHCP.
    virtual void regenerate_default() = 0;
};

// Runs argv[0] from PATH with stdio detached. Returns the exit status,
// -1 when the program could not be started or was killed after `timeout`.
int run_command(const std::vector<std::string> &argv, std::chrono::milliseconds timeout);

using CommandRunner = std::function<int(const std::vector<std::string> &, std::chrono::milliseconds)>;

// systemd-resolved drop-in + systemctl/resolvectl commands.
class SystemdResolverService final : public ResolverService
{
public:
    SystemdResolverService(std::string dropin_path, Privileges privileges, CommandRunner runner = run_command);

    void apply_transport(const Provider *provider, bool dot) override;
    void flush_caches() override;
    void regenerate_default() override;

private:
    bool restart_unit(const std::string &unit);

    std::string dropin_path_;
    Privileges privileges_;
    CommandRunner run_;
};
} // namespace rg
