#pragma once

#include <optional>
#include <string>
#include <vector>

#include "rg/model.hpp"

namespace rg
{
// Returns the normalised textual form of an IPv4/IPv6 literal, or nullopt.
std::optional<std::string> normalize_ip(const std::string &text);

std::vector<Provider> builtin_providers();

// Fixed provider set, populated once at startup.
class ProviderRegistry
{
public:
    // Validates every descriptor; throws Error(InvalidArgument) on
    // duplicate ids, bad addresses or DoT without a hostname.
    explicit ProviderRegistry(std::vector<Provider> providers);

    static ProviderRegistry with_builtins(const std::vector<Provider> &extra = {});

    const std::vector<Provider> &all() const { return providers_; }
    const Provider *find(const std::string &id) const;
    // 1-based, in registration order
    const Provider *at_index(int index) const;
    // Accepts an id or a 1-based index.
    const Provider *lookup(const std::string &key) const;
    // Provider whose addresses are exactly the given nameserver set.
    const Provider *match_nameservers(const std::vector<std::string> &ns) const;

private:
    std::vector<Provider> providers_;
};
} // namespace rg
