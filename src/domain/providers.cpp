#include "rg/providers.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

#include <arpa/inet.h>
#include <netinet/in.h>

#include "rg/errors.hpp"

namespace rg
{
std::optional<std::string> normalize_ip(const std::string &text)
{
    auto first = std::find_if_not(text.begin(), text.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(text.rbegin(), text.rend(),
                                 [](unsigned char c) { return std::isspace(c); }).base();
    if (first >= last) return std::nullopt;
    const std::string ip(first, last);

    char buf[INET6_ADDRSTRLEN]{};
    if (in_addr a4{}; inet_pton(AF_INET, ip.c_str(), &a4) == 1)
    {
        if (inet_ntop(AF_INET, &a4, buf, sizeof(buf))) return std::string{buf};
        return std::nullopt;
    }
    if (in6_addr a6{}; inet_pton(AF_INET6, ip.c_str(), &a6) == 1)
    {
        if (inet_ntop(AF_INET6, &a6, buf, sizeof(buf))) return std::string{buf};
    }
    return std::nullopt;
}

std::vector<Provider> builtin_providers()
{
    return {
        {"google", "Google", "8.8.8.8", "8.8.4.4", true, "dns.google"},
        {"cloudflare", "Cloudflare", "1.1.1.1", "1.0.0.1", true, "cloudflare-dns.com"},
        {"quad9", "Quad9 (Security)", "9.9.9.9", "149.112.112.112", true, "dns.quad9.net"},
        {"adguard", "AdGuard (No Ads)", "94.140.14.14", "94.140.15.15", true, "dns.adguard-dns.com"},
        {"cleanbrowsing", "CleanBrowsing (Family)", "185.228.168.9", "185.228.169.9", false, ""},
    };
}

ProviderRegistry::ProviderRegistry(std::vector<Provider> providers)
{
    std::unordered_set<std::string> ids;
    for (auto &p : providers)
    {
        if (p.id.empty())
            throw Error(ErrorKind::InvalidArgument, "provider id is empty");
        if (!ids.insert(p.id).second)
            throw Error(ErrorKind::InvalidArgument, "duplicate provider id '" + p.id + "'");
        if (p.display_name.empty()) p.display_name = p.id;

        auto primary = normalize_ip(p.primary_address);
        if (!primary)
            throw Error(ErrorKind::InvalidArgument,
                        "provider '" + p.id + "': invalid primary address '" + p.primary_address + "'");
        p.primary_address = *primary;

        if (p.secondary_address)
        {
            auto secondary = normalize_ip(*p.secondary_address);
            if (!secondary)
                throw Error(ErrorKind::InvalidArgument,
                            "provider '" + p.id + "': invalid secondary address '" + *p.secondary_address + "'");
            p.secondary_address = *secondary;
        }
        if (p.supports_dot && p.dot_hostname.empty())
            throw Error(ErrorKind::InvalidArgument,
                        "provider '" + p.id + "' supports DoT but has no dot_hostname");
    }
    providers_ = std::move(providers);
}

ProviderRegistry ProviderRegistry::with_builtins(const std::vector<Provider> &extra)
{
    auto all = builtin_providers();
    all.insert(all.end(), extra.begin(), extra.end());
    return ProviderRegistry(std::move(all));
}

const Provider *ProviderRegistry::find(const std::string &id) const
{
    auto it = std::ranges::find(providers_, id, &Provider::id);
    return it == providers_.end() ? nullptr : &*it;
}

const Provider *ProviderRegistry::at_index(const int index) const
{
    if (index < 1 || static_cast<size_t>(index) > providers_.size()) return nullptr;
    return &providers_[static_cast<size_t>(index) - 1];
}

const Provider *ProviderRegistry::lookup(const std::string &key) const
{
    if (!key.empty() && std::ranges::all_of(key, [](unsigned char c) { return std::isdigit(c); }))
    {
        try { return at_index(std::stoi(key)); }
        catch (const std::out_of_range &) { return nullptr; }
    }
    return find(key);
}

const Provider *ProviderRegistry::match_nameservers(const std::vector<std::string> &ns) const
{
    if (ns.empty()) return nullptr;
    std::vector<std::string> want = ns;
    std::ranges::sort(want);
    for (const auto &p : providers_)
    {
        auto have = p.addresses();
        std::ranges::sort(have);
        if (have == want) return &p;
    }
    return nullptr;
}
} // namespace rg
