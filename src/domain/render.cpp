#include "rg/render.hpp"

#include <algorithm>
#include <sstream>
#include <string_view>

namespace rg
{
namespace
{
constexpr std::string_view kDotMarker = "(DNS-over-TLS via ";
}

std::string render_live_config(const Provider *provider, const bool dot)
{
    std::ostringstream os;
    if (!provider)
    {
        os << "# Generated by resolvguard - system default (DHCP)\n";
        os << "# The network manager regenerates this file.\n";
        return os.str();
    }

    if (dot)
    {
        os << "# Generated by resolvguard - " << provider->display_name
           << ' ' << kDotMarker << provider->dot_hostname << ")\n";
        os << "nameserver " << kStubResolver << '\n';
        os << "options edns0 trust-ad\n";
        return os.str();
    }

    os << "# Generated by resolvguard - " << provider->display_name << '\n';
    for (const auto &ip : provider->addresses()) os << "nameserver " << ip << '\n';
    return os.str();
}

std::string render_dot_dropin(const Provider &provider)
{
    std::ostringstream os;
    os << "# Generated by resolvguard - " << provider.display_name << '\n';
    os << "[Resolve]\n";
    os << "DNS=";
    bool first = true;
    for (const auto &ip : provider.addresses())
    {
        if (!first) os << ' ';
        os << ip << '#' << provider.dot_hostname;
        first = false;
    }
    os << '\n';
    os << "FallbackDNS=";
    first = true;
    for (const auto &ip : provider.addresses())
    {
        if (!first) os << ' ';
        os << ip;
        first = false;
    }
    os << '\n';
    os << "Domains=~.\n";
    os << "DNSOverTLS=yes\n";
    os << "DNSSEC=no\n";
    return os.str();
}

std::vector<std::string> parse_nameservers(const std::string &content)
{
    std::vector<std::string> out;
    std::istringstream is(content);
    std::string line;
    while (std::getline(is, line))
    {
        std::istringstream ls(line);
        std::string key, value;
        if (!(ls >> key) || key != "nameserver") continue;
        if (ls >> value) out.push_back(value);
    }
    return out;
}

std::optional<std::string> parse_dot_hostname(const std::string &content)
{
    if (parse_nameservers(content) != std::vector<std::string>{kStubResolver}) return std::nullopt;

    std::istringstream is(content);
    std::string line;
    while (std::getline(is, line))
    {
        if (!line.starts_with('#')) continue;
        const auto at = line.find(kDotMarker);
        if (at == std::string::npos) continue;
        const auto begin = at + kDotMarker.size();
        const auto end = line.find(')', begin);
        if (end == std::string::npos || end == begin) return std::nullopt;
        return line.substr(begin, end - begin);
    }
    return std::nullopt;
}

bool verify_nameservers(const std::string &content, const std::vector<std::string> &expected)
{
    const auto current = parse_nameservers(content);
    return std::ranges::all_of(expected, [&](const std::string &ip)
    {
        return std::ranges::find(current, ip) != current.end();
    });
}
} // namespace rg
