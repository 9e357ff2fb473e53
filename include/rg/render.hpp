#pragma once

#include <optional>
#include <string>
#include <vector>

#include "rg/model.hpp"

namespace rg
{
inline constexpr const char *kStubResolver = "127.0.0.53";

// Live resolver file for `provider` (nullptr = OS default / DHCP).
// Output depends only on the arguments.
std::string render_live_config(const Provider *provider, bool dot);

// systemd-resolved drop-in carrying the DNS-over-TLS transport.
std::string render_dot_dropin(const Provider &provider);

// `nameserver` entries in file order.
std::vector<std::string> parse_nameservers(const std::string &content);

// TLS hostname named by a DNS-over-TLS rendering: the stub as the only
// nameserver plus the header written by render_live_config. nullopt otherwise.
std::optional<std::string> parse_dot_hostname(const std::string &content);

// True when every expected address is present in the live content.
bool verify_nameservers(const std::string &content, const std::vector<std::string> &expected);
} // namespace rg
