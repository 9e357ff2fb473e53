#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "rg/model.hpp"

namespace rg
{
inline constexpr const char *kDefaultConfigPath = "/etc/resolvguard/config.yaml";

struct PathsConfig
{
    std::string live_config = "/etc/resolv.conf";
    std::string state_file = "/var/lib/resolvguard/state.yaml";
    std::string backup_dir = "/var/lib/resolvguard/backups";
    std::string event_log = "/var/log/resolvguard/events.ndjson"; // empty = disabled
    std::string dot_dropin = "/etc/systemd/resolved.conf.d/resolvguard.conf";
    std::string lock_file = "/var/lib/resolvguard/resolvguard.lock";
};

struct BackupConfig
{
    std::size_t retention = 10; // records kept (>= 1)
    int max_age_days = 7;       // 0 disables age-based cleanup
};

struct ProbeConfig
{
    int concurrency = 4;   // 1..64
    int timeout_ms = 2000; // >= 100
    int samples = 3;       // per domain, benchmark only
    std::vector<std::string> domains{"google.com", "cloudflare.com", "github.com"};
};

struct BenchmarkConfig
{
    double min_success_rate = 0.5; // below = unreliable
};

struct LeakConfig
{
    std::vector<std::string> domains{"google.com", "cloudflare.com", "github.com"};
    std::vector<std::string> stub_addresses{"127.0.0.53", "127.0.0.54"};
};

struct LoggingConfig
{
    std::string level = "info"; // debug, info, warn, error, none
};

struct AppConfig
{
    PathsConfig paths;
    BackupConfig backups;
    ProbeConfig probe;
    BenchmarkConfig benchmark;
    LeakConfig leak;
    LoggingConfig logging;
    std::vector<Provider> providers; // appended after the built-ins
};

// Loads `config_path` over the defaults. A missing file is an error only
// when `required`; otherwise the defaults are kept.
bool load_config(const std::string &config_path, bool required, AppConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const AppConfig &config, std::string &error);
} // namespace rg
