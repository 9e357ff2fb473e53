#include "rg/config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <filesystem>
#include <sstream>

#include "rg/logger.hpp"
#include "rg/providers.hpp"

namespace rg
{
namespace
{
std::vector<std::string> string_list(const YAML::Node &node)
{
    std::vector<std::string> out;
    if (node.IsSequence())
    {
        for (const auto &item : node) out.push_back(item.as<std::string>());
    }
    else if (node.IsScalar())
    {
        out.push_back(node.as<std::string>());
    }
    return out;
}

void warn_unknown_keys(const YAML::Node &node,
                       const std::vector<std::string> &valid,
                       const std::string &where)
{
    for (const auto &kv : node)
    {
        const auto key = kv.first.as<std::string>();
        if (std::ranges::find(valid, key) == valid.end())
            RG_LOG_WARN("[Config] Unknown key " << where << "'" << key << "' (will be ignored)");
    }
}

Provider parse_provider(const YAML::Node &node)
{
    Provider p{};
    if (node["id"]) p.id = node["id"].as<std::string>();
    p.display_name = node["name"] ? node["name"].as<std::string>() : p.id;
    if (node["primary"]) p.primary_address = node["primary"].as<std::string>();
    if (node["secondary"]) p.secondary_address = node["secondary"].as<std::string>();
    if (node["dot_hostname"]) p.dot_hostname = node["dot_hostname"].as<std::string>();
    p.supports_dot = !p.dot_hostname.empty();
    return p;
}
} // namespace

bool validate_config(const AppConfig &config, std::string &error)
{
    if (config.paths.live_config.empty())
    {
        error = "paths.live_config must not be empty";
        return false;
    }
    if (config.paths.state_file.empty() || config.paths.backup_dir.empty())
    {
        error = "paths.state_file and paths.backup_dir must not be empty";
        return false;
    }

    if (config.backups.retention < 1)
    {
        error = "backups.retention must be at least 1";
        return false;
    }
    if (config.backups.max_age_days < 0)
    {
        error = "backups.max_age_days must be >= 0";
        return false;
    }

    if (config.probe.concurrency < 1 || config.probe.concurrency > 64)
    {
        error = "probe.concurrency must be between 1 and 64";
        return false;
    }
    if (config.probe.timeout_ms < 100)
    {
        error = "probe.timeout_ms must be >= 100ms";
        return false;
    }
    if (config.probe.samples < 1)
    {
        error = "probe.samples must be at least 1";
        return false;
    }
    if (config.probe.domains.empty() || config.leak.domains.empty())
    {
        error = "probe.domains and leak.domains must not be empty";
        return false;
    }

    if (config.benchmark.min_success_rate < 0.0 || config.benchmark.min_success_rate > 1.0)
    {
        error = "benchmark.min_success_rate must be between 0 and 1";
        return false;
    }

    for (const auto &stub : config.leak.stub_addresses)
    {
        if (!normalize_ip(stub))
        {
            error = "leak.stub_addresses: '" + stub + "' is not an IP address";
            return false;
        }
    }

    if (!logging::is_level_name(config.logging.level))
    {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    for (const auto &p : config.providers)
    {
        if (p.id.empty())
        {
            error = "Provider missing 'id' field";
            return false;
        }
        if (!normalize_ip(p.primary_address))
        {
            error = "Provider '" + p.id + "' needs a valid 'primary' address";
            return false;
        }
        if (p.secondary_address && !normalize_ip(*p.secondary_address))
        {
            error = "Provider '" + p.id + "' has an invalid 'secondary' address";
            return false;
        }
    }
    return true;
}

bool load_config(const std::string &config_path, const bool required, AppConfig &config, std::string &error)
{
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec))
    {
        if (required)
        {
            error = "Cannot open config file: " + config_path;
            return false;
        }
        RG_LOG_DEBUG("[Config] " << config_path << " not found, using defaults");
        return validate_config(config, error);
    }

    try
    {
        YAML::Node yaml = YAML::LoadFile(config_path);
        if (!yaml.IsMap())
        {
            if (yaml.IsNull()) return validate_config(config, error);
            error = "Config root must be a mapping";
            return false;
        }

        warn_unknown_keys(yaml, {"paths", "backups", "probe", "benchmark", "leak", "logging", "providers"}, "");

        if (const auto paths = yaml["paths"])
        {
            warn_unknown_keys(paths,
                              {"live_config", "state_file", "backup_dir", "event_log", "dot_dropin", "lock_file"},
                              "paths.");
            if (paths["live_config"]) config.paths.live_config = paths["live_config"].as<std::string>();
            if (paths["state_file"]) config.paths.state_file = paths["state_file"].as<std::string>();
            if (paths["backup_dir"]) config.paths.backup_dir = paths["backup_dir"].as<std::string>();
            if (paths["event_log"])
                config.paths.event_log = paths["event_log"].IsNull() ? "" : paths["event_log"].as<std::string>();
            if (paths["dot_dropin"]) config.paths.dot_dropin = paths["dot_dropin"].as<std::string>();
            if (paths["lock_file"]) config.paths.lock_file = paths["lock_file"].as<std::string>();
        }

        if (const auto backups = yaml["backups"])
        {
            if (backups["retention"])
            {
                const int retention = backups["retention"].as<int>();
                if (retention < 1)
                {
                    error = "backups.retention must be at least 1";
                    return false;
                }
                config.backups.retention = static_cast<std::size_t>(retention);
            }
            if (backups["max_age_days"]) config.backups.max_age_days = backups["max_age_days"].as<int>();
        }

        if (const auto probe = yaml["probe"])
        {
            if (probe["concurrency"]) config.probe.concurrency = probe["concurrency"].as<int>();
            if (probe["timeout_ms"]) config.probe.timeout_ms = probe["timeout_ms"].as<int>();
            if (probe["samples"]) config.probe.samples = probe["samples"].as<int>();
            if (probe["domains"]) config.probe.domains = string_list(probe["domains"]);
        }

        if (const auto benchmark = yaml["benchmark"])
        {
            if (benchmark["min_success_rate"])
                config.benchmark.min_success_rate = benchmark["min_success_rate"].as<double>();
        }

        if (const auto leak = yaml["leak"])
        {
            if (leak["domains"]) config.leak.domains = string_list(leak["domains"]);
            if (leak["stub_addresses"]) config.leak.stub_addresses = string_list(leak["stub_addresses"]);
        }

        if (const auto log = yaml["logging"])
        {
            if (log["level"]) config.logging.level = log["level"].as<std::string>();
        }

        if (const auto providers = yaml["providers"])
        {
            if (!providers.IsSequence())
            {
                error = "providers must be a list";
                return false;
            }
            for (const auto &node : providers) config.providers.push_back(parse_provider(node));
        }

        if (!validate_config(config, error))
        {
            return false;
        }

        RG_LOG_DEBUG("[Config] Loaded " << config_path);
        std::ostringstream probe_msg;
        probe_msg << "[Config] Probe: concurrency " << config.probe.concurrency << ", timeout "
                  << config.probe.timeout_ms << "ms, " << config.probe.samples << " sample(s)";
        RG_LOG_DEBUG(probe_msg.str());
        if (!config.providers.empty())
            RG_LOG_DEBUG("[Config] " << config.providers.size() << " extra provider(s)");
        return true;
    }
    catch (const YAML::BadFile &)
    {
        error = "Cannot open config file: " + config_path;
        return false;
    }
    catch (const YAML::ParserException &e)
    {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    }
    catch (const YAML::Exception &e)
    {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}
} // namespace rg
