#include "rg/cli.hpp"

#include <charconv>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>

#include "rg/logger.hpp"

using namespace std::string_view_literals;

namespace rg {

const char *command_str(Command c)
{
    switch (c)
    {
        case Command::Switch: return "switch";
        case Command::Test: return "test";
        case Command::Benchmark: return "benchmark";
        case Command::Status: return "status";
        case Command::Reset: return "reset";
        case Command::List: return "list";
        case Command::Backups: return "backups";
        case Command::Restore: return "restore";
        case Command::Help: return "help";
        case Command::None: break;
    }
    return "none";
}

void print_usage(const char *prog)
{
    std::cout << "DNS provider switcher with leak check and benchmark\n";
    std::cout << "Usage: " << prog << " [options] <command>\n";
    std::cout << "Commands:\n";
    std::cout << "  <N|id> [--dot]     Switch to provider N (see --list) or by id\n";
    std::cout << "  --test             Leak and connectivity check of the active resolver\n";
    std::cout << "  --benchmark        Rank all providers by median latency\n";
    std::cout << "  --status           Show the active provider and lock state\n";
    std::cout << "  --reset            Restore the system default (DHCP) configuration\n";
    std::cout << "  --list             List registered providers\n";
    std::cout << "  --backups          List stored backups\n";
    std::cout << "  --restore NAME     Restore a backup by file name, or 'latest'\n";
    std::cout << "Options:\n";
    std::cout << "  --dot              Enable DNS-over-TLS for the switch\n";
    std::cout << "  --config PATH      Configuration file (default: /etc/resolvguard/config.yaml)\n";
    std::cout << "  --samples N        Benchmark samples per domain\n";
    std::cout << "  --concurrency K    Parallel probes (1..64)\n";
    std::cout << "  --timeout MS       Per-probe timeout in milliseconds (>= 100)\n";
    std::cout << "  --log-level L      debug|info|warn|error|none\n";
    std::cout << "  --json             Output results in JSON format\n";
    std::cout << "  -h, --help         Show this help\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  sudo " << prog << " 2 --dot\n";
    std::cout << "  " << prog << " --benchmark --samples 5\n";
}

namespace {

// Accepts "--name VALUE" and "--name=VALUE".
bool option_value(std::string_view a, std::string_view name, int &i, int argc, char **argv, std::string &val)
{
    if (a == name && i + 1 < argc)
    {
        val = argv[++i];
        return true;
    }
    if (a.size() > name.size() + 1 && a.substr(0, name.size()) == name && a[name.size()] == '=')
    {
        val = std::string(a.substr(name.size() + 1));
        return true;
    }
    std::cerr << "invalid " << name << " usage\n";
    return false;
}

bool matches(std::string_view a, std::string_view name)
{
    return a == name || (a.size() > name.size() && a.substr(0, name.size()) == name && a[name.size()] == '=');
}

bool parse_int(const std::string &val, std::string_view name, int lo, int hi, int &out)
{
    int v = 0;
    const auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), v);
    if (ec != std::errc{} || ptr != val.data() + val.size())
    {
        std::cerr << "invalid " << name << " value: " << val << "\n";
        return false;
    }
    if (v < lo || v > hi)
    {
        std::cerr << name << " must be between " << lo << " and " << hi << "\n";
        return false;
    }
    out = v;
    return true;
}

bool set_command(Options &opt, Command c)
{
    if (opt.command != Command::None && opt.command != c)
    {
        std::cerr << "conflicting commands: " << command_str(opt.command) << " and " << command_str(c) << "\n";
        return false;
    }
    opt.command = c;
    return true;
}

} // namespace

bool parse_args(int argc, char **argv, Options &opt)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i];
        if (a == "-h"sv || a == "--help"sv)
        {
            opt.command = Command::Help;
            return true;
        }
        if (a == "--test"sv)
        {
            if (!set_command(opt, Command::Test)) return false;
        }
        else if (a == "--benchmark"sv)
        {
            if (!set_command(opt, Command::Benchmark)) return false;
        }
        else if (a == "--status"sv)
        {
            if (!set_command(opt, Command::Status)) return false;
        }
        else if (a == "--reset"sv)
        {
            if (!set_command(opt, Command::Reset)) return false;
        }
        else if (a == "--list"sv)
        {
            if (!set_command(opt, Command::List)) return false;
        }
        else if (a == "--backups"sv)
        {
            if (!set_command(opt, Command::Backups)) return false;
        }
        else if (a == "--dot"sv)
        {
            opt.dot = true;
        }
        else if (a == "--json"sv)
        {
            opt.json = true;
        }
        else if (matches(a, "--restore"sv))
        {
            if (!set_command(opt, Command::Restore)) return false;
            if (!option_value(a, "--restore"sv, i, argc, argv, opt.restore_name)) return false;
        }
        else if (matches(a, "--config"sv))
        {
            if (!option_value(a, "--config"sv, i, argc, argv, opt.config_path)) return false;
        }
        else if (matches(a, "--log-level"sv))
        {
            if (!option_value(a, "--log-level"sv, i, argc, argv, opt.log_level)) return false;
            if (!logging::is_level_name(opt.log_level))
            {
                std::cerr << "unknown log level: " << opt.log_level << "\n";
                return false;
            }
        }
        else if (matches(a, "--samples"sv))
        {
            std::string val;
            if (!option_value(a, "--samples"sv, i, argc, argv, val)) return false;
            if (!parse_int(val, "--samples"sv, 1, 100, opt.samples)) return false;
        }
        else if (matches(a, "--concurrency"sv))
        {
            std::string val;
            if (!option_value(a, "--concurrency"sv, i, argc, argv, val)) return false;
            if (!parse_int(val, "--concurrency"sv, 1, 64, opt.concurrency)) return false;
        }
        else if (matches(a, "--timeout"sv))
        {
            std::string val;
            if (!option_value(a, "--timeout"sv, i, argc, argv, val)) return false;
            if (!parse_int(val, "--timeout"sv, 100, 60000, opt.timeout_ms)) return false;
        }
        else if (!a.empty() && a[0] == '-')
        {
            std::cerr << "unknown option: " << a << "\n";
            return false;
        }
        else
        {
            if (!opt.provider.empty())
            {
                std::cerr << "only one provider may be given\n";
                return false;
            }
            if (!set_command(opt, Command::Switch)) return false;
            opt.provider = std::string(a);
        }
    }

    if (opt.dot && opt.command != Command::Switch)
    {
        std::cerr << "--dot only applies to a provider switch\n";
        return false;
    }
    return opt.command != Command::None;
}

} // namespace rg
