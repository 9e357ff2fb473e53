#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "fakes.hpp"
#include "rg/cli.hpp"
#include "rg/config.hpp"
#include "rg/logger.hpp"

using namespace rg;
using namespace rg::testing;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static void assert_contains(const std::string& haystack, std::string_view needle, std::string_view msg)
{
    if (haystack.find(needle) == std::string::npos)
    {
        std::cerr << "ASSERT FAILED: missing substring: " << needle << " | " << msg << std::endl;
        std::cerr << "Actual: " << haystack << std::endl;
        std::exit(1);
    }
}

static bool parse(std::vector<std::string> args, Options& opt)
{
    args.insert(args.begin(), "resolvguard");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);
    opt = Options{};
    return parse_args(static_cast<int>(args.size()), argv.data(), opt);
}

static std::string write_config(const TempDir& dir, const std::string& yaml)
{
    const std::string path = dir.file("config.yaml");
    std::ofstream(path) << yaml;
    return path;
}

static void test_missing_optional_config_keeps_defaults()
{
    TempDir dir;
    AppConfig cfg;
    std::string err;
    assert_true(load_config(dir.file("absent.yaml"), false, cfg, err), "missing optional config is fine");
    assert_true(cfg.paths.live_config == "/etc/resolv.conf", "default live path");
    assert_true(cfg.backups.retention == 10 && cfg.backups.max_age_days == 7, "default retention");
    assert_true(cfg.probe.concurrency == 4 && cfg.probe.timeout_ms == 2000, "default probe");

    AppConfig strict;
    assert_true(!load_config(dir.file("absent.yaml"), true, strict, err), "missing required config fails");
    assert_contains(err, "Cannot open config file", "error names the problem");
}

static void test_full_config()
{
    TempDir dir;
    const std::string path = write_config(dir,
        "paths:\n"
        "  live_config: /tmp/rg/resolv.conf\n"
        "  event_log: ~\n"
        "backups:\n"
        "  retention: 4\n"
        "  max_age_days: 0\n"
        "probe:\n"
        "  concurrency: 8\n"
        "  timeout_ms: 750\n"
        "  samples: 5\n"
        "  domains: [example.org, example.net]\n"
        "benchmark:\n"
        "  min_success_rate: 0.8\n"
        "leak:\n"
        "  domains: example.com\n"
        "logging:\n"
        "  level: debug\n"
        "providers:\n"
        "  - id: mullvad\n"
        "    name: Mullvad\n"
        "    primary: 194.242.2.2\n"
        "    dot_hostname: dns.mullvad.net\n"
        "  - id: lan\n"
        "    primary: 192.168.1.1\n"
        "    secondary: 192.168.1.2\n");
    AppConfig cfg;
    std::string err;
    assert_true(load_config(path, true, cfg, err), "valid config loads");
    assert_true(cfg.paths.live_config == "/tmp/rg/resolv.conf", "live path");
    assert_true(cfg.paths.event_log.empty(), "null event log disables it");
    assert_true(cfg.paths.state_file == "/var/lib/resolvguard/state.yaml", "untouched default kept");
    assert_true(cfg.backups.retention == 4 && cfg.backups.max_age_days == 0, "backups");
    assert_true(cfg.probe.concurrency == 8 && cfg.probe.timeout_ms == 750 && cfg.probe.samples == 5, "probe");
    assert_true(cfg.probe.domains == std::vector<std::string>{"example.org", "example.net"}, "probe domains");
    assert_true(cfg.leak.domains == std::vector<std::string>{"example.com"}, "scalar domain list");
    assert_true(cfg.benchmark.min_success_rate == 0.8, "min success rate");
    assert_true(cfg.logging.level == "debug", "log level");

    assert_true(cfg.providers.size() == 2, "two extra providers");
    assert_true(cfg.providers[0].supports_dot && cfg.providers[0].dot_hostname == "dns.mullvad.net", "DoT");
    assert_true(!cfg.providers[1].supports_dot, "no DoT without hostname");
    assert_true(cfg.providers[1].display_name == "lan", "name defaults to id");
    assert_true(cfg.providers[1].secondary_address == std::optional<std::string>("192.168.1.2"), "secondary");
}

static void test_invalid_values_rejected()
{
    const std::vector<std::pair<std::string, std::string>> cases = {
        {"backups:\n  retention: 0\n", "retention"},
        {"probe:\n  concurrency: 65\n", "concurrency"},
        {"probe:\n  timeout_ms: 50\n", "timeout_ms"},
        {"benchmark:\n  min_success_rate: 1.5\n", "min_success_rate"},
        {"leak:\n  stub_addresses: [localhost]\n", "stub_addresses"},
        {"logging:\n  level: verbose\n", "log level"},
        {"providers:\n  - id: x\n    primary: not-an-ip\n", "primary"},
        {"providers:\n  id: x\n", "providers must be a list"},
        {"probe: [unterminated\n", "YAML parse error"},
        {"probe:\n  concurrency: many\n", "Config load error"},
    };
    for (const auto& [yaml, needle] : cases)
    {
        TempDir dir;
        AppConfig cfg;
        std::string err;
        assert_true(!load_config(write_config(dir, yaml), true, cfg, err), "invalid config rejected");
        assert_contains(err, needle, "error message");
    }
}

static void test_empty_config_file()
{
    TempDir dir;
    AppConfig cfg;
    std::string err;
    assert_true(load_config(write_config(dir, ""), true, cfg, err), "empty file means defaults");
}

static void test_cli_switch()
{
    Options opt;
    assert_true(parse({"2", "--dot"}, opt), "switch with dot");
    assert_true(opt.command == Command::Switch && opt.provider == "2" && opt.dot, "fields");

    assert_true(parse({"cloudflare", "--json", "--config=/tmp/c.yaml"}, opt), "switch by id");
    assert_true(opt.provider == "cloudflare" && opt.json && opt.config_path == "/tmp/c.yaml", "inline value");

    assert_true(!parse({"google", "quad9"}, opt), "two providers rejected");
    assert_true(!parse({"--dot"}, opt), "dot alone rejected");
    assert_true(!parse({"--status", "--dot"}, opt), "dot with another command rejected");
}

static void test_cli_commands_and_options()
{
    Options opt;
    assert_true(parse({"--benchmark", "--samples", "5", "--concurrency=8", "--timeout", "900"}, opt), "benchmark");
    assert_true(opt.command == Command::Benchmark, "command");
    assert_true(opt.samples == 5 && opt.concurrency == 8 && opt.timeout_ms == 900, "overrides");

    assert_true(parse({"--restore", "latest"}, opt), "restore");
    assert_true(opt.command == Command::Restore && opt.restore_name == "latest", "restore name");

    assert_true(parse({"--status", "--log-level", "WARN"}, opt), "status");
    assert_true(opt.log_level == "WARN", "level kept as given");

    assert_true(parse({"--test"}, opt) && opt.command == Command::Test, "test");
    assert_true(parse({"--reset"}, opt) && opt.command == Command::Reset, "reset");
    assert_true(parse({"--list"}, opt) && opt.command == Command::List, "list");
    assert_true(parse({"--backups"}, opt) && opt.command == Command::Backups, "backups");
    assert_true(parse({"--list", "-h"}, opt) && opt.command == Command::Help, "help wins");

    assert_true(!parse({"--status", "--reset"}, opt), "conflicting commands");
    assert_true(!parse({"--samples", "0", "--benchmark"}, opt), "samples range");
    assert_true(!parse({"--concurrency", "abc", "--benchmark"}, opt), "not a number");
    assert_true(!parse({"--timeout"}, opt), "missing value");
    assert_true(!parse({"--log-level", "loud", "--status"}, opt), "unknown level");
    assert_true(!parse({"--frobnicate"}, opt), "unknown option");
    assert_true(!parse({"--json"}, opt), "no command");
}

static void test_log_level_names()
{
    assert_true(logging::string_to_level("debug") == logging::Level::LVL_DEBUG, "debug");
    assert_true(logging::string_to_level("Error") == logging::Level::LVL_ERROR, "case-insensitive");
    assert_true(logging::string_to_level("bogus") == logging::Level::LVL_INFO, "unknown -> info");
    assert_true(logging::is_level_name("NONE") && !logging::is_level_name("trace"), "names");
}

int main()
{
    logging::Logger::init(logging::Level::LVL_ERROR);
    test_missing_optional_config_keeps_defaults();
    test_full_config();
    test_invalid_values_rejected();
    test_empty_config_file();
    test_cli_switch();
    test_cli_commands_and_options();
    test_log_level_names();

    std::cout << "config tests: OK" << std::endl;
    return 0;
}
