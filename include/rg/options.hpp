#pragma once

#include <string>

namespace rg
{
enum class Command
{
    None,
    Switch,    // <index|id> [--dot]
    Test,      // leak check
    Benchmark,
    Status,
    Reset,
    List,
    Backups,
    Restore,
    Help,
};

struct Options
{
    Command command = Command::None;
    std::string provider;     // id or 1-based index
    bool dot = false;         // DNS-over-TLS
    std::string restore_name; // backup file name or "latest"
    std::string config_path;  // empty = default location
    bool json = false;        // JSON output mode
    std::string log_level;    // overrides logging.level when set
    // probe overrides; 0 = from the configuration file
    int samples = 0;
    int concurrency = 0;
    int timeout_ms = 0;
};

const char *command_str(Command c);
} // namespace rg
