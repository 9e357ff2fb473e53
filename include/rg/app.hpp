#pragma once

#include "rg/errors.hpp"
#include "rg/options.hpp"

namespace rg
{
// Process exit codes (sysexits.h values where one fits)
inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitUsage = 64;
inline constexpr int kExitCorruptBackup = 65;
inline constexpr int kExitIO = 74;
inline constexpr int kExitPermission = 77;

int exit_code_for(ErrorKind kind);

// Loads the configuration, wires the components and executes opt.command.
int run_app(const Options &opt);
} // namespace rg
