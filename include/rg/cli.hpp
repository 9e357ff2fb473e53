#pragma once

#include "rg/options.hpp"

namespace rg
{
void print_usage(const char *prog);

// false on invalid usage (message already printed to stderr)
bool parse_args(int argc, char **argv, Options &opt);
} // namespace rg
