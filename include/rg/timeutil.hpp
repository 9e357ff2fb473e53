#pragma once

#include <optional>
#include <string>

#include "rg/model.hpp"

namespace rg
{
// ISO-8601 UTC with microseconds: 2026-10-19T10:15:00.123456Z
std::string format_iso8601(TimePoint tp);
std::optional<TimePoint> parse_iso8601(const std::string &s);

// Compact form used in backup file names: 20261019T101500.123456Z
std::string format_compact(TimePoint tp);
std::optional<TimePoint> parse_compact(const std::string &s);
} // namespace rg
