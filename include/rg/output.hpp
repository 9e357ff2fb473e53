#pragma once

#include <optional>
#include <string>
#include <vector>

#include "rg/model.hpp"

namespace rg
{
// Forward declarations to avoid heavy includes in header
struct RankedProvider;
struct ReconcileReport;
class ProviderRegistry;

// Observed facts shown by --status next to the persisted record.
struct StatusView
{
    SystemState state;
    const Provider *active = nullptr;
    bool observed_locked{};
    std::vector<std::string> nameservers; // from the live file
    std::string live_path;
};

// Text formatting (returns complete text block with trailing newlines)
std::string format_status_text(const StatusView &view);

std::string format_providers_text(const std::vector<Provider> &providers,
                                  const std::optional<std::string> &active_id);

std::string format_backups_text(const std::vector<BackupRecord> &records);

std::string format_switch_text(const SwitchResult &result);

std::string format_ranking_text(const std::vector<RankedProvider> &ranking);

std::string format_leak_text(const LeakReport &report, const Provider *expected);

// JSON documents for --json (single object string without trailing newline)
std::string build_status_json(const StatusView &view);

std::string build_providers_json(const std::vector<Provider> &providers,
                                 const std::optional<std::string> &active_id);

std::string build_backups_json(const std::vector<BackupRecord> &records);

std::string build_switch_json(const SwitchResult &result);

std::string build_ranking_json(const std::vector<RankedProvider> &ranking);

std::string build_leak_json(const LeakReport &report, const Provider *expected);

// NDJSON event builders (single-line JSON strings without trailing newline)
std::string build_ndjson_switch_event(TimePoint ts, const char *op, const SwitchResult &result);

std::string build_ndjson_switch_failed(TimePoint ts,
                                       const char *op,
                                       const std::string &target,
                                       const char *kind,
                                       const char *step,
                                       const std::string &error);

std::string build_ndjson_benchmark_event(TimePoint ts, const std::vector<RankedProvider> &ranking);

std::string build_ndjson_leak_event(TimePoint ts, const LeakReport &report, const Provider *expected);

std::string build_ndjson_lock_desync_event(TimePoint ts, const ReconcileReport &report);
} // namespace rg
