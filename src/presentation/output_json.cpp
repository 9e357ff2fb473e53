#include "rg/output.hpp"

#include <filesystem>

#include "rg/benchmark.hpp"
#include "rg/config_manager.hpp"
#include "rg/json.hpp"
#include "rg/timeutil.hpp"

namespace rg
{
namespace
{
std::string string_array(const std::vector<std::string> &items)
{
    std::string out = "[";
    for (size_t i = 0; i < items.size(); ++i)
    {
        if (i) out += ',';
        out += '"';
        out += json_escape(items[i]);
        out += '"';
    }
    out += ']';
    return out;
}

std::string objects_array(const std::vector<std::string> &objects)
{
    std::string out = "[";
    for (size_t i = 0; i < objects.size(); ++i)
    {
        if (i) out += ',';
        out += objects[i];
    }
    out += ']';
    return out;
}

std::optional<std::string> opt_time(const std::optional<TimePoint> &tp)
{
    if (!tp) return std::nullopt;
    return format_iso8601(*tp);
}

JsonObject &state_fields(JsonObject &o, const SystemState &st)
{
    return o.opt_str("active_provider", st.active_provider_id)
        .boolean("dot_enabled", st.dot_enabled)
        .boolean("locked", st.locked)
        .opt_str("last_switch_at", opt_time(st.last_switch_at))
        .opt_str("last_backup", st.last_backup_ref);
}

std::string backup_json(const BackupRecord &rec)
{
    return JsonObject{}
        .str("name", std::filesystem::path(rec.storage_path).filename().string())
        .str("path", rec.storage_path)
        .str("created_at", format_iso8601(rec.created_at))
        .str("reason", backup_reason_str(rec.reason))
        .str("sha256", rec.content_digest)
        .build();
}

std::string provider_json(const Provider &p)
{
    JsonObject o;
    o.str("id", p.id).str("name", p.display_name).str("primary", p.primary_address).opt_str(
        "secondary", p.secondary_address);
    if (p.supports_dot) o.str("dot_hostname", p.dot_hostname);
    else o.null("dot_hostname");
    return o.build();
}

std::string ranked_json(const RankedProvider &rp, int rank)
{
    JsonObject o;
    o.str("id", rp.provider.id);
    if (rp.reliable) o.integer("rank", rank);
    else o.null("rank");
    if (rp.score_ms)
    {
        double p90 = rp.stats.max;
        for (const auto &[p, v] : rp.stats.percentiles)
            if (p == 90) p90 = v;
        o.num("median_ms", *rp.score_ms).num("p90_ms", p90).num("min_ms", rp.stats.min).num(
            "avg_ms", rp.stats.avg).num("max_ms", rp.stats.max);
    }
    else
    {
        o.null("median_ms");
    }
    o.num("success_rate", rp.success_rate)
        .integer("successes", rp.successes)
        .integer("attempts", rp.attempts)
        .boolean("reliable", rp.reliable);
    return o.build();
}

std::string ranking_array(const std::vector<RankedProvider> &ranking)
{
    std::vector<std::string> items;
    int rank = 1;
    for (const auto &rp : ranking) items.push_back(ranked_json(rp, rp.reliable ? rank++ : 0));
    return objects_array(items);
}

JsonObject &leak_fields(JsonObject &o, const LeakReport &report, const Provider *expected)
{
    if (expected) o.str("expected_provider", expected->id);
    else o.null("expected_provider");
    return o.boolean("leaked", report.leaked)
        .str("observed", report.observed_address)
        .str("expected", report.expected_address)
        .boolean("via_stub", report.via_stub)
        .str("connectivity", connectivity_str(report.connectivity))
        .integer("succeeded", report.succeeded)
        .integer("attempted", report.attempted);
}

JsonObject event(TimePoint ts, const char *name)
{
    JsonObject o;
    o.str("ts", format_iso8601(ts)).str("event", name);
    return o;
}
} // namespace

std::string build_status_json(const StatusView &view)
{
    JsonObject o;
    o.str("live_file", view.live_path);
    state_fields(o, view.state);
    return o.boolean("observed_locked", view.observed_locked)
        .raw("nameservers", string_array(view.nameservers))
        .build();
}

std::string build_providers_json(const std::vector<Provider> &providers,
                                 const std::optional<std::string> &active_id)
{
    std::vector<std::string> items;
    for (const auto &p : providers) items.push_back(provider_json(p));
    return JsonObject{}.raw("providers", objects_array(items)).opt_str("active", active_id).build();
}

std::string build_backups_json(const std::vector<BackupRecord> &records)
{
    std::vector<std::string> items;
    for (const auto &r : records) items.push_back(backup_json(r));
    return JsonObject{}.raw("backups", objects_array(items)).build();
}

std::string build_switch_json(const SwitchResult &result)
{
    JsonObject o;
    o.str("outcome", switch_outcome_str(result.outcome)).str("message", result.message);
    o.raw("backup", result.backup ? backup_json(*result.backup) : std::string("null"));
    JsonObject st;
    state_fields(st, result.state);
    return o.raw("state", st.build()).build();
}

std::string build_ranking_json(const std::vector<RankedProvider> &ranking)
{
    auto best = Benchmarker::winner(ranking);
    return JsonObject{}
        .raw("ranking", ranking_array(ranking))
        .opt_str("winner", best ? std::optional<std::string>(best->provider.id) : std::nullopt)
        .build();
}

std::string build_leak_json(const LeakReport &report, const Provider *expected)
{
    JsonObject o;
    return leak_fields(o, report, expected).build();
}

std::string build_ndjson_switch_event(TimePoint ts, const char *op, const SwitchResult &result)
{
    JsonObject o = event(ts, op);
    o.str("outcome", switch_outcome_str(result.outcome));
    o.opt_str("provider", result.state.active_provider_id).boolean("dot", result.state.dot_enabled);
    o.boolean("locked", result.state.locked);
    if (result.backup) o.str("backup", result.backup->storage_path);
    else o.null("backup");
    return o.build();
}

std::string build_ndjson_switch_failed(TimePoint ts,
                                       const char *op,
                                       const std::string &target,
                                       const char *kind,
                                       const char *step,
                                       const std::string &error)
{
    return event(ts, op)
        .str("outcome", "failed")
        .str("target", target)
        .str("kind", kind)
        .str("step", step)
        .str("error", error)
        .build();
}

std::string build_ndjson_benchmark_event(TimePoint ts, const std::vector<RankedProvider> &ranking)
{
    auto best = Benchmarker::winner(ranking);
    return event(ts, "benchmark")
        .opt_str("winner", best ? std::optional<std::string>(best->provider.id) : std::nullopt)
        .raw("ranking", ranking_array(ranking))
        .build();
}

std::string build_ndjson_leak_event(TimePoint ts, const LeakReport &report, const Provider *expected)
{
    JsonObject o = event(ts, "leak-check");
    return leak_fields(o, report, expected).build();
}

std::string build_ndjson_lock_desync_event(TimePoint ts, const ReconcileReport &report)
{
    return event(ts, "lock-desync")
        .str("kind", error_kind_str(ErrorKind::LockDesync))
        .boolean("observed_locked", report.observed_locked)
        .boolean("recorded_locked", !report.observed_locked)
        .build();
}
} // namespace rg
