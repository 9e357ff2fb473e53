#include <limits>
#include <string>
#include <string_view>
#include <vector>
#include <iostream>

#include "rg/benchmark.hpp"
#include "rg/config_manager.hpp"
#include "rg/json.hpp"
#include "rg/output.hpp"
#include "rg/providers.hpp"
#include "rg/timeutil.hpp"

using namespace rg;

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

static void assert_not_contains(const std::string& haystack, std::string_view needle, std::string_view msg)
{
    if (haystack.find(needle) != std::string::npos)
    {
        std::cerr << "ASSERT FAILED: unexpected substring: " << needle << " | " << msg << std::endl;
        std::cerr << "Actual: " << haystack << std::endl;
        std::exit(1);
    }
}

static TimePoint fixed_time()
{
    return *parse_iso8601("2026-10-19T10:15:00.000001Z");
}

static BackupRecord record(const std::string& name, BackupReason reason, TimePoint at)
{
    BackupRecord r{};
    r.storage_path = "/var/lib/resolvguard/backups/" + name;
    r.reason = reason;
    r.created_at = at;
    r.content_digest = "ab";
    return r;
}

static RankedProvider ranked(const Provider& p, double median, bool reliable)
{
    RankedProvider rp{};
    rp.provider = p;
    rp.reliable = reliable;
    rp.attempts = 6;
    rp.successes = reliable ? 6 : 1;
    rp.success_rate = static_cast<double>(rp.successes) / rp.attempts;
    rp.score_ms = median;
    rp.stats.min = median - 1.0;
    rp.stats.max = median + 10.0;
    rp.stats.median = median;
    rp.stats.percentiles = {{90, median + 5.0}};
    return rp;
}

static void test_json_escape_and_numbers()
{
    assert_true(json_escape("a\"b\\c\n\x01") == "a\\\"b\\\\c\\n\\u0001", "escape");
    const std::string js = JsonObject{}
                               .num("x", 1.0 / 3.0)
                               .num("nan", std::numeric_limits<double>::quiet_NaN())
                               .integer("n", -4)
                               .build();
    assert_true(js == "{\"x\":0.333,\"nan\":null,\"n\":-4}", "numbers");
}

static void test_status_text_and_json()
{
    const ProviderRegistry reg = ProviderRegistry::with_builtins();
    StatusView v{};
    v.live_path = "/etc/resolv.conf";
    v.state.active_provider_id = "cloudflare";
    v.state.dot_enabled = true;
    v.state.locked = true;
    v.state.last_switch_at = fixed_time();
    v.state.last_backup_ref = "/var/lib/resolvguard/backups/resolv.conf.backup_x";
    v.active = reg.find("cloudflare");
    v.observed_locked = false;
    v.nameservers = {"127.0.0.53"};

    const std::string s = format_status_text(v);
    assert_contains(s, "Provider: Cloudflare (cloudflare)\n", "provider line");
    assert_contains(s, "DNS-over-TLS: on\n", "dot line");
    assert_contains(s, "Nameservers: 127.0.0.53\n", "nameservers");
    assert_contains(s, "Locked: no (state record says yes)\n", "desync shown");
    assert_contains(s, "Last switch: 2026-10-19T10:15:00.000001Z\n", "time");
    assert_contains(s, "Last backup: resolv.conf.backup_x\n", "backup file name");

    const std::string js = build_status_json(v);
    assert_contains(js, "\"active_provider\":\"cloudflare\"", "json provider");
    assert_contains(js, "\"locked\":true", "recorded lock");
    assert_contains(js, "\"observed_locked\":false", "observed lock");
    assert_contains(js, "\"nameservers\":[\"127.0.0.53\"]", "nameservers array");

    StatusView none{};
    none.live_path = "/etc/resolv.conf";
    none.state.active_provider_id = "retired";
    const std::string t = format_status_text(none);
    assert_contains(t, "Provider: retired (not registered)\n", "unregistered id");
    assert_contains(t, "Nameservers: (none)\n", "no nameservers");
    assert_contains(t, "Last switch: never\n", "never switched");
}

static void test_providers_listing()
{
    const ProviderRegistry reg = ProviderRegistry::with_builtins();
    const std::string s = format_providers_text(reg.all(), std::string("quad9"));
    assert_contains(s, "  1. Google", "numbered from 1");
    assert_contains(s, "DoT: dns.google", "DoT host");
    assert_contains(s, "DoT: -", "no DoT marker");
    assert_contains(s, "dns.quad9.net  [active]\n", "active marked");

    const std::string js = build_providers_json(reg.all(), std::nullopt);
    assert_contains(js, "{\"id\":\"google\",\"name\":\"Google\",\"primary\":\"8.8.8.8\",\"secondary\":\"8.8.4.4\","
                        "\"dot_hostname\":\"dns.google\"}", "provider object");
    assert_contains(js, "\"dot_hostname\":null", "no DoT is null");
    assert_contains(js, "\"active\":null", "no active provider");
}

static void test_backups_listing()
{
    assert_true(format_backups_text({}) == "No backups\n", "empty");
    const TimePoint t = fixed_time();
    const std::vector<BackupRecord> recs = {
        record("resolv.conf.backup_a", BackupReason::PreSwitch, t),
        record("resolv.conf.backup_b", BackupReason::PreReset, t + std::chrono::seconds(1)),
    };
    const std::string s = format_backups_text(recs);
    assert_true(s.find("backup_b") < s.find("backup_a"), "newest first");
    assert_contains(s, "pre-reset", "reason shown");

    const std::string js = build_backups_json(recs);
    assert_contains(js, "\"name\":\"resolv.conf.backup_a\"", "name");
    assert_contains(js, "\"reason\":\"pre-switch\"", "reason");
    assert_contains(js, "\"created_at\":\"2026-10-19T10:15:00.000001Z\"", "created_at");
}

static void test_switch_result()
{
    SwitchResult r{};
    r.outcome = SwitchOutcome::SwitchedUnlocked;
    r.message = "switched to Google but the file is not locked";
    r.backup = record("resolv.conf.backup_a", BackupReason::PreSwitch, fixed_time());
    r.state.active_provider_id = "google";
    const std::string s = format_switch_text(r);
    assert_contains(s, "WARNING: switched to Google", "warning prefix");
    assert_contains(s, "Backup: /var/lib/resolvguard/backups/resolv.conf.backup_a\n", "backup path");
    assert_contains(s, "Locked: no\n", "lock state");

    const std::string js = build_switch_json(r);
    assert_contains(js, "\"outcome\":\"switched-unlocked\"", "outcome");
    assert_contains(js, "\"state\":{\"active_provider\":\"google\"", "nested state");

    SwitchResult noop{};
    noop.message = "already using Google";
    noop.state.locked = true;
    assert_contains(format_switch_text(noop), "Unchanged: already using Google\n", "no-op prefix");
    assert_contains(build_switch_json(noop), "\"backup\":null", "no backup");
}

static void test_ranking()
{
    const ProviderRegistry reg = ProviderRegistry::with_builtins();
    const std::vector<RankedProvider> ranking = {
        ranked(*reg.find("cloudflare"), 11.5, true),
        ranked(*reg.find("google"), 20.25, true),
        ranked(*reg.find("quad9"), 300.0, false),
    };
    const std::string s = format_ranking_text(ranking);
    assert_contains(s, "   1  Cloudflare", "rank 1");
    assert_contains(s, "   2  Google", "rank 2");
    assert_contains(s, "   -  Quad9", "unreliable unranked");
    assert_contains(s, "unreliable\n", "marked unreliable");
    assert_contains(s, "Fastest: Cloudflare (11.500 ms median)\n", "winner line");

    const std::string js = build_ranking_json(ranking);
    assert_contains(js, "\"winner\":\"cloudflare\"", "winner id");
    assert_contains(js, "{\"id\":\"cloudflare\",\"rank\":1,\"median_ms\":11.500,\"p90_ms\":16.500", "first entry");
    assert_contains(js, "{\"id\":\"quad9\",\"rank\":null", "unreliable rank null");

    const std::vector<RankedProvider> none = {ranked(*reg.find("google"), 0.0, false)};
    assert_contains(format_ranking_text(none), "No reliable provider", "no winner");
    assert_contains(build_ranking_json(none), "\"winner\":null", "json no winner");
}

static void test_leak_text()
{
    const ProviderRegistry reg = ProviderRegistry::with_builtins();
    const Provider* cf = reg.find("cloudflare");

    LeakReport leak{};
    leak.leaked = true;
    leak.observed_address = "8.8.8.8";
    leak.expected_address = "1.1.1.1";
    leak.succeeded = leak.attempted = 3;
    leak.connectivity = Connectivity::Excellent;
    const std::string s = format_leak_text(leak, cf);
    assert_contains(s, "Connectivity: EXCELLENT (3/3 lookups)\n", "connectivity");
    assert_contains(s, "DNS LEAK: answered by 8.8.8.8, expected 1.1.1.1 (Cloudflare)\n", "leak line");

    LeakReport ok = leak;
    ok.leaked = false;
    ok.observed_address = "1.0.0.1";
    assert_contains(format_leak_text(ok, cf), "No leak: answered by 1.0.0.1 (Cloudflare)\n", "no leak");

    LeakReport stub = ok;
    stub.via_stub = true;
    stub.observed_address = "127.0.0.53";
    assert_contains(format_leak_text(stub, cf), "Answered by local stub 127.0.0.53", "stub");

    LeakReport dflt = ok;
    dflt.observed_address = "192.168.1.1";
    dflt.expected_address.clear();
    assert_contains(format_leak_text(dflt, nullptr), "Resolver: 192.168.1.1 (system default)\n", "default");

    LeakReport down{};
    down.attempted = 3;
    const std::string d = format_leak_text(down, cf);
    assert_contains(d, "DISCONNECTED (0/3 lookups)", "disconnected");
    assert_not_contains(d, "LEAK", "no verdict without answers");

    const std::string js = build_leak_json(leak, cf);
    assert_contains(js, "\"expected_provider\":\"cloudflare\",\"leaked\":true,\"observed\":\"8.8.8.8\"", "json");
}

static void test_ndjson_events()
{
    const TimePoint t = fixed_time();
    SwitchResult r{};
    r.outcome = SwitchOutcome::Switched;
    r.state.active_provider_id = "quad9";
    r.state.locked = true;
    const std::string sw = build_ndjson_switch_event(t, "switch", r);
    assert_true(sw.rfind("{\"ts\":\"2026-10-19T10:15:00.000001Z\",\"event\":\"switch\"", 0) == 0, "event prefix");
    assert_contains(sw, "\"outcome\":\"switched\",\"provider\":\"quad9\",\"dot\":false,\"locked\":true", "fields");
    assert_not_contains(sw, "\n", "single line");

    const std::string failed = build_ndjson_switch_failed(t, "reset", "default", error_kind_str(ErrorKind::IOFailure),
                                                          switch_step_str(SwitchStep::Backup), "disk \"full\"");
    assert_contains(failed, "\"outcome\":\"failed\",\"target\":\"default\"", "failure target");
    assert_contains(failed, "\"step\":\"backup\"", "step");
    assert_contains(failed, "\"error\":\"disk \\\"full\\\"\"", "escaped error");

    ReconcileReport rep{};
    rep.lock_desync = true;
    rep.observed_locked = false;
    const std::string ds = build_ndjson_lock_desync_event(t, rep);
    assert_contains(ds, "\"event\":\"lock-desync\"", "desync event");
    assert_contains(ds, "\"observed_locked\":false,\"recorded_locked\":true", "both sides");

    LeakReport leak{};
    assert_contains(build_ndjson_leak_event(t, leak, nullptr), "\"event\":\"leak-check\",\"expected_provider\":null",
                    "leak event");
    assert_contains(build_ndjson_benchmark_event(t, {}), "\"event\":\"benchmark\",\"winner\":null,\"ranking\":[]",
                    "benchmark event");
}

int main()
{
    test_json_escape_and_numbers();
    test_status_text_and_json();
    test_providers_listing();
    test_backups_listing();
    test_switch_result();
    test_ranking();
    test_leak_text();
    test_ndjson_events();
    std::cout << "presentation tests: OK" << std::endl;
    return 0;
}
