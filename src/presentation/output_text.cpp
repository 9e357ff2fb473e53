#include "rg/output.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string_view>

#include "rg/benchmark.hpp"
#include "rg/timeutil.hpp"

namespace rg {

static std::string upper(std::string s)
{
    std::ranges::transform(s, s.begin(), [](unsigned char c) { return std::toupper(c); });
    return s;
}

static std::string join(const std::vector<std::string>& items, std::string_view sep)
{
    std::string out;
    for (const auto& item : items)
    {
        if (!out.empty()) out += sep;
        out += item;
    }
    return out;
}

static std::string provider_label(const Provider* p)
{
    if (!p) return "system default (DHCP)";
    return p->display_name + " (" + p->id + ")";
}

static double pct_of(const Aggregation& ag, int p)
{
    for (const auto& [k, v] : ag.percentiles)
        if (k == p) return v;
    return ag.max;
}

std::string format_status_text(const StatusView& view)
{
    const SystemState& st = view.state;
    std::ostringstream os;
    os << "Live file: " << view.live_path << '\n';
    os << "Provider: ";
    if (view.active) os << provider_label(view.active);
    else if (st.active_provider_id) os << *st.active_provider_id << " (not registered)";
    else os << provider_label(nullptr);
    os << '\n';
    os << "DNS-over-TLS: " << (st.dot_enabled ? "on" : "off") << '\n';
    os << "Nameservers: " << (view.nameservers.empty() ? std::string("(none)") : join(view.nameservers, ", "))
       << '\n';
    os << "Locked: " << (view.observed_locked ? "yes" : "no");
    if (view.observed_locked != st.locked)
        os << " (state record says " << (st.locked ? "yes" : "no") << ")";
    os << '\n';
    os << "Last switch: " << (st.last_switch_at ? format_iso8601(*st.last_switch_at) : std::string("never")) << '\n';
    os << "Last backup: "
       << (st.last_backup_ref ? std::filesystem::path(*st.last_backup_ref).filename().string()
                              : std::string("none"))
       << '\n';
    return os.str();
}

std::string format_providers_text(const std::vector<Provider>& providers,
                                  const std::optional<std::string>& active_id)
{
    std::ostringstream os;
    int idx = 1;
    for (const auto& p : providers)
    {
        os << std::setw(3) << idx++ << ". " << std::left << std::setw(24) << p.display_name
           << std::setw(34) << join(p.addresses(), ", ")
           << (p.supports_dot ? "DoT: " + p.dot_hostname : std::string("DoT: -")) << std::right;
        if (active_id && *active_id == p.id) os << "  [active]";
        os << '\n';
    }
    return os.str();
}

std::string format_backups_text(const std::vector<BackupRecord>& records)
{
    if (records.empty()) return "No backups\n";
    std::ostringstream os;
    // newest first
    for (auto it = records.rbegin(); it != records.rend(); ++it)
    {
        os << format_iso8601(it->created_at) << "  " << std::left << std::setw(12)
           << backup_reason_str(it->reason) << std::right
           << std::filesystem::path(it->storage_path).filename().string() << '\n';
    }
    return os.str();
}

std::string format_switch_text(const SwitchResult& result)
{
    std::ostringstream os;
    switch (result.outcome)
    {
        case SwitchOutcome::Switched: os << "OK: "; break;
        case SwitchOutcome::NoOp: os << "Unchanged: "; break;
        case SwitchOutcome::SwitchedUnlocked: os << "WARNING: "; break;
    }
    os << result.message << '\n';
    if (result.backup)
        os << "Backup: " << result.backup->storage_path << '\n';
    os << "Locked: " << (result.state.locked ? "yes" : "no") << '\n';
    return os.str();
}

std::string format_ranking_text(const std::vector<RankedProvider>& ranking)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    os << "Rank  " << std::left << std::setw(24) << "Provider" << std::right
       << std::setw(12) << "median ms" << std::setw(12) << "p90 ms" << std::setw(12) << "min ms"
       << std::setw(10) << "success" << '\n';
    int rank = 1;
    for (const auto& rp : ranking)
    {
        if (rp.reliable) os << std::setw(4) << rank++ << "  ";
        else os << "   -  ";
        os << std::left << std::setw(24) << rp.provider.display_name << std::right;
        if (rp.score_ms)
            os << std::setw(12) << *rp.score_ms << std::setw(12) << pct_of(rp.stats, 90)
               << std::setw(12) << rp.stats.min;
        else
            os << std::setw(12) << "-" << std::setw(12) << "-" << std::setw(12) << "-";
        os << std::setw(5) << rp.successes << "/" << std::left << std::setw(4) << rp.attempts << std::right;
        if (!rp.reliable) os << " unreliable";
        os << '\n';
    }
    if (auto best = Benchmarker::winner(ranking))
        os << "Fastest: " << best->provider.display_name << " (" << *best->score_ms << " ms median)\n";
    else
        os << "No reliable provider; check the network connection\n";
    return os.str();
}

std::string format_leak_text(const LeakReport& report, const Provider* expected)
{
    std::ostringstream os;
    os << "Connectivity: " << upper(connectivity_str(report.connectivity)) << " (" << report.succeeded << "/"
       << report.attempted << " lookups)\n";
    if (report.succeeded == 0) return os.str();
    if (report.observed_address.empty())
    {
        os << "Answering server not reported\n";
        return os.str();
    }

    if (report.leaked)
    {
        os << "DNS LEAK: answered by " << report.observed_address << ", expected " << report.expected_address;
        if (expected) os << " (" << expected->display_name << ")";
        os << '\n';
    }
    else if (report.via_stub)
    {
        os << "Answered by local stub " << report.observed_address << "; upstream not observable\n";
    }
    else if (expected)
    {
        os << "No leak: answered by " << report.observed_address << " (" << expected->display_name << ")\n";
    }
    else
    {
        os << "Resolver: " << report.observed_address << " (system default)\n";
    }
    return os.str();
}

} // namespace rg
