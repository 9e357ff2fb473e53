#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace rg {

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

struct Provider {
    std::string                id;
    std::string                display_name;
    std::string                primary_address;
    std::optional<std::string> secondary_address;
    bool                       supports_dot{};
    std::string                dot_hostname;   // required when supports_dot

    std::vector<std::string> addresses() const;
    bool owns_address(const std::string& ip) const;
};

enum class BackupReason { PreSwitch, PreReset, PreRestore };

struct BackupRecord {
    TimePoint    created_at{};
    std::string  storage_path;
    std::string  content_digest;   // sha256, lowercase hex
    BackupReason reason{BackupReason::PreSwitch};
};

struct SystemState {
    std::optional<std::string> active_provider_id;   // nullopt = DHCP / OS default
    bool                       dot_enabled{};
    bool                       locked{};
    std::optional<TimePoint>   last_switch_at;
    std::optional<std::string> last_backup_ref;
};

enum class ProbeStatus { Ok, Timeout, Unreachable, Failed, NotAvailable, Cancelled };

struct ProbeResult {
    std::string provider_id;        // empty for the system resolver path
    std::string target_domain;
    double      ms{};
    ProbeStatus status{ProbeStatus::Failed};
    std::string resolved_address;   // first A/AAAA answer
    std::string answered_by;        // server the response came from
    std::string error;
    bool        success{};
};

enum class Connectivity { Excellent, Unstable, Disconnected };

struct LeakReport {
    bool         leaked{};
    std::string  observed_address;
    std::string  expected_address;
    int          succeeded{};
    int          attempted{};
    Connectivity connectivity{Connectivity::Disconnected};
    bool         via_stub{};   // answered by a local stub, upstream not observable
};

enum class SwitchOutcome { Switched, NoOp, SwitchedUnlocked };

struct SwitchResult {
    SwitchOutcome               outcome{SwitchOutcome::NoOp};
    std::optional<BackupRecord> backup;
    SystemState                 state;
    std::string                 message;
};

const char* backup_reason_str(BackupReason r);
std::optional<BackupReason> parse_backup_reason(const std::string& s);
const char* probe_status_str(ProbeStatus s);
const char* connectivity_str(Connectivity c);
const char* switch_outcome_str(SwitchOutcome o);

} // namespace rg
