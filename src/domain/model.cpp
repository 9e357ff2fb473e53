#include "rg/model.hpp"

namespace rg {

std::vector<std::string> Provider::addresses() const
{
    std::vector<std::string> out{primary_address};
    if (secondary_address) out.push_back(*secondary_address);
    return out;
}

bool Provider::owns_address(const std::string& ip) const
{
    return ip == primary_address || (secondary_address && ip == *secondary_address);
}

const char* backup_reason_str(const BackupReason r)
{
    switch (r)
    {
        case BackupReason::PreSwitch: return "pre-switch";
        case BackupReason::PreReset: return "pre-reset";
        case BackupReason::PreRestore: return "pre-restore";
    }
    return "pre-switch";
}

std::optional<BackupReason> parse_backup_reason(const std::string& s)
{
    if (s == "pre-switch") return BackupReason::PreSwitch;
    if (s == "pre-reset") return BackupReason::PreReset;
    if (s == "pre-restore") return BackupReason::PreRestore;
    return std::nullopt;
}

const char* probe_status_str(const ProbeStatus s)
{
    switch (s)
    {
        case ProbeStatus::Ok: return "ok";
        case ProbeStatus::Timeout: return "timeout";
        case ProbeStatus::Unreachable: return "unreachable";
        case ProbeStatus::Failed: return "failed";
        case ProbeStatus::NotAvailable: return "not-available";
        case ProbeStatus::Cancelled: return "cancelled";
    }
    return "failed";
}

const char* connectivity_str(const Connectivity c)
{
    switch (c)
    {
        case Connectivity::Excellent: return "excellent";
        case Connectivity::Unstable: return "unstable";
        case Connectivity::Disconnected: return "disconnected";
    }
    return "disconnected";
}

const char* switch_outcome_str(const SwitchOutcome o)
{
    switch (o)
    {
        case SwitchOutcome::Switched: return "switched";
        case SwitchOutcome::NoOp: return "no-op";
        case SwitchOutcome::SwitchedUnlocked: return "switched-unlocked";
    }
    return "no-op";
}

} // namespace rg
