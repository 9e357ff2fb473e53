#include "rg/config_manager.hpp"

#include <filesystem>
#include <memory>
#include <optional>

#include "rg/fsutil.hpp"
#include "rg/logger.hpp"
#include "rg/render.hpp"

namespace rg
{
namespace
{
bool same_state(const SystemState &a, const SystemState &b)
{
    return a.active_provider_id == b.active_provider_id && a.dot_enabled == b.dot_enabled
           && a.locked == b.locked && a.last_switch_at == b.last_switch_at
           && a.last_backup_ref == b.last_backup_ref;
}

std::string describe(const Provider *provider, const bool dot)
{
    if (!provider) return "system default (DHCP)";
    return provider->display_name + (dot ? " (DNS-over-TLS)" : "");
}
} // namespace

ConfigManager::ConfigManager(ConfigManagerSettings settings,
                             const ProviderRegistry &registry,
                             BackupStore &backups,
                             StateStore &states,
                             ConfigLock &lock,
                             ResolverService &resolver,
                             Privileges privileges)
    : settings_(std::move(settings)),
      registry_(registry),
      backups_(backups),
      states_(states),
      lock_(lock),
      resolver_(resolver),
      privileges_(privileges)
{
}

std::unique_ptr<ProcessLock> ConfigManager::lock_other_processes() const
{
    if (settings_.lock_file.empty()) return nullptr;
    const auto parent = std::filesystem::path(settings_.lock_file).parent_path();
    if (!parent.empty()) ensure_directory(parent.string());
    return std::make_unique<ProcessLock>(settings_.lock_file);
}

void ConfigManager::enter(const SwitchStep step) const
{
    logging::set_step(switch_step_str(step));
    if (settings_.fault_hook) settings_.fault_hook(step);
}

bool ConfigManager::detect_desync(SystemState &state) const
{
    const bool observed = lock_.is_locked();
    if (observed == state.locked) return false;
    RG_LOG_WARN("lock desync: state records locked=" << (state.locked ? "true" : "false")
                << " but " << settings_.live_path << " is "
                << (observed ? "immutable" : "writable") << "; following the file");
    state.locked = observed;
    return true;
}

// Called on the way out of a failed switch so `locked` does not keep
// claiming a lock that was already released.
void ConfigManager::record_observed_lock() const
{
    try
    {
        SystemState persisted = states_.load();
        if (detect_desync(persisted)) states_.save(persisted);
    }
    catch (const Error &e)
    {
        RG_LOG_ERROR("could not record the lock state after a failed switch: " << e.what());
    }
}

// The old content is still live; leave it as protected as it was found.
void ConfigManager::relock_after_abort() const
{
    if (lock_.is_locked()) return;
    try
    {
        lock_.acquire();
        RG_LOG_INFO("switch aborted: " << settings_.live_path << " locked again");
    }
    catch (const Error &e)
    {
        RG_LOG_ERROR("switch aborted and " << settings_.live_path << " could not be locked again: " << e.what());
    }
}

SwitchResult ConfigManager::switch_to(const Provider &provider, const bool enable_dot)
{
    privileges_.require("switching DNS provider");
    if (enable_dot && !provider.supports_dot)
        throw Error(ErrorKind::InvalidArgument, provider.display_name + " does not support DNS-over-TLS");
    if (!registry_.find(provider.id))
        throw Error(ErrorKind::InvalidArgument, "unknown provider '" + provider.id + "'");

    return apply(Target{&provider, enable_dot, render_live_config(&provider, enable_dot),
                        BackupReason::PreSwitch, true, describe(&provider, enable_dot)});
}

SwitchResult ConfigManager::reset()
{
    privileges_.require("resetting DNS configuration");
    return apply(Target{nullptr, false, render_live_config(nullptr, false),
                        BackupReason::PreReset, false, describe(nullptr, false)});
}

SwitchResult ConfigManager::restore(const BackupRecord &record)
{
    privileges_.require("restoring a backup");
    std::string content = backups_.restore(record);
    const std::string name = std::filesystem::path(record.storage_path).filename().string();

    // A DoT rendering lists only the stub; the upstream is in its header.
    const Provider *match = nullptr;
    bool dot = false;
    if (const auto host = parse_dot_hostname(content))
    {
        for (const auto &p : registry_.all())
        {
            if (p.supports_dot && p.dot_hostname == *host)
            {
                match = &p;
                dot = true;
                break;
            }
        }
        if (!match) RG_LOG_WARN("restore: " << name << " uses DNS-over-TLS via unregistered " << *host);
    }
    else
    {
        match = registry_.match_nameservers(parse_nameservers(content));
    }
    RG_LOG_INFO("restore: " << name << " matches "
                << (match ? describe(match, dot) : std::string("no registered provider")));
    return apply(Target{match, dot, std::move(content), BackupReason::PreRestore, true, "backup " + name});
}

ReconcileReport ConfigManager::reconcile()
{
    privileges_.require("reconciling state");
    std::scoped_lock guard(mtx_);
    auto cross_process = lock_other_processes();

    ReconcileReport report{};
    SystemState state = states_.load();
    report.lock_desync = detect_desync(state);
    report.observed_locked = state.locked;

    if (state.active_provider_id && !registry_.find(*state.active_provider_id))
    {
        RG_LOG_WARN("state names unregistered provider '" << *state.active_provider_id << "'; clearing it");
        state.active_provider_id.reset();
        state.dot_enabled = false;
        report.cleared_provider = true;
    }
    if (report.lock_desync || report.cleared_provider) states_.save(state);
    report.state = std::move(state);
    return report;
}

SwitchResult ConfigManager::converge(const Target &target, SystemState state, const bool dirty)
{
    SwitchResult result{};
    result.outcome = SwitchOutcome::NoOp;
    result.message = "already using " + target.label;

    const SystemState before = state;
    state.active_provider_id = target.provider ? std::optional<std::string>(target.provider->id) : std::nullopt;
    state.dot_enabled = target.dot;

    // A previous switch may have left the file unlocked: retrying relocks it.
    if (target.relock && !state.locked)
    {
        try
        {
            enter(SwitchStep::Lock);
            lock_.acquire();
            state.locked = true;
        }
        catch (const Error &e)
        {
            result.outcome = SwitchOutcome::SwitchedUnlocked;
            result.message = "configuration is current but could not be locked: " + std::string(e.what());
            RG_LOG_WARN(result.message);
        }
    }
    else if (!target.relock && state.locked)
    {
        lock_.release();
        state.locked = false;
    }

    if (dirty || !same_state(before, state))
    {
        enter(SwitchStep::UpdateState);
        states_.save(state);
    }
    result.state = std::move(state);
    return result;
}

SwitchResult ConfigManager::apply(const Target &target)
{
    std::scoped_lock guard(mtx_);
    logging::StepScope step_tag;
    auto cross_process = lock_other_processes();

    SystemState state = states_.load();
    const bool desynced = detect_desync(state);

    enter(SwitchStep::ReadCurrent);
    const std::string current = read_file(settings_.live_path, SwitchStep::ReadCurrent).value_or(std::string{});
    if (current == target.content)
    {
        RG_LOG_INFO("switch: " << settings_.live_path << " already matches " << target.label);
        return converge(target, std::move(state), desynced);
    }

    RG_LOG_INFO("switch: " << settings_.live_path << " -> " << target.label);
    SwitchResult result{};
    const bool was_locked = state.locked;
    try
    {
        enter(SwitchStep::Unlock);
        lock_.release();
        state.locked = false;

        enter(SwitchStep::Backup);
        result.backup = backups_.snapshot(current, target.reason);
        state.last_backup_ref = result.backup->storage_path;

        enter(SwitchStep::Transport);
        resolver_.apply_transport(target.provider, target.dot);

        atomic_write(settings_.live_path, target.content, SwitchStep::Write, 0644,
                     [this](const std::string &) { enter(SwitchStep::Write); },
                     [this](const std::string &) { enter(SwitchStep::Sync); });
    }
    catch (const Error &e)
    {
        RG_LOG_ERROR("switch aborted at step " << switch_step_str(e.step()) << "; "
                     << settings_.live_path << " was not modified");
        if (was_locked) relock_after_abort();
        record_observed_lock();
        throw;
    }

    // The new content is live from here on; nothing below rolls it back.
    state.active_provider_id = target.provider ? std::optional<std::string>(target.provider->id) : std::nullopt;
    state.dot_enabled = target.dot;
    state.last_switch_at = std::chrono::time_point_cast<std::chrono::microseconds>(Clock::now());
    result.outcome = SwitchOutcome::Switched;
    result.message = "switched to " + target.label;

    if (target.relock)
    {
        try
        {
            enter(SwitchStep::Lock);
            lock_.acquire();
            state.locked = true;
        }
        catch (const Error &e)
        {
            state.locked = lock_.is_locked();
            result.outcome = SwitchOutcome::SwitchedUnlocked;
            result.message = "switched to " + target.label + " but the file is not locked ("
                             + e.what() + "); run the switch again to relock";
            RG_LOG_WARN(result.message);
        }
    }

    try
    {
        enter(SwitchStep::UpdateState);
        states_.save(state);
    }
    catch (const Error &e)
    {
        throw Error(e.kind(),
                    "new configuration is live but the state record was not updated: "
                    + std::string(e.what()),
                    SwitchStep::UpdateState);
    }

    enter(SwitchStep::Done);
    resolver_.flush_caches();
    if (!target.relock) resolver_.regenerate_default();

    result.state = std::move(state);
    return result;
}
} // namespace rg
