#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "rg/backup_store.hpp"
#include "rg/config_lock.hpp"
#include "rg/errors.hpp"
#include "rg/fsutil.hpp"
#include "rg/model.hpp"
#include "rg/privilege.hpp"
#include "rg/providers.hpp"
#include "rg/resolver_service.hpp"
#include "rg/state_store.hpp"

namespace rg
{
// Invoked when a switch reaches a step; throwing aborts the switch there.
// SwitchStep::Write fires between the temp write and the rename, Sync just
// after it; a throw at Sync only costs durability.
using FaultHook = std::function<void(SwitchStep)>;

struct ConfigManagerSettings
{
    std::string live_path;
    std::string lock_file; // cross-process flock; empty = in-process only
    FaultHook fault_hook;  // tests only
};

struct ReconcileReport
{
    bool lock_desync{};
    bool observed_locked{};
    bool cleared_provider{};
    SystemState state;
};

// Sole writer of the live resolver file and the persisted SystemState.
class ConfigManager
{
public:
    ConfigManager(ConfigManagerSettings settings,
                  const ProviderRegistry &registry,
                  BackupStore &backups,
                  StateStore &states,
                  ConfigLock &lock,
                  ResolverService &resolver,
                  Privileges privileges);

    ConfigManager(const ConfigManager &) = delete;
    ConfigManager &operator=(const ConfigManager &) = delete;

    // read -> release -> snapshot -> transport -> atomic write -> acquire -> save.
    // Failures before the rename leave the live file untouched; a lock
    // failure after it yields SwitchOutcome::SwitchedUnlocked.
    SwitchResult switch_to(const Provider &provider, bool enable_dot);

    // Back to the OS default; the file is left unlocked for the network manager.
    SwitchResult reset();

    // Writes the verified content of `record` back and relocks it.
    SwitchResult restore(const BackupRecord &record);

    // Resynchronises `locked` with the observed primitive and drops an
    // active provider id that is no longer registered.
    ReconcileReport reconcile();

    SystemState state() const { return states_.load(); }

    const std::string &live_path() const { return settings_.live_path; }

private:
    struct Target
    {
        const Provider *provider;
        bool dot;
        std::string content;
        BackupReason reason;
        bool relock;
        std::string label;
    };

    SwitchResult apply(const Target &target);
    // Content already matches: bring lock and state in line without a backup.
    SwitchResult converge(const Target &target, SystemState state, bool dirty);
    std::unique_ptr<ProcessLock> lock_other_processes() const;
    // Tags log records with `step` and runs the fault hook.
    void enter(SwitchStep step) const;
    // Follows the observed lock when `state.locked` disagrees; true on desync.
    bool detect_desync(SystemState &state) const;
    void record_observed_lock() const;
    void relock_after_abort() const;

    ConfigManagerSettings settings_;
    const ProviderRegistry &registry_;
    BackupStore &backups_;
    StateStore &states_;
    ConfigLock &lock_;
    ResolverService &resolver_;
    Privileges privileges_;
    std::mutex mtx_;
};
} // namespace rg
