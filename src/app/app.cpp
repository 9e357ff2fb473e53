#include "rg/app.hpp"

#include <filesystem>
#include <iostream>

#include <signal.h>

#include "rg/backup_store.hpp"
#include "rg/benchmark.hpp"
#include "rg/config.hpp"
#include "rg/config_lock.hpp"
#include "rg/config_manager.hpp"
#include "rg/event_log.hpp"
#include "rg/fsutil.hpp"
#include "rg/leak_detector.hpp"
#include "rg/logger.hpp"
#include "rg/output.hpp"
#include "rg/probe_engine.hpp"
#include "rg/prober.hpp"
#include "rg/providers.hpp"
#include "rg/render.hpp"
#include "rg/resolver_service.hpp"
#include "rg/state_store.hpp"

namespace rg
{
int exit_code_for(const ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::PermissionDenied: return kExitPermission;
        case ErrorKind::IOFailure: return kExitIO;
        case ErrorKind::CorruptBackup: return kExitCorruptBackup;
        case ErrorKind::InvalidArgument: return kExitUsage;
        case ErrorKind::LockDesync: break;
    }
    return kExitFailure;
}

namespace
{
// Holds termination signals for the duration of a switch; they are
// delivered once the switch has run to completion or failed.
class SignalBlock
{
public:
    SignalBlock()
    {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);
        sigaddset(&set, SIGHUP);
        ::sigprocmask(SIG_BLOCK, &set, &saved_);
    }

    ~SignalBlock() { ::sigprocmask(SIG_SETMASK, &saved_, nullptr); }

    SignalBlock(const SignalBlock &) = delete;
    SignalBlock &operator=(const SignalBlock &) = delete;

private:
    sigset_t saved_;
};

struct Components
{
    const AppConfig &cfg;
    const ProviderRegistry &registry;
    Privileges privileges;
    BackupStore &backups;
    StateStore &states;
    ImmutableAttrLock &lock;
    ConfigManager &manager;
    ProbeEngine &engine;
    EventLog &events;
    bool json;
};

void emit(const Components &c, const std::string &text, const std::string &json)
{
    if (c.json) std::cout << json << "\n";
    else std::cout << text;
}

std::chrono::milliseconds probe_timeout(const Components &c)
{
    return std::chrono::milliseconds(c.cfg.probe.timeout_ms);
}

LeakReport leak_check(Components &c, const Provider *expected)
{
    LeakDetector detector(c.engine, c.cfg.leak.domains, c.cfg.leak.stub_addresses, probe_timeout(c));
    LeakReport report = detector.check(expected);
    c.events.append(build_ndjson_leak_event(Clock::now(), report, expected));
    return report;
}

// Re-reads the live file and checks the addresses the switch put there.
void verify_switch(Components &c, const SystemState &state)
{
    const Provider *active = state.active_provider_id ? c.registry.find(*state.active_provider_id) : nullptr;
    if (!active) return;

    const std::vector<std::string> expected = state.dot_enabled
                                                  ? std::vector<std::string>{kStubResolver}
                                                  : active->addresses();
    const auto content = read_file(c.cfg.paths.live_config).value_or(std::string{});
    if (verify_nameservers(content, expected))
        RG_LOG_INFO("verify: " << c.cfg.paths.live_config << " lists the expected nameservers");
    else
        RG_LOG_WARN("verify: " << c.cfg.paths.live_config << " does not list the expected nameservers");
}

template <typename Fn>
int run_switch(Components &c, const char *op, const std::string &target, Fn &&fn)
{
    SwitchResult result;
    try
    {
        SignalBlock hold;
        result = fn();
    }
    catch (const Error &e)
    {
        c.events.append(build_ndjson_switch_failed(Clock::now(), op, target, error_kind_str(e.kind()),
                                                   switch_step_str(e.step()), e.what()));
        throw;
    }
    c.events.append(build_ndjson_switch_event(Clock::now(), op, result));

    if (c.json)
    {
        std::cout << build_switch_json(result) << "\n";
    }
    else
    {
        std::cout << format_switch_text(result);
    }
    if (result.outcome == SwitchOutcome::SwitchedUnlocked)
        RG_LOG_WARN("the live file is not protected against being overwritten");
    return kExitOk;
}

int cmd_switch(Components &c, const Options &opt)
{
    const Provider *provider = c.registry.lookup(opt.provider);
    if (!provider)
        throw Error(ErrorKind::InvalidArgument, "unknown provider '" + opt.provider + "' (see --list)");

    const int rc = run_switch(c, "switch", provider->id, [&] { return c.manager.switch_to(*provider, opt.dot); });
    verify_switch(c, c.states.load());

    const LeakReport report = leak_check(c, provider);
    if (!c.json) std::cout << format_leak_text(report, provider);
    return rc;
}

int cmd_reset(Components &c)
{
    return run_switch(c, "reset", "default", [&] { return c.manager.reset(); });
}

int cmd_restore(Components &c, const Options &opt)
{
    const auto record = c.backups.find(opt.restore_name);
    if (!record) throw Error(ErrorKind::InvalidArgument, "no backup named '" + opt.restore_name + "' (see --backups)");
    const std::string name = std::filesystem::path(record->storage_path).filename().string();
    return run_switch(c, "restore", name, [&] { return c.manager.restore(*record); });
}

int cmd_test(Components &c)
{
    const SystemState state = c.states.load();
    const Provider *expected = state.active_provider_id ? c.registry.find(*state.active_provider_id) : nullptr;
    const LeakReport report = leak_check(c, expected);
    emit(c, format_leak_text(report, expected), build_leak_json(report, expected));
    return kExitOk;
}

int cmd_benchmark(Components &c, const Options &opt)
{
    const int samples = opt.samples > 0 ? opt.samples : c.cfg.probe.samples;
    Benchmarker bench(c.engine, c.cfg.benchmark.min_success_rate, probe_timeout(c));
    const auto ranking = bench.run(c.registry.all(), c.cfg.probe.domains, samples);
    c.events.append(build_ndjson_benchmark_event(Clock::now(), ranking));
    emit(c, format_ranking_text(ranking), build_ranking_json(ranking));
    return kExitOk;
}

int cmd_status(Components &c)
{
    StatusView view{};
    view.live_path = c.cfg.paths.live_config;
    if (c.privileges.elevated())
    {
        const ReconcileReport rep = c.manager.reconcile();
        if (rep.lock_desync) c.events.append(build_ndjson_lock_desync_event(Clock::now(), rep));
        view.state = rep.state;
    }
    else
    {
        view.state = c.states.load();
    }
    view.observed_locked = c.lock.is_locked();
    view.active = view.state.active_provider_id ? c.registry.find(*view.state.active_provider_id) : nullptr;
    view.nameservers = parse_nameservers(read_file(view.live_path).value_or(std::string{}));
    emit(c, format_status_text(view), build_status_json(view));
    return kExitOk;
}

int cmd_list(Components &c)
{
    const SystemState state = c.states.load();
    emit(c, format_providers_text(c.registry.all(), state.active_provider_id),
         build_providers_json(c.registry.all(), state.active_provider_id));
    return kExitOk;
}

int cmd_backups(Components &c)
{
    const auto records = c.backups.list();
    emit(c, format_backups_text(records), build_backups_json(records));
    return kExitOk;
}
} // namespace

int run_app(const Options &opt)
{
    logging::Logger::init(logging::Level::LVL_INFO);

    AppConfig cfg;
    std::string error;
    const bool explicit_config = !opt.config_path.empty();
    const std::string config_path = explicit_config ? opt.config_path : std::string(kDefaultConfigPath);
    if (!load_config(config_path, explicit_config, cfg, error))
    {
        std::cerr << "config error: " << error << "\n";
        return kExitUsage;
    }
    logging::Logger::set_level(logging::string_to_level(opt.log_level.empty() ? cfg.logging.level : opt.log_level));
    if (opt.concurrency > 0) cfg.probe.concurrency = opt.concurrency;
    if (opt.timeout_ms > 0) cfg.probe.timeout_ms = opt.timeout_ms;

    try
    {
        const ProviderRegistry registry = ProviderRegistry::with_builtins(cfg.providers);
        const Privileges privileges = Privileges::detect();

        BackupStore backups(cfg.paths.backup_dir,
                            std::filesystem::path(cfg.paths.live_config).filename().string(),
                            cfg.backups.retention,
                            std::chrono::hours(24 * cfg.backups.max_age_days));
        StateStore states(cfg.paths.state_file);
        ImmutableAttrLock lock(cfg.paths.live_config, privileges);
        SystemdResolverService resolver(cfg.paths.dot_dropin, privileges);
        ConfigManager manager(ConfigManagerSettings{cfg.paths.live_config, cfg.paths.lock_file, {}},
                              registry, backups, states, lock, resolver, privileges);
        LdnsProber prober(cfg.paths.live_config);
        ProbeEngine engine(prober, cfg.probe.concurrency);
        EventLog events(cfg.paths.event_log);

        Components c{cfg, registry, privileges, backups, states, lock, manager, engine, events, opt.json};
        switch (opt.command)
        {
            case Command::Switch: return cmd_switch(c, opt);
            case Command::Reset: return cmd_reset(c);
            case Command::Restore: return cmd_restore(c, opt);
            case Command::Test: return cmd_test(c);
            case Command::Benchmark: return cmd_benchmark(c, opt);
            case Command::Status: return cmd_status(c);
            case Command::List: return cmd_list(c);
            case Command::Backups: return cmd_backups(c);
            case Command::Help:
            case Command::None: break;
        }
        return kExitUsage;
    }
    catch (const Error &e)
    {
        if (e.step() != SwitchStep::None)
            RG_LOG_ERROR(error_kind_str(e.kind()) << " at step " << switch_step_str(e.step()) << ": " << e.what());
        else
            RG_LOG_ERROR(error_kind_str(e.kind()) << ": " << e.what());
        return exit_code_for(e.kind());
    }
}
} // namespace rg
