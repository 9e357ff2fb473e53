#include "rg/resolver_service.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include "rg/errors.hpp"
#include "rg/fsutil.hpp"
#include "rg/logger.hpp"
#include "rg/render.hpp"

extern char **environ;

namespace fs = std::filesystem;

namespace rg
{
int run_command(const std::vector<std::string> &argv, const std::chrono::milliseconds timeout)
{
    if (argv.empty()) return -1;

    std::vector<char *> args;
    args.reserve(argv.size() + 1);
    for (const auto &a : argv) args.push_back(const_cast<char *>(a.c_str()));
    args.push_back(nullptr);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    // the caller may hold termination signals blocked; the child must not inherit that
    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    sigset_t none;
    sigemptyset(&none);
    posix_spawnattr_setsigmask(&attr, &none);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGMASK);

    pid_t pid = -1;
    const int rc = posix_spawnp(&pid, args[0], &actions, &attr, args.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);
    if (rc != 0)
    {
        RG_LOG_DEBUG("spawn " << argv[0] << " failed: " << std::strerror(rc));
        return -1;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;)
    {
        int status = 0;
        const pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid)
        {
            if (WIFEXITED(status)) return WEXITSTATUS(status);
            return -1;
        }
        if (w < 0 && errno != EINTR) return -1;
        if (std::chrono::steady_clock::now() >= deadline)
        {
            RG_LOG_WARN(argv[0] << " timed out after " << timeout.count() << " ms");
            ::kill(pid, SIGKILL);
            ::waitpid(pid, &status, 0);
            return -1;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

namespace
{
constexpr std::chrono::milliseconds kStopTimeout{10000};
constexpr std::chrono::milliseconds kStartTimeout{15000};
} // namespace

SystemdResolverService::SystemdResolverService(std::string dropin_path, Privileges privileges, CommandRunner runner)
    : dropin_path_(std::move(dropin_path)), privileges_(privileges), run_(std::move(runner))
{
}

// stop, then start
bool SystemdResolverService::restart_unit(const std::string &unit)
{
    RG_LOG_INFO("restarting " << unit);
    run_({"systemctl", "stop", unit}, kStopTimeout);
    if (run_({"systemctl", "start", unit}, kStartTimeout) != 0)
    {
        RG_LOG_WARN("could not start " << unit << "; check the service status");
        return false;
    }
    return true;
}

void SystemdResolverService::apply_transport(const Provider *provider, const bool dot)
{
    privileges_.require("configuring the resolver service");

    std::error_code ec;
    if (provider && dot)
    {
        const std::string wanted = render_dot_dropin(*provider);
        if (auto current = read_file(dropin_path_, SwitchStep::Transport); current && *current == wanted)
        {
            RG_LOG_DEBUG("transport: drop-in already current");
            return;
        }
        ensure_directory(fs::path(dropin_path_).parent_path().string());
        atomic_write(dropin_path_, wanted, SwitchStep::Transport, 0644);
        RG_LOG_INFO("transport: DNS-over-TLS via " << provider->dot_hostname);
    }
    else
    {
        if (!fs::exists(dropin_path_, ec)) return;
        if (!fs::remove(dropin_path_, ec) && ec)
            throw Error(ErrorKind::IOFailure,
                        "remove " + dropin_path_ + ": " + ec.message(), SwitchStep::Transport);
        RG_LOG_INFO("transport: DNS-over-TLS disabled");
    }

    run_({"systemctl", "enable", "systemd-resolved"}, kStartTimeout);
    if (!restart_unit("systemd-resolved"))
        throw Error(ErrorKind::IOFailure, "systemd-resolved did not restart", SwitchStep::Transport);
}

void SystemdResolverService::flush_caches()
{
    static const std::vector<std::vector<std::string>> commands = {
        {"resolvectl", "flush-caches"},
        {"systemd-resolve", "--flush-caches"},
        {"service", "nscd", "restart"},
    };
    for (const auto &cmd : commands)
    {
        if (run_(cmd, kStopTimeout) == 0)
        {
            RG_LOG_INFO("dns cache flushed (" << cmd[0] << ")");
            return;
        }
    }
    RG_LOG_DEBUG("no cache flush command succeeded");
}

void SystemdResolverService::regenerate_default()
{
    RG_LOG_INFO("asking NetworkManager to regenerate the resolver configuration");
    if (!restart_unit("NetworkManager"))
        RG_LOG_WARN("NetworkManager restart failed; the resolver file keeps the default template");
}
} // namespace rg
