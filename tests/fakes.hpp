#pragma once

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "rg/config_lock.hpp"
#include "rg/errors.hpp"
#include "rg/prober.hpp"
#include "rg/resolver_service.hpp"

namespace rg::testing
{
// mkdtemp-backed directory removed on scope exit
class TempDir
{
public:
    TempDir()
    {
        std::string tmpl = (std::filesystem::temp_directory_path() / "rgtest.XXXXXX").string();
        if (!::mkdtemp(tmpl.data())) std::abort();
        path_ = tmpl;
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    std::string file(const std::string &name) const { return (std::filesystem::path(path_) / name).string(); }
    const std::string &path() const { return path_; }

private:
    std::string path_;
};

// In-memory immutable flag with the contract of ImmutableAttrLock.
class FakeConfigLock final : public ConfigLock
{
public:
    void acquire() override
    {
        std::lock_guard<std::mutex> lk(mtx_);
        ++acquire_calls;
        if (fail_acquire) throw Error(ErrorKind::IOFailure, "filesystem does not support the immutable attribute");
        locked_ = true;
    }

    void release() override
    {
        std::lock_guard<std::mutex> lk(mtx_);
        ++release_calls;
        if (fail_release) throw Error(ErrorKind::PermissionDenied, "clear immutable attribute: Operation not permitted");
        locked_ = false;
    }

    bool is_locked() const override
    {
        std::lock_guard<std::mutex> lk(mtx_);
        return locked_;
    }

    // simulates someone running chattr behind our back
    void force(bool locked)
    {
        std::lock_guard<std::mutex> lk(mtx_);
        locked_ = locked;
    }

    bool fail_acquire = false;
    bool fail_release = false;
    int acquire_calls = 0;
    int release_calls = 0;

private:
    mutable std::mutex mtx_;
    bool locked_ = false;
};

class FakeResolverService final : public ResolverService
{
public:
    void apply_transport(const Provider *provider, bool dot) override
    {
        transports.emplace_back(provider ? provider->id : std::string{}, dot);
        if (fail_transport)
            throw Error(ErrorKind::IOFailure, "systemd-resolved did not restart", SwitchStep::Transport);
    }

    void flush_caches() override { ++flushes; }

    void regenerate_default() override { ++regenerations; }

    bool fail_transport = false;
    std::vector<std::pair<std::string, bool>> transports;
    int flushes = 0;
    int regenerations = 0;
};

// Scripted prober; tracks how many resolve() calls overlap.
class FakeProber final : public Prober
{
public:
    using Handler = std::function<ProbeResult(const ProbeTarget &, const std::string &)>;

    explicit FakeProber(Handler handler, std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : handler_(std::move(handler)), delay_(delay)
    {
    }

    ProbeResult resolve(const ProbeTarget &target,
                        const std::string &domain,
                        std::chrono::milliseconds) override
    {
        const int now = running_.fetch_add(1) + 1;
        int seen = peak_.load();
        while (now > seen && !peak_.compare_exchange_weak(seen, now)) {}
        calls_.fetch_add(1);
        if (delay_.count() > 0) std::this_thread::sleep_for(delay_);
        ProbeResult r{};
        try
        {
            r = handler_(target, domain);
        }
        catch (...)
        {
            running_.fetch_sub(1);
            throw;
        }
        running_.fetch_sub(1);
        return r;
    }

    int peak() const { return peak_.load(); }
    int calls() const { return calls_.load(); }

private:
    Handler handler_;
    std::chrono::milliseconds delay_;
    std::atomic<int> running_{0};
    std::atomic<int> peak_{0};
    std::atomic<int> calls_{0};
};

inline ProbeResult ok_result(double ms, const std::string &answered_by, const std::string &address = "93.184.216.34")
{
    ProbeResult r{};
    r.status = ProbeStatus::Ok;
    r.success = true;
    r.ms = ms;
    r.answered_by = answered_by;
    r.resolved_address = address;
    return r;
}

inline ProbeResult failed_result(ProbeStatus status, double ms = 2000.0)
{
    ProbeResult r{};
    r.status = status;
    r.success = false;
    r.ms = ms;
    r.error = probe_status_str(status);
    return r;
}
} // namespace rg::testing
