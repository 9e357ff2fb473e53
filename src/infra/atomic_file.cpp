#include "rg/fsutil.hpp"

#include <cerrno>
#include <filesystem>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include "rg/logger.hpp"

namespace fs = std::filesystem;

namespace rg
{
namespace
{
class Fd
{
public:
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() { if (fd_ >= 0) ::close(fd_); }
    Fd(const Fd &) = delete;
    Fd &operator=(const Fd &) = delete;

    int get() const { return fd_; }
    // close() reports deferred write errors, so callers check it
    int close()
    {
        const int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }

private:
    int fd_;
};

std::string parent_dir(const std::string &path)
{
    auto parent = fs::path(path).parent_path();
    return parent.empty() ? std::string{"."} : parent.string();
}

void fsync_dir(const std::string &dir, SwitchStep step)
{
    Fd fd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (fd.get() < 0) throw_errno("open directory " + dir, errno, step);
    if (::fsync(fd.get()) != 0) throw_errno("fsync directory " + dir, errno, step);
}
} // namespace

std::optional<std::string> read_file(const std::string &path, const SwitchStep step)
{
    Fd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (fd.get() < 0)
    {
        if (errno == ENOENT) return std::nullopt;
        throw_errno("open " + path, errno, step);
    }

    std::string out;
    char buf[4096];
    for (;;)
    {
        const ssize_t n = ::read(fd.get(), buf, sizeof(buf));
        if (n < 0)
        {
            if (errno == EINTR) continue;
            throw_errno("read " + path, errno, step);
        }
        if (n == 0) break;
        out.append(buf, static_cast<size_t>(n));
    }
    return out;
}

void atomic_write(const std::string &path,
                  std::string_view content,
                  const SwitchStep step,
                  const mode_t mode,
                  const BeforeRenameHook &before_rename,
                  const AfterRenameHook &after_rename)
{
    const std::string tmp = path + ".tmp";
    Fd fd(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode));
    if (fd.get() < 0) throw_errno("create " + tmp, errno, step);

    auto fail = [&](const std::string &what, int err) {
        ::unlink(tmp.c_str());
        throw_errno(what, err, step);
    };

    size_t off = 0;
    while (off < content.size())
    {
        const ssize_t n = ::write(fd.get(), content.data() + off, content.size() - off);
        if (n < 0)
        {
            if (errno == EINTR) continue;
            fail("write " + tmp, errno);
        }
        off += static_cast<size_t>(n);
    }
    // open() applies the umask; the live file gets exactly `mode`
    if (::fchmod(fd.get(), mode) != 0) fail("chmod " + tmp, errno);
    if (::fsync(fd.get()) != 0) fail("fsync " + tmp, errno);
    if (fd.close() != 0) fail("close " + tmp, errno);

    if (before_rename)
    {
        try
        {
            before_rename(tmp);
        }
        catch (...)
        {
            ::unlink(tmp.c_str());
            throw;
        }
    }

    if (::rename(tmp.c_str(), path.c_str()) != 0) fail("rename " + tmp + " -> " + path, errno);

    // The new content is visible; only its durability across a crash is left.
    try
    {
        if (after_rename) after_rename(path);
        fsync_dir(parent_dir(path), step);
    }
    catch (const Error &e)
    {
        RG_LOG_WARN("write: " << path << " was replaced but the directory was not synced: " << e.what());
    }
}

void ensure_directory(const std::string &dir)
{
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw_errno("create directory " + dir, ec.value());
}

ProcessLock::ProcessLock(const std::string &path)
{
    fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd_ < 0) throw_errno("open lock file " + path, errno);
    while (::flock(fd_, LOCK_EX) != 0)
    {
        if (errno == EINTR) continue;
        const int err = errno;
        ::close(fd_);
        fd_ = -1;
        throw_errno("flock " + path, err);
    }
}

ProcessLock::~ProcessLock()
{
    if (fd_ >= 0)
    {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}
} // namespace rg
