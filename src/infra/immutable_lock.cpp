#include "rg/config_lock.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <linux/fs.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include "rg/errors.hpp"
#include "rg/logger.hpp"

namespace rg
{
namespace
{
bool unsupported(const int err)
{
    return err == ENOTTY || err == EOPNOTSUPP || err == EINVAL || err == ENOSYS;
}

[[noreturn]] void throw_attr_error(const std::string &what, const std::string &path, const int err)
{
    if (unsupported(err))
        throw Error(ErrorKind::IOFailure,
                    what + " " + path + ": filesystem does not support the immutable attribute ("
                    + std::strerror(err) + ")");
    throw_errno(what + " " + path, err);
}

// O_RDONLY is enough for the flags ioctl, even on an immutable file.
int open_target(const std::string &path)
{
    return ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
}
} // namespace

ImmutableAttrLock::ImmutableAttrLock(std::string path, Privileges privileges)
    : path_(std::move(path)), privileges_(privileges)
{
}

void ImmutableAttrLock::acquire()
{
    privileges_.require("locking " + path_);

    const int fd = open_target(path_);
    if (fd < 0) throw_errno("open " + path_, errno, SwitchStep::Lock);

    int flags = 0;
    if (::ioctl(fd, FS_IOC_GETFLAGS, &flags) != 0)
    {
        const int err = errno;
        ::close(fd);
        throw_attr_error("read attributes of", path_, err);
    }
    if (flags & FS_IMMUTABLE_FL)
    {
        ::close(fd);
        RG_LOG_DEBUG("lock: " << path_ << " already immutable");
        return;
    }

    flags |= FS_IMMUTABLE_FL;
    if (::ioctl(fd, FS_IOC_SETFLAGS, &flags) != 0)
    {
        const int err = errno;
        ::close(fd);
        throw_attr_error("set immutable attribute on", path_, err);
    }
    ::close(fd);
    RG_LOG_INFO("lock: " << path_ << " is now immutable");
}

void ImmutableAttrLock::release()
{
    privileges_.require("unlocking " + path_);

    const int fd = open_target(path_);
    if (fd < 0)
    {
        if (errno == ENOENT)
        {
            RG_LOG_DEBUG("unlock: " << path_ << " does not exist");
            return;
        }
        throw_errno("open " + path_, errno, SwitchStep::Unlock);
    }

    int flags = 0;
    if (::ioctl(fd, FS_IOC_GETFLAGS, &flags) != 0)
    {
        const int err = errno;
        ::close(fd);
        // Nothing can be immutable on such a filesystem.
        if (unsupported(err))
        {
            RG_LOG_DEBUG("unlock: attributes unsupported on " << path_);
            return;
        }
        throw_errno("read attributes of " + path_, err, SwitchStep::Unlock);
    }
    if (!(flags & FS_IMMUTABLE_FL))
    {
        ::close(fd);
        RG_LOG_WARN("unlock: " << path_ << " was not locked");
        return;
    }

    flags &= ~FS_IMMUTABLE_FL;
    if (::ioctl(fd, FS_IOC_SETFLAGS, &flags) != 0)
    {
        const int err = errno;
        ::close(fd);
        throw_errno("clear immutable attribute on " + path_, err, SwitchStep::Unlock);
    }
    ::close(fd);
    RG_LOG_INFO("unlock: " << path_ << " is writable");
}

bool ImmutableAttrLock::is_locked() const
{
    const int fd = open_target(path_);
    if (fd < 0) return false;
    int flags = 0;
    const bool ok = ::ioctl(fd, FS_IOC_GETFLAGS, &flags) == 0;
    ::close(fd);
    return ok && (flags & FS_IMMUTABLE_FL);
}
} // namespace rg
