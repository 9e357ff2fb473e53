#include "rg/event_log.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

#include "rg/logger.hpp"

namespace rg
{
EventLog::EventLog(std::string path)
    : path_(std::move(path))
{
}

void EventLog::append(const std::string &json_object)
{
    if (path_.empty()) return;

    std::lock_guard<std::mutex> lk(mtx_);
    const auto parent = std::filesystem::path(path_).parent_path();
    std::error_code ec;
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);

    const std::string line = json_object + "\n";
    const int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0640);
    bool ok = fd >= 0;
    int err = ok ? 0 : errno;
    if (ok)
    {
        // O_APPEND keeps a single write() contiguous with concurrent writers
        const ssize_t n = ::write(fd, line.data(), line.size());
        if (n != static_cast<ssize_t>(line.size()))
        {
            ok = false;
            err = n < 0 ? errno : EIO;
        }
        ::close(fd);
    }
    if (!ok && !warned_)
    {
        warned_ = true;
        RG_LOG_WARN("event log " << path_ << " is not writable: " << std::strerror(err));
    }
}
} // namespace rg
