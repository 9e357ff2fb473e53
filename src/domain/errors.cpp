#include "rg/errors.hpp"

#include <cerrno>
#include <cstring>

namespace rg
{
const char *error_kind_str(const ErrorKind k)
{
    switch (k)
    {
        case ErrorKind::PermissionDenied: return "permission-denied";
        case ErrorKind::IOFailure: return "io-failure";
        case ErrorKind::CorruptBackup: return "corrupt-backup";
        case ErrorKind::LockDesync: return "lock-desync";
        case ErrorKind::InvalidArgument: return "invalid-argument";
    }
    return "unknown";
}

const char *switch_step_str(const SwitchStep s)
{
    switch (s)
    {
        case SwitchStep::None: return "none";
        case SwitchStep::ReadCurrent: return "read-current";
        case SwitchStep::Unlock: return "unlock";
        case SwitchStep::Backup: return "backup";
        case SwitchStep::Transport: return "transport";
        case SwitchStep::Write: return "write";
        case SwitchStep::Sync: return "sync";
        case SwitchStep::Lock: return "lock";
        case SwitchStep::UpdateState: return "update-state";
        case SwitchStep::Done: return "done";
    }
    return "unknown";
}

void throw_errno(const std::string &what, const int err, const SwitchStep step)
{
    const std::string msg = what + ": " + std::strerror(err);
    if (err == EPERM || err == EACCES)
        throw Error(ErrorKind::PermissionDenied, msg, step);
    throw Error(ErrorKind::IOFailure, msg, step);
}
} // namespace rg
