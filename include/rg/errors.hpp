#pragma once

#include <stdexcept>
#include <string>

namespace rg
{
enum class ErrorKind
{
    PermissionDenied,
    IOFailure,
    CorruptBackup,
    LockDesync,
    InvalidArgument,
};

// Position inside a switch pipeline; None outside of one.
enum class SwitchStep
{
    None,
    ReadCurrent,
    Unlock,
    Backup,
    Transport,
    Write,
    Sync,
    Lock,
    UpdateState,
    Done,
};

const char *error_kind_str(ErrorKind k);

const char *switch_step_str(SwitchStep s);

class Error : public std::runtime_error
{
public:
    Error(ErrorKind kind, const std::string &what, SwitchStep step = SwitchStep::None)
        : std::runtime_error(what), kind_(kind), step_(step)
    {
    }

    ErrorKind kind() const { return kind_; }
    SwitchStep step() const { return step_; }

private:
    ErrorKind kind_;
    SwitchStep step_;
};

// Raises PermissionDenied for EPERM/EACCES, IOFailure otherwise.
[[noreturn]] void throw_errno(const std::string &what, int err, SwitchStep step = SwitchStep::None);
} // namespace rg
