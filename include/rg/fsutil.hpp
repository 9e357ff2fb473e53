#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <sys/types.h>

#include "rg/errors.hpp"

namespace rg
{
// Called after the temp file is flushed and before the rename; throwing
// from it aborts the write with the live file untouched.
using BeforeRenameHook = std::function<void(const std::string & /*tmp_path*/)>;

// Called once the rename succeeded. The write is committed at that point:
// an Error from here is logged, never thrown to the caller.
using AfterRenameHook = std::function<void(const std::string & /*path*/)>;

// nullopt when the file does not exist; other failures throw Error.
std::optional<std::string> read_file(const std::string &path, SwitchStep step = SwitchStep::None);

// temp file in the same directory -> write -> fsync -> rename -> fsync(dir).
// Readers observe either the old or the new content. The rename is the
// commit point: failures before it throw and remove the temp file, a failed
// directory sync after it only warns.
void atomic_write(const std::string &path,
                  std::string_view content,
                  SwitchStep step = SwitchStep::Write,
                  mode_t mode = 0644,
                  const BeforeRenameHook &before_rename = {},
                  const AfterRenameHook &after_rename = {});

void ensure_directory(const std::string &dir);

// Holds an exclusive flock(2) on `path` for its lifetime.
class ProcessLock
{
public:
    explicit ProcessLock(const std::string &path);
    ~ProcessLock();

    ProcessLock(const ProcessLock &) = delete;
    ProcessLock &operator=(const ProcessLock &) = delete;

private:
    int fd_ = -1;
};
} // namespace rg
