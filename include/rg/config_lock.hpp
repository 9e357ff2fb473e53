#pragma once

#include <string>

#include "rg/privilege.hpp"

namespace rg
{
// Exclusive "protect" state on the live configuration file.
class ConfigLock
{
public:
    virtual ~ConfigLock() = default;

    // Idempotent. Throws Error(PermissionDenied) without privileges,
    // Error(IOFailure) when the primitive is unavailable.
    virtual void acquire() = 0;

    // Idempotent; releasing an unlocked file is logged, not an error.
    virtual void release() = 0;

    // Observed state of the primitive, not a cached flag.
    virtual bool is_locked() const = 0;
};

// Linux immutable attribute (chattr +i) via FS_IOC_SETFLAGS.
class ImmutableAttrLock final : public ConfigLock
{
public:
    ImmutableAttrLock(std::string path, Privileges privileges);

    void acquire() override;
    void release() override;
    bool is_locked() const override;

private:
    std::string path_;
    Privileges privileges_;
};
} // namespace rg
