#pragma once

#include <string_view>

namespace rg
{
// Capability to touch the live resolver file and its lock primitive.
// Obtained once at startup and handed to every component that needs it.
class Privileges
{
public:
    // Elevated when the effective uid is 0.
    static Privileges detect();
    static Privileges elevated_for_testing() { return Privileges(true); }
    static Privileges unprivileged() { return Privileges(false); }

    bool elevated() const { return elevated_; }

    // Throws Error(PermissionDenied) naming `operation` when not elevated.
    void require(std::string_view operation) const;

private:
    explicit Privileges(bool elevated) : elevated_(elevated) {}

    bool elevated_;
};
} // namespace rg
