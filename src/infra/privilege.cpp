#include "rg/privilege.hpp"

#include <string>

#include <unistd.h>

#include "rg/errors.hpp"

namespace rg
{
Privileges Privileges::detect()
{
    return Privileges(::geteuid() == 0);
}

void Privileges::require(std::string_view operation) const
{
    if (!elevated_)
        throw Error(ErrorKind::PermissionDenied,
                    std::string(operation) + " requires root privileges (run with sudo)");
}
} // namespace rg
