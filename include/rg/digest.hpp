#pragma once

#include <string>
#include <string_view>

namespace rg
{
// SHA-256 of `data` as lowercase hex; throws Error(IOFailure) when the
// crypto backend fails.
std::string sha256_hex(std::string_view data);
} // namespace rg
