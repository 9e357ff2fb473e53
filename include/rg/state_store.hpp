#pragma once

#include <string>

#include "rg/model.hpp"

namespace rg
{
// The persisted SystemState record (YAML). Only ConfigManager saves it.
class StateStore
{
public:
    explicit StateStore(std::string path);

    // Default state (no provider, unlocked) when the file does not exist;
    // Error(IOFailure) when it cannot be read or parsed.
    SystemState load() const;

    // Atomic temp-write-then-rename.
    void save(const SystemState &state) const;

    const std::string &path() const { return path_; }

private:
    std::string path_;
};

std::string serialize_state(const SystemState &state);
SystemState parse_state(const std::string &text);
} // namespace rg
