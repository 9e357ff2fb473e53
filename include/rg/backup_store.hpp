#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rg/model.hpp"

namespace rg
{
// Timestamped snapshots of the live file, one file per record:
//   <stem>.backup_<yyyymmddTHHMMSS.uuuuuuZ>_<reason>_<sha256>
class BackupStore
{
public:
    BackupStore(std::string dir,
                std::string stem,
                std::size_t cap,
                std::chrono::hours max_age = std::chrono::hours{0});

    // Writes the bytes, then rotates. Throws Error(IOFailure) on any write
    // failure; the record is never returned for a partial file.
    BackupRecord snapshot(std::string_view current, BackupReason reason);

    // Removes the oldest records beyond `cap` and, when max_age is set,
    // records older than max_age except the newest. Returns the count removed.
    std::size_t rotate(std::size_t cap);

    // Reads the content back; Error(CorruptBackup) on digest mismatch.
    std::string restore(const BackupRecord &record) const;

    // Oldest first.
    std::vector<BackupRecord> list() const;
    std::optional<BackupRecord> latest() const;
    std::optional<BackupRecord> find(const std::string &name) const;

    const std::string &dir() const { return dir_; }
    std::size_t cap() const { return cap_; }

    std::optional<BackupRecord> parse_name(const std::string &name) const;

private:
    std::string dir_;
    std::string stem_;
    std::size_t cap_;
    std::chrono::hours max_age_;
};
} // namespace rg
