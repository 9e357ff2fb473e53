#include "rg/backup_store.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

#include "rg/digest.hpp"
#include "rg/errors.hpp"
#include "rg/fsutil.hpp"
#include "rg/logger.hpp"
#include "rg/timeutil.hpp"

namespace fs = std::filesystem;

namespace rg
{
BackupStore::BackupStore(std::string dir,
                         std::string stem,
                         const std::size_t cap,
                         const std::chrono::hours max_age)
    : dir_(std::move(dir)), stem_(std::move(stem)), cap_(cap), max_age_(max_age)
{
    if (cap_ == 0)
        throw Error(ErrorKind::InvalidArgument, "backup retention must be at least 1");
}

std::optional<BackupRecord> BackupStore::parse_name(const std::string &name) const
{
    const std::string prefix = stem_ + ".backup_";
    if (name.rfind(prefix, 0) != 0) return std::nullopt;
    const std::string rest = name.substr(prefix.size());

    const auto p1 = rest.find('_');
    if (p1 == std::string::npos) return std::nullopt;
    const auto p2 = rest.find('_', p1 + 1);
    if (p2 == std::string::npos || rest.find('_', p2 + 1) != std::string::npos) return std::nullopt;

    auto created = parse_compact(rest.substr(0, p1));
    auto reason = parse_backup_reason(rest.substr(p1 + 1, p2 - p1 - 1));
    std::string digest = rest.substr(p2 + 1);
    if (!created || !reason) return std::nullopt;
    if (digest.size() != 64
        || !std::ranges::all_of(digest, [](unsigned char c) { return std::isxdigit(c) && !std::isupper(c); }))
        return std::nullopt;

    BackupRecord rec{};
    rec.created_at = *created;
    rec.reason = *reason;
    rec.content_digest = std::move(digest);
    rec.storage_path = (fs::path(dir_) / name).string();
    return rec;
}

std::vector<BackupRecord> BackupStore::list() const
{
    std::vector<BackupRecord> out;
    std::error_code ec;
    fs::directory_iterator it(dir_, ec);
    if (ec) return out;

    for (const auto &entry : it)
    {
        std::error_code fec;
        if (!entry.is_regular_file(fec)) continue;
        if (auto rec = parse_name(entry.path().filename().string()))
            out.push_back(std::move(*rec));
    }
    std::ranges::sort(out, [](const BackupRecord &a, const BackupRecord &b)
    {
        if (a.created_at != b.created_at) return a.created_at < b.created_at;
        return a.storage_path < b.storage_path;
    });
    return out;
}

std::optional<BackupRecord> BackupStore::latest() const
{
    auto all = list();
    if (all.empty()) return std::nullopt;
    return all.back();
}

std::optional<BackupRecord> BackupStore::find(const std::string &name) const
{
    if (name == "latest") return latest();
    return parse_name(fs::path(name).filename().string());
}

BackupRecord BackupStore::snapshot(std::string_view current, const BackupReason reason)
{
    ensure_directory(dir_);

    // created_at is strictly increasing within one store
    auto now = std::chrono::time_point_cast<std::chrono::microseconds>(Clock::now());
    TimePoint created = now;
    if (auto newest = latest(); newest && created <= newest->created_at)
        created = newest->created_at + std::chrono::microseconds(1);

    BackupRecord rec{};
    rec.created_at = created;
    rec.reason = reason;
    rec.content_digest = sha256_hex(current);
    const std::string name = stem_ + ".backup_" + format_compact(created) + "_"
                             + backup_reason_str(reason) + "_" + rec.content_digest;
    rec.storage_path = (fs::path(dir_) / name).string();

    atomic_write(rec.storage_path, current, SwitchStep::Backup, 0600);
    RG_LOG_INFO("backup: created " << rec.storage_path);

    rotate(cap_);
    return rec;
}

std::size_t BackupStore::rotate(const std::size_t cap)
{
    auto records = list();
    std::vector<const BackupRecord *> doomed;

    const std::size_t excess = records.size() > cap ? records.size() - cap : 0;
    for (std::size_t i = 0; i < excess; ++i) doomed.push_back(&records[i]);

    if (max_age_.count() > 0 && !records.empty())
    {
        const auto cutoff = Clock::now() - max_age_;
        for (std::size_t i = excess; i + 1 < records.size(); ++i)
        {
            if (records[i].created_at < cutoff) doomed.push_back(&records[i]);
        }
    }

    std::size_t removed = 0;
    for (const auto *rec : doomed)
    {
        std::error_code ec;
        if (fs::remove(rec->storage_path, ec))
        {
            ++removed;
            RG_LOG_DEBUG("backup: removed " << rec->storage_path);
        }
        else if (ec)
        {
            RG_LOG_WARN("backup: could not remove " << rec->storage_path << ": " << ec.message());
        }
    }
    if (removed > 0) RG_LOG_INFO("backup: cleanup removed " << removed << " old backup(s)");
    return removed;
}

std::string BackupStore::restore(const BackupRecord &record) const
{
    auto content = read_file(record.storage_path);
    if (!content)
        throw Error(ErrorKind::IOFailure, "backup " + record.storage_path + " does not exist");

    if (const std::string actual = sha256_hex(*content); actual != record.content_digest)
        throw Error(ErrorKind::CorruptBackup,
                    "backup " + record.storage_path + " is corrupt: expected sha256 "
                    + record.content_digest + ", found " + actual);
    return *content;
}
} // namespace rg
