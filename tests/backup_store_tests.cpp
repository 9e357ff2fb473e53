#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include "fakes.hpp"
#include "rg/backup_store.hpp"
#include "rg/digest.hpp"
#include "rg/fsutil.hpp"
#include "rg/timeutil.hpp"

using namespace rg;
using namespace rg::testing;
namespace fs = std::filesystem;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static void test_digest_known_values()
{
    assert_true(sha256_hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855", "sha256 of empty");
    assert_true(sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", "sha256 of abc");
}

static void test_snapshot_names_and_content()
{
    TempDir dir;
    BackupStore store(dir.file("b"), "resolv.conf", 5);
    const std::string content = "nameserver 9.9.9.9\n";
    const BackupRecord rec = store.snapshot(content, BackupReason::PreSwitch);

    const std::string name = fs::path(rec.storage_path).filename().string();
    const std::string expected = "resolv.conf.backup_" + format_compact(rec.created_at) + "_pre-switch_"
                                 + sha256_hex(content);
    assert_true(name == expected, "file name carries time, reason and digest");
    assert_true(read_file(rec.storage_path).value_or("") == content, "bytes stored");
    assert_true((fs::status(rec.storage_path).permissions() & fs::perms::others_read) == fs::perms::none,
                "backups not world readable");
    assert_true(store.restore(rec) == content, "restore returns the bytes");

    auto parsed = store.parse_name(name);
    assert_true(parsed && parsed->created_at == rec.created_at && parsed->reason == rec.reason
                && parsed->content_digest == rec.content_digest, "name parses back to the record");
}

static void test_list_ignores_foreign_files()
{
    TempDir dir;
    BackupStore store(dir.file("b"), "resolv.conf", 5);
    store.snapshot("a\n", BackupReason::PreSwitch);
    std::ofstream(dir.file("b/notes.txt")) << "x";
    std::ofstream(dir.file("b/resolv.conf.backup_garbage")) << "x";
    std::ofstream(dir.file("b/hosts.backup_20260101T000000.000000Z_pre-switch_"
                           "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855")) << "";
    assert_true(store.list().size() == 1, "only our records are listed");

    BackupStore missing(dir.file("nope"), "resolv.conf", 5);
    assert_true(missing.list().empty(), "missing directory lists nothing");
    assert_true(!missing.latest().has_value(), "no latest");
}

static void test_rotation_keeps_newest_cap()
{
    TempDir dir;
    BackupStore store(dir.file("b"), "resolv.conf", 3);
    std::vector<BackupRecord> made;
    for (int i = 0; i < 7; ++i)
    {
        made.push_back(store.snapshot("v" + std::to_string(i) + "\n", BackupReason::PreSwitch));
    }
    const auto kept = store.list();
    assert_true(kept.size() == 3, "count bounded by cap");
    for (size_t i = 0; i < 3; ++i)
    {
        assert_true(kept[i].storage_path == made[4 + i].storage_path, "the newest survive, oldest first");
    }
    assert_true(store.latest()->storage_path == made.back().storage_path, "latest is the newest");
    assert_true(store.rotate(1) == 2, "explicit rotate removes the excess");
    assert_true(store.list().size() == 1, "one left");
}

static void test_created_at_strictly_increasing()
{
    TempDir dir;
    BackupStore store(dir.file("b"), "resolv.conf", 50);
    for (int i = 0; i < 20; ++i) store.snapshot("same\n", BackupReason::PreReset);
    const auto all = store.list();
    assert_true(all.size() == 20, "identical content still gets distinct records");
    for (size_t i = 1; i < all.size(); ++i)
    {
        assert_true(all[i - 1].created_at < all[i].created_at, "strictly increasing");
    }
}

static void test_age_cleanup_keeps_newest()
{
    TempDir dir;
    BackupStore store(dir.file("b"), "resolv.conf", 10, std::chrono::hours(24));
    // plant two records from last year
    const auto old = Clock::now() - std::chrono::hours(24 * 365);
    for (int i = 0; i < 2; ++i)
    {
        const auto tp = std::chrono::time_point_cast<std::chrono::microseconds>(old) + std::chrono::microseconds(i);
        const std::string name = "resolv.conf.backup_" + format_compact(tp) + "_pre-switch_" + sha256_hex("old\n");
        atomic_write(dir.file("b/" + name), "old\n");
    }
    assert_true(store.list().size() == 2, "planted");
    assert_true(store.rotate(10) == 1, "expired records go, the newest stays");

    store.snapshot("fresh\n", BackupReason::PreSwitch);
    const auto kept = store.list();
    assert_true(kept.size() == 1, "only the fresh record remains");
    assert_true(store.restore(kept[0]) == "fresh\n", "fresh content");
}

static void test_corrupt_backup_detected()
{
    TempDir dir;
    BackupStore store(dir.file("b"), "resolv.conf", 5);
    const BackupRecord rec = store.snapshot("nameserver 1.1.1.1\n", BackupReason::PreSwitch);
    std::ofstream(rec.storage_path, std::ios::app) << "nameserver 6.6.6.6\n";
    try
    {
        store.restore(rec);
        assert_true(false, "restore of a modified backup must throw");
    }
    catch (const Error &e)
    {
        assert_true(e.kind() == ErrorKind::CorruptBackup, "CorruptBackup kind");
    }
}

static void test_find_by_name_and_latest()
{
    TempDir dir;
    BackupStore store(dir.file("b"), "resolv.conf", 5);
    const BackupRecord a = store.snapshot("a\n", BackupReason::PreSwitch);
    const BackupRecord b = store.snapshot("b\n", BackupReason::PreRestore);

    auto by_name = store.find(fs::path(a.storage_path).filename().string());
    assert_true(by_name && by_name->storage_path == a.storage_path, "find by file name");
    auto by_path = store.find(a.storage_path);
    assert_true(by_path && by_path->storage_path == a.storage_path, "find accepts a full path");
    auto latest = store.find("latest");
    assert_true(latest && latest->storage_path == b.storage_path && latest->reason == BackupReason::PreRestore,
                "latest");
    assert_true(!store.find("resolv.conf.backup_bogus").has_value(), "unparseable name");
}

static void test_write_commits_at_rename()
{
    TempDir dir;
    const std::string path = dir.file("resolv.conf.backup_x");
    bool threw = false;
    try
    {
        atomic_write(path, "nameserver 9.9.9.9\n", SwitchStep::Backup, 0600, {},
                     [](const std::string &) { throw Error(ErrorKind::IOFailure, "fsync directory", SwitchStep::Backup); });
    }
    catch (const Error &)
    {
        threw = true;
    }
    assert_true(!threw, "a failure after the rename does not undo the write");
    assert_true(read_file(path) == std::optional<std::string>("nameserver 9.9.9.9\n"), "content in place");
    assert_true(!fs::exists(path + ".tmp"), "no temp file");

    threw = false;
    try
    {
        atomic_write(dir.file("other"), "x\n", SwitchStep::Backup, 0600,
                     [](const std::string &) { throw Error(ErrorKind::IOFailure, "injected", SwitchStep::Backup); });
    }
    catch (const Error &e)
    {
        threw = e.step() == SwitchStep::Backup;
    }
    assert_true(threw, "a failure before the rename aborts");
    assert_true(!fs::exists(dir.file("other")) && !fs::exists(dir.file("other.tmp")), "nothing left behind");
}

static void test_zero_cap_rejected()
{
    try
    {
        BackupStore store("/tmp/unused", "resolv.conf", 0);
        assert_true(false, "cap 0 must throw");
    }
    catch (const Error &e)
    {
        assert_true(e.kind() == ErrorKind::InvalidArgument, "InvalidArgument");
    }
}

int main()
{
    test_digest_known_values();
    test_snapshot_names_and_content();
    test_list_ignores_foreign_files();
    test_rotation_keeps_newest_cap();
    test_created_at_strictly_increasing();
    test_age_cleanup_keeps_newest();
    test_corrupt_backup_detected();
    test_find_by_name_and_latest();
    test_write_commits_at_rename();
    test_zero_cap_rejected();

    std::cout << "backup store tests: OK" << std::endl;
    return 0;
}
