#include <catch2/catch_test_macros.hpp>
#include "util/files.hpp"
#include "util/fs_lock.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace chainquery::util;

TEST_CASE("File utilities", "[files]") {
    // Create a temporary test directory
    auto test_dir = std::filesystem::temp_directory_path() / "chainquery_files_test";
    std::filesystem::remove_all(test_dir);

    SECTION("ensure_directory creates directories") {
        auto subdir = test_dir / "sub" / "nested";
        REQUIRE(ensure_directory(subdir));
        REQUIRE(std::filesystem::exists(subdir));
        REQUIRE(std::filesystem::is_directory(subdir));
    }

    SECTION("ensure_directory on an existing directory") {
        REQUIRE(ensure_directory(test_dir));
        REQUIRE(ensure_directory(test_dir));
    }

    SECTION("ensure_directory fails on a regular file") {
        REQUIRE(ensure_directory(test_dir));
        auto file_path = test_dir / "plain.txt";
        std::ofstream(file_path) << "x";
        REQUIRE_FALSE(ensure_directory(file_path));
    }

    SECTION("Default directories live under HOME") {
        const char* home = std::getenv("HOME");
        if (home != nullptr && *home != '\0') {
            REQUIRE(get_default_datadir() == std::filesystem::path(home) / ".chainquery");
            REQUIRE(get_default_blocksdir() ==
                    std::filesystem::path(home) / ".bitcoin" / "blocks");
        }
        REQUIRE(get_default_datadir().filename() == ".chainquery");
        REQUIRE(get_default_blocksdir().filename() == "blocks");
    }

    std::filesystem::remove_all(test_dir);
}

TEST_CASE("DirectoryLock", "[files][fs_lock]") {
    auto test_dir = std::filesystem::temp_directory_path() / "chainquery_lock_test";
    std::filesystem::remove_all(test_dir);
    REQUIRE(ensure_directory(test_dir));

    SECTION("Acquire creates the lock file") {
        DirectoryLock lock(test_dir);
        REQUIRE_FALSE(lock.IsHeld());
        REQUIRE(lock.Acquire() == LockResult::Success);
        REQUIRE(lock.IsHeld());
        REQUIRE(std::filesystem::exists(test_dir / ".lock"));
        REQUIRE(lock.GetPath() == test_dir / ".lock");

        // Re-acquiring a held lock is a no-op
        REQUIRE(lock.Acquire() == LockResult::Success);
    }

    SECTION("Second lock on the same directory is refused") {
        DirectoryLock first(test_dir);
        REQUIRE(first.Acquire() == LockResult::Success);

        DirectoryLock second(test_dir);
        REQUIRE(second.Acquire() == LockResult::ErrorLock);
        REQUIRE_FALSE(second.IsHeld());
        REQUIRE_FALSE(second.GetReason().empty());

        // The failed attempt must not have dropped the first lock
        REQUIRE(first.IsHeld());
        first.Release();
        REQUIRE(second.Acquire() == LockResult::Success);
    }

    SECTION("Lock is released on destruction") {
        {
            DirectoryLock lock(test_dir);
            REQUIRE(lock.Acquire() == LockResult::Success);
        }
        DirectoryLock again(test_dir);
        REQUIRE(again.Acquire() == LockResult::Success);
    }

    SECTION("Different lock file names are independent") {
        DirectoryLock a(test_dir, ".lock");
        DirectoryLock b(test_dir, ".other");
        REQUIRE(a.Acquire() == LockResult::Success);
        REQUIRE(b.Acquire() == LockResult::Success);
    }

    SECTION("Missing directory") {
        DirectoryLock lock(test_dir / "does" / "not" / "exist");
        REQUIRE(lock.Acquire() == LockResult::ErrorWrite);
        REQUIRE_FALSE(lock.IsHeld());
    }

    std::filesystem::remove_all(test_dir);
}
