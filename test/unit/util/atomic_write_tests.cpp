// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for atomic file writes (files.cpp)

#include <catch2/catch_test_macros.hpp>
#include "util/files.hpp"
#include <filesystem>
#include <fstream>
#include <thread>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

using namespace cdnscan::util;

namespace {

std::string slurp(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

}  // namespace

TEST_CASE("Atomic write: O_NOFOLLOW symlink protection", "[atomic_write][security]") {
    auto test_dir = std::filesystem::temp_directory_path() / "cdnscan_atomic_test_symlink";
    std::filesystem::remove_all(test_dir);
    std::filesystem::create_directories(test_dir);

    SECTION("Symlink target is never written through") {
        auto real_file = test_dir / "real.txt";
        auto symlink = test_dir / "link.txt";
        {
            std::ofstream f(real_file);
            f << "original";
        }
        std::filesystem::create_symlink(real_file, symlink);

        // rename() replaces the link itself; the target must stay intact
        (void)atomic_write_file(symlink, std::string("should not write"));
        REQUIRE(slurp(real_file) == "original");
    }

    std::filesystem::remove_all(test_dir);
}

TEST_CASE("Atomic write: File permissions", "[atomic_write][permissions]") {
    auto test_dir = std::filesystem::temp_directory_path() / "cdnscan_atomic_test_perms";
    std::filesystem::remove_all(test_dir);
    std::filesystem::create_directories(test_dir);

    SECTION("File created with specified mode") {
        auto file_path = test_dir / "test_0600.txt";
        REQUIRE(atomic_write_file(file_path, std::string("abc"), 0600));

        struct stat st;
        REQUIRE(stat(file_path.c_str(), &st) == 0);
        REQUIRE((st.st_mode & 0777) == 0600);
    }

    SECTION("File created with default mode is owner-readable") {
        auto file_path = test_dir / "test_default.txt";
        REQUIRE(atomic_write_file(file_path, std::string("abc")));

        struct stat st;
        REQUIRE(stat(file_path.c_str(), &st) == 0);
        REQUIRE((st.st_mode & 0400) != 0);
    }

    std::filesystem::remove_all(test_dir);
}

TEST_CASE("Atomic write: Overwrite safety", "[atomic_write][overwrite]") {
    auto test_dir = std::filesystem::temp_directory_path() / "cdnscan_atomic_test_overwrite";
    std::filesystem::remove_all(test_dir);
    std::filesystem::create_directories(test_dir);

    SECTION("Overwriting replaces the whole file") {
        auto file_path = test_dir / "result.txt";
        std::string first(5000, 'a');
        std::string second = "ip: 1.1.1.1, server_rtt: 1, cdn_rtt: 2\n";

        REQUIRE(atomic_write_file(file_path, first));
        REQUIRE(atomic_write_file(file_path, second));

        auto result = read_file_string(file_path);
        REQUIRE(result.has_value());
        REQUIRE(*result == second);
    }

    SECTION("No temp files left behind after successful write") {
        auto file_path = test_dir / "clean.txt";
        REQUIRE(atomic_write_file(file_path, std::string("data")));

        int temp_file_count = 0;
        for (const auto& entry : std::filesystem::directory_iterator(test_dir)) {
            if (entry.path().filename().string().find(".tmp.") != std::string::npos) {
                temp_file_count++;
            }
        }
        REQUIRE(temp_file_count == 0);
    }

    SECTION("Concurrent writes to different files") {
        auto file1 = test_dir / "file1.txt";
        auto file2 = test_dir / "file2.txt";
        bool ok1 = false;
        bool ok2 = false;

        std::thread t1([&]() { ok1 = atomic_write_file(file1, std::string("one")); });
        std::thread t2([&]() { ok2 = atomic_write_file(file2, std::string("two")); });
        t1.join();
        t2.join();

        REQUIRE(ok1);
        REQUIRE(ok2);
        REQUIRE(read_file_string(file1) == std::optional<std::string>("one"));
        REQUIRE(read_file_string(file2) == std::optional<std::string>("two"));
    }

    std::filesystem::remove_all(test_dir);
}

TEST_CASE("Atomic write: Readonly directory", "[atomic_write][readonly]") {
    auto test_dir = std::filesystem::temp_directory_path() / "cdnscan_atomic_test_readonly";
    std::filesystem::remove_all(test_dir);
    std::filesystem::create_directories(test_dir);

    SECTION("Write fails on readonly directory") {
        // Root bypasses file permissions
        if (geteuid() == 0) {
            WARN("Skipping readonly test when running as root");
            std::filesystem::remove_all(test_dir);
            return;
        }

        std::filesystem::permissions(test_dir,
                                      std::filesystem::perms::owner_read |
                                      std::filesystem::perms::owner_exec,
                                      std::filesystem::perm_options::replace);

        REQUIRE_FALSE(atomic_write_file(test_dir / "fail.txt", std::string("x")));

        std::filesystem::permissions(test_dir,
                                      std::filesystem::perms::owner_all,
                                      std::filesystem::perm_options::replace);
    }

    std::filesystem::remove_all(test_dir);
}

TEST_CASE("Atomic write: Directory creation", "[atomic_write][mkdir]") {
    auto test_dir = std::filesystem::temp_directory_path() / "cdnscan_atomic_test_mkdir";
    std::filesystem::remove_all(test_dir);

    auto file_path = test_dir / "sub1" / "sub2" / "scan_cursor.json";
    REQUIRE(atomic_write_file(file_path, std::string("{}")));
    REQUIRE(std::filesystem::exists(test_dir / "sub1" / "sub2"));
    REQUIRE(read_file_string(file_path) == std::optional<std::string>("{}"));

    REQUIRE(ensure_directory(test_dir / "other"));
    REQUIRE(std::filesystem::is_directory(test_dir / "other"));

    std::filesystem::remove_all(test_dir);
}

TEST_CASE("Read file: missing and empty files", "[atomic_write][read]") {
    auto test_dir = std::filesystem::temp_directory_path() / "cdnscan_read_test";
    std::filesystem::remove_all(test_dir);
    std::filesystem::create_directories(test_dir);

    SECTION("Missing file yields nullopt") {
        REQUIRE_FALSE(read_file_string(test_dir / "absent.txt").has_value());
    }

    SECTION("Empty file yields empty string") {
        auto file_path = test_dir / "empty.txt";
        REQUIRE(atomic_write_file(file_path, std::string()));
        auto result = read_file_string(file_path);
        REQUIRE(result.has_value());
        REQUIRE(result->empty());
    }

    std::filesystem::remove_all(test_dir);
}
