// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for the scanner startup sequence against a scratch data directory

#include <catch2/catch_test_macros.hpp>
#include "app/scanner.hpp"
#include "scan/result_store.hpp"
#include "scan/scan_cursor.hpp"
#include "util/errors.hpp"
#include <filesystem>
#include <fstream>

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <nlohmann/json.hpp>

using namespace cdnscan;
using namespace cdnscan::app;
using json = nlohmann::json;

namespace {

uint16_t UnusedPort() {
    asio::io_context io;
    asio::ip::tcp::acceptor acceptor(io, asio::ip::tcp::endpoint(asio::ip::address_v4::loopback(), 0));
    return acceptor.local_endpoint().port();
}

struct DataDirFixture {
    std::filesystem::path dir;
    json config;

    explicit DataDirFixture(const char* name) : dir(std::filesystem::temp_directory_path() / name) {
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);

        // Nothing listens on the origin port, so every probe fails fast
        config = {{"port_base", 23000},
                  {"max_connection_count", 2},
                  {"server_url", "http://127.0.0.1:" + std::to_string(UnusedPort()) + "/"},
                  {"cdn_url", "http://cdn.test:" + std::to_string(UnusedPort()) + "/"},
                  {"listen_ip", "127.0.0.1"},
                  {"max_rtt", 300},
                  {"server_res_body", "ok"},
                  {"cdn_res_body", "ok"},
                  {"max_subnet_len", 4},
                  {"tunnel_binary", Script("tunnel", "exec sleep 30")},
                  {"tunnel_startup_timeout_ms", 100},
                  {"origin_via_tunnel", false}};
        Write(CONFIG_FILE_NAME, config.dump(2));
        Write(TUNNEL_TEMPLATE_FILE_NAME, R"({"inbounds": [], "outbounds": [], "route": {"rules": []}})");
        Write(OUTBOUND_TEMPLATE_FILE_NAME, R"({"type": "vless", "server_port": 443})");
        Write("ips.txt", "127.0.0.0/30\n127.0.1.0/31\n");
    }

    ~DataDirFixture() {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    void Write(const std::string& name, const std::string& content) const {
        std::ofstream f(dir / name);
        f << content;
    }

    std::string Script(const std::string& name, const std::string& body) const {
        auto path = dir / name;
        Write(name, "#!/bin/sh\n" + body + "\n");
        std::filesystem::permissions(path, std::filesystem::perms::owner_all);
        return path.string();
    }

    void SetConfig(const std::string& key, json value) {
        config[key] = std::move(value);
        Write(CONFIG_FILE_NAME, config.dump(2));
    }

    ScannerOptions Options() const {
        ScannerOptions opts;
        opts.datadir = dir;
        opts.ip_file = dir / "ips.txt";
        return opts;
    }

    scan::ScanCursor SavedCursor() const { return *scan::ScanCursor::LoadFromFile(dir / CURSOR_FILE_NAME); }
};

}  // namespace

TEST_CASE("Scanner: runs the scan to completion", "[app][scanner]") {
    DataDirFixture fx("cdnscan_scanner_complete");
    {
        Scanner scanner(fx.Options());
        REQUIRE(scanner.Run() == 0);
    }

    REQUIRE(fx.SavedCursor().offset == 4);
    REQUIRE(std::filesystem::exists(fx.dir / RESULT_FILE_NAME));
    REQUIRE(scan::ResultStore::LoadFromFile(fx.dir / RESULT_FILE_NAME).empty());
    REQUIRE(std::filesystem::exists(fx.dir / TUNNEL_CONFIG_FILE_NAME));

    SECTION("A finished scan returns immediately") {
        Scanner again(fx.Options());
        REQUIRE(again.Run() == 0);
    }
}

TEST_CASE("Scanner: resume state", "[app][scanner]") {
    DataDirFixture fx("cdnscan_scanner_resume");

    SECTION("Saved results survive a completed cursor") {
        fx.Write(CURSOR_FILE_NAME, R"({"range_index": 0, "offset": 4})");
        fx.Write(RESULT_FILE_NAME, "ip: 127.0.1.1, server_rtt: 90, cdn_rtt: 12\n");
        Scanner scanner(fx.Options());
        REQUIRE(scanner.Run() == 0);
        auto store = scan::ResultStore::LoadFromFile(fx.dir / RESULT_FILE_NAME);
        REQUIRE(store.size() == 1);
        REQUIRE(store.Get(asio::ip::make_address("127.0.1.1"))->origin_rtt_ms == 90);
    }

    SECTION("Cursor that does not fit the ranges") {
        fx.Write(CURSOR_FILE_NAME, R"({"range_index": 5, "offset": 0})");
        Scanner scanner(fx.Options());
        REQUIRE_THROWS_AS(scanner.Run(), StateError);
    }

    SECTION("Corrupt result file") {
        fx.Write(RESULT_FILE_NAME, "ip: not-an-address, server_rtt: 1, cdn_rtt: 2\n");
        Scanner scanner(fx.Options());
        REQUIRE_THROWS_AS(scanner.Run(), StateError);
    }

    SECTION("--no-cache starts over") {
        fx.Write(CURSOR_FILE_NAME, R"({"range_index": 5, "offset": 0})");
        fx.SetConfig("tunnel_binary", fx.Script("broken-tunnel", "echo 'FATAL[0000] bad config'; exit 1"));
        auto opts = fx.Options();
        opts.no_cache = true;
        Scanner scanner(opts);
        REQUIRE_THROWS_AS(scanner.Run(), ProcessError);
        // State was reset before the first batch
        REQUIRE(fx.SavedCursor() == scan::ScanCursor{0, 0});
    }
}

TEST_CASE("Scanner: startup errors", "[app][scanner]") {
    DataDirFixture fx("cdnscan_scanner_errors");

    SECTION("No ranges in the address file") {
        fx.Write("ips.txt", "nothing to see here\n");
        Scanner scanner(fx.Options());
        REQUIRE_THROWS_AS(scanner.Run(), StateError);
    }

    SECTION("Missing address file") {
        auto opts = fx.Options();
        opts.ip_file = fx.dir / "missing.txt";
        Scanner scanner(opts);
        REQUIRE_THROWS_AS(scanner.Run(), StateError);
    }

    SECTION("Missing configuration") {
        std::filesystem::remove(fx.dir / CONFIG_FILE_NAME);
        Scanner scanner(fx.Options());
        REQUIRE_THROWS_AS(scanner.Run(), ConfigError);
    }

    SECTION("Broken tunnel template") {
        fx.Write(TUNNEL_TEMPLATE_FILE_NAME, R"({"outbounds": []})");
        Scanner scanner(fx.Options());
        REQUIRE_THROWS_AS(scanner.Run(), ConfigError);
    }
}
