// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for tunnel process startup and release, using shell scripts as the tunnel binary

#include <catch2/catch_test_macros.hpp>
#include "tunnel/tunnel_supervisor.hpp"
#include "util/errors.hpp"
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <thread>
#include <pthread.h>
#include <signal.h>

using namespace cdnscan;
using namespace cdnscan::tunnel;
using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

struct TunnelFixture {
    std::filesystem::path dir;

    explicit TunnelFixture(const char* name) : dir(std::filesystem::temp_directory_path() / name) {
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
    }
    ~TunnelFixture() {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    // Write an executable shell script standing in for the tunnel binary
    std::string Script(const std::string& name, const std::string& body) const {
        auto path = dir / name;
        {
            std::ofstream f(path);
            f << "#!/bin/sh\n" << body << "\n";
        }
        std::filesystem::permissions(path, std::filesystem::perms::owner_all);
        return path.string();
    }

    TunnelSupervisor Make(const std::string& binary, std::chrono::milliseconds startup = 2000ms) const {
        TunnelConfigTemplate tmpl(json::parse(R"({"inbounds": [], "outbounds": [], "route": {"rules": []}})"),
                                  json::parse(R"({"type": "vless", "server_port": 443})"));
        TunnelSupervisor::Options opts;
        opts.binary = binary;
        opts.config_path = dir / "config.json";
        opts.listen_ip = "127.0.0.1";
        opts.port_base = 21000;
        opts.startup_timeout = startup;
        opts.stop_grace = 1000ms;
        return TunnelSupervisor(std::move(tmpl), opts);
    }
};

std::vector<asio::ip::address> Batch() {
    return {asio::ip::make_address("104.16.0.1"), asio::ip::make_address("104.16.0.2")};
}

bool ProcessGone(pid_t pid) {
    return kill(pid, 0) != 0 && errno == ESRCH;
}

extern "C" void NoteInterrupt(int) {}

// Installs a handler without SA_RESTART (like the scanner's stop handler)
// and signals the calling thread once after delay.
class InterruptAfter {
public:
    explicit InterruptAfter(std::chrono::milliseconds delay) {
        struct sigaction sa {};
        sa.sa_handler = NoteInterrupt;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0;
        sigaction(SIGUSR1, &sa, &previous_);
        pthread_t target = pthread_self();
        thread_ = std::thread([target, delay] {
            std::this_thread::sleep_for(delay);
            pthread_kill(target, SIGUSR1);
        });
    }
    ~InterruptAfter() {
        thread_.join();
        sigaction(SIGUSR1, &previous_, nullptr);
    }

private:
    struct sigaction previous_ {};
    std::thread thread_;
};

}  // namespace

TEST_CASE("TunnelSupervisor: ready on first non-error output", "[tunnel_supervisor]") {
    TunnelFixture fx("cdnscan_tunnel_ready");
    auto supervisor = fx.Make(fx.Script("tunnel-ok", "echo \"INFO started with $1 $2\"; exec sleep 30"));

    TunnelHandle handle = supervisor.Start(Batch());
    REQUIRE(handle.active());
    pid_t pid = handle.pid();
    REQUIRE(pid > 0);
    REQUIRE(handle.RecentOutput().find("INFO started with run -c") != std::string::npos);

    SECTION("The generated config is on disk") {
        std::ifstream f(fx.dir / "config.json");
        json config = json::parse(f);
        REQUIRE(config["inbounds"].size() == 2);
        REQUIRE(config["inbounds"][1]["listen_port"] == 21001);
        REQUIRE(config["outbounds"][0]["server"] == "104.16.0.1");
    }

    SECTION("Release stops the process and is idempotent") {
        handle.Release();
        REQUIRE_FALSE(handle.active());
        REQUIRE(ProcessGone(pid));
        handle.Release();
        REQUIRE_FALSE(handle.active());
    }

    SECTION("Destruction releases") {
        { TunnelHandle moved = std::move(handle); }
        REQUIRE_FALSE(handle.active());
        REQUIRE(ProcessGone(pid));
    }
}

TEST_CASE("TunnelSupervisor: silent but alive counts as ready", "[tunnel_supervisor]") {
    TunnelFixture fx("cdnscan_tunnel_quiet");
    auto supervisor = fx.Make(fx.Script("tunnel-quiet", "exec sleep 30"), 200ms);

    TunnelHandle handle = supervisor.Start(Batch());
    REQUIRE(handle.active());
    pid_t pid = handle.pid();
    handle.Release();
    REQUIRE(ProcessGone(pid));
}

TEST_CASE("TunnelSupervisor: a signal does not shorten startup", "[tunnel_supervisor]") {
    TunnelFixture fx("cdnscan_tunnel_signal");

    SECTION("Late error report still fails Start") {
        auto supervisor = fx.Make(
            fx.Script("tunnel-late-fatal", "sleep 1; echo 'FATAL listen tcp: address already in use'; exit 1"), 5000ms);
        auto start = std::chrono::steady_clock::now();
        InterruptAfter interrupt(100ms);
        try {
            (void)supervisor.Start(Batch());
            FAIL("expected ProcessError");
        } catch (const ProcessError& e) {
            REQUIRE(e.diagnostics().find("address already in use") != std::string::npos);
        }
        REQUIRE(std::chrono::steady_clock::now() - start >= 900ms);
    }

    SECTION("Silent process waits out the full startup timeout") {
        auto supervisor = fx.Make(fx.Script("tunnel-late-quiet", "exec sleep 30"), 600ms);
        auto start = std::chrono::steady_clock::now();
        InterruptAfter interrupt(100ms);
        TunnelHandle handle = supervisor.Start(Batch());
        REQUIRE(std::chrono::steady_clock::now() - start >= 550ms);
        REQUIRE(handle.active());
    }
}

TEST_CASE("TunnelSupervisor: startup failures", "[tunnel_supervisor]") {
    TunnelFixture fx("cdnscan_tunnel_failures");

    SECTION("Error report on the diagnostic stream") {
        auto supervisor =
            fx.Make(fx.Script("tunnel-fatal", "echo 'FATAL[0000] decode config: unknown outbound type'; exit 1"));
        try {
            (void)supervisor.Start(Batch());
            FAIL("expected ProcessError");
        } catch (const ProcessError& e) {
            REQUIRE(e.diagnostics().find("unknown outbound type") != std::string::npos);
        }
    }

    SECTION("Error report from a process that keeps running") {
        auto supervisor = fx.Make(fx.Script("tunnel-error-alive", "echo 'ERROR listen: address in use'; exec sleep 30"));
        REQUIRE_THROWS_AS(supervisor.Start(Batch()), ProcessError);
    }

    SECTION("Exit before any output") {
        auto supervisor = fx.Make(fx.Script("tunnel-exit", "exit 3"));
        try {
            (void)supervisor.Start(Batch());
            FAIL("expected ProcessError");
        } catch (const ProcessError& e) {
            REQUIRE(std::string(e.what()).find("exit status 3") != std::string::npos);
        }
    }

    SECTION("Missing binary") {
        auto supervisor = fx.Make((fx.dir / "no-such-tunnel").string());
        REQUIRE_THROWS_AS(supervisor.Start(Batch()), ProcessError);
    }

    SECTION("Unwritable config path") {
        auto supervisor = fx.Make(fx.Script("tunnel-unused", "exec sleep 30"));
        { std::ofstream(fx.dir / "blocker") << "x"; }
        TunnelConfigTemplate tmpl(json::parse(R"({"inbounds": [], "outbounds": [], "route": {"rules": []}})"),
                                  json::object());
        TunnelSupervisor::Options opts = supervisor.options();
        opts.config_path = fx.dir / "blocker" / "config.json";
        TunnelSupervisor broken(std::move(tmpl), opts);
        REQUIRE_THROWS_AS(broken.Start(Batch()), StateError);
    }
}
