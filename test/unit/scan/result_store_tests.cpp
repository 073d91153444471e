// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for the latency-ordered result cache

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include "scan/address_range.hpp"
#include "scan/result_store.hpp"
#include "util/errors.hpp"
#include "util/files.hpp"
#include <algorithm>
#include <filesystem>
#include <random>
#include <set>

using namespace cdnscan;
using namespace cdnscan::scan;

namespace {

asio::ip::address ip(const char* s) {
    return asio::ip::make_address(s);
}

// ordered() is a duplicate-free permutation of the keys, sorted by record
void CheckInvariant(const ResultStore& store) {
    const auto& ordered = store.ordered();
    REQUIRE(ordered.size() == store.size());
    std::set<asio::ip::address> unique(ordered.begin(), ordered.end());
    REQUIRE(unique.size() == ordered.size());
    for (std::size_t i = 1; i < ordered.size(); ++i) {
        REQUIRE_FALSE(*store.Get(ordered[i]) < *store.Get(ordered[i - 1]));
    }
}

}  // namespace

TEST_CASE("ResultStore: merge-commit ordering", "[result_store]") {
    ResultStore store;
    auto a = ip("1.1.1.1");
    auto b = ip("2.2.2.2");

    SECTION("New entries are sorted on commit") {
        store.AddResult(a, {50, 80});
        store.AddResult(b, {10, 20});
        REQUIRE(store.HasStaged());
        REQUIRE(store.ordered().empty());

        store.Commit();
        REQUIRE_FALSE(store.HasStaged());
        REQUIRE(store.ordered() == std::vector<asio::ip::address>{b, a});

        SECTION("Re-measured entry moves to its new position") {
            store.AddResult(a, {5, 5});
            store.Commit();
            REQUIRE(store.ordered() == std::vector<asio::ip::address>{a, b});
            REQUIRE(store.size() == 2);
            REQUIRE(*store.Get(a) == LatencyRecord{5, 5});
        }

        SECTION("Commit without new results changes nothing") {
            auto before = store.ordered();
            store.Commit();
            store.Commit();
            REQUIRE(store.ordered() == before);
        }
    }

    SECTION("Latest measurement wins within one batch") {
        store.AddResult(a, {10, 10});
        store.AddResult(a, {90, 90});
        store.AddResult(b, {50, 50});
        store.Commit();
        REQUIRE(store.ordered() == std::vector<asio::ip::address>{b, a});
        REQUIRE(*store.Get(a) == LatencyRecord{90, 90});
    }

    SECTION("Candidate RTT breaks origin RTT ties") {
        store.AddResult(a, {10, 30});
        store.AddResult(b, {10, 20});
        store.Commit();
        REQUIRE(store.ordered() == std::vector<asio::ip::address>{b, a});
    }

    SECTION("Equal records: newer entry precedes committed one") {
        store.AddResult(a, {10, 10});
        store.Commit();
        store.AddResult(b, {10, 10});
        store.Commit();
        REQUIRE(store.ordered() == std::vector<asio::ip::address>{b, a});
    }

    SECTION("Equal records within one batch are ordered by address") {
        store.AddResult(b, {7, 7});
        store.AddResult(a, {7, 7});
        store.Commit();
        REQUIRE(store.ordered() == std::vector<asio::ip::address>{a, b});
    }
}

TEST_CASE("ResultStore: invariant holds across random batches", "[result_store]") {
    ResultStore store;
    std::mt19937 rng(12345);
    std::uniform_int_distribution<int> addr_dist(0, 199);
    std::uniform_int_distribution<uint64_t> rtt_dist(0, 50);

    for (int batch = 0; batch < 50; ++batch) {
        for (int k = 0; k < 16; ++k) {
            asio::ip::address_v4 addr(0x0a000000u + static_cast<uint32_t>(addr_dist(rng)));
            store.AddResult(addr, {rtt_dist(rng), rtt_dist(rng)});
        }
        store.Commit();
        CheckInvariant(store);
    }
    REQUIRE(store.size() <= 200);
}

TEST_CASE("ResultStore: serialization", "[result_store][persistence]") {
    ResultStore store;
    store.AddResult(ip("104.16.1.1"), {120, 45});
    store.AddResult(ip("2606:4700::6810:84e5"), {99, 300});
    store.AddResult(ip("172.64.0.9"), {120, 10});
    store.Commit();

    SECTION("Text layout") {
        REQUIRE(store.Serialize() ==
                "ip: 2606:4700::6810:84e5, server_rtt: 99, cdn_rtt: 300\n"
                "ip: 172.64.0.9, server_rtt: 120, cdn_rtt: 10\n"
                "ip: 104.16.1.1, server_rtt: 120, cdn_rtt: 45\n");
    }

    SECTION("Reload yields identical mapping and order") {
        auto reloaded = ResultStore::Deserialize(store.Serialize(), "test");
        REQUIRE(reloaded.ordered() == store.ordered());
        for (const auto& addr : store.ordered()) {
            REQUIRE(reloaded.Get(addr) == store.Get(addr));
        }
        REQUIRE_FALSE(reloaded.HasStaged());
    }

    SECTION("IPv4-mapped IPv6 keys stay IPv6 across a reload") {
        auto range = AddressRange::Parse("::ffff:1.2.3.0/120");
        REQUIRE(range);
        auto candidate = *range->GetIp(4);
        REQUIRE(candidate.is_v6());

        ResultStore mapped;
        mapped.AddResult(candidate, {10, 20});
        mapped.AddResult(ip("1.2.3.4"), {30, 40});
        mapped.Commit();

        auto reloaded = ResultStore::Deserialize(mapped.Serialize(), "test");
        REQUIRE(reloaded.size() == 2);
        REQUIRE(reloaded.ordered() == mapped.ordered());
        REQUIRE(reloaded.ordered()[0].is_v6());
        REQUIRE(*reloaded.Get(candidate) == LatencyRecord{10, 20});
        REQUIRE(*reloaded.Get(ip("1.2.3.4")) == LatencyRecord{30, 40});

        std::vector<AddressRange> ranges{*range};
        REQUIRE(EnableRangesContaining(ranges, reloaded.ordered()) == 1);
        REQUIRE(ranges[0].enabled());
    }

    SECTION("CRLF line endings and blank lines are accepted") {
        auto reloaded = ResultStore::Deserialize(
            "ip: 1.1.1.1, server_rtt: 1, cdn_rtt: 2\r\n\r\n"
            "ip: 2.2.2.2, server_rtt: 3, cdn_rtt: 4\r\n",
            "test");
        REQUIRE(reloaded.size() == 2);
        REQUIRE(*reloaded.Get(ip("2.2.2.2")) == LatencyRecord{3, 4});
    }

    SECTION("Out-of-order file is re-sorted") {
        auto reloaded = ResultStore::Deserialize(
            "ip: 1.1.1.1, server_rtt: 50, cdn_rtt: 2\n"
            "ip: 2.2.2.2, server_rtt: 3, cdn_rtt: 4\n",
            "test");
        REQUIRE(reloaded.ordered() == std::vector<asio::ip::address>{ip("2.2.2.2"), ip("1.1.1.1")});
    }
}

TEST_CASE("ResultStore: corrupt input is rejected", "[result_store][persistence]") {
    auto bad = GENERATE(as<std::string>{},
                        "ip: 1.1.1.1, server_rtt: 1\n",
                        "ip: 1.1.1.1, server_rtt: x, cdn_rtt: 2\n",
                        "ip: 1.1.1, server_rtt: 1, cdn_rtt: 2\n",
                        "1.1.1.1, server_rtt: 1, cdn_rtt: 2\n",
                        "ip: 1.1.1.1, server_rtt: -1, cdn_rtt: 2\n",
                        "ip: 1.1.1.1, server_rtt: 1, cdn_rtt: 2 extra\n");

    std::string text = "ip: 9.9.9.9, server_rtt: 1, cdn_rtt: 1\n" + bad;
    REQUIRE_THROWS_AS(ResultStore::Deserialize(text, "result.txt"), StateError);
}

TEST_CASE("ResultStore: duplicate address is rejected", "[result_store][persistence]") {
    REQUIRE_THROWS_AS(ResultStore::Deserialize("ip: 1.1.1.1, server_rtt: 1, cdn_rtt: 2\n"
                                               "ip: 1.1.1.1, server_rtt: 3, cdn_rtt: 4\n",
                                               "result.txt"),
                      StateError);
}

TEST_CASE("ResultStore: file persistence", "[result_store][persistence]") {
    auto test_dir = std::filesystem::temp_directory_path() / "cdnscan_result_store_test";
    std::filesystem::remove_all(test_dir);
    std::filesystem::create_directories(test_dir);
    auto path = test_dir / "result.txt";

    SECTION("Missing file loads as empty store") {
        auto store = ResultStore::LoadFromFile(path);
        REQUIRE(store.empty());
    }

    SECTION("Save and load") {
        ResultStore store;
        store.AddResult(ip("1.1.1.1"), {1, 2});
        store.Commit();
        REQUIRE(store.SaveToFile(path));

        auto loaded = ResultStore::LoadFromFile(path);
        REQUIRE(loaded.size() == 1);
        REQUIRE(*loaded.Get(ip("1.1.1.1")) == LatencyRecord{1, 2});
    }

    SECTION("Corrupt file is a StateError naming the file") {
        REQUIRE(cdnscan::util::atomic_write_file(path, std::string("garbage\n")));
        try {
            (void)ResultStore::LoadFromFile(path);
            FAIL("expected StateError");
        } catch (const StateError& e) {
            REQUIRE(std::string(e.what()).find("result.txt:1") != std::string::npos);
        }
    }

    std::filesystem::remove_all(test_dir);
}
