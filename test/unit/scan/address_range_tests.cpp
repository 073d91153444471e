// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for address range parsing and enumeration

#include <catch2/catch_test_macros.hpp>
#include "scan/address_range.hpp"
#include "util/errors.hpp"
#include <filesystem>
#include <stdexcept>

using namespace cdnscan;
using namespace cdnscan::scan;

namespace {

asio::ip::address ip(const char* s) {
    return asio::ip::make_address(s);
}

}  // namespace

TEST_CASE("AddressRange: parse single token", "[address_range]") {
    SECTION("IPv4") {
        auto r = AddressRange::Parse("104.16.0.0/24");
        REQUIRE(r.has_value());
        REQUIRE(r->base() == ip("104.16.0.0"));
        REQUIRE(r->prefix_length() == 24);
        REQUIRE(r->capacity() == 256);
        REQUIRE_FALSE(r->enabled());
    }

    SECTION("Host bits are masked") {
        auto r = AddressRange::Parse("192.167.3.3/24");
        REQUIRE(r.has_value());
        REQUIRE(r->ToString() == "192.167.3.0/24");
    }

    SECTION("IPv6") {
        auto r = AddressRange::Parse("2606:4700::1/120");
        REQUIRE(r.has_value());
        REQUIRE(r->base() == ip("2606:4700::"));
        REQUIRE(r->capacity() == 256);
        REQUIRE(r->address_bits() == 128);
    }

    SECTION("Malformed tokens") {
        REQUIRE_FALSE(AddressRange::Parse("256.1.1.1/24").has_value());
        REQUIRE_FALSE(AddressRange::Parse("1.1.1.1/33").has_value());
        REQUIRE_FALSE(AddressRange::Parse("1.1.1.1").has_value());
        REQUIRE_FALSE(AddressRange::Parse("1.1.1.1/").has_value());
        REQUIRE_FALSE(AddressRange::Parse("/24").has_value());
        REQUIRE_FALSE(AddressRange::Parse("2606::/129").has_value());
    }

    SECTION("Constructor rejects over-long prefix") {
        REQUIRE_THROWS_AS(AddressRange(ip("1.2.3.4"), 33), std::invalid_argument);
    }
}

TEST_CASE("AddressRange: capacity and GetIp", "[address_range]") {
    SECTION("/32 holds one address") {
        AddressRange r(ip("1.2.3.4"), 32);
        REQUIRE(r.capacity() == 1);
        REQUIRE(r.GetIp(0) == std::optional<asio::ip::address>(ip("1.2.3.4")));
        REQUIRE_FALSE(r.GetIp(1).has_value());
    }

    SECTION("IPv4 offsets carry across octets") {
        AddressRange r(ip("10.0.0.0"), 16);
        REQUIRE(r.capacity() == 65536);
        REQUIRE(r.GetIp(0) == std::optional<asio::ip::address>(ip("10.0.0.0")));
        REQUIRE(r.GetIp(256) == std::optional<asio::ip::address>(ip("10.0.1.0")));
        REQUIRE(r.GetIp(65535) == std::optional<asio::ip::address>(ip("10.0.255.255")));
        REQUIRE_FALSE(r.GetIp(65536).has_value());
    }

    SECTION("IPv6 offsets use 128-bit arithmetic") {
        AddressRange r(ip("2001:db8::"), 96);
        REQUIRE(r.capacity() == (uint64_t{1} << 32));
        REQUIRE(r.GetIp(0x1ff) == std::optional<asio::ip::address>(ip("2001:db8::1ff")));
        REQUIRE(r.GetIp(0xffffffff) == std::optional<asio::ip::address>(ip("2001:db8::ffff:ffff")));
        REQUIRE_FALSE(r.GetIp(uint64_t{1} << 32).has_value());
    }

    SECTION("Short IPv6 prefix saturates capacity") {
        AddressRange r(ip("2400::"), 32);
        REQUIRE(r.capacity() == UINT64_MAX);
        REQUIRE(r.GetIp(uint64_t{1} << 40) == std::optional<asio::ip::address>(ip("2400::100:0:0")));
    }

    SECTION("Contains") {
        AddressRange r(ip("104.16.0.0"), 13);
        REQUIRE(r.Contains(ip("104.23.255.1")));
        REQUIRE_FALSE(r.Contains(ip("104.24.0.0")));
        REQUIRE_FALSE(r.Contains(ip("2606:4700::1")));
    }
}

TEST_CASE("AddressRangeParser: free-form text", "[address_range][parser]") {
    AddressRangeParser parser;

    SECTION("Extracts tokens from surrounding text in order") {
        auto ranges = parser.Parse(
            "# cloudflare\n"
            "173.245.48.0/20 some comment\n"
            "route 103.21.244.0/22 via edge, 2400:cb00::/32\n");
        REQUIRE(ranges.size() == 3);
        REQUIRE(ranges[0].ToString() == "173.245.48.0/20");
        REQUIRE(ranges[1].ToString() == "103.21.244.0/22");
        REQUIRE(ranges[2].ToString() == "2400:cb00::/32");
    }

    SECTION("Malformed tokens are skipped, the rest is kept") {
        auto ranges = parser.Parse("999.1.1.1/24 1.1.1.0/24 2.2.2.2/40 3.3.3.0/24");
        REQUIRE(ranges.size() == 2);
        REQUIRE(ranges[0].ToString() == "1.1.1.0/24");
        REQUIRE(ranges[1].ToString() == "3.3.3.0/24");
    }

    SECTION("Duplicates collapse to their first appearance") {
        auto ranges = parser.Parse("5.5.5.0/24\n1.1.1.0/24\n5.5.5.9/24\n1.1.1.0/24\n");
        REQUIRE(ranges.size() == 2);
        REQUIRE(ranges[0].ToString() == "5.5.5.0/24");
        REQUIRE(ranges[1].ToString() == "1.1.1.0/24");
    }

    SECTION("Same base with different prefix is a different range") {
        auto ranges = parser.Parse("1.1.1.0/24 1.1.1.0/25");
        REQUIRE(ranges.size() == 2);
    }

    SECTION("Empty input") {
        REQUIRE(parser.Parse("").empty());
        REQUIRE(parser.Parse("no ranges here").empty());
    }

    SECTION("Missing file is a StateError") {
        auto missing = std::filesystem::temp_directory_path() / "cdnscan_no_such_ip_file.txt";
        std::filesystem::remove(missing);
        REQUIRE_THROWS_AS(parser.LoadFile(missing), StateError);
    }
}

TEST_CASE("ComputeMaxOffset", "[address_range]") {
    std::vector<AddressRange> ranges{AddressRange(ip("1.1.1.0"), 24), AddressRange(ip("2.2.0.0"), 20)};
    REQUIRE(ComputeMaxOffset(ranges, 1000000) == 4096);
    REQUIRE(ComputeMaxOffset(ranges, 100) == 100);
    REQUIRE(ComputeMaxOffset({}, 100) == 0);
}

TEST_CASE("EnableRangesContaining", "[address_range]") {
    std::vector<AddressRange> ranges{
        AddressRange(ip("1.1.1.0"), 24),
        AddressRange(ip("2.2.2.0"), 24),
        AddressRange(ip("1.1.0.0"), 16),
        AddressRange(ip("2606:4700::"), 32),
    };

    auto n = EnableRangesContaining(ranges, {ip("1.1.1.7"), ip("2606:4700:10::1"), ip("9.9.9.9")});
    REQUIRE(n == 3);
    REQUIRE(ranges[0].enabled());
    REQUIRE_FALSE(ranges[1].enabled());
    REQUIRE(ranges[2].enabled());
    REQUIRE(ranges[3].enabled());

    // Already enabled ranges are not counted again
    REQUIRE(EnableRangesContaining(ranges, {ip("1.1.1.8")}) == 0);
}
