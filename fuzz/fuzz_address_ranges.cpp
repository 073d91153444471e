// Fuzz target for address source parsing
// Tests AddressRangeParser::Parse, AddressRange::Parse and GetIp
//
// The address source is scraped, third-party text. Bugs can cause:
// - Crashes on malformed tokens (prefix overflow, bad address text)
// - Ranges that do not contain their own addresses
// - Duplicate ranges (the same block probed twice per offset)
//
// Target code:
// - src/scan/address_range.cpp

#include "scan/address_range.hpp"
#include <cstddef>
#include <cstdint>
#include <set>
#include <string>

using namespace cdnscan::scan;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    static const AddressRangeParser parser;
    std::string text(reinterpret_cast<const char*>(data), size);

    auto ranges = parser.Parse(text);

    std::set<std::string> seen;
    for (const auto& range : ranges) {
        // Parsed ranges must be duplicate-free
        if (!seen.insert(range.ToString()).second) {
            __builtin_trap();
        }

        // ToString() must parse back to the same range
        auto reparsed = AddressRange::Parse(range.ToString());
        if (!reparsed || !(*reparsed == range)) {
            __builtin_trap();
        }

        // First and last address belong to the range, one past the end does not exist
        uint64_t cap = range.capacity();
        auto first = range.GetIp(0);
        if (!first || !range.Contains(*first)) {
            __builtin_trap();
        }
        if (cap != UINT64_MAX) {
            auto last = range.GetIp(cap - 1);
            if (!last || !range.Contains(*last)) {
                __builtin_trap();
            }
            if (range.GetIp(cap).has_value()) {
                __builtin_trap();
            }
        }
    }

    return 0;
}
