// Fuzz target for probe response handling
// Tests ParseHttpResponse and ParsedUrl::Parse
//
// Responses come from arbitrary hosts on the internet (every candidate
// address is untrusted). Bugs can cause:
// - Out-of-bounds reads on truncated headers or chunk framing
// - Bodies larger than the response they were decoded from
//
// Target code:
// - src/probe/http_probe.cpp (ParseHttpResponse, DecodeChunked)
// - src/probe/url.cpp

#include "probe/http_probe.hpp"
#include "probe/url.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

using namespace cdnscan::probe;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size < 1) return 0;

    uint8_t mode = data[0];
    std::string text(reinterpret_cast<const char*>(data + 1), size - 1);

    if ((mode & 0x01) == 0) {
        std::string body;
        auto state = ParseHttpResponse(text, (mode & 0x02) != 0, body);
        if (state == HttpParseState::Complete && body.size() > text.size()) {
            __builtin_trap();
        }
        // Parsing must not depend on previous calls
        std::string body2;
        if (ParseHttpResponse(text, (mode & 0x02) != 0, body2) != state) {
            __builtin_trap();
        }
    } else {
        auto url = ParsedUrl::Parse(text);
        if (url) {
            if (url->target.empty() || url->target[0] != '/' || url->host.empty() || url->port == 0) {
                __builtin_trap();
            }
            // Canonical form is a fixed point
            auto again = ParsedUrl::Parse(url->ToString());
            if (!again || again->ToString() != url->ToString()) {
                __builtin_trap();
            }
        }
    }

    return 0;
}
