// Fuzz target for result file loading
// Tests ResultStore::Deserialize and the sorted-index invariant
//
// The result file is user-editable. A corrupt file must be rejected with
// StateError, never crash or yield an unsorted index.
//
// Target code:
// - src/scan/result_store.cpp (Deserialize, Commit, Serialize)

#include "scan/result_store.hpp"
#include "util/errors.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

using namespace cdnscan;
using namespace cdnscan::scan;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    std::string text(reinterpret_cast<const char*>(data), size);

    ResultStore store;
    try {
        store = ResultStore::Deserialize(text, "<fuzz>");
    } catch (const StateError&) {
        return 0;
    }

    const auto& ordered = store.ordered();
    if (ordered.size() != store.size()) {
        __builtin_trap();
    }
    for (size_t i = 1; i < ordered.size(); ++i) {
        if (*store.Get(ordered[i]) < *store.Get(ordered[i - 1])) {
            __builtin_trap();
        }
    }

    // Serialized output must load back to the same order
    ResultStore again;
    try {
        again = ResultStore::Deserialize(store.Serialize(), "<fuzz>");
    } catch (const StateError&) {
        __builtin_trap();
    }
    if (again.ordered() != ordered) {
        __builtin_trap();
    }

    return 0;
}
