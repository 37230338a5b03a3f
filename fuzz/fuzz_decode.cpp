// Fuzz target for decode() — exercises the binary codec on arbitrary bytes.
// Any operation that decodes must survive encode() and decode again.

#include <ot-cpp/codec.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    auto op = ot_cpp::decode(span);
    if (op) {
        auto again = ot_cpp::decode(ot_cpp::encode(*op));
        if (!again || *again != *op) std::abort();
    }
    return 0;
}
