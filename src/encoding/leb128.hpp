#pragma once

// Unsigned LEB128 (Little Endian Base 128) variable-length integers.
// Frames op headers and counts in the ot-cpp binary encoding.
// Internal header — not installed.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace ot_cpp::encoding {

// Longest valid encoding of a uint64: ceil(64 / 7) bytes.
inline constexpr std::size_t max_uleb128_size = 10;

// Encode a uint64 as unsigned LEB128, appending bytes to output.
inline void encode_uleb128(std::uint64_t value, std::vector<std::byte>& output) {
    do {
        auto byte = static_cast<std::byte>(value & 0x7F);
        value >>= 7;
        if (value != 0) {
            byte |= std::byte{0x80};  // more bytes follow
        }
        output.push_back(byte);
    } while (value != 0);
}

// Decoded value + number of bytes consumed.
struct DecodeResult {
    std::uint64_t value;
    std::size_t bytes_read;
};

// Decode an unsigned LEB128 value from the front of a byte span.
// Returns nullopt if the input is truncated or the value exceeds 64 bits.
inline auto decode_uleb128(std::span<const std::byte> input) -> std::optional<DecodeResult> {
    auto value = std::uint64_t{0};

    for (std::size_t i = 0; i < input.size() && i < max_uleb128_size; ++i) {
        const auto bits = static_cast<std::uint64_t>(input[i] & std::byte{0x7F});
        // The tenth byte may only carry the top bit of the value.
        if (i == max_uleb128_size - 1 && bits > 1) return std::nullopt;

        value |= bits << (7 * i);
        if ((input[i] & std::byte{0x80}) == std::byte{0}) {
            return DecodeResult{.value = value, .bytes_read = i + 1};
        }
    }

    return std::nullopt;  // truncated or overlong
}

}  // namespace ot_cpp::encoding
