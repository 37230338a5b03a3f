#pragma once

// DEFLATE compression for encoded operation bodies.
//
// Bodies at or above the caller's threshold are compressed using raw
// DEFLATE (no zlib/gzip header). The uncompressed size travels in front of
// the compressed bytes, so inflating needs a single pass into an exactly
// sized buffer.
//
// Internal header — not installed.

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include <zlib.h>

namespace ot_cpp::codec {

// Refuse to inflate bodies claiming to be larger than this.
inline constexpr std::size_t max_inflated_size = std::size_t{64} * 1024 * 1024;

// Compress data using raw DEFLATE (no zlib/gzip header).
inline auto deflate_compress(std::span<const std::byte> input)
    -> std::optional<std::vector<std::byte>> {

    if (input.empty()) return std::vector<std::byte>{};

    auto stream = z_stream{};
    // windowBits = -15 for raw deflate (negative = no header)
    auto ret = ::deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                              -15, 8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) return std::nullopt;

    auto bound = ::deflateBound(&stream, static_cast<uLong>(input.size()));
    auto output = std::vector<std::byte>(bound);

    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(bound);

    ret = ::deflate(&stream, Z_FINISH);
    ::deflateEnd(&stream);

    if (ret != Z_STREAM_END) return std::nullopt;

    output.resize(stream.total_out);
    return output;
}

// Inflate raw DEFLATE data that must expand to exactly `expected_size` bytes.
inline auto deflate_decompress(std::span<const std::byte> input, std::size_t expected_size)
    -> std::optional<std::vector<std::byte>> {

    if (expected_size > max_inflated_size) return std::nullopt;
    if (input.empty()) return std::nullopt;

    auto output = std::vector<std::byte>(expected_size);

    auto stream = z_stream{};
    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(output.size());

    auto ret = ::inflateInit2(&stream, -15);
    if (ret != Z_OK) return std::nullopt;

    ret = ::inflate(&stream, Z_FINISH);
    const auto consumed_all = stream.avail_in == 0;
    ::inflateEnd(&stream);

    if (ret != Z_STREAM_END || !consumed_all || stream.total_out != expected_size) {
        return std::nullopt;
    }
    return output;
}

}  // namespace ot_cpp::codec
