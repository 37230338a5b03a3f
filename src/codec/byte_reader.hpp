#pragma once

// Bounds-checked cursor over an encoded operation.
// Every read returns nullopt instead of running past the end.
// Internal header — not installed.

#include "../encoding/leb128.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace ot_cpp::codec {

class ByteReader {
public:
    explicit ByteReader(std::span<const std::byte> data) : data_{data} {}

    auto remaining() const -> std::size_t { return data_.size() - pos_; }
    auto at_end() const -> bool { return pos_ >= data_.size(); }

    auto read_u8() -> std::optional<std::uint8_t> {
        if (at_end()) return std::nullopt;
        return static_cast<std::uint8_t>(data_[pos_++]);
    }

    auto read_uleb128() -> std::optional<std::uint64_t> {
        auto result = encoding::decode_uleb128(data_.subspan(pos_));
        if (!result) return std::nullopt;
        pos_ += result->bytes_read;
        return result->value;
    }

    auto read_bytes(std::size_t n) -> std::optional<std::span<const std::byte>> {
        if (n > remaining()) return std::nullopt;
        auto result = data_.subspan(pos_, n);
        pos_ += n;
        return result;
    }

    auto read_text(std::size_t n) -> std::optional<std::string> {
        auto bytes = read_bytes(n);
        if (!bytes) return std::nullopt;
        return std::string{reinterpret_cast<const char*>(bytes->data()), bytes->size()};
    }

    // Everything not read yet.
    auto rest() const -> std::span<const std::byte> { return data_.subspan(pos_); }

private:
    std::span<const std::byte> data_;
    std::size_t pos_{0};
};

}  // namespace ot_cpp::codec
