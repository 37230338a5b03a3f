/// @file codec.hpp
/// @brief Compact binary encoding of TextOperations.
///
/// Layout: one flag byte, then the body either as-is (flag 0) or as
/// uleb128(body size) followed by the raw-DEFLATE body (flag 1). The body
/// is uleb128(op count) and, per op, uleb128(length << 2 | tag) with tag
/// 0 = retain, 1 = insert, 2 = delete; an insert is followed by its text.

#pragma once

#include <ot-cpp/text_operation.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace ot_cpp {

/// Tuning for encode().
struct EncodeOptions {
    bool compress{true};                  ///< Allow DEFLATE for large bodies.
    std::size_t deflate_threshold{256};   ///< Smallest body worth compressing.
};

/// Serialize an operation. Compressed output is used only when it is
/// smaller than the plain body.
auto encode(const TextOperation& op, const EncodeOptions& options = {})
    -> std::vector<std::byte>;

/// Parse an operation produced by encode().
///
/// Adjacent ops of one kind are merged. Returns nullopt on an unknown flag
/// or tag, a zero-length op, truncated or trailing bytes, or a body that
/// fails to inflate.
auto decode(std::span<const std::byte> data) -> std::optional<TextOperation>;

}  // namespace ot_cpp
