/// @file op.hpp
/// @brief The three edit primitives: Retain, Insert and Delete.

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <variant>

namespace ot_cpp {

/// Skips `count` characters at the cursor, keeping them in the output.
struct Retain {
    std::size_t count{0};  ///< Number of characters kept.

    auto operator==(const Retain&) const -> bool = default;
};

/// Inserts `text` at the cursor. Consumes nothing from the input.
struct Insert {
    std::string text;  ///< The inserted characters.

    auto operator==(const Insert&) const -> bool = default;
};

/// Removes `count` characters at the cursor.
struct Delete {
    std::size_t count{0};  ///< Number of characters removed.

    auto operator==(const Delete&) const -> bool = default;
};

/// A single edit primitive.
///
/// A closed set of alternatives; every algorithm dispatches over all three
/// with std::visit. Lengths are counted in bytes of the UTF-8 text.
using Op = std::variant<Retain, Insert, Delete>;

/// Upper bound on the base and target length of an operation. Keeps
/// len_difference() and the signed JSON form of Delete representable.
inline constexpr std::size_t max_length =
    static_cast<std::size_t>(std::numeric_limits<std::int64_t>::max());

/// Discriminator for the Op alternatives, in variant index order.
enum class OpKind : std::uint8_t {
    retain,  ///< Retain
    insert,  ///< Insert
    del,     ///< Delete
};

/// Convert an OpKind to its string representation.
constexpr auto to_string_view(OpKind kind) noexcept -> std::string_view {
    switch (kind) {
        case OpKind::retain: return "retain";
        case OpKind::insert: return "insert";
        case OpKind::del:    return "delete";
    }
    return "unknown";
}

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const Retain& r) { return r.count; },
///     [](const Insert& i) { return i.text.size(); },
///     [](const Delete& d) { return d.count; },
/// }, op);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

// -- Op properties ------------------------------------------------------------

/// Which primitive an Op holds.
inline auto kind_of(const Op& op) noexcept -> OpKind {
    return static_cast<OpKind>(op.index());
}

/// Number of characters the op covers (input for Retain/Delete,
/// output for Insert).
inline auto length(const Op& op) noexcept -> std::size_t {
    return std::visit(overload{
        [](const Retain& r) { return r.count; },
        [](const Insert& i) { return i.text.size(); },
        [](const Delete& d) { return d.count; },
    }, op);
}

/// Change in document length caused by the op.
inline auto len_difference(const Op& op) noexcept -> std::int64_t {
    return std::visit(overload{
        [](const Retain&) { return std::int64_t{0}; },
        [](const Insert& i) { return static_cast<std::int64_t>(i.text.size()); },
        [](const Delete& d) { return -static_cast<std::int64_t>(d.count); },
    }, op);
}

/// The op with its first `n` characters removed. Requires n <= length(op).
inline auto shorten(const Op& op, std::size_t n) -> Op {
    return std::visit(overload{
        [n](const Retain& r) -> Op { return Retain{r.count - n}; },
        [n](const Insert& i) -> Op { return Insert{i.text.substr(n)}; },
        [n](const Delete& d) -> Op { return Delete{d.count - n}; },
    }, op);
}

}  // namespace ot_cpp
