#pragma once

// Internal header — not installed.
// Cursor over a TextOperation that can consume an op part-way.
// Shared by compose() and transform(), which walk two operations in step.

#include <ot-cpp/op.hpp>
#include <ot-cpp/text_operation.hpp>

#include <cstddef>
#include <span>
#include <variant>

namespace ot_cpp::detail {

class OpCursor {
public:
    explicit OpCursor(const TextOperation& op) noexcept : ops_{op.ops()} {}

    auto exhausted() const noexcept -> bool { return index_ >= ops_.size(); }

    // Kind of the current op. Requires !exhausted().
    auto kind() const noexcept -> OpKind { return kind_of(ops_[index_]); }

    // True if there is a current op and it has the given kind.
    auto at(OpKind k) const noexcept -> bool { return !exhausted() && kind() == k; }

    // Units of the current op not consumed yet. Requires !exhausted().
    auto remaining() const noexcept -> std::size_t {
        return length(ops_[index_]) - offset_;
    }

    // Consume the next n units of the current op and return them as an op.
    // Requires 0 < n <= remaining().
    auto take(std::size_t n) -> Op {
        auto piece = std::visit(overload{
            [n](const Retain&) -> Op { return Retain{n}; },
            [this, n](const Insert& i) -> Op { return Insert{i.text.substr(offset_, n)}; },
            [n](const Delete&) -> Op { return Delete{n}; },
        }, ops_[index_]);

        offset_ += n;
        if (offset_ == length(ops_[index_])) {
            ++index_;
            offset_ = 0;
        }
        return piece;
    }

    // Consume whatever is left of the current op.
    auto take_all() -> Op { return take(remaining()); }

private:
    std::span<const Op> ops_;
    std::size_t index_{0};
    std::size_t offset_{0};
};

}  // namespace ot_cpp::detail
