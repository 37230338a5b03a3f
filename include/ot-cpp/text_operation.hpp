/// @file text_operation.hpp
/// @brief TextOperation, its builder, and the compose/transform algebra.

#pragma once

#include <ot-cpp/error.hpp>
#include <ot-cpp/op.hpp>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iosfwd>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ot_cpp {

class OperationBuilder;

/// An edit script taking one revision of a plain-text document to the next.
///
/// A TextOperation is a sequence of Retain, Insert and Delete ops walked
/// left to right over the document. It is always in normal form: no two
/// adjacent ops are of the same kind and no op is empty. Instances are
/// immutable; use OperationBuilder (or the list constructors, which
/// normalize) to create them.
///
/// @code
/// auto op = OperationBuilder{}.retain(5).insert(" world").build();
/// auto doc = op.apply("hello");  // "hello world"
/// @endcode
class TextOperation {
public:
    /// The empty operation. Applies only to the empty document.
    TextOperation() = default;

    /// Build from a list of ops, merging neighbours and dropping empty ops.
    TextOperation(std::initializer_list<Op> ops);

    /// Build from a vector of ops, merging neighbours and dropping empty ops.
    explicit TextOperation(const std::vector<Op>& ops);

    // -- Inspection -----------------------------------------------------------

    auto ops() const noexcept -> std::span<const Op> { return ops_; }
    auto begin() const noexcept { return ops_.begin(); }
    auto end() const noexcept { return ops_.end(); }
    auto size() const noexcept -> std::size_t { return ops_.size(); }
    auto empty() const noexcept -> bool { return ops_.empty(); }

    /// Length of the document this operation applies to.
    auto base_length() const noexcept -> std::size_t { return base_length_; }

    /// Length of the document this operation produces.
    auto target_length() const noexcept -> std::size_t { return target_length_; }

    /// target_length() - base_length().
    auto len_difference() const noexcept -> std::int64_t;

    /// True if applying the operation leaves every document unchanged.
    auto is_noop() const noexcept -> bool;

    // -- Algebra --------------------------------------------------------------

    /// Apply to a document, returning the edited document.
    /// @throws IncompatibleOperationError if base_length() != doc.size().
    auto apply(std::string_view doc) const -> std::string;

    /// The operation that undoes this one.
    ///
    /// `doc` is the document *before* this operation; deleted text is read
    /// back from it. invert(doc).apply(apply(doc)) == doc.
    /// @throws IncompatibleOperationError if base_length() != doc.size().
    auto invert(std::string_view doc) const -> TextOperation;

    /// Equivalent to ot_cpp::compose(*this, next).
    auto compose(const TextOperation& next) const -> TextOperation;

    auto operator==(const TextOperation& other) const -> bool {
        return ops_ == other.ops_;
    }

private:
    friend class OperationBuilder;

    std::vector<Op> ops_;
    std::size_t base_length_{0};
    std::size_t target_length_{0};
};

/// Accumulates ops into a normalized TextOperation.
///
/// Appending an op of the same kind as the last one merges the two;
/// appending an empty op does nothing.
class OperationBuilder {
public:
    OperationBuilder() = default;

    /// Start from an existing operation and keep appending to it.
    explicit OperationBuilder(TextOperation base) : op_{std::move(base)} {}

    /// Append an op, merging it into the last op when the kinds match.
    auto append(Op op) -> OperationBuilder&;

    auto retain(std::size_t count) -> OperationBuilder& { return append(Retain{count}); }
    auto insert(std::string text) -> OperationBuilder& { return append(Insert{std::move(text)}); }
    auto del(std::size_t count) -> OperationBuilder& { return append(Delete{count}); }

    /// Number of ops appended so far (after merging).
    auto size() const noexcept -> std::size_t { return op_.size(); }

    /// Finish, moving the accumulated operation out.
    auto build() && -> TextOperation { return std::move(op_); }

    /// Finish, copying the accumulated operation.
    auto build() const& -> TextOperation { return op_; }

private:
    TextOperation op_;
};

/// The result of transforming two concurrent operations.
struct TransformResult {
    TextOperation a_prime;  ///< A, rewritten to apply after B.
    TextOperation b_prime;  ///< B, rewritten to apply after A.

    auto operator==(const TransformResult&) const -> bool = default;
};

/// Combine two consecutive operations into one with the same effect.
///
/// `second` must apply to the output of `first`.
/// @throws IncompatibleOperationError if first.target_length() differs
///   from second.base_length().
auto compose(const TextOperation& first, const TextOperation& second) -> TextOperation;

/// Reconcile two concurrent operations made against the same document.
///
/// Returns (A', B') such that compose(a, B') and compose(b, A') yield the
/// same document. When both insert at the same position, the text of `a`
/// ends up before the text of `b`.
/// @throws IncompatibleOperationError if a and b disagree on base_length().
auto transform(const TextOperation& a, const TextOperation& b) -> TransformResult;

/// Human-readable rendering, e.g. `[retain(5), insert(" world")]`.
auto to_string(const Op& op) -> std::string;
auto to_string(const TextOperation& op) -> std::string;

auto operator<<(std::ostream& os, const Op& op) -> std::ostream&;
auto operator<<(std::ostream& os, const TextOperation& op) -> std::ostream&;

}  // namespace ot_cpp
