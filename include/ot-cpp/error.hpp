/// @file error.hpp
/// @brief Error types for the ot-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ot_cpp {

/// Reasons an operation cannot be applied to a document or combined
/// with another operation.
enum class ErrorKind : std::uint8_t {
    operation_too_long,    ///< The operation reaches past the end of its input.
    operation_too_short,   ///< The operation stops before the end of its input.
    base_length_mismatch,  ///< Two concurrent operations disagree on the base length.
    length_overflow,       ///< A base or target length would exceed max_length.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::operation_too_long:   return "operation_too_long";
        case ErrorKind::operation_too_short:  return "operation_too_short";
        case ErrorKind::base_length_mismatch: return "base_length_mismatch";
        case ErrorKind::length_overflow:      return "length_overflow";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Thrown when the lengths implied by an operation and a document (or a
/// second operation) do not line up.
///
/// The inputs do not belong together; retrying with the same inputs fails
/// the same way. No partial result is produced.
class IncompatibleOperationError : public std::runtime_error {
public:
    IncompatibleOperationError(ErrorKind kind, const std::string& message)
        : std::runtime_error{message}, kind_{kind} {}

    auto kind() const noexcept -> ErrorKind { return kind_; }

    /// The error as a value, for callers that store or compare failures.
    auto error() const -> Error { return Error{kind_, what()}; }

private:
    ErrorKind kind_;
};

}  // namespace ot_cpp
