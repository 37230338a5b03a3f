/// @file diff.hpp
/// @brief Building TextOperations from splices and document snapshots.

#pragma once

#include <ot-cpp/text_operation.hpp>

#include <cstddef>
#include <string_view>

namespace ot_cpp {

/// An operation that deletes `delete_count` characters at `index` and
/// inserts `text` in their place, on a document of `doc_length` characters.
///
/// @code
/// auto op = make_splice(11, 5, 6, " C++23");  // "Hello World" -> "Hello C++23"
/// @endcode
/// @throws IncompatibleOperationError if index + delete_count > doc_length.
auto make_splice(std::size_t doc_length, std::size_t index,
                 std::size_t delete_count, std::string_view text) -> TextOperation;

/// An operation taking `before` to `after`.
///
/// Keeps the common prefix and suffix and replaces the middle, so the
/// result has at most one Delete and one Insert.
auto diff(std::string_view before, std::string_view after) -> TextOperation;

}  // namespace ot_cpp
