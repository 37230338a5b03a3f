#include <ot-cpp/diff.hpp>

#include "fail.hpp"

#include <algorithm>
#include <string>

namespace ot_cpp {

auto make_splice(std::size_t doc_length, std::size_t index,
                 std::size_t delete_count, std::string_view text) -> TextOperation {
    if (index > doc_length || delete_count > doc_length - index) {
        detail::fail(ErrorKind::operation_too_long,
                     "cannot splice: range [" + std::to_string(index) + ", " +
                         std::to_string(index + delete_count) +
                         ") exceeds document length " + std::to_string(doc_length));
    }

    return OperationBuilder{}
        .retain(index)
        .del(delete_count)
        .insert(std::string{text})
        .retain(doc_length - index - delete_count)
        .build();
}

auto diff(std::string_view before, std::string_view after) -> TextOperation {
    const auto limit = std::min(before.size(), after.size());

    auto prefix = std::size_t{0};
    while (prefix < limit && before[prefix] == after[prefix]) ++prefix;

    // The suffix may not overlap the prefix on either side.
    auto suffix = std::size_t{0};
    while (suffix < limit - prefix &&
           before[before.size() - 1 - suffix] == after[after.size() - 1 - suffix]) {
        ++suffix;
    }

    return OperationBuilder{}
        .retain(prefix)
        .del(before.size() - prefix - suffix)
        .insert(std::string{after.substr(prefix, after.size() - prefix - suffix)})
        .retain(suffix)
        .build();
}

}  // namespace ot_cpp
