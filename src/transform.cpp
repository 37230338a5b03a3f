#include <ot-cpp/text_operation.hpp>

#include "fail.hpp"
#include "op_cursor.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace ot_cpp {

auto transform(const TextOperation& a, const TextOperation& b) -> TransformResult {
    if (a.base_length() != b.base_length()) {
        detail::fail(ErrorKind::base_length_mismatch,
                     "cannot transform operations: base lengths differ (" +
                         std::to_string(a.base_length()) + " vs " +
                         std::to_string(b.base_length()) + ")");
    }

    auto cur_a = detail::OpCursor{a};
    auto cur_b = detail::OpCursor{b};
    auto a_prime = OperationBuilder{};
    auto b_prime = OperationBuilder{};

    while (!cur_a.exhausted() || !cur_b.exhausted()) {
        // Inserts go first; on a tie the insert of `a` is placed before
        // the insert of `b`.
        if (cur_a.at(OpKind::insert)) {
            auto ins = cur_a.take_all();
            b_prime.retain(length(ins));
            a_prime.append(std::move(ins));
            continue;
        }
        if (cur_b.at(OpKind::insert)) {
            auto ins = cur_b.take_all();
            a_prime.retain(length(ins));
            b_prime.append(std::move(ins));
            continue;
        }

        // Equal base lengths mean both sides run out of Retain/Delete
        // together.
        if (cur_a.exhausted() || cur_b.exhausted()) {
            detail::fail(ErrorKind::base_length_mismatch,
                         "cannot transform operations: one operation ended early");
        }
        const auto n = std::min(cur_a.remaining(), cur_b.remaining());
        const auto piece_a = cur_a.take(n);
        const auto piece_b = cur_b.take(n);

        std::visit(overload{
            [&](const Retain&, const Retain&) {
                a_prime.retain(n);
                b_prime.retain(n);
            },
            [&](const Delete&, const Retain&) { a_prime.del(n); },
            [&](const Retain&, const Delete&) { b_prime.del(n); },
            // Both deleted the same span.
            [](const Delete&, const Delete&) {},
            // Inserts were consumed above.
            [](const auto&, const auto&) {},
        }, piece_a, piece_b);
    }

    return TransformResult{
        .a_prime = std::move(a_prime).build(),
        .b_prime = std::move(b_prime).build(),
    };
}

}  // namespace ot_cpp
