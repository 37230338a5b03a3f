#include <ot-cpp/text_operation.hpp>

#include "fail.hpp"
#include "op_cursor.hpp"

#include <algorithm>
#include <utility>

namespace ot_cpp {

auto compose(const TextOperation& first, const TextOperation& second) -> TextOperation {
    auto a = detail::OpCursor{first};
    auto b = detail::OpCursor{second};
    auto result = OperationBuilder{};

    while (!a.exhausted() || !b.exhausted()) {
        // Text deleted by `first` never reaches `second`.
        if (a.at(OpKind::del)) {
            result.append(a.take_all());
            continue;
        }
        // Text inserted by `second` never existed for `first`.
        if (b.at(OpKind::insert)) {
            result.append(b.take_all());
            continue;
        }

        if (a.exhausted()) {
            detail::fail(ErrorKind::operation_too_short,
                         "cannot compose operations: first operation is too short");
        }
        if (b.exhausted()) {
            detail::fail(ErrorKind::operation_too_long,
                         "cannot compose operations: first operation is too long");
        }

        const auto n = std::min(a.remaining(), b.remaining());
        auto piece_a = a.take(n);
        auto piece_b = b.take(n);

        std::visit(overload{
            [&](const Retain&, const Retain&) { result.retain(n); },
            [&](Insert& ins, const Retain&) { result.insert(std::move(ins.text)); },
            [&](const Retain&, const Delete&) { result.del(n); },
            // `second` deletes exactly what `first` inserted.
            [](const Insert&, const Delete&) {},
            // Delete on the left and Insert on the right were consumed above.
            [](const auto&, const auto&) {},
        }, piece_a, piece_b);
    }

    return std::move(result).build();
}

}  // namespace ot_cpp
