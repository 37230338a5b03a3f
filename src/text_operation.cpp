#include <ot-cpp/text_operation.hpp>

#include "fail.hpp"

#include <ostream>
#include <string>
#include <utility>

namespace ot_cpp {

// -- Construction -------------------------------------------------------------

TextOperation::TextOperation(std::initializer_list<Op> ops) {
    auto builder = OperationBuilder{};
    for (const auto& op : ops) builder.append(op);
    *this = std::move(builder).build();
}

TextOperation::TextOperation(const std::vector<Op>& ops) {
    auto builder = OperationBuilder{};
    for (const auto& op : ops) builder.append(op);
    *this = std::move(builder).build();
}

auto OperationBuilder::append(Op op) -> OperationBuilder& {
    const auto n = length(op);
    if (n == 0) return *this;

    // Every merged count is bounded by one of the two totals, so checking
    // the totals keeps the counts in range too.
    const auto base_grows = !std::holds_alternative<Insert>(op);
    const auto target_grows = !std::holds_alternative<Delete>(op);
    if ((base_grows && n > max_length - op_.base_length_) ||
        (target_grows && n > max_length - op_.target_length_)) {
        detail::fail(ErrorKind::length_overflow,
                     "cannot append op: operation length exceeds " +
                         std::to_string(max_length));
    }
    if (base_grows) op_.base_length_ += n;
    if (target_grows) op_.target_length_ += n;

    auto& ops = op_.ops_;
    if (!ops.empty() && ops.back().index() == op.index()) {
        std::visit(overload{
            [n](Retain& last) { last.count += n; },
            [&op](Insert& last) { last.text += std::get<Insert>(op).text; },
            [n](Delete& last) { last.count += n; },
        }, ops.back());
        return *this;
    }

    ops.push_back(std::move(op));
    return *this;
}

// -- Inspection ---------------------------------------------------------------

auto TextOperation::len_difference() const noexcept -> std::int64_t {
    return static_cast<std::int64_t>(target_length_) -
           static_cast<std::int64_t>(base_length_);
}

auto TextOperation::is_noop() const noexcept -> bool {
    // Normal form leaves at most one Retain when nothing else is present.
    return ops_.empty() ||
           (ops_.size() == 1 && std::holds_alternative<Retain>(ops_.front()));
}

// -- Apply / invert -----------------------------------------------------------

auto TextOperation::apply(std::string_view doc) const -> std::string {
    auto out = std::string{};
    out.reserve(target_length_);
    auto cursor = std::size_t{0};

    const auto advance = [&](std::size_t n) {
        if (n > doc.size() - cursor) {
            detail::fail(ErrorKind::operation_too_long,
                         "cannot apply operation: operation is too long");
        }
        cursor += n;
    };

    for (const auto& op : ops_) {
        std::visit(overload{
            [&](const Retain& r) {
                advance(r.count);
                out.append(doc.substr(cursor - r.count, r.count));
            },
            [&](const Insert& i) { out += i.text; },
            [&](const Delete& d) { advance(d.count); },
        }, op);
    }

    if (cursor != doc.size()) {
        detail::fail(ErrorKind::operation_too_short,
                     "cannot apply operation: operation is too short");
    }
    return out;
}

auto TextOperation::invert(std::string_view doc) const -> TextOperation {
    auto inverse = OperationBuilder{};
    auto cursor = std::size_t{0};

    const auto advance = [&](std::size_t n) {
        if (n > doc.size() - cursor) {
            detail::fail(ErrorKind::operation_too_long,
                         "cannot invert operation: operation is too long");
        }
        cursor += n;
    };

    for (const auto& op : ops_) {
        std::visit(overload{
            [&](const Retain& r) {
                advance(r.count);
                inverse.retain(r.count);
            },
            [&](const Insert& i) { inverse.del(i.text.size()); },
            [&](const Delete& d) {
                advance(d.count);
                inverse.insert(std::string{doc.substr(cursor - d.count, d.count)});
            },
        }, op);
    }

    if (cursor != doc.size()) {
        detail::fail(ErrorKind::operation_too_short,
                     "cannot invert operation: operation is too short");
    }
    return std::move(inverse).build();
}

auto TextOperation::compose(const TextOperation& next) const -> TextOperation {
    return ot_cpp::compose(*this, next);
}

// -- Formatting ---------------------------------------------------------------

auto to_string(const Op& op) -> std::string {
    return std::visit(overload{
        [](const Retain& r) { return "retain(" + std::to_string(r.count) + ")"; },
        [](const Insert& i) { return "insert(\"" + i.text + "\")"; },
        [](const Delete& d) { return "delete(" + std::to_string(d.count) + ")"; },
    }, op);
}

auto to_string(const TextOperation& op) -> std::string {
    auto out = std::string{"["};
    for (const auto& o : op) {
        if (out.size() > 1) out += ", ";
        out += to_string(o);
    }
    out += "]";
    return out;
}

auto operator<<(std::ostream& os, const Op& op) -> std::ostream& {
    return os << to_string(op);
}

auto operator<<(std::ostream& os, const TextOperation& op) -> std::ostream& {
    return os << to_string(op);
}

}  // namespace ot_cpp
