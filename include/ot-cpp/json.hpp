/// @file json.hpp
/// @brief nlohmann/json interoperability for ot-cpp.
///
/// Ops use the compact form common to OT wire protocols: a Retain is a
/// positive integer, a Delete a negative integer and an Insert a string.
/// A TextOperation is a JSON array of ops.
///
/// @code
/// auto op = TextOperation{Retain{5}, Insert{" world"}, Delete{2}};
/// nlohmann::json j = op;             // [5, " world", -2]
/// auto back = j.get<TextOperation>();
/// @endcode

#pragma once

#include <ot-cpp/op.hpp>
#include <ot-cpp/text_operation.hpp>

#include <nlohmann/json.hpp>

namespace ot_cpp {

void to_json(nlohmann::json& j, const Retain& r);
void to_json(nlohmann::json& j, const Insert& i);
void to_json(nlohmann::json& j, const Delete& d);

// -- Op (variant) -------------------------------------------------------------

void to_json(nlohmann::json& j, const Op& op);

/// @throws std::runtime_error on zero, fractional or non-numeric,
///   non-string values.
void from_json(const nlohmann::json& j, Op& op);

// -- TextOperation ------------------------------------------------------------

void to_json(nlohmann::json& j, const TextOperation& op);

/// Ops are normalized on the way in; adjacent ops of one kind merge.
/// @throws std::runtime_error if `j` is not an array of valid ops.
void from_json(const nlohmann::json& j, TextOperation& op);

}  // namespace ot_cpp
