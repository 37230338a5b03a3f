/// @file ot.hpp
/// @brief Umbrella header for the ot-cpp library.
///
/// Include this single header for the whole public API: Op,
/// TextOperation, OperationBuilder, compose/transform, splices and
/// diffs, history helpers, the binary codec, and Error.
/// JSON support lives in <ot-cpp/json.hpp> so that nlohmann/json is only
/// pulled in where it is used.

#pragma once

#include <ot-cpp/codec.hpp>
#include <ot-cpp/diff.hpp>
#include <ot-cpp/error.hpp>
#include <ot-cpp/history.hpp>
#include <ot-cpp/op.hpp>
#include <ot-cpp/text_operation.hpp>
