#pragma once

// Internal header — not installed.
// Raise an IncompatibleOperationError, leaving a debug trace first.

#include <ot-cpp/error.hpp>

#include <spdlog/spdlog.h>

#include <string>

namespace ot_cpp::detail {

[[noreturn]] inline void fail(ErrorKind kind, const std::string& message) {
    spdlog::debug("ot-cpp: {} ({})", message, to_string_view(kind));
    throw IncompatibleOperationError{kind, message};
}

}  // namespace ot_cpp::detail
