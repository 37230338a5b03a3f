/// @file history.hpp
/// @brief Operations over runs of TextOperations: squashing and rebasing.

#pragma once

#include <ot-cpp/text_operation.hpp>

#include <cstddef>
#include <span>

namespace ot_cpp {

/// Tuning for compose_all().
struct ComposeOptions {
    /// Runs at least this long are reduced in parallel on the shared
    /// executor. 0 disables parallel reduction.
    std::size_t parallel_threshold{64};
};

/// Compose a run of consecutive operations into one.
///
/// ops[i + 1] must apply to the output of ops[i]. The result is equal to
/// folding compose() from the left. An empty run yields the empty
/// operation.
/// @throws IncompatibleOperationError if two neighbours do not line up.
auto compose_all(std::span<const TextOperation> ops,
                 const ComposeOptions& options = {}) -> TextOperation;

/// Transform `op` over operations applied concurrently to its base.
///
/// `concurrent` is a run of consecutive operations whose first element
/// shares `op`'s base document. The returned operation applies after the
/// whole run. Each step keeps `op` on the left of transform(), so its
/// inserts win ties.
/// @throws IncompatibleOperationError if the run does not start at op's
///   base or its neighbours do not line up.
auto rebase(const TextOperation& op,
            std::span<const TextOperation> concurrent) -> TextOperation;

}  // namespace ot_cpp
