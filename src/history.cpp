#include <ot-cpp/history.hpp>

#include <spdlog/spdlog.h>
#include <taskflow/taskflow.hpp>

#include <exception>
#include <utility>
#include <vector>

namespace ot_cpp {

namespace {

// Shared by every compose_all() call that crosses the parallel threshold.
// Sized to the hardware; created on first use.
auto reduction_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

auto compose_sequential(std::span<const TextOperation> ops) -> TextOperation {
    auto result = ops.front();
    for (const auto& op : ops.subspan(1)) {
        result = compose(result, op);
    }
    return result;
}

// Compose neighbours pairwise until one operation is left. Each level
// halves the run; an odd tail is carried over unchanged.
auto compose_parallel(std::span<const TextOperation> ops) -> TextOperation {
    auto level = std::vector<TextOperation>(ops.begin(), ops.end());
    auto& executor = reduction_executor();

    while (level.size() > 1) {
        const auto pairs = level.size() / 2;
        auto next = std::vector<TextOperation>(pairs + level.size() % 2);
        auto errors = std::vector<std::exception_ptr>(pairs);

        spdlog::trace("ot-cpp: compose_all level of {} ops, {} pairs", level.size(), pairs);

        auto taskflow = tf::Taskflow{};
        for (std::size_t i = 0; i < pairs; ++i) {
            taskflow.emplace([&level, &next, &errors, i] {
                try {
                    next[i] = compose(level[2 * i], level[2 * i + 1]);
                } catch (...) {
                    errors[i] = std::current_exception();
                }
            });
        }
        executor.run(taskflow).wait();

        for (const auto& error : errors) {
            if (error) std::rethrow_exception(error);
        }
        if (level.size() % 2 == 1) {
            next.back() = std::move(level.back());
        }
        level = std::move(next);
    }

    return std::move(level.front());
}

}  // anonymous namespace

auto compose_all(std::span<const TextOperation> ops,
                 const ComposeOptions& options) -> TextOperation {
    if (ops.empty()) return TextOperation{};
    if (options.parallel_threshold == 0 || ops.size() < options.parallel_threshold) {
        return compose_sequential(ops);
    }
    return compose_parallel(ops);
}

auto rebase(const TextOperation& op,
            std::span<const TextOperation> concurrent) -> TextOperation {
    auto result = op;
    for (const auto& other : concurrent) {
        result = transform(result, other).a_prime;
    }
    return result;
}

}  // namespace ot_cpp
