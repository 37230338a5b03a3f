// ot-cpp benchmarks — measures throughput of the core algebra.

#include <ot-cpp/json.hpp>
#include <ot-cpp/ot.hpp>

#include "../tests/random_operation.hpp"

#include <benchmark/benchmark.h>

#include <random>
#include <string>
#include <vector>

using namespace ot_cpp;

namespace {

auto make_doc(std::mt19937& rng, std::size_t size) -> std::string {
    auto doc = std::string{};
    while (doc.size() < size) doc += test_support::random_string(rng, 64);
    doc.resize(size);
    return doc;
}

}  // anonymous namespace

// =============================================================================
// Single-operation algebra
// =============================================================================

static void bm_apply(benchmark::State& state) {
    auto rng = std::mt19937{1};
    const auto doc = make_doc(rng, static_cast<std::size_t>(state.range(0)));
    const auto op = test_support::random_operation(rng, doc);
    for (auto _ : state) {
        auto out = op.apply(doc);
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * doc.size()));
}
BENCHMARK(bm_apply)->Range(64, 64 << 10);

static void bm_invert(benchmark::State& state) {
    auto rng = std::mt19937{2};
    const auto doc = make_doc(rng, static_cast<std::size_t>(state.range(0)));
    const auto op = test_support::random_operation(rng, doc);
    for (auto _ : state) {
        auto inverse = op.invert(doc);
        benchmark::DoNotOptimize(inverse);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_invert)->Range(64, 64 << 10);

static void bm_compose(benchmark::State& state) {
    auto rng = std::mt19937{3};
    const auto doc = make_doc(rng, static_cast<std::size_t>(state.range(0)));
    const auto a = test_support::random_operation(rng, doc);
    const auto b = test_support::random_operation(rng, a.apply(doc));
    for (auto _ : state) {
        auto ab = compose(a, b);
        benchmark::DoNotOptimize(ab);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_compose)->Range(64, 64 << 10);

static void bm_transform(benchmark::State& state) {
    auto rng = std::mt19937{4};
    const auto doc = make_doc(rng, static_cast<std::size_t>(state.range(0)));
    const auto a = test_support::random_operation(rng, doc);
    const auto b = test_support::random_operation(rng, doc);
    for (auto _ : state) {
        auto result = transform(a, b);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_transform)->Range(64, 64 << 10);

// =============================================================================
// History
// =============================================================================

static void bm_compose_all(benchmark::State& state) {
    auto rng = std::mt19937{5};
    auto doc = make_doc(rng, 4096);
    auto ops = std::vector<TextOperation>{};
    for (std::int64_t i = 0; i < state.range(0); ++i) {
        ops.push_back(test_support::random_operation(rng, doc));
        doc = ops.back().apply(doc);
    }
    const auto options = ComposeOptions{.parallel_threshold = static_cast<std::size_t>(state.range(1))};
    for (auto _ : state) {
        auto squashed = compose_all(ops, options);
        benchmark::DoNotOptimize(squashed);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_compose_all)
    ->Args({256, 0})
    ->Args({256, 64})
    ->Args({2048, 0})
    ->Args({2048, 64});

// =============================================================================
// Interchange
// =============================================================================

static void bm_encode_decode(benchmark::State& state) {
    auto rng = std::mt19937{6};
    const auto doc = make_doc(rng, static_cast<std::size_t>(state.range(0)));
    const auto op = test_support::random_operation(rng, doc);
    for (auto _ : state) {
        auto decoded = decode(encode(op));
        benchmark::DoNotOptimize(decoded);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_encode_decode)->Range(64, 64 << 10);

static void bm_json_round_trip(benchmark::State& state) {
    auto rng = std::mt19937{7};
    const auto doc = make_doc(rng, static_cast<std::size_t>(state.range(0)));
    const auto op = test_support::random_operation(rng, doc);
    for (auto _ : state) {
        auto text = nlohmann::json(op).dump();
        auto back = nlohmann::json::parse(text).get<TextOperation>();
        benchmark::DoNotOptimize(back);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_json_round_trip)->Range(64, 64 << 10);
