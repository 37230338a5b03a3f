// Fuzz target for the algebra — seeds a generator from the input and
// checks the invert, compose and transform laws on the result.

#include <ot-cpp/text_operation.hpp>

#include "tests/random_operation.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <random>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    auto seed = std::seed_seq(data, data + size);
    auto rng = std::mt19937{seed};

    namespace ts = ot_cpp::test_support;
    const auto doc = ts::random_string(rng, 64);
    const auto a = ts::random_operation(rng, doc);
    const auto b = ts::random_operation(rng, doc);

    if (a.invert(doc).apply(a.apply(doc)) != doc) std::abort();

    const auto [a_prime, b_prime] = ot_cpp::transform(a, b);
    if (ot_cpp::compose(a, b_prime).apply(doc) != ot_cpp::compose(b, a_prime).apply(doc)) {
        std::abort();
    }

    const auto c = ts::random_operation(rng, a.apply(doc));
    if (ot_cpp::compose(a, c).apply(doc) != c.apply(a.apply(doc))) std::abort();

    return 0;
}
