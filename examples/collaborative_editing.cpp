// collaborative_editing — a server and two clients editing one document
//
// Demonstrates: make_splice, transform, rebase against server history,
//               insert tie-breaking, JSON as the wire format

#include <ot-cpp/json.hpp>
#include <ot-cpp/ot.hpp>

#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstring>
#include <span>
#include <string>
#include <vector>

namespace ot = ot_cpp;

namespace {

// Authoritative copy: the document plus every operation applied to it.
struct Server {
    std::string doc;
    std::vector<ot::TextOperation> history;

    // Accept an operation made at `revision` and return its rebased form.
    auto receive(std::size_t revision, const ot::TextOperation& op) -> ot::TextOperation {
        const auto concurrent = std::span{history}.subspan(revision);
        auto rebased = ot::rebase(op, concurrent);
        doc = rebased.apply(doc);
        history.push_back(rebased);
        return rebased;
    }
};

// Ship an operation through its JSON wire form.
auto over_the_wire(const ot::TextOperation& op) -> ot::TextOperation {
    const auto text = nlohmann::json(op).dump();
    std::printf("  wire: %s\n", text.c_str());
    return nlohmann::json::parse(text).get<ot::TextOperation>();
}

}  // anonymous namespace

int main(int argc, char** argv) {
    if (argc > 1 && std::strcmp(argv[1], "-v") == 0) {
        spdlog::set_level(spdlog::level::debug);
    }

    auto server = Server{.doc = "Hello World", .history = {}};
    std::printf("Base document: \"%s\"\n\n", server.doc.c_str());

    // Both clients start from revision 0.
    auto alice = server.doc;
    auto bob = server.doc;
    const auto base_revision = server.history.size();

    // Alice replaces "World" with "C++23"; Bob prepends ">>> ".
    const auto alice_op = ot::make_splice(alice.size(), 6, 5, "C++23");
    const auto bob_op = ot::make_splice(bob.size(), 0, 0, ">>> ");
    alice = alice_op.apply(alice);
    bob = bob_op.apply(bob);
    std::printf("Alice locally: \"%s\"\n", alice.c_str());
    std::printf("Bob locally:   \"%s\"\n\n", bob.c_str());

    // Alice reaches the server first.
    std::printf("Server receives Alice's edit\n");
    const auto alice_applied = server.receive(base_revision, over_the_wire(alice_op));

    // Bob's edit was made before he saw Alice's.
    std::printf("Server receives Bob's edit\n");
    const auto bob_applied = server.receive(base_revision, over_the_wire(bob_op));

    // Each client applies what the server broadcast, transformed over its
    // own edit.
    bob = ot::transform(bob_op, alice_applied).b_prime.apply(bob);
    alice = bob_applied.apply(alice);

    std::printf("\nServer: \"%s\"\n", server.doc.c_str());
    std::printf("Alice:  \"%s\"\n", alice.c_str());
    std::printf("Bob:    \"%s\"\n", bob.c_str());

    // Concurrent inserts at the same spot: the first operand goes first.
    const auto left = ot::TextOperation{ot::Insert{"[A]"}, ot::Retain{server.doc.size()}};
    const auto right = ot::TextOperation{ot::Insert{"[B]"}, ot::Retain{server.doc.size()}};
    const auto right_prime = ot::transform(left, right).b_prime;
    std::printf("\nTie at offset 0: \"%s\"\n",
                ot::compose(left, right_prime).apply(server.doc).c_str());

    try {
        (void)ot::TextOperation{ot::Retain{3}}.apply(server.doc);
    } catch (const ot::IncompatibleOperationError& e) {
        std::printf("\nStale operation rejected: %s (%s)\n", e.what(),
                    std::string{ot::to_string_view(e.kind())}.c_str());
    }

    return (server.doc == alice && alice == bob) ? 0 : 1;
}
