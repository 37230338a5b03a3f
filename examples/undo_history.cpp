// undo_history — local undo stack, squashing, and compact encoding
//
// Demonstrates: diff, invert for undo, compose_all to squash a session,
//               the binary codec

#include <ot-cpp/ot.hpp>

#include <cstdio>
#include <string>
#include <vector>

namespace ot = ot_cpp;

int main() {
    auto doc = std::string{"The quick brown fox"};
    const auto original = doc;

    // Record a session of edits as diffs between snapshots.
    const auto snapshots = std::vector<std::string>{
        "The quick brown fox jumps",
        "The quick red fox jumps",
        "The slow red fox jumps",
        "The slow red fox jumps over the lazy dog",
    };

    auto session = std::vector<ot::TextOperation>{};
    auto undo_stack = std::vector<ot::TextOperation>{};
    for (const auto& next : snapshots) {
        auto op = ot::diff(doc, next);
        undo_stack.push_back(op.invert(doc));
        doc = op.apply(doc);
        session.push_back(std::move(op));
        std::printf("edit: %-42s %s\n", ("\"" + doc + "\"").c_str(),
                    ot::to_string(session.back()).c_str());
    }

    // Undo the last two edits.
    for (int i = 0; i < 2; ++i) {
        doc = undo_stack.back().apply(doc);
        undo_stack.pop_back();
        std::printf("undo: \"%s\"\n", doc.c_str());
    }

    // Squash the full session into one operation.
    const auto squashed = ot::compose_all(session);
    std::printf("\nsquashed: %s\n", ot::to_string(squashed).c_str());
    std::printf("squashed applied to original: \"%s\"\n", squashed.apply(original).c_str());

    // Encode it for storage or transport.
    const auto bytes = ot::encode(squashed);
    std::printf("encoded size: %zu bytes\n", bytes.size());

    const auto decoded = ot::decode(bytes);
    if (!decoded || *decoded != squashed) {
        std::printf("decode mismatch\n");
        return 1;
    }
    std::printf("decoded operation matches\n");
    return 0;
}
