#include <ot-cpp/text_operation.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace ot_cpp;

TEST(Compose, delete_then_append) {
    const auto a = TextOperation{Retain{2}, Delete{3}};
    const auto b = TextOperation{Retain{2}, Insert{"!"}};

    const auto ab = compose(a, b);
    EXPECT_EQ(ab, (TextOperation{Retain{2}, Delete{3}, Insert{"!"}}));
    EXPECT_EQ(ab.apply("hello"), "he!");
    EXPECT_EQ(b.apply(a.apply("hello")), "he!");
}

TEST(Compose, member_matches_free_function) {
    const auto a = TextOperation{Retain{5}, Insert{" world"}};
    const auto b = TextOperation{Delete{1}, Retain{10}};
    EXPECT_EQ(a.compose(b), compose(a, b));
}

TEST(Compose, retain_over_insert_keeps_inserted_text) {
    const auto a = TextOperation{Retain{1}, Insert{"abc"}, Retain{1}};
    const auto b = TextOperation{Retain{5}};
    EXPECT_EQ(compose(a, b), a);
}

TEST(Compose, delete_of_inserted_text_cancels) {
    const auto a = TextOperation{Insert{"abc"}};
    const auto b = TextOperation{Delete{3}};
    EXPECT_TRUE(compose(a, b).empty());
}

TEST(Compose, partial_delete_of_inserted_text) {
    const auto a = TextOperation{Retain{1}, Insert{"abcd"}, Retain{1}};
    const auto b = TextOperation{Retain{2}, Delete{2}, Retain{2}};

    const auto ab = compose(a, b);
    EXPECT_EQ(ab, (TextOperation{Retain{1}, Insert{"ad"}, Retain{1}}));
    EXPECT_EQ(ab.apply("xy"), "xady");
}

TEST(Compose, deletes_on_both_sides_accumulate) {
    const auto a = TextOperation{Delete{2}, Retain{3}};
    const auto b = TextOperation{Delete{1}, Retain{2}};

    const auto ab = compose(a, b);
    EXPECT_EQ(ab, (TextOperation{Delete{3}, Retain{2}}));
    EXPECT_EQ(ab.apply("hello"), "lo");
}

TEST(Compose, lengths_chain_through) {
    const auto a = TextOperation{Retain{3}, Insert{"xx"}};
    const auto b = TextOperation{Delete{2}, Retain{3}, Insert{"y"}};

    const auto ab = compose(a, b);
    EXPECT_EQ(ab.base_length(), a.base_length());
    EXPECT_EQ(ab.target_length(), b.target_length());
}

TEST(Compose, empty_operations) {
    EXPECT_TRUE(compose(TextOperation{}, TextOperation{}).empty());
    EXPECT_EQ(compose(TextOperation{}, TextOperation{Insert{"a"}}), TextOperation{Insert{"a"}});
}

TEST(Compose, first_too_long_throws) {
    try {
        (void)compose(TextOperation{Retain{3}}, TextOperation{Retain{2}});
        FAIL() << "expected IncompatibleOperationError";
    } catch (const IncompatibleOperationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::operation_too_long);
        EXPECT_EQ(std::string{e.what()},
                  "cannot compose operations: first operation is too long");
    }
}

TEST(Compose, first_too_short_throws) {
    try {
        (void)compose(TextOperation{Retain{2}}, TextOperation{Retain{3}});
        FAIL() << "expected IncompatibleOperationError";
    } catch (const IncompatibleOperationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::operation_too_short);
        EXPECT_EQ(std::string{e.what()},
                  "cannot compose operations: first operation is too short");
    }
}

TEST(Compose, trailing_insert_of_second_is_allowed_after_first_ends) {
    const auto a = TextOperation{Delete{2}};
    const auto b = TextOperation{Insert{"new"}};
    const auto ab = compose(a, b);
    EXPECT_EQ(ab, (TextOperation{Delete{2}, Insert{"new"}}));
    EXPECT_EQ(ab.apply("ab"), "new");
}
