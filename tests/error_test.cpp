#include <ot-cpp/error.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace ot_cpp;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::operation_too_long),   "operation_too_long");
    EXPECT_EQ(to_string_view(ErrorKind::operation_too_short),  "operation_too_short");
    EXPECT_EQ(to_string_view(ErrorKind::base_length_mismatch), "base_length_mismatch");
    EXPECT_EQ(to_string_view(ErrorKind::length_overflow),      "length_overflow");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::operation_too_long, "too long"};
    const auto e2 = Error{ErrorKind::operation_too_long, "too long"};
    const auto e3 = Error{ErrorKind::operation_too_short, "too long"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Error, different_messages_are_not_equal) {
    const auto e1 = Error{ErrorKind::operation_too_long, "foo"};
    const auto e2 = Error{ErrorKind::operation_too_long, "bar"};

    EXPECT_NE(e1, e2);
}

TEST(IncompatibleOperationError, carries_kind_and_message) {
    const auto e = IncompatibleOperationError{ErrorKind::base_length_mismatch, "lengths differ"};

    EXPECT_EQ(e.kind(), ErrorKind::base_length_mismatch);
    EXPECT_EQ(std::string{e.what()}, "lengths differ");
    EXPECT_EQ(e.error(), (Error{ErrorKind::base_length_mismatch, "lengths differ"}));
}

TEST(IncompatibleOperationError, is_a_runtime_error) {
    try {
        throw IncompatibleOperationError{ErrorKind::operation_too_short, "short"};
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string{e.what()}, "short");
        return;
    }
    FAIL() << "exception not caught as std::runtime_error";
}
