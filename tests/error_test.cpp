#include <jsonmerge-cpp/error.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace jsonmerge_cpp;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::parse_error),         "parse_error");
    EXPECT_EQ(to_string_view(ErrorKind::malformed_patch),     "malformed_patch");
    EXPECT_EQ(to_string_view(ErrorKind::missing_field),       "missing_field");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_pointer),     "invalid_pointer");
    EXPECT_EQ(to_string_view(ErrorKind::path_not_found),      "path_not_found");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_index),       "invalid_index");
    EXPECT_EQ(to_string_view(ErrorKind::precondition_failed), "precondition_failed");
    EXPECT_EQ(to_string_view(ErrorKind::test_failed),         "test_failed");
    EXPECT_EQ(to_string_view(ErrorKind::unknown_operation),   "unknown_operation");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::invalid_index, "bad index"};
    const auto e2 = Error{ErrorKind::invalid_index, "bad index"};
    const auto e3 = Error{ErrorKind::path_not_found, "bad index"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Error, different_messages_are_not_equal) {
    const auto e1 = Error{ErrorKind::test_failed, "foo"};
    const auto e2 = Error{ErrorKind::test_failed, "bar"};

    EXPECT_NE(e1, e2);
}

TEST(PatchError, without_context) {
    const auto e = PatchError{ErrorKind::missing_field, "no path"};

    EXPECT_EQ(e.kind(), ErrorKind::missing_field);
    EXPECT_EQ(e.error().message, "no path");
    EXPECT_FALSE(e.op_index().has_value());
    EXPECT_TRUE(e.op().empty());
    EXPECT_TRUE(e.path().empty());
    EXPECT_EQ(std::string{e.what()}, "missing_field: no path");
}

TEST(PatchError, with_operation_context) {
    const auto e = PatchError{Error{ErrorKind::path_not_found, "missing key a"}, 3, "remove", "/a/b"};

    EXPECT_EQ(e.kind(), ErrorKind::path_not_found);
    ASSERT_TRUE(e.op_index().has_value());
    EXPECT_EQ(*e.op_index(), 3u);
    EXPECT_EQ(e.op(), "remove");
    EXPECT_EQ(e.path(), "/a/b");
    EXPECT_EQ(std::string{e.what()}, "operation 3 (remove /a/b): path_not_found: missing key a");
}

TEST(PatchError, is_a_runtime_error) {
    try {
        throw PatchError{ErrorKind::unknown_operation, "frobnicate"};
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string{e.what()}.find("frobnicate"), std::string::npos);
        return;
    }
    FAIL() << "PatchError was not caught as std::runtime_error";
}
