#include <jsonmerge-cpp/error.hpp>
#include <jsonmerge-cpp/operation.hpp>

#include <gtest/gtest.h>

using namespace jsonmerge_cpp;

TEST(OpType, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(OpType::add),     "add");
    EXPECT_EQ(to_string_view(OpType::remove),  "remove");
    EXPECT_EQ(to_string_view(OpType::replace), "replace");
    EXPECT_EQ(to_string_view(OpType::move),    "move");
    EXPECT_EQ(to_string_view(OpType::test),    "test");
    EXPECT_EQ(to_string_view(OpType::copy),    "copy");
    EXPECT_EQ(to_string_view(OpType::unknown), "unknown");
}

TEST(OpType, parses_known_names) {
    EXPECT_EQ(op_type_from_string("add"), OpType::add);
    EXPECT_EQ(op_type_from_string("move"), OpType::move);
    EXPECT_EQ(op_type_from_string("copy"), OpType::copy);
    EXPECT_EQ(op_type_from_string("ADD"), OpType::unknown);
    EXPECT_EQ(op_type_from_string(""), OpType::unknown);
}

TEST(Operation, move_fields) {
    const auto op = Operation{Json{{"op", "move"}, {"from", "/biscuits"}, {"path", "/cookies"}}};

    EXPECT_EQ(op.kind(), "move");
    EXPECT_EQ(op.type(), OpType::move);
    EXPECT_EQ(op.path(), "/cookies");
    EXPECT_EQ(op.from(), "/biscuits");
}

TEST(Operation, add_fields) {
    const auto op = Operation{Json::parse(
        R"({ "op": "add", "path": "/biscuits/1", "value": { "name": "Ginger Nut" } })")};

    EXPECT_EQ(op.kind(), "add");
    EXPECT_EQ(op.path(), "/biscuits/1");
    EXPECT_EQ(op.value(), (Json{{"name", "Ginger Nut"}}));
    EXPECT_THROW(op.from(), PatchError);
}

TEST(Operation, missing_from_is_missing_field) {
    const auto op = Operation{Json{{"op", "copy"}, {"path", "/a"}}};
    try {
        op.from();
        FAIL() << "expected PatchError";
    } catch (const PatchError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::missing_field);
    }
}

TEST(Operation, missing_path_is_missing_field) {
    const auto op = Operation{Json{{"op", "remove"}}};
    try {
        op.path();
        FAIL() << "expected PatchError";
    } catch (const PatchError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::missing_field);
    }
}

TEST(Operation, non_string_path_is_missing_field) {
    const auto op = Operation{Json{{"op", "remove"}, {"path", 5}}};
    EXPECT_THROW(op.path(), PatchError);
}

TEST(Operation, null_value_is_present) {
    const auto op = Operation{Json{{"op", "add"}, {"path", "/a"}, {"value", nullptr}}};
    EXPECT_TRUE(op.value().is_null());
}

TEST(Operation, absent_value_throws) {
    const auto op = Operation{Json{{"op", "replace"}, {"path", "/a"}}};
    EXPECT_THROW(op.value(), PatchError);
}

TEST(Operation, missing_or_non_string_op_is_unknown) {
    EXPECT_EQ((Operation{Json{{"path", "/a"}}}.kind()), "unknown");
    EXPECT_EQ((Operation{Json{{"op", 1}, {"path", "/a"}}}.type()), OpType::unknown);
}

TEST(Operation, unrecognized_op_keeps_raw_name) {
    const auto op = Operation{Json{{"op", "frobnicate"}, {"path", "/a"}}};
    EXPECT_EQ(op.kind(), "frobnicate");
    EXPECT_EQ(op.type(), OpType::unknown);
}

TEST(Operation, non_object_is_malformed) {
    try {
        Operation{Json{1, 2}};
        FAIL() << "expected PatchError";
    } catch (const PatchError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::malformed_patch);
    }
}

TEST(Operation, to_json_keeps_extra_fields) {
    const auto raw = Json{{"op", "test"}, {"path", "/a"}, {"value", 1}, {"comment", "keep me"}};
    const auto op = Operation{raw};
    const Json j = op;
    EXPECT_EQ(j, raw);
    EXPECT_EQ(op.string_field("comment"), "keep me");
    EXPECT_FALSE(op.string_field("value").has_value());
}
