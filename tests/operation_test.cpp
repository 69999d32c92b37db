#include <jsonpatch-cpp/operation.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace jsonpatch_cpp;

TEST(OpKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(OpKind::test),    "test");
    EXPECT_EQ(to_string_view(OpKind::remove),  "remove");
    EXPECT_EQ(to_string_view(OpKind::add),     "add");
    EXPECT_EQ(to_string_view(OpKind::replace), "replace");
}

TEST(OpKind, parse_op_kind_accepts_known_names) {
    EXPECT_EQ(parse_op_kind("test"),    OpKind::test);
    EXPECT_EQ(parse_op_kind("remove"),  OpKind::remove);
    EXPECT_EQ(parse_op_kind("add"),     OpKind::add);
    EXPECT_EQ(parse_op_kind("replace"), OpKind::replace);
}

TEST(OpKind, parse_op_kind_rejects_unknown_names) {
    EXPECT_FALSE(parse_op_kind("move").has_value());
    EXPECT_FALSE(parse_op_kind("TEST").has_value());
    EXPECT_FALSE(parse_op_kind("").has_value());
}

TEST(NewTestCondition, builds_a_test_operation) {
    const auto op = new_test_condition("/status/condition", "bar");

    EXPECT_EQ(op.kind, OpKind::test);
    EXPECT_EQ(op.path, "/status/condition");
    ASSERT_TRUE(op.value.has_value());
    EXPECT_EQ(*op.value, nlohmann::json("bar"));
}

TEST(NewTestCondition, does_not_reject_forbidden_paths) {
    const auto op = new_test_condition("/metadata/resourceVersion", "1");
    EXPECT_EQ(op.path, "/metadata/resourceVersion");
}

TEST(Operation, equality_is_structural) {
    const auto a = new_test_condition("/a", 1);
    const auto b = new_test_condition("/a", 1);
    const auto c = new_test_condition("/a", 2);
    const auto d = Operation{OpKind::remove, "/a"};

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_NE(a, d);
    EXPECT_FALSE(d.value.has_value());
}
