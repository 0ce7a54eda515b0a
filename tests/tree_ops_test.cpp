#include "src/tree_ops.hpp"

#include <mithril-sync/error.hpp>

#include <gtest/gtest.h>

using namespace mithril_sync;
using namespace mithril_sync::detail;

TEST(TreeOps, child_count_of_containers_and_scalars) {
    EXPECT_EQ(child_count(Value{Object{{"a", 1}, {"b", 2}}}), 2u);
    EXPECT_EQ(child_count(Value{Set{1, 2, 3}}), 3u);
    EXPECT_EQ(child_count(Value{"abc"}), 0u);
}

TEST(TreeOps, find_child_accepts_numeric_field_steps_on_arrays) {
    const auto list = Value{Array{"a", "b"}};
    ASSERT_NE(find_child(list, key_step("1")), nullptr);
    EXPECT_EQ(*find_child(list, key_step("1")), Value{"b"});
    EXPECT_EQ(find_child(list, key_step("x")), nullptr);
    EXPECT_EQ(find_child(list, index_step(2)), nullptr);
}

TEST(TreeOps, find_child_on_scalar_is_null) {
    EXPECT_EQ(find_child(Value{5}, key_step("a")), nullptr);
}

TEST(TreeOps, child_slot_grows_arrays_with_holes) {
    auto list = Value{Array{}};
    child_slot(list, index_step(2)) = "c";
    EXPECT_EQ(list, (Value{Array{Value{}, Value{}, "c"}}));
}

TEST(TreeOps, child_slot_limits_array_growth) {
    auto list = Value{Array{1}};
    EXPECT_NO_THROW(child_slot(list, index_step(max_index_growth)));
    EXPECT_EQ(list.as<Array>().size(), max_index_growth + 1);

    auto small = Value{Array{}};
    try {
        child_slot(small, index_step(4000000000u));
        FAIL() << "expected SyncError";
    } catch (const SyncError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_argument);
    }
    EXPECT_TRUE(small.as<Array>().empty());
}

TEST(TreeOps, child_slot_rejects_field_names_on_arrays) {
    auto list = Value{Array{}};
    EXPECT_THROW(child_slot(list, key_step("name")), SyncError);
}

TEST(TreeOps, child_slot_rejects_scalars) {
    auto scalar = Value{true};
    EXPECT_THROW(child_slot(scalar, key_step("a")), SyncError);
}

TEST(TreeOps, remove_child_pops_last_array_element) {
    auto list = Value{Array{1, 2, 3}};
    EXPECT_TRUE(remove_child(list, index_step(2)));
    EXPECT_EQ(list, (Value{Array{1, 2}}));
}

TEST(TreeOps, remove_child_leaves_hole_in_the_middle) {
    auto list = Value{Array{1, 2, 3}};
    EXPECT_TRUE(remove_child(list, index_step(0)));
    EXPECT_EQ(list, (Value{Array{Value{}, 2, 3}}));
}

TEST(TreeOps, remove_child_missing_is_false) {
    auto obj = Value{Object{{"a", 1}}};
    EXPECT_FALSE(remove_child(obj, key_step("b")));
}

TEST(TreeOps, ensure_parent_creates_arrays_before_indices) {
    auto root = Value{Object{}};
    auto& parent = ensure_parent(root, Path{key_step("list"), index_step(0), key_step("name")});
    EXPECT_TRUE(parent.is_object());
    EXPECT_TRUE(root.as<Object>().find("list")->is_array());
}

TEST(TreeOps, ensure_parent_rejects_scalar_intermediate) {
    auto root = Value{Object{{"a", 1}}};
    EXPECT_THROW(ensure_parent(root, Path{key_step("a"), key_step("b")}), SyncError);
}
