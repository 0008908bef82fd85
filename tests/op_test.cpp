#include <oplog-cpp/op.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace oplog_cpp;
using namespace oplog_cpp::test;

TEST(OpKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(OpKind::add_block),             "add_block");
    EXPECT_EQ(to_string_view(OpKind::remove_block),          "remove_block");
    EXPECT_EQ(to_string_view(OpKind::duplicate_block),       "duplicate_block");
    EXPECT_EQ(to_string_view(OpKind::move_block),            "move_block");
    EXPECT_EQ(to_string_view(OpKind::batch_move_blocks),     "batch_move_blocks");
    EXPECT_EQ(to_string_view(OpKind::batch_add_blocks),      "batch_add_blocks");
    EXPECT_EQ(to_string_view(OpKind::batch_remove_blocks),   "batch_remove_blocks");
    EXPECT_EQ(to_string_view(OpKind::add_edge),              "add_edge");
    EXPECT_EQ(to_string_view(OpKind::remove_edge),           "remove_edge");
    EXPECT_EQ(to_string_view(OpKind::update_parent),         "update_parent");
    EXPECT_EQ(to_string_view(OpKind::update_subflow_config), "update_subflow_config");
    EXPECT_EQ(to_string_view(OpKind::add_variable),          "add_variable");
    EXPECT_EQ(to_string_view(OpKind::remove_variable),       "remove_variable");
    EXPECT_EQ(to_string_view(OpKind::update_variable),       "update_variable");
}

TEST(OpKind, from_string_round_trips_every_kind) {
    for (auto name : {"add_block", "remove_edge", "update_parent", "update_variable"}) {
        auto kind = op_kind_from_string(name);
        ASSERT_TRUE(kind.has_value()) << name;
        EXPECT_EQ(to_string_view(*kind), name);
    }
}

TEST(OpKind, from_string_rejects_unknown_names) {
    EXPECT_FALSE(op_kind_from_string("teleport_block").has_value());
    EXPECT_FALSE(op_kind_from_string("").has_value());
}

TEST(Operation, kind_follows_the_payload) {
    const auto move = make_op(MoveBlockPayload{.block_id = "b1", .before = {}, .after = {1, 1}});
    const auto edge_op = make_op(AddEdgePayload{.edge = edge("e1", "a", "b")});

    EXPECT_EQ(move.kind(), OpKind::move_block);
    EXPECT_EQ(edge_op.kind(), OpKind::add_edge);
}

TEST(Operation, equality_detects_payload_changes) {
    const auto base = make_op(MoveBlockPayload{.block_id = "b1", .before = {}, .after = {1, 1}});
    auto different = base;
    std::get<MoveBlockPayload>(different.payload).after = {2, 2};

    EXPECT_EQ(base, base);
    EXPECT_NE(base, different);
}

TEST(Operation, timestamp_is_optional) {
    const auto op = make_op(AddEdgePayload{.edge = edge("e1", "a", "b")}, "op-1", std::nullopt);
    EXPECT_FALSE(op.timestamp.has_value());
}
