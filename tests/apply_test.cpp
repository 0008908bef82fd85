#include <oplog-cpp/apply.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace oplog_cpp;
using namespace oplog_cpp::test;

namespace {

auto canvas() -> InMemoryDocumentStore {
    auto store = InMemoryDocumentStore{};
    store.add_block(block("a", {0, 0}));
    store.add_block(block("b", {100, 0}));
    store.add_edge(edge("e-ab", "a", "b"));
    return store;
}

}  // anonymous namespace

TEST(ApplyStatus, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ApplyStatus::applied), "applied");
    EXPECT_EQ(to_string_view(ApplyStatus::skipped), "skipped");
}

TEST(Apply, move_updates_position) {
    auto store = canvas();

    auto result = apply_operation(store, make_op(MoveBlockPayload{.block_id = "a", .before = {0, 0}, .after = {7, 8}}));

    EXPECT_TRUE(result.applied());
    EXPECT_EQ(store.get_block("a")->position, (Position{7, 8}));
}

TEST(Apply, missing_target_skips_the_whole_operation) {
    auto store = canvas();

    auto result = apply_operation(store, make_op(BatchMoveBlocksPayload{.moves = {
        BlockMove{.block_id = "a", .before = {}, .after = {1, 1}},
        BlockMove{.block_id = "gone", .before = {}, .after = {2, 2}},
    }}));

    EXPECT_EQ(result.status, ApplyStatus::skipped);
    EXPECT_EQ(result.missing.blocks, (std::vector<EntityId>{"gone"}));
    EXPECT_EQ(store.get_block("a")->position, (Position{0, 0}));
}

TEST(Apply, removing_an_absent_entity_is_skipped) {
    auto store = canvas();

    auto result = apply_operation(store, make_op(RemoveEdgePayload{.edge = edge("nope", "a", "b")}));

    EXPECT_FALSE(result.applied());
    EXPECT_EQ(store.edge_count(), 1u);
}

TEST(Apply, add_block_restores_children_before_edges) {
    auto store = InMemoryDocumentStore{};
    store.add_block(block("outside"));

    // Children listed before their parent still land after it.
    auto result = apply_operation(store, make_op(AddBlockPayload{
        .block = block("loop"),
        .edges = {edge("e1", "deep", "outside"), edge("e2", "loop", "inner")},
        .children = {block("deep", {}, "inner"), block("inner", {}, "loop")},
    }));

    ASSERT_TRUE(result.applied());
    EXPECT_EQ(store.block_count(), 4u);
    EXPECT_EQ(store.get_block("deep")->parent_id, "inner");
    EXPECT_TRUE(store.has_edge("e1"));
    EXPECT_TRUE(store.has_edge("e2"));
}

TEST(Apply, snapshot_edges_to_vanished_blocks_are_dropped) {
    auto store = InMemoryDocumentStore{};

    auto result = apply_operation(store, make_op(AddBlockPayload{
        .block = block("b1"),
        .edges = {edge("e1", "b1", "deleted-elsewhere")},
        .children = {},
    }));

    EXPECT_TRUE(result.applied());
    EXPECT_TRUE(store.has_block("b1"));
    EXPECT_FALSE(store.has_edge("e1"));
}

TEST(Apply, update_parent_moves_block_and_swaps_edges) {
    auto store = canvas();
    store.add_block(block("loop", {200, 200}));

    auto result = apply_operation(store, make_op(UpdateParentPayload{
        .block_id = "a",
        .old_parent = std::nullopt,
        .new_parent = "loop",
        .old_position = {0, 0},
        .new_position = {10, 10},
        .detached_edges = {edge("e-ab", "a", "b")},
        .attached_edges = {edge("e-loop", "loop", "a")},
    }));

    ASSERT_TRUE(result.applied());
    auto a = store.get_block("a");
    EXPECT_EQ(a->parent_id, "loop");
    EXPECT_EQ(a->position, (Position{10, 10}));
    EXPECT_FALSE(store.has_edge("e-ab"));
    EXPECT_TRUE(store.has_edge("e-loop"));
}

TEST(Apply, batch_remove_tolerates_children_removed_with_their_container) {
    auto store = canvas();
    store.add_block(block("loop"));
    store.add_block(block("child", {}, "loop"));

    auto result = apply_operation(store, make_op(BatchRemoveBlocksPayload{
        .blocks = {block("loop"), block("child", {}, "loop"), block("a")},
        .edges = {edge("e-ab", "a", "b")},
    }));

    EXPECT_TRUE(result.applied());
    EXPECT_EQ(store.block_count(), 1u);
    EXPECT_EQ(store.edge_count(), 0u);
}

TEST(Apply, subflow_config_and_variables) {
    auto store = canvas();
    store.add_variable(variable("v1", "count", std::int64_t{1}));

    apply_operation(store, make_op(UpdateSubflowConfigPayload{
        .block_id = "a",
        .subflow = SubflowKind::parallel,
        .before = {},
        .after = {{"count", std::int64_t{4}}},
    }));
    apply_operation(store, make_op(UpdateVariablePayload{
        .variable_id = "v1",
        .field = "value",
        .before = std::int64_t{1},
        .after = std::int64_t{2},
    }));

    EXPECT_EQ(get_field<std::int64_t>(store.get_block("a")->data, "count"), 4);
    EXPECT_EQ(store.get_variable("v1")->value, FieldValue{std::int64_t{2}});
}
