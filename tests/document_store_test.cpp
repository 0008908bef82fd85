#include <oplog-cpp/document_store.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace oplog_cpp;
using namespace oplog_cpp::test;

TEST(InMemoryDocumentStore, add_and_get_block) {
    auto store = InMemoryDocumentStore{};
    store.add_block(block("b1", {3, 4}));

    auto b = store.get_block("b1");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->position, (Position{3, 4}));
    EXPECT_TRUE(store.has_block("b1"));
    EXPECT_FALSE(store.get_block("b2").has_value());
}

TEST(InMemoryDocumentStore, removing_a_container_cascades_to_children_and_edges) {
    auto store = InMemoryDocumentStore{};
    store.add_block(block("loop"));
    store.add_block(block("inner", {}, "loop"));
    store.add_block(block("deep", {}, "inner"));
    store.add_block(block("other"));
    store.add_edge(edge("e1", "deep", "other"));
    store.add_edge(edge("e2", "other", "other"));

    store.remove_block("loop");

    EXPECT_EQ(store.block_count(), 1u);
    EXPECT_TRUE(store.has_block("other"));
    EXPECT_FALSE(store.has_edge("e1"));
    EXPECT_TRUE(store.has_edge("e2"));
}

TEST(InMemoryDocumentStore, children_are_listed_sorted) {
    auto store = InMemoryDocumentStore{};
    store.add_block(block("loop"));
    store.add_block(block("z", {}, "loop"));
    store.add_block(block("a", {}, "loop"));

    EXPECT_EQ(store.children_of("loop"), (std::vector<EntityId>{"a", "z"}));
}

TEST(InMemoryDocumentStore, live_subblock_values_are_merged_into_snapshots) {
    auto store = InMemoryDocumentStore{};
    store.add_block(block("b2"));
    store.set_subblock_value("b2", "color", std::string{"red"});

    EXPECT_FALSE(store.get_block("b2")->subblocks.contains("color"));

    auto merged = store.merge_subblock_state("doc", "b2");
    ASSERT_TRUE(merged.has_value());
    EXPECT_EQ(get_field<std::string>(merged->subblocks, "color"), "red");
    EXPECT_EQ(get_field<std::string>(store.graph().blocks_by_id.at("b2").subblocks, "color"), "red");
}

TEST(InMemoryDocumentStore, re_adding_a_block_replaces_live_values) {
    auto store = InMemoryDocumentStore{};
    store.add_block(block("b2"));
    store.set_subblock_value("b2", "color", std::string{"blue"});

    auto snapshot = block("b2");
    snapshot.subblocks["color"] = std::string{"red"};
    store.add_block(snapshot);

    EXPECT_EQ(get_field<std::string>(store.merge_subblock_state("doc", "b2")->subblocks, "color"), "red");
}

TEST(InMemoryDocumentStore, update_parent_and_position) {
    auto store = InMemoryDocumentStore{};
    store.add_block(block("loop"));
    store.add_block(block("b1", {50, 50}));

    store.update_parent("b1", EntityId{"loop"});
    store.update_position("b1", {5, 5});

    auto b = store.get_block("b1");
    EXPECT_EQ(b->parent_id, "loop");
    EXPECT_EQ(b->position, (Position{5, 5}));
}

TEST(InMemoryDocumentStore, variable_updates_are_field_checked) {
    auto store = InMemoryDocumentStore{};
    store.add_variable(variable("v1", "apiKey"));

    store.update_variable("v1", "name", std::string{"token"});
    store.update_variable("v1", "value", std::int64_t{7});

    auto v = store.get_variable("v1");
    EXPECT_EQ(v->name, "token");
    EXPECT_EQ(v->value, FieldValue{std::int64_t{7}});
    EXPECT_THROW(store.update_variable("v1", "colour", std::string{"x"}), std::invalid_argument);
    EXPECT_THROW(store.update_variable("v1", "type", std::int64_t{1}), std::invalid_argument);
}

TEST(InMemoryDocumentStore, graph_reflects_every_entity) {
    auto store = InMemoryDocumentStore{};
    store.add_block(block("a"));
    store.add_block(block("b"));
    store.add_edge(edge("e1", "a", "b"));
    store.add_variable(variable("v1", "x"));

    auto g = store.graph();

    EXPECT_EQ(g.blocks_by_id.size(), 2u);
    EXPECT_TRUE(g.has_edge("e1"));
    EXPECT_TRUE(g.has_variable("v1"));
}
