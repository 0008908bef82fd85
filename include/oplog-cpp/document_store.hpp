/// @file document_store.hpp
/// @brief The document store collaborator and an in-memory implementation.

#pragma once

#include <oplog-cpp/graph.hpp>
#include <oplog-cpp/types.hpp>
#include <oplog-cpp/value.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace oplog_cpp {

/// Holds the current materialized graph of one document.
///
/// The operation log never owns document state; it reads and mutates it
/// only through this interface. All calls are synchronous and happen on
/// the single logical thread that drives the session.
class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    // -- Reading --------------------------------------------------------------

    virtual auto get_block(const EntityId& id) const -> std::optional<BlockState> = 0;
    virtual auto get_edge(const EntityId& id) const -> std::optional<EdgeState> = 0;
    virtual auto get_edges() const -> std::vector<EdgeState> = 0;
    virtual auto get_variable(const EntityId& id) const -> std::optional<VariableState> = 0;

    /// Ids of the blocks whose parent is `id` (one level).
    virtual auto children_of(const EntityId& id) const -> std::vector<EntityId> = 0;

    /// Copy of the whole graph.
    virtual auto graph() const -> GraphView = 0;

    /// A block with its live sub-block values merged in.
    ///
    /// This is the state a removal must snapshot: the block record alone
    /// may hold stale field values.
    virtual auto merge_subblock_state(const DocumentId& document_id,
                                      const EntityId& block_id) const
        -> std::optional<BlockState> = 0;

    virtual auto has_block(const EntityId& id) const -> bool { return get_block(id).has_value(); }
    virtual auto has_edge(const EntityId& id) const -> bool { return get_edge(id).has_value(); }
    virtual auto has_variable(const EntityId& id) const -> bool { return get_variable(id).has_value(); }

    // -- Mutation -------------------------------------------------------------

    /// Insert or replace a block. Its sub-block values become the live values.
    virtual void add_block(const BlockState& block) = 0;

    /// Remove a block, its nested children and every edge touching them.
    virtual void remove_block(const EntityId& id) = 0;

    virtual void add_edge(const EdgeState& edge) = 0;
    virtual void remove_edge(const EntityId& id) = 0;
    virtual void update_parent(const EntityId& block_id,
                               const std::optional<EntityId>& parent_id) = 0;
    virtual void update_position(const EntityId& block_id, Position position) = 0;
    virtual void update_subflow_config(const EntityId& block_id, SubflowKind kind,
                                       const FieldMap& config) = 0;
    virtual void add_variable(const VariableState& variable) = 0;
    virtual void remove_variable(const EntityId& id) = 0;
    virtual void update_variable(const EntityId& id, std::string_view field,
                                 const FieldValue& value) = 0;
};

/// A DocumentStore that keeps the graph in hash maps.
///
/// Live sub-block values are held apart from block records, the way an
/// editor keeps form state in its own store, and are merged back by
/// merge_subblock_state().
class InMemoryDocumentStore : public DocumentStore {
public:
    InMemoryDocumentStore() = default;

    auto get_block(const EntityId& id) const -> std::optional<BlockState> override;
    auto get_edge(const EntityId& id) const -> std::optional<EdgeState> override;
    auto get_edges() const -> std::vector<EdgeState> override;
    auto get_variable(const EntityId& id) const -> std::optional<VariableState> override;
    auto children_of(const EntityId& id) const -> std::vector<EntityId> override;
    auto graph() const -> GraphView override;
    auto merge_subblock_state(const DocumentId& document_id,
                              const EntityId& block_id) const
        -> std::optional<BlockState> override;
    auto has_block(const EntityId& id) const -> bool override { return blocks_.contains(id); }
    auto has_edge(const EntityId& id) const -> bool override { return edges_.contains(id); }
    auto has_variable(const EntityId& id) const -> bool override { return variables_.contains(id); }

    void add_block(const BlockState& block) override;
    void remove_block(const EntityId& id) override;
    void add_edge(const EdgeState& edge) override;
    void remove_edge(const EntityId& id) override;
    void update_parent(const EntityId& block_id,
                       const std::optional<EntityId>& parent_id) override;
    void update_position(const EntityId& block_id, Position position) override;
    void update_subflow_config(const EntityId& block_id, SubflowKind kind,
                               const FieldMap& config) override;
    void add_variable(const VariableState& variable) override;
    void remove_variable(const EntityId& id) override;
    void update_variable(const EntityId& id, std::string_view field,
                         const FieldValue& value) override;

    /// Set a live sub-block value, as a form edit would.
    void set_subblock_value(const EntityId& block_id, std::string key, FieldValue value);

    /// Number of blocks, edges and variables.
    auto block_count() const -> std::size_t { return blocks_.size(); }
    auto edge_count() const -> std::size_t { return edges_.size(); }
    auto variable_count() const -> std::size_t { return variables_.size(); }

private:
    std::unordered_map<EntityId, BlockState> blocks_;
    std::unordered_map<EntityId, EdgeState> edges_;
    std::unordered_map<EntityId, VariableState> variables_;
    std::unordered_map<EntityId, FieldMap> subblock_values_;
};

}  // namespace oplog_cpp
