/// @file op.hpp
/// @brief Operation types for the collaborative operation log.

#pragma once

#include <oplog-cpp/graph.hpp>
#include <oplog-cpp/types.hpp>
#include <oplog-cpp/value.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace oplog_cpp {

/// The kind of mutation an operation represents.
///
/// Enumerators follow the alternative order of Payload.
enum class OpKind : std::uint8_t {
    add_block,              ///< Create a block (with nested children and edges).
    remove_block,           ///< Delete a block and everything attached to it.
    duplicate_block,        ///< Create a copy of an existing block.
    move_block,             ///< Change a block position.
    batch_move_blocks,      ///< Move several blocks at once.
    batch_add_blocks,       ///< Create several blocks and their edges at once.
    batch_remove_blocks,    ///< Delete several blocks and their edges at once.
    add_edge,               ///< Connect two blocks.
    remove_edge,            ///< Disconnect two blocks.
    update_parent,          ///< Move a block into or out of a container.
    update_subflow_config,  ///< Change a loop/parallel configuration.
    add_variable,           ///< Create a variable.
    remove_variable,        ///< Delete a variable.
    update_variable,        ///< Change one field of a variable.
};

/// Convert an OpKind to its string representation.
constexpr auto to_string_view(OpKind kind) noexcept -> std::string_view {
    switch (kind) {
        case OpKind::add_block:             return "add_block";
        case OpKind::remove_block:          return "remove_block";
        case OpKind::duplicate_block:       return "duplicate_block";
        case OpKind::move_block:            return "move_block";
        case OpKind::batch_move_blocks:     return "batch_move_blocks";
        case OpKind::batch_add_blocks:      return "batch_add_blocks";
        case OpKind::batch_remove_blocks:   return "batch_remove_blocks";
        case OpKind::add_edge:              return "add_edge";
        case OpKind::remove_edge:           return "remove_edge";
        case OpKind::update_parent:         return "update_parent";
        case OpKind::update_subflow_config: return "update_subflow_config";
        case OpKind::add_variable:          return "add_variable";
        case OpKind::remove_variable:       return "remove_variable";
        case OpKind::update_variable:       return "update_variable";
    }
    return "unknown";
}

/// Parse an OpKind from its string representation.
auto op_kind_from_string(std::string_view name) -> std::optional<OpKind>;

// -- Payloads -----------------------------------------------------------------

/// A block was created. Children and edges are restored with it.
struct AddBlockPayload {
    BlockState block;
    std::vector<EdgeState> edges;
    std::vector<BlockState> children;
    auto operator==(const AddBlockPayload&) const -> bool = default;
};

/// A block was removed. Carries the snapshot needed to rebuild it.
struct RemoveBlockPayload {
    BlockState block;
    std::vector<EdgeState> edges;       ///< Every edge touching the block or its children.
    std::vector<BlockState> children;   ///< Nested blocks of a container, all depths.
    auto operator==(const RemoveBlockPayload&) const -> bool = default;
};

/// A block was created as a copy of another.
struct DuplicateBlockPayload {
    EntityId source_id;
    BlockState block;
    std::vector<EdgeState> edges;
    auto operator==(const DuplicateBlockPayload&) const -> bool = default;
};

/// A block changed position.
struct MoveBlockPayload {
    EntityId block_id;
    Position before;
    Position after;
    auto operator==(const MoveBlockPayload&) const -> bool = default;
};

/// One element of a batch move.
struct BlockMove {
    EntityId block_id;
    Position before;
    Position after;
    auto operator==(const BlockMove&) const -> bool = default;
};

struct BatchMoveBlocksPayload {
    std::vector<BlockMove> moves;
    auto operator==(const BatchMoveBlocksPayload&) const -> bool = default;
};

struct BatchAddBlocksPayload {
    std::vector<BlockState> blocks;
    std::vector<EdgeState> edges;
    auto operator==(const BatchAddBlocksPayload&) const -> bool = default;
};

struct BatchRemoveBlocksPayload {
    std::vector<BlockState> blocks;    ///< Selected blocks plus their nested children.
    std::vector<EdgeState> edges;
    auto operator==(const BatchRemoveBlocksPayload&) const -> bool = default;
};

struct AddEdgePayload {
    EdgeState edge;
    auto operator==(const AddEdgePayload&) const -> bool = default;
};

struct RemoveEdgePayload {
    EdgeState edge;
    auto operator==(const RemoveEdgePayload&) const -> bool = default;
};

/// A block moved into or out of a container.
///
/// Edges crossing the container boundary are detached, and edges to
/// the new context may be attached, inside the same operation so that
/// undo restores position, parent and edges together.
struct UpdateParentPayload {
    EntityId block_id;
    std::optional<EntityId> old_parent;
    std::optional<EntityId> new_parent;
    Position old_position;
    Position new_position;
    std::vector<EdgeState> detached_edges;  ///< Removed by the operation.
    std::vector<EdgeState> attached_edges;  ///< Added by the operation.
    auto operator==(const UpdateParentPayload&) const -> bool = default;
};

struct UpdateSubflowConfigPayload {
    EntityId block_id;
    SubflowKind subflow{SubflowKind::loop};
    FieldMap before;
    FieldMap after;
    auto operator==(const UpdateSubflowConfigPayload&) const -> bool = default;
};

struct AddVariablePayload {
    VariableState variable;
    auto operator==(const AddVariablePayload&) const -> bool = default;
};

struct RemoveVariablePayload {
    VariableState variable;
    auto operator==(const RemoveVariablePayload&) const -> bool = default;
};

/// One field ("name", "type" or "value") of a variable changed.
struct UpdateVariablePayload {
    EntityId variable_id;
    std::string field;
    FieldValue before;
    FieldValue after;
    auto operator==(const UpdateVariablePayload&) const -> bool = default;
};

/// The kind-specific data of an operation. One alternative per OpKind.
using Payload = std::variant<
    AddBlockPayload,
    RemoveBlockPayload,
    DuplicateBlockPayload,
    MoveBlockPayload,
    BatchMoveBlocksPayload,
    BatchAddBlocksPayload,
    BatchRemoveBlocksPayload,
    AddEdgePayload,
    RemoveEdgePayload,
    UpdateParentPayload,
    UpdateSubflowConfigPayload,
    AddVariablePayload,
    RemoveVariablePayload,
    UpdateVariablePayload
>;

/// The OpKind matching the active alternative of a payload.
auto kind_of(const Payload& payload) noexcept -> OpKind;

/// A single mutation of a document.
///
/// Operations are immutable once created. The timestamp is the sender's
/// clock in milliseconds; it is absent only on operations decoded from
/// peers that did not send one.
struct Operation {
    OperationId id;                         ///< Unique operation identifier.
    std::optional<std::int64_t> timestamp;  ///< Sender clock, milliseconds.
    DocumentId document_id;                 ///< The document being mutated.
    ActorId actor_id;                       ///< The actor that issued the mutation.
    Payload payload;                        ///< Kind-specific data.

    /// The kind of mutation this operation performs.
    auto kind() const noexcept -> OpKind { return kind_of(payload); }

    auto operator==(const Operation&) const -> bool = default;
};

/// A recorded user action: the forward operation and its inverse.
struct OperationEntry {
    OperationId id;       ///< Same as operation.id.
    Operation operation;  ///< Replayed on redo.
    Operation inverse;    ///< Replayed on undo.

    auto operator==(const OperationEntry&) const -> bool = default;
};

}  // namespace oplog_cpp
