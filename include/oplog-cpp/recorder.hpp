/// @file recorder.hpp
/// @brief Records user edits as undoable, queued operations.

#pragma once

#include <oplog-cpp/document_store.hpp>
#include <oplog-cpp/guard.hpp>
#include <oplog-cpp/ids.hpp>
#include <oplog-cpp/ledger.hpp>
#include <oplog-cpp/op.hpp>
#include <oplog-cpp/operation_queue.hpp>
#include <oplog-cpp/types.hpp>

#include <optional>
#include <string>
#include <vector>

namespace oplog_cpp {

/// Turns user edits into operations.
///
/// Every record_* call checks the guard first and does nothing outside
/// the `local` context, so remote application and undo/redo replay are
/// never re-recorded. Otherwise it builds the forward operation from its
/// arguments and from state captured now, checks that the entities it
/// needs exist, pushes {operation, inverse} to the ledger, and enqueues
/// the operation with its local application as the optimistic action.
///
/// Each call returns the id of the recorded operation, or nullopt when
/// nothing was recorded.
///
/// @code
/// recorder.record_move("b1", {0, 0}, {10, 10});
/// recorder.record_remove_block("b2");  // snapshot taken from the store
/// @endcode
class Recorder {
public:
    Recorder(DocumentStore& store, Ledger& ledger, OperationQueue& queue,
             const RemoteApplicationGuard& guard, const ActiveDocument& active,
             Clock clock);

    Recorder(const Recorder&) = delete;
    auto operator=(const Recorder&) -> Recorder& = delete;

    // -- Blocks ---------------------------------------------------------------

    auto record_add_block(BlockState block, std::vector<EdgeState> edges = {},
                          std::vector<BlockState> children = {})
        -> std::optional<OperationId>;

    /// Remove a block, snapshotting it (with live sub-block values, nested
    /// children and touching edges) from the store.
    auto record_remove_block(const EntityId& block_id) -> std::optional<OperationId>;

    /// Remove a block using a snapshot captured by the caller.
    auto record_remove_block(BlockState snapshot, std::vector<EdgeState> edges,
                             std::vector<BlockState> children = {})
        -> std::optional<OperationId>;

    auto record_duplicate_block(const EntityId& source_id, BlockState duplicate,
                                std::vector<EdgeState> edges = {})
        -> std::optional<OperationId>;

    auto record_move(const EntityId& block_id, Position before, Position after)
        -> std::optional<OperationId>;

    auto record_batch_move(std::vector<BlockMove> moves) -> std::optional<OperationId>;

    auto record_batch_add_blocks(std::vector<BlockState> blocks, std::vector<EdgeState> edges = {})
        -> std::optional<OperationId>;

    /// Remove several blocks, snapshotting all of them from the store.
    auto record_batch_remove_blocks(const std::vector<EntityId>& block_ids)
        -> std::optional<OperationId>;

    // -- Edges ----------------------------------------------------------------

    auto record_add_edge(EdgeState edge) -> std::optional<OperationId>;

    /// Remove an edge, snapshotting it from the store.
    auto record_remove_edge(const EntityId& edge_id) -> std::optional<OperationId>;

    // -- Containers -----------------------------------------------------------

    /// Move a block into (or, with nullopt, out of) a container.
    ///
    /// The current parent and position are captured from the store. Edges
    /// between the block and blocks outside the new container are detached
    /// in the same operation; `attached_edges` are added by it.
    auto record_update_parent(const EntityId& block_id, std::optional<EntityId> new_parent,
                              Position new_position,
                              std::vector<EdgeState> attached_edges = {})
        -> std::optional<OperationId>;

    /// Replace the configuration of a loop or parallel block.
    auto record_update_subflow_config(const EntityId& block_id, SubflowKind subflow,
                                      FieldMap config) -> std::optional<OperationId>;

    // -- Variables ------------------------------------------------------------

    auto record_add_variable(VariableState variable) -> std::optional<OperationId>;
    auto record_remove_variable(const EntityId& variable_id) -> std::optional<OperationId>;
    auto record_update_variable(const EntityId& variable_id, std::string field,
                                FieldValue value) -> std::optional<OperationId>;

    // -- Snapshots ------------------------------------------------------------

    /// The removal payload for a block as it is now, or nullopt if absent.
    auto snapshot_block(const EntityId& block_id) const -> std::optional<RemoveBlockPayload>;

    // -- Edge recording suppression -------------------------------------------

    /// Edges added or removed inside the scope are applied and sent but not
    /// pushed to the ledger: they belong to a block-level action that
    /// already carries them.
    class ScopedEdgeRecordingSkip {
    public:
        explicit ScopedEdgeRecordingSkip(Recorder& recorder)
            : recorder_{recorder}, previous_{recorder.skip_edges_} {
            recorder_.skip_edges_ = true;
        }
        ~ScopedEdgeRecordingSkip() { recorder_.skip_edges_ = previous_; }

        ScopedEdgeRecordingSkip(const ScopedEdgeRecordingSkip&) = delete;
        auto operator=(const ScopedEdgeRecordingSkip&) -> ScopedEdgeRecordingSkip& = delete;

    private:
        Recorder& recorder_;
        bool previous_;
    };

    auto edge_recording_skipped() const -> bool { return skip_edges_; }

private:
    auto record(Payload payload, bool push_to_ledger = true) -> std::optional<OperationId>;

    DocumentStore& store_;
    Ledger& ledger_;
    OperationQueue& queue_;
    const RemoteApplicationGuard& guard_;
    const ActiveDocument& active_;
    Clock clock_;
    bool skip_edges_{false};
};

}  // namespace oplog_cpp
