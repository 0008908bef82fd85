#include <oplog-cpp/recorder.hpp>

#include <oplog-cpp/apply.hpp>
#include <oplog-cpp/inverse.hpp>
#include <oplog-cpp/referents.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <deque>
#include <unordered_set>
#include <utility>

namespace oplog_cpp {

namespace {

// True if `id` is `ancestor` or nested (at any depth) inside it.
auto is_within(const DocumentStore& store, const EntityId& id, const EntityId& ancestor) -> bool {
    auto current = std::optional<EntityId>{id};
    auto hops = std::size_t{0};
    while (current) {
        if (*current == ancestor) return true;
        auto block = store.get_block(*current);
        if (!block || ++hops > 1024) return false;
        current = block->parent_id;
    }
    return false;
}

auto variable_field(const VariableState& variable, std::string_view field) -> std::optional<FieldValue> {
    if (field == "name") return FieldValue{variable.name};
    if (field == "type") return FieldValue{variable.type};
    if (field == "value") return variable.value;
    return std::nullopt;
}

}  // anonymous namespace

Recorder::Recorder(DocumentStore& store, Ledger& ledger, OperationQueue& queue,
                   const RemoteApplicationGuard& guard, const ActiveDocument& active,
                   Clock clock)
    : store_{store}, ledger_{ledger}, queue_{queue}, guard_{guard}, active_{active},
      clock_{std::move(clock)} {}

// -- Blocks -------------------------------------------------------------------

auto Recorder::record_add_block(BlockState block, std::vector<EdgeState> edges,
                                std::vector<BlockState> children)
    -> std::optional<OperationId> {
    return record(AddBlockPayload{.block = std::move(block),
                                  .edges = std::move(edges),
                                  .children = std::move(children)});
}

auto Recorder::record_remove_block(const EntityId& block_id) -> std::optional<OperationId> {
    if (guard_.context() != ApplyContext::local) return record(RemoveBlockPayload{});
    auto snapshot = snapshot_block(block_id);
    if (!snapshot) {
        spdlog::warn("cannot record removal of unknown block {}", block_id);
        return std::nullopt;
    }
    return record(std::move(*snapshot));
}

auto Recorder::record_remove_block(BlockState snapshot, std::vector<EdgeState> edges,
                                   std::vector<BlockState> children)
    -> std::optional<OperationId> {
    return record(RemoveBlockPayload{.block = std::move(snapshot),
                                     .edges = std::move(edges),
                                     .children = std::move(children)});
}

auto Recorder::record_duplicate_block(const EntityId& source_id, BlockState duplicate,
                                      std::vector<EdgeState> edges)
    -> std::optional<OperationId> {
    return record(DuplicateBlockPayload{.source_id = source_id,
                                        .block = std::move(duplicate),
                                        .edges = std::move(edges)});
}

auto Recorder::record_move(const EntityId& block_id, Position before, Position after)
    -> std::optional<OperationId> {
    return record(MoveBlockPayload{.block_id = block_id, .before = before, .after = after});
}

auto Recorder::record_batch_move(std::vector<BlockMove> moves) -> std::optional<OperationId> {
    if (moves.empty()) return std::nullopt;
    return record(BatchMoveBlocksPayload{.moves = std::move(moves)});
}

auto Recorder::record_batch_add_blocks(std::vector<BlockState> blocks, std::vector<EdgeState> edges)
    -> std::optional<OperationId> {
    if (blocks.empty()) return std::nullopt;
    return record(BatchAddBlocksPayload{.blocks = std::move(blocks), .edges = std::move(edges)});
}

auto Recorder::record_batch_remove_blocks(const std::vector<EntityId>& block_ids)
    -> std::optional<OperationId> {
    if (guard_.context() != ApplyContext::local) return record(BatchRemoveBlocksPayload{});

    auto payload = BatchRemoveBlocksPayload{};
    auto seen_blocks = std::unordered_set<EntityId>{};
    auto seen_edges = std::unordered_set<EntityId>{};

    for (const auto& id : block_ids) {
        if (seen_blocks.contains(id)) continue;  // already nested in an earlier selection
        auto snapshot = snapshot_block(id);
        if (!snapshot) {
            spdlog::warn("batch removal skips unknown block {}", id);
            continue;
        }
        if (seen_blocks.insert(snapshot->block.id).second) {
            payload.blocks.push_back(std::move(snapshot->block));
        }
        for (auto& child : snapshot->children) {
            if (seen_blocks.insert(child.id).second) payload.blocks.push_back(std::move(child));
        }
        for (auto& edge : snapshot->edges) {
            if (seen_edges.insert(edge.id).second) payload.edges.push_back(std::move(edge));
        }
    }
    if (payload.blocks.empty()) return std::nullopt;
    return record(std::move(payload));
}

// -- Edges --------------------------------------------------------------------

auto Recorder::record_add_edge(EdgeState edge) -> std::optional<OperationId> {
    return record(AddEdgePayload{.edge = std::move(edge)}, !skip_edges_);
}

auto Recorder::record_remove_edge(const EntityId& edge_id) -> std::optional<OperationId> {
    if (guard_.context() != ApplyContext::local) return record(RemoveEdgePayload{});
    auto edge = store_.get_edge(edge_id);
    if (!edge) {
        spdlog::warn("cannot record removal of unknown edge {}", edge_id);
        return std::nullopt;
    }
    return record(RemoveEdgePayload{.edge = std::move(*edge)}, !skip_edges_);
}

// -- Containers ---------------------------------------------------------------

auto Recorder::record_update_parent(const EntityId& block_id, std::optional<EntityId> new_parent,
                                    Position new_position, std::vector<EdgeState> attached_edges)
    -> std::optional<OperationId> {
    if (guard_.context() != ApplyContext::local) return record(UpdateParentPayload{});
    auto block = store_.get_block(block_id);
    if (!block) {
        spdlog::warn("cannot record reparenting of unknown block {}", block_id);
        return std::nullopt;
    }
    if (new_parent && is_within(store_, *new_parent, block_id)) {
        spdlog::warn("refusing to move block {} into its own subtree", block_id);
        return std::nullopt;
    }

    // Edges from the block's subtree to anything that does not end up in
    // the same container are cut by the move.
    auto detached = std::vector<EdgeState>{};
    for (auto& edge : store_.get_edges()) {
        auto from_inside = is_within(store_, edge.source, block_id);
        auto to_inside = is_within(store_, edge.target, block_id);
        if (from_inside == to_inside) continue;

        const auto& other_id = from_inside ? edge.target : edge.source;
        auto other = store_.get_block(other_id);
        if (other && other->parent_id == new_parent) continue;
        detached.push_back(std::move(edge));
    }

    return record(UpdateParentPayload{.block_id = block_id,
                                      .old_parent = block->parent_id,
                                      .new_parent = std::move(new_parent),
                                      .old_position = block->position,
                                      .new_position = new_position,
                                      .detached_edges = std::move(detached),
                                      .attached_edges = std::move(attached_edges)});
}

auto Recorder::record_update_subflow_config(const EntityId& block_id, SubflowKind subflow,
                                            FieldMap config) -> std::optional<OperationId> {
    if (guard_.context() != ApplyContext::local) return record(UpdateSubflowConfigPayload{});
    auto block = store_.get_block(block_id);
    if (!block) {
        spdlog::warn("cannot record {} config of unknown block {}", to_string_view(subflow), block_id);
        return std::nullopt;
    }
    return record(UpdateSubflowConfigPayload{.block_id = block_id,
                                             .subflow = subflow,
                                             .before = std::move(block->data),
                                             .after = std::move(config)});
}

// -- Variables ----------------------------------------------------------------

auto Recorder::record_add_variable(VariableState variable) -> std::optional<OperationId> {
    return record(AddVariablePayload{.variable = std::move(variable)});
}

auto Recorder::record_remove_variable(const EntityId& variable_id) -> std::optional<OperationId> {
    if (guard_.context() != ApplyContext::local) return record(RemoveVariablePayload{});
    auto variable = store_.get_variable(variable_id);
    if (!variable) {
        spdlog::warn("cannot record removal of unknown variable {}", variable_id);
        return std::nullopt;
    }
    return record(RemoveVariablePayload{.variable = std::move(*variable)});
}

auto Recorder::record_update_variable(const EntityId& variable_id, std::string field,
                                      FieldValue value) -> std::optional<OperationId> {
    if (guard_.context() != ApplyContext::local) return record(UpdateVariablePayload{});
    auto variable = store_.get_variable(variable_id);
    if (!variable) {
        spdlog::warn("cannot record update of unknown variable {}", variable_id);
        return std::nullopt;
    }
    auto before = variable_field(*variable, field);
    if (!before) {
        spdlog::warn("variable {} has no field '{}'", variable_id, field);
        return std::nullopt;
    }
    if (field != "value" && !std::holds_alternative<std::string>(value)) {
        spdlog::warn("variable field '{}' must be a string", field);
        return std::nullopt;
    }
    return record(UpdateVariablePayload{.variable_id = variable_id,
                                        .field = std::move(field),
                                        .before = std::move(*before),
                                        .after = std::move(value)});
}

// -- Snapshots ----------------------------------------------------------------

auto Recorder::snapshot_block(const EntityId& block_id) const -> std::optional<RemoveBlockPayload> {
    auto document_id = active_.document_id.value_or(DocumentId{});
    auto block = store_.merge_subblock_state(document_id, block_id);
    if (!block) return std::nullopt;

    auto payload = RemoveBlockPayload{.block = std::move(*block), .edges = {}, .children = {}};
    auto subtree = std::unordered_set<EntityId>{block_id};

    // Breadth-first, so every child follows its parent.
    auto frontier = std::deque<EntityId>{block_id};
    while (!frontier.empty()) {
        auto current = std::move(frontier.front());
        frontier.pop_front();
        for (auto& child_id : store_.children_of(current)) {
            if (!subtree.insert(child_id).second) continue;
            if (auto child = store_.merge_subblock_state(document_id, child_id)) {
                payload.children.push_back(std::move(*child));
            }
            frontier.push_back(std::move(child_id));
        }
    }

    for (auto& edge : store_.get_edges()) {
        if (subtree.contains(edge.source) || subtree.contains(edge.target)) {
            payload.edges.push_back(std::move(edge));
        }
    }
    return payload;
}

// -- Recording ----------------------------------------------------------------

auto Recorder::record(Payload payload, bool push_to_ledger) -> std::optional<OperationId> {
    if (auto context = guard_.context(); context != ApplyContext::local) {
        spdlog::debug("not recording {} during {} application",
                      to_string_view(kind_of(payload)), to_string_view(context));
        return std::nullopt;
    }
    if (!active_.document_id) {
        spdlog::warn("no active document, {} not recorded", to_string_view(kind_of(payload)));
        return std::nullopt;
    }

    auto op = Operation{.id = generate_operation_id(),
                        .timestamp = clock_(),
                        .document_id = *active_.document_id,
                        .actor_id = active_.actor_id,
                        .payload = std::move(payload)};

    if (auto missing = missing_referents(op, store_); !missing.empty()) {
        spdlog::warn("{} {} not recorded: {} referenced entities are missing",
                     to_string_view(op.kind()), op.id,
                     missing.blocks.size() + missing.edges.size() + missing.variables.size());
        return std::nullopt;
    }

    if (push_to_ledger) ledger_.push(op.document_id, op.actor_id, make_entry(op));

    // Earlier unconfirmed edits of a removed entity must not reach the server.
    auto removed = removed_entities(op);
    for (const auto& entity : removed.blocks) queue_.cancel_operations_for_entity(entity);
    for (const auto& entity : removed.edges) queue_.cancel_operations_for_entity(entity);
    for (const auto& entity : removed.variables) queue_.cancel_operations_for_entity(entity);

    auto id = op.id;
    queue_.enqueue(make_queued(op), [this, &op] {
        auto result = apply_operation(store_, op);
        if (!result.applied()) {
            spdlog::warn("local {} {} was {}", to_string_view(op.kind()), op.id,
                         to_string_view(result.status));
        }
    });

    if (!removed.empty()) {
        auto pruned = ledger_.prune_invalid_entries(op.document_id, store_.graph());
        if (pruned > 0) {
            spdlog::debug("local {} pruned {} history entries", to_string_view(op.kind()), pruned);
        }
    }
    return id;
}

}  // namespace oplog_cpp
