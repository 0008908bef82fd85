#include <oplog-cpp/apply.hpp>

#include <spdlog/spdlog.h>

#include <unordered_set>
#include <utility>
#include <vector>

namespace oplog_cpp {

namespace {

// Adds blocks so that every parent inside the set lands before its children.
void add_blocks_parent_first(DocumentStore& store, std::vector<const BlockState*> pending) {
    auto waiting = std::unordered_set<EntityId>{};
    for (const auto* b : pending) waiting.insert(b->id);

    while (!pending.empty()) {
        auto progressed = false;
        for (auto it = pending.begin(); it != pending.end();) {
            const auto* b = *it;
            if (b->parent_id && waiting.contains(*b->parent_id)) {
                ++it;
                continue;
            }
            store.add_block(*b);
            waiting.erase(b->id);
            it = pending.erase(it);
            progressed = true;
        }
        if (!progressed) {
            // A parent cycle inside a snapshot; add the rest as they are.
            for (const auto* b : pending) store.add_block(*b);
            return;
        }
    }
}

void add_edges(DocumentStore& store, const std::vector<EdgeState>& edges, const Operation& op) {
    for (const auto& edge : edges) {
        if (!store.has_block(edge.source) || !store.has_block(edge.target)) {
            spdlog::warn("{} {}: dropping edge {} ({} -> {}), endpoint no longer exists",
                         to_string_view(op.kind()), op.id, edge.id, edge.source, edge.target);
            continue;
        }
        store.add_edge(edge);
    }
}

void remove_edges(DocumentStore& store, const std::vector<EdgeState>& edges) {
    for (const auto& edge : edges) {
        if (store.has_edge(edge.id)) store.remove_edge(edge.id);
    }
}

}  // anonymous namespace

auto apply_operation(DocumentStore& store, const Operation& op) -> ApplyResult {
    if (auto missing = missing_referents(op, store); !missing.empty()) {
        return ApplyResult{.status = ApplyStatus::skipped, .missing = std::move(missing)};
    }

    std::visit(overload{
        [&](const AddBlockPayload& p) {
            auto blocks = std::vector<const BlockState*>{&p.block};
            for (const auto& c : p.children) blocks.push_back(&c);
            add_blocks_parent_first(store, std::move(blocks));
            add_edges(store, p.edges, op);
        },
        [&](const RemoveBlockPayload& p) {
            store.remove_block(p.block.id);
        },
        [&](const DuplicateBlockPayload& p) {
            store.add_block(p.block);
            add_edges(store, p.edges, op);
        },
        [&](const MoveBlockPayload& p) {
            store.update_position(p.block_id, p.after);
        },
        [&](const BatchMoveBlocksPayload& p) {
            for (const auto& m : p.moves) store.update_position(m.block_id, m.after);
        },
        [&](const BatchAddBlocksPayload& p) {
            auto blocks = std::vector<const BlockState*>{};
            for (const auto& b : p.blocks) blocks.push_back(&b);
            add_blocks_parent_first(store, std::move(blocks));
            add_edges(store, p.edges, op);
        },
        [&](const BatchRemoveBlocksPayload& p) {
            // Children may already be gone with their container.
            for (const auto& b : p.blocks) {
                if (store.has_block(b.id)) store.remove_block(b.id);
            }
        },
        [&](const AddEdgePayload& p) {
            store.add_edge(p.edge);
        },
        [&](const RemoveEdgePayload& p) {
            store.remove_edge(p.edge.id);
        },
        [&](const UpdateParentPayload& p) {
            remove_edges(store, p.detached_edges);
            store.update_parent(p.block_id, p.new_parent);
            store.update_position(p.block_id, p.new_position);
            add_edges(store, p.attached_edges, op);
        },
        [&](const UpdateSubflowConfigPayload& p) {
            store.update_subflow_config(p.block_id, p.subflow, p.after);
        },
        [&](const AddVariablePayload& p) {
            store.add_variable(p.variable);
        },
        [&](const RemoveVariablePayload& p) {
            store.remove_variable(p.variable.id);
        },
        [&](const UpdateVariablePayload& p) {
            store.update_variable(p.variable_id, p.field, p.after);
        },
    }, op.payload);

    return ApplyResult{};
}

}  // namespace oplog_cpp
