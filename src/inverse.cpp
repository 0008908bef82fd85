#include <oplog-cpp/inverse.hpp>

#include <utility>

namespace oplog_cpp {

namespace {

auto invert(const Payload& payload) -> Payload {
    return std::visit(overload{
        [](const AddBlockPayload& p) -> Payload {
            return RemoveBlockPayload{.block = p.block, .edges = p.edges, .children = p.children};
        },
        [](const RemoveBlockPayload& p) -> Payload {
            return AddBlockPayload{.block = p.block, .edges = p.edges, .children = p.children};
        },
        [](const DuplicateBlockPayload& p) -> Payload {
            return RemoveBlockPayload{.block = p.block, .edges = p.edges, .children = {}};
        },
        [](const MoveBlockPayload& p) -> Payload {
            return MoveBlockPayload{.block_id = p.block_id, .before = p.after, .after = p.before};
        },
        [](const BatchMoveBlocksPayload& p) -> Payload {
            auto inverse = BatchMoveBlocksPayload{};
            inverse.moves.reserve(p.moves.size());
            for (const auto& m : p.moves) {
                inverse.moves.push_back(BlockMove{.block_id = m.block_id, .before = m.after, .after = m.before});
            }
            return inverse;
        },
        [](const BatchAddBlocksPayload& p) -> Payload {
            return BatchRemoveBlocksPayload{.blocks = p.blocks, .edges = p.edges};
        },
        [](const BatchRemoveBlocksPayload& p) -> Payload {
            return BatchAddBlocksPayload{.blocks = p.blocks, .edges = p.edges};
        },
        [](const AddEdgePayload& p) -> Payload {
            return RemoveEdgePayload{.edge = p.edge};
        },
        [](const RemoveEdgePayload& p) -> Payload {
            return AddEdgePayload{.edge = p.edge};
        },
        [](const UpdateParentPayload& p) -> Payload {
            return UpdateParentPayload{
                .block_id = p.block_id,
                .old_parent = p.new_parent,
                .new_parent = p.old_parent,
                .old_position = p.new_position,
                .new_position = p.old_position,
                .detached_edges = p.attached_edges,
                .attached_edges = p.detached_edges,
            };
        },
        [](const UpdateSubflowConfigPayload& p) -> Payload {
            return UpdateSubflowConfigPayload{
                .block_id = p.block_id,
                .subflow = p.subflow,
                .before = p.after,
                .after = p.before,
            };
        },
        [](const AddVariablePayload& p) -> Payload {
            return RemoveVariablePayload{.variable = p.variable};
        },
        [](const RemoveVariablePayload& p) -> Payload {
            return AddVariablePayload{.variable = p.variable};
        },
        [](const UpdateVariablePayload& p) -> Payload {
            return UpdateVariablePayload{
                .variable_id = p.variable_id,
                .field = p.field,
                .before = p.after,
                .after = p.before,
            };
        },
    }, payload);
}

}  // anonymous namespace

auto make_inverse(const Operation& op) -> Operation {
    return Operation{
        .id = op.id + ":inverse",
        .timestamp = op.timestamp,
        .document_id = op.document_id,
        .actor_id = op.actor_id,
        .payload = invert(op.payload),
    };
}

auto make_entry(Operation op) -> OperationEntry {
    auto inverse = make_inverse(op);
    auto id = op.id;
    return OperationEntry{
        .id = std::move(id),
        .operation = std::move(op),
        .inverse = std::move(inverse),
    };
}

}  // namespace oplog_cpp
