#include <oplog-cpp/referents.hpp>

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace oplog_cpp {

namespace {

// Appends ids without duplicates, preserving first-seen order.
class RefCollector {
public:
    void block(const EntityId& id) { add(refs_.blocks, seen_blocks_, id); }
    void edge(const EntityId& id) { add(refs_.edges, seen_edges_, id); }
    void variable(const EntityId& id) { add(refs_.variables, seen_variables_, id); }

    void parent_of(const BlockState& b) {
        if (b.parent_id) block(*b.parent_id);
    }

    void edge_with_endpoints(const EdgeState& e) {
        edge(e.id);
        block(e.source);
        block(e.target);
    }

    auto take() -> EntityRefs { return std::move(refs_); }

private:
    static void add(std::vector<EntityId>& out, std::unordered_set<EntityId>& seen,
                    const EntityId& id) {
        if (seen.insert(id).second) out.push_back(id);
    }

    EntityRefs refs_;
    std::unordered_set<EntityId> seen_blocks_;
    std::unordered_set<EntityId> seen_edges_;
    std::unordered_set<EntityId> seen_variables_;
};

// Parents referenced by `blocks` that the same set does not contain.
void require_outside_parents(RefCollector& out, const std::vector<const BlockState*>& blocks) {
    auto inside = std::unordered_set<EntityId>{};
    for (const auto* b : blocks) inside.insert(b->id);
    for (const auto* b : blocks) {
        if (b->parent_id && !inside.contains(*b->parent_id)) out.block(*b->parent_id);
    }
}

auto block_set(const BlockState& block, const std::vector<BlockState>& rest)
    -> std::vector<const BlockState*> {
    auto result = std::vector<const BlockState*>{&block};
    for (const auto& b : rest) result.push_back(&b);
    return result;
}

auto block_set(const std::vector<BlockState>& blocks) -> std::vector<const BlockState*> {
    auto result = std::vector<const BlockState*>{};
    for (const auto& b : blocks) result.push_back(&b);
    return result;
}

}  // anonymous namespace

auto required_referents(const Operation& op) -> EntityRefs {
    auto out = RefCollector{};
    std::visit(overload{
        [&](const AddBlockPayload& p) { require_outside_parents(out, block_set(p.block, p.children)); },
        [&](const RemoveBlockPayload& p) { out.block(p.block.id); },
        [&](const DuplicateBlockPayload& p) { out.parent_of(p.block); },
        [&](const MoveBlockPayload& p) { out.block(p.block_id); },
        [&](const BatchMoveBlocksPayload& p) {
            for (const auto& m : p.moves) out.block(m.block_id);
        },
        [&](const BatchAddBlocksPayload& p) { require_outside_parents(out, block_set(p.blocks)); },
        [&](const BatchRemoveBlocksPayload& p) {
            for (const auto& b : p.blocks) out.block(b.id);
        },
        [&](const AddEdgePayload& p) {
            out.block(p.edge.source);
            out.block(p.edge.target);
        },
        [&](const RemoveEdgePayload& p) { out.edge(p.edge.id); },
        [&](const UpdateParentPayload& p) {
            out.block(p.block_id);
            if (p.new_parent) out.block(*p.new_parent);
        },
        [&](const UpdateSubflowConfigPayload& p) { out.block(p.block_id); },
        [&](const AddVariablePayload&) {},
        [&](const RemoveVariablePayload& p) { out.variable(p.variable.id); },
        [&](const UpdateVariablePayload& p) { out.variable(p.variable_id); },
    }, op.payload);
    return out.take();
}

auto created_entities(const Operation& op) -> EntityRefs {
    auto out = RefCollector{};
    std::visit(overload{
        [&](const AddBlockPayload& p) {
            out.block(p.block.id);
            for (const auto& c : p.children) out.block(c.id);
            for (const auto& e : p.edges) out.edge(e.id);
        },
        [&](const DuplicateBlockPayload& p) {
            out.block(p.block.id);
            for (const auto& e : p.edges) out.edge(e.id);
        },
        [&](const BatchAddBlocksPayload& p) {
            for (const auto& b : p.blocks) out.block(b.id);
            for (const auto& e : p.edges) out.edge(e.id);
        },
        [&](const AddEdgePayload& p) { out.edge(p.edge.id); },
        [&](const UpdateParentPayload& p) {
            for (const auto& e : p.attached_edges) out.edge(e.id);
        },
        [&](const AddVariablePayload& p) { out.variable(p.variable.id); },
        [](const auto&) {},
    }, op.payload);
    return out.take();
}

auto removed_entities(const Operation& op) -> EntityRefs {
    auto out = RefCollector{};
    std::visit(overload{
        [&](const RemoveBlockPayload& p) {
            out.block(p.block.id);
            for (const auto& c : p.children) out.block(c.id);
            for (const auto& e : p.edges) out.edge(e.id);
        },
        [&](const BatchRemoveBlocksPayload& p) {
            for (const auto& b : p.blocks) out.block(b.id);
            for (const auto& e : p.edges) out.edge(e.id);
        },
        [&](const RemoveEdgePayload& p) { out.edge(p.edge.id); },
        [&](const UpdateParentPayload& p) {
            for (const auto& e : p.detached_edges) out.edge(e.id);
        },
        [&](const RemoveVariablePayload& p) { out.variable(p.variable.id); },
        [](const auto&) {},
    }, op.payload);
    return out.take();
}

auto referenced_entities(const Operation& op) -> EntityRefs {
    auto out = RefCollector{};
    auto snapshot = [&](const BlockState& b) {
        out.block(b.id);
        out.parent_of(b);
    };
    std::visit(overload{
        [&](const AddBlockPayload& p) {
            snapshot(p.block);
            for (const auto& c : p.children) snapshot(c);
            for (const auto& e : p.edges) out.edge_with_endpoints(e);
        },
        [&](const RemoveBlockPayload& p) {
            snapshot(p.block);
            for (const auto& c : p.children) snapshot(c);
            for (const auto& e : p.edges) out.edge_with_endpoints(e);
        },
        [&](const DuplicateBlockPayload& p) {
            snapshot(p.block);
            out.block(p.source_id);
            for (const auto& e : p.edges) out.edge_with_endpoints(e);
        },
        [&](const MoveBlockPayload& p) { out.block(p.block_id); },
        [&](const BatchMoveBlocksPayload& p) {
            for (const auto& m : p.moves) out.block(m.block_id);
        },
        [&](const BatchAddBlocksPayload& p) {
            for (const auto& b : p.blocks) snapshot(b);
            for (const auto& e : p.edges) out.edge_with_endpoints(e);
        },
        [&](const BatchRemoveBlocksPayload& p) {
            for (const auto& b : p.blocks) snapshot(b);
            for (const auto& e : p.edges) out.edge_with_endpoints(e);
        },
        [&](const AddEdgePayload& p) { out.edge_with_endpoints(p.edge); },
        [&](const RemoveEdgePayload& p) { out.edge_with_endpoints(p.edge); },
        [&](const UpdateParentPayload& p) {
            out.block(p.block_id);
            if (p.old_parent) out.block(*p.old_parent);
            if (p.new_parent) out.block(*p.new_parent);
            for (const auto& e : p.detached_edges) out.edge_with_endpoints(e);
            for (const auto& e : p.attached_edges) out.edge_with_endpoints(e);
        },
        [&](const UpdateSubflowConfigPayload& p) { out.block(p.block_id); },
        [&](const AddVariablePayload& p) { out.variable(p.variable.id); },
        [&](const RemoveVariablePayload& p) { out.variable(p.variable.id); },
        [&](const UpdateVariablePayload& p) { out.variable(p.variable_id); },
    }, op.payload);
    return out.take();
}

auto references_entity(const Operation& op, const EntityId& id) -> bool {
    return referenced_entities(op).contains(id);
}

}  // namespace oplog_cpp
