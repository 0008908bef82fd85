#include <oplog-cpp/remote_dispatcher.hpp>

#include <oplog-cpp/apply.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace oplog_cpp {

namespace {

// Entities present in `before` and absent from `after`.
auto vanished(const GraphView& before, const GraphView& after) -> EntityRefs {
    auto refs = EntityRefs{};
    for (const auto& [id, block] : before.blocks_by_id) {
        if (!after.has_block(id)) refs.blocks.push_back(id);
    }
    for (const auto& [id, edge] : before.edges_by_id) {
        if (!after.has_edge(id)) refs.edges.push_back(id);
    }
    for (const auto& [id, variable] : before.variables_by_id) {
        if (!after.has_variable(id)) refs.variables.push_back(id);
    }
    return refs;
}

}  // anonymous namespace

RemoteDispatcher::RemoteDispatcher(DocumentStore& store, Ledger& ledger, OperationQueue& queue,
                                   OrderingFilter& ordering, RemoteApplicationGuard& guard,
                                   const ActiveDocument& active)
    : store_{store}, ledger_{ledger}, queue_{queue}, ordering_{ordering}, guard_{guard},
      active_{active} {}

void RemoteDispatcher::handle_operation(const Operation& op) {
    if (!is_active(op.document_id)) {
        spdlog::debug("ignoring {} {} for inactive document {}",
                      to_string_view(op.kind()), op.id, op.document_id);
        return;
    }
    if (queue_.contains(op.id)) {
        spdlog::debug("ignoring echo of own operation {}", op.id);
        return;
    }

    auto filtered = filter_positions(op);
    if (!filtered) return;

    auto removed = EntityRefs{};
    {
        auto scope = RemoteApplicationGuard::ScopedRemoteApply{guard_};
        try {
            auto result = apply_operation(store_, *filtered);
            if (!result.applied()) {
                spdlog::debug("remote {} {} was {}", to_string_view(op.kind()), op.id,
                              to_string_view(result.status));
                return;
            }
        } catch (const std::exception& e) {
            spdlog::warn("remote {} {} failed to apply: {}", to_string_view(op.kind()), op.id,
                         e.what());
            return;
        }
        removed = removed_entities(*filtered);
    }

    if (!removed.empty()) after_removal(op.document_id, removed);
}

void RemoteDispatcher::handle_entity_deleted(const EntityDeletion& deletion) {
    if (!is_active(deletion.document_id)) {
        spdlog::debug("ignoring deletion of {} for inactive document {}", deletion.entity_id,
                      deletion.document_id);
        return;
    }

    auto before = store_.graph();
    {
        auto scope = RemoteApplicationGuard::ScopedRemoteApply{guard_};
        try {
            switch (deletion.kind) {
                case EntityKind::block:    store_.remove_block(deletion.entity_id); break;
                case EntityKind::edge:     store_.remove_edge(deletion.entity_id); break;
                case EntityKind::variable: store_.remove_variable(deletion.entity_id); break;
            }
        } catch (const std::exception& e) {
            spdlog::warn("remote deletion of {} {} failed: {}", to_string_view(deletion.kind),
                         deletion.entity_id, e.what());
            return;
        }
    }

    auto removed = vanished(before, store_.graph());
    // The entity may already be gone locally; its history still has to go.
    if (!removed.contains(deletion.entity_id)) {
        switch (deletion.kind) {
            case EntityKind::block:    removed.blocks.push_back(deletion.entity_id); break;
            case EntityKind::edge:     removed.edges.push_back(deletion.entity_id); break;
            case EntityKind::variable: removed.variables.push_back(deletion.entity_id); break;
        }
    }
    after_removal(deletion.document_id, removed);
}

void RemoteDispatcher::handle_document_reverted(const DocumentRevert& revert) {
    spdlog::info("document {} reverted, dropping history of {}", revert.document_id,
                 revert.actor_id);
    ledger_.clear(revert.document_id, revert.actor_id);
    if (is_active(revert.document_id)) guard_.release();
}

auto RemoteDispatcher::is_active(const DocumentId& document_id) const -> bool {
    return active_.document_id == document_id;
}

auto RemoteDispatcher::filter_positions(const Operation& op) -> std::optional<Operation> {
    if (const auto* move = std::get_if<MoveBlockPayload>(&op.payload)) {
        if (!ordering_.should_apply(move->block_id, op.timestamp)) return std::nullopt;
        return op;
    }
    if (const auto* batch = std::get_if<BatchMoveBlocksPayload>(&op.payload)) {
        auto kept = BatchMoveBlocksPayload{};
        for (const auto& m : batch->moves) {
            if (ordering_.should_apply(m.block_id, op.timestamp)) kept.moves.push_back(m);
        }
        if (kept.moves.empty()) return std::nullopt;
        auto filtered = op;
        filtered.payload = std::move(kept);
        return filtered;
    }
    return op;
}

void RemoteDispatcher::after_removal(const DocumentId& document_id, const EntityRefs& removed) {
    auto forget = [&](const EntityId& id) {
        queue_.cancel_operations_for_entity(id);
        ordering_.forget(id);
    };
    for (const auto& id : removed.blocks) forget(id);
    for (const auto& id : removed.edges) forget(id);
    for (const auto& id : removed.variables) forget(id);

    ledger_.prune_invalid_entries(document_id, store_.graph());
}

}  // namespace oplog_cpp
