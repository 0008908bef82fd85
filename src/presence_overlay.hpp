#pragma once

// Internal header, not installed. Entity presence on top of a GraphView,
// used by Ledger::prune_invalid_entries() to simulate replay order.

#include <oplog-cpp/graph.hpp>
#include <oplog-cpp/referents.hpp>
#include <oplog-cpp/types.hpp>

#include <unordered_set>

namespace oplog_cpp::detail {

// One kind of entity: ids added or removed relative to the base graph.
struct PresenceDelta {
    std::unordered_set<EntityId> added;
    std::unordered_set<EntityId> removed;

    template <typename BaseHas>
    auto has(const EntityId& id, BaseHas&& base_has) const -> bool {
        if (added.contains(id)) return true;
        if (removed.contains(id)) return false;
        return base_has(id);
    }

    void add(const EntityId& id) {
        removed.erase(id);
        added.insert(id);
    }

    void remove(const EntityId& id) {
        added.erase(id);
        removed.insert(id);
    }
};

class PresenceOverlay {
public:
    explicit PresenceOverlay(const GraphView& base) : base_{base} {}

    auto has_block(const EntityId& id) const -> bool {
        return blocks_.has(id, [&](const EntityId& i) { return base_.has_block(i); });
    }
    auto has_edge(const EntityId& id) const -> bool {
        return edges_.has(id, [&](const EntityId& i) { return base_.has_edge(i); });
    }
    auto has_variable(const EntityId& id) const -> bool {
        return variables_.has(id, [&](const EntityId& i) { return base_.has_variable(i); });
    }

    // Fold the effect of applying `op` into the overlay.
    void apply_effects(const Operation& op) {
        auto removed = removed_entities(op);
        for (const auto& id : removed.blocks) blocks_.remove(id);
        for (const auto& id : removed.edges) edges_.remove(id);
        for (const auto& id : removed.variables) variables_.remove(id);

        auto created = created_entities(op);
        for (const auto& id : created.blocks) blocks_.add(id);
        for (const auto& id : created.edges) edges_.add(id);
        for (const auto& id : created.variables) variables_.add(id);
    }

private:
    const GraphView& base_;
    PresenceDelta blocks_;
    PresenceDelta edges_;
    PresenceDelta variables_;
};

static_assert(EntityLookup<PresenceOverlay>);

}  // namespace oplog_cpp::detail
