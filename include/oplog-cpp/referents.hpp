/// @file referents.hpp
/// @brief Entity reference extraction for operations.

#pragma once

#include <oplog-cpp/op.hpp>
#include <oplog-cpp/types.hpp>

#include <algorithm>
#include <concepts>
#include <utility>
#include <vector>

namespace oplog_cpp {

/// Entity ids grouped by kind.
struct EntityRefs {
    std::vector<EntityId> blocks;
    std::vector<EntityId> edges;
    std::vector<EntityId> variables;

    auto empty() const -> bool {
        return blocks.empty() && edges.empty() && variables.empty();
    }

    /// True if `id` appears in any of the three lists.
    auto contains(const EntityId& id) const -> bool {
        return std::ranges::find(blocks, id) != blocks.end()
            || std::ranges::find(edges, id) != edges.end()
            || std::ranges::find(variables, id) != variables.end();
    }

    auto operator==(const EntityRefs&) const -> bool = default;
};

/// Entities that must exist for `op` to apply.
///
/// Removals, moves and updates need their target. Additions need the
/// parent container unless the operation creates it itself. Edges carried
/// in a block snapshot are not required: their endpoints outside the
/// snapshot may have gone away and the edge is then dropped on replay.
auto required_referents(const Operation& op) -> EntityRefs;

/// Entities that exist after `op` applies and that it brings into being.
auto created_entities(const Operation& op) -> EntityRefs;

/// Entities that no longer exist after `op` applies.
auto removed_entities(const Operation& op) -> EntityRefs;

/// Every entity `op` mentions, including edge endpoints and parents.
auto referenced_entities(const Operation& op) -> EntityRefs;

/// True if `op` mentions `id` anywhere in its payload.
auto references_entity(const Operation& op, const EntityId& id) -> bool;

/// Anything that can answer presence queries for entity ids.
template <typename G>
concept EntityLookup = requires(const G& g, const EntityId& id) {
    { g.has_block(id) } -> std::convertible_to<bool>;
    { g.has_edge(id) } -> std::convertible_to<bool>;
    { g.has_variable(id) } -> std::convertible_to<bool>;
};

/// Required referents of `op` that `lookup` does not contain.
template <EntityLookup G>
auto missing_referents(const Operation& op, const G& lookup) -> EntityRefs {
    auto required = required_referents(op);
    auto missing = EntityRefs{};
    for (auto& id : required.blocks) {
        if (!lookup.has_block(id)) missing.blocks.push_back(std::move(id));
    }
    for (auto& id : required.edges) {
        if (!lookup.has_edge(id)) missing.edges.push_back(std::move(id));
    }
    for (auto& id : required.variables) {
        if (!lookup.has_variable(id)) missing.variables.push_back(std::move(id));
    }
    return missing;
}

}  // namespace oplog_cpp
