/// @file graph.hpp
/// @brief Entity snapshots and the materialized graph view.

#pragma once

#include <oplog-cpp/types.hpp>
#include <oplog-cpp/value.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace oplog_cpp {

/// The two container kinds that own nested blocks.
enum class SubflowKind : std::uint8_t {
    loop,      ///< Iterates its children a number of times.
    parallel,  ///< Runs its children concurrently.
};

/// Convert a SubflowKind to its string representation.
constexpr auto to_string_view(SubflowKind kind) noexcept -> std::string_view {
    switch (kind) {
        case SubflowKind::loop:     return "loop";
        case SubflowKind::parallel: return "parallel";
    }
    return "unknown";
}

/// Full state of a block, as captured at snapshot time.
///
/// A removal carries one of these for every block it deletes, so the
/// block can be rebuilt later without reading live state.
struct BlockState {
    EntityId id;                         ///< Block identifier.
    std::string type;                    ///< Block type (e.g. "agent", "loop").
    std::string name;                    ///< Display name.
    Position position;                   ///< Canvas position.
    std::optional<EntityId> parent_id;   ///< Containing loop/parallel block, if any.
    bool enabled{true};                  ///< Whether the block takes part in execution.
    FieldMap subblocks;                  ///< Sub-block (form field) values.
    FieldMap data;                       ///< Container configuration (loop count, ...).

    auto operator==(const BlockState&) const -> bool = default;
};

/// A connection between two blocks.
struct EdgeState {
    EntityId id;                ///< Edge identifier.
    EntityId source;            ///< Source block.
    EntityId target;            ///< Target block.
    std::string source_handle;  ///< Output handle on the source block.
    std::string target_handle;  ///< Input handle on the target block.

    auto operator==(const EdgeState&) const -> bool = default;
};

/// A document-level variable.
struct VariableState {
    EntityId id;        ///< Variable identifier.
    std::string name;   ///< Variable name.
    std::string type;   ///< Declared type ("string", "number", ...).
    FieldValue value;   ///< Current value.

    auto operator==(const VariableState&) const -> bool = default;
};

/// A copy of the materialized graph, keyed by entity id.
struct GraphView {
    std::unordered_map<EntityId, BlockState> blocks_by_id;
    std::unordered_map<EntityId, EdgeState> edges_by_id;
    std::unordered_map<EntityId, VariableState> variables_by_id;

    auto has_block(const EntityId& id) const -> bool { return blocks_by_id.contains(id); }
    auto has_edge(const EntityId& id) const -> bool { return edges_by_id.contains(id); }
    auto has_variable(const EntityId& id) const -> bool { return variables_by_id.contains(id); }

    auto operator==(const GraphView&) const -> bool = default;
};

}  // namespace oplog_cpp
