/// @file types.hpp
/// @brief Core identity types: DocumentId, ActorId, EntityId, OperationId, Position.

#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace oplog_cpp {

/// Identifies a shared graph document.
using DocumentId = std::string;

/// Identifies a participant editing a document.
using ActorId = std::string;

/// Identifies a block, edge or variable inside a document.
using EntityId = std::string;

/// Identifies a single operation. Unique across all actors.
using OperationId = std::string;

/// The three kinds of entity a document holds.
enum class EntityKind : std::uint8_t {
    block,     ///< A node of the graph.
    edge,      ///< A connection between two blocks.
    variable,  ///< A document-level variable.
};

/// Convert an EntityKind to its string representation.
constexpr auto to_string_view(EntityKind kind) noexcept -> std::string_view {
    switch (kind) {
        case EntityKind::block:    return "block";
        case EntityKind::edge:     return "edge";
        case EntityKind::variable: return "variable";
    }
    return "unknown";
}

/// A canvas position.
struct Position {
    double x{0.0};  ///< Horizontal coordinate.
    double y{0.0};  ///< Vertical coordinate.

    auto operator==(const Position&) const -> bool = default;
};

/// Key of one undo/redo stack pair: (document, actor).
///
/// Actors never share a stack, so concurrent editors of the same
/// document never contend on the same history.
struct LedgerKey {
    DocumentId document_id;  ///< The document the history belongs to.
    ActorId actor_id;        ///< The actor whose edits are recorded.

    auto operator<=>(const LedgerKey&) const = default;
    auto operator==(const LedgerKey&) const -> bool = default;
};

/// Document and actor a session is currently editing as.
struct ActiveDocument {
    std::optional<DocumentId> document_id;  ///< Unset while no document is open.
    ActorId actor_id;                       ///< The local actor.
};

}  // namespace oplog_cpp

// -- std::hash specializations ------------------------------------------------

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<oplog_cpp::LedgerKey> {
    auto operator()(const oplog_cpp::LedgerKey& key) const noexcept -> std::size_t {
        auto h1 = std::hash<std::string>{}(key.document_id);
        auto h2 = std::hash<std::string>{}(key.actor_id);
        return h1 ^ (h2 << 1);
    }
};

/// @endcond
