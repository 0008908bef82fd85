/// @file ordering_filter.hpp
/// @brief Per-entity staleness filter for high-frequency updates.

#pragma once

#include <oplog-cpp/types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>

namespace oplog_cpp {

/// Drops inbound updates older than the newest one already applied.
///
/// Drag positions are sent many times per second by several actors and
/// may arrive out of send order. Comparing sender timestamps makes the
/// latest intent win instead of the latest arrival. One filter covers
/// one document; clear it when the active document changes.
class OrderingFilter {
public:
    OrderingFilter() = default;

    /// True if an update for `entity_id` stamped `timestamp` should apply.
    ///
    /// Applies iff timestamp >= last_seen(entity_id) and then advances
    /// last_seen. An update without a timestamp always applies and leaves
    /// the table unchanged.
    auto should_apply(const EntityId& entity_id, std::optional<std::int64_t> timestamp) -> bool;

    /// Timestamp of the newest applied update for `entity_id`, 0 if none.
    auto last_seen(const EntityId& entity_id) const -> std::int64_t;

    /// Drop the row of an entity that no longer exists.
    void forget(const EntityId& entity_id);

    /// Drop every row.
    void clear();

    auto size() const -> std::size_t { return last_seen_.size(); }

private:
    std::unordered_map<EntityId, std::int64_t> last_seen_;
};

}  // namespace oplog_cpp
