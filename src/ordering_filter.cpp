#include <oplog-cpp/ordering_filter.hpp>

#include <spdlog/spdlog.h>

namespace oplog_cpp {

auto OrderingFilter::should_apply(const EntityId& entity_id,
                                  std::optional<std::int64_t> timestamp) -> bool {
    if (!timestamp) {
        spdlog::warn("update for {} has no timestamp, applying without ordering check", entity_id);
        return true;
    }
    auto& last = last_seen_[entity_id];
    if (*timestamp < last) {
        spdlog::debug("dropping stale update for {} ({} < {})", entity_id, *timestamp, last);
        return false;
    }
    last = *timestamp;
    return true;
}

auto OrderingFilter::last_seen(const EntityId& entity_id) const -> std::int64_t {
    auto it = last_seen_.find(entity_id);
    return it != last_seen_.end() ? it->second : 0;
}

void OrderingFilter::forget(const EntityId& entity_id) {
    last_seen_.erase(entity_id);
}

void OrderingFilter::clear() {
    last_seen_.clear();
}

}  // namespace oplog_cpp
