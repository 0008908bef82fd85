/// @file apply.hpp
/// @brief Applying operations to a document store.

#pragma once

#include <oplog-cpp/document_store.hpp>
#include <oplog-cpp/op.hpp>
#include <oplog-cpp/referents.hpp>

#include <cstdint>
#include <string_view>

namespace oplog_cpp {

/// Outcome of apply_operation().
enum class ApplyStatus : std::uint8_t {
    applied,  ///< The store was mutated.
    skipped,  ///< A required referent was missing; the store is unchanged.
};

constexpr auto to_string_view(ApplyStatus status) noexcept -> std::string_view {
    switch (status) {
        case ApplyStatus::applied: return "applied";
        case ApplyStatus::skipped: return "skipped";
    }
    return "unknown";
}

struct ApplyResult {
    ApplyStatus status{ApplyStatus::applied};
    EntityRefs missing;  ///< Required referents that were absent (when skipped).

    auto applied() const -> bool { return status == ApplyStatus::applied; }
    auto operator==(const ApplyResult&) const -> bool = default;
};

/// Apply `op` to `store`.
///
/// All-or-nothing with respect to required referents: if any is absent
/// nothing is mutated and the result is `skipped`. Removing an entity
/// that is already gone is therefore a no-op. Snapshot edges whose
/// endpoints no longer exist are dropped with a warning while the rest
/// of the operation applies. Never throws on missing entities; exceptions
/// raised by the store itself propagate.
auto apply_operation(DocumentStore& store, const Operation& op) -> ApplyResult;

}  // namespace oplog_cpp
