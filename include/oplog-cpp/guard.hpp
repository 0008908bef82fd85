/// @file guard.hpp
/// @brief Reentrancy guard between local recording, remote application
/// and undo/redo replay.

#pragma once

#include <oplog-cpp/event_loop.hpp>

#include <cstdint>
#include <memory>
#include <string_view>

namespace oplog_cpp {

/// Why the document is being mutated right now.
enum class ApplyContext : std::uint8_t {
    local,      ///< A user edit; it should be recorded and sent.
    remote,     ///< An inbound operation is being applied.
    undo_redo,  ///< A ledger entry is being replayed.
};

constexpr auto to_string_view(ApplyContext context) noexcept -> std::string_view {
    switch (context) {
        case ApplyContext::local:     return "local";
        case ApplyContext::remote:    return "remote";
        case ApplyContext::undo_redo: return "undo_redo";
    }
    return "unknown";
}

/// The two reentrancy flags of a document session.
///
/// Both are plain booleans rather than counters: setting a flag that is
/// already set is a no-op and the nested caller does not own it. The
/// recorder consults context() and records nothing unless it is `local`.
///
/// The undo/redo flag is released on the next microtask of the event
/// loop, not when replay returns, so listeners that fire synchronously
/// off the replayed mutation still observe it.
class RemoteApplicationGuard {
public:
    explicit RemoteApplicationGuard(EventLoop& loop)
        : loop_{loop}, undo_redo_{std::make_shared<UndoRedoFlag>()} {}

    RemoteApplicationGuard(const RemoteApplicationGuard&) = delete;
    auto operator=(const RemoteApplicationGuard&) -> RemoteApplicationGuard& = delete;

    auto applying_remote() const -> bool { return applying_remote_; }
    auto undo_redo_in_progress() const -> bool { return undo_redo_->set; }

    /// The current context. Remote application wins if both flags are set.
    auto context() const -> ApplyContext;

    /// Set applying_remote. Returns false (and changes nothing) if it was set.
    auto begin_remote_apply() -> bool;

    /// Clear applying_remote.
    void end_remote_apply();

    /// Set undo_redo_in_progress and schedule its release as a microtask.
    /// Returns false (and schedules nothing) if it was already set.
    auto begin_undo_redo() -> bool;

    /// Clear both flags immediately. Pending microtask releases become no-ops.
    void release();

    /// Sets applying_remote for the lifetime of the scope, when not already set.
    ///
    /// The destructor clears the flag only if this scope set it, so it is
    /// released on every exit path, exceptions included.
    class ScopedRemoteApply {
    public:
        explicit ScopedRemoteApply(RemoteApplicationGuard& guard)
            : guard_{guard}, owns_{guard.begin_remote_apply()} {}

        ~ScopedRemoteApply() {
            if (owns_) guard_.end_remote_apply();
        }

        ScopedRemoteApply(const ScopedRemoteApply&) = delete;
        auto operator=(const ScopedRemoteApply&) -> ScopedRemoteApply& = delete;

        /// True if this scope set the flag.
        auto owns() const -> bool { return owns_; }

    private:
        RemoteApplicationGuard& guard_;
        bool owns_;
    };

private:
    // Shared with the pending release microtask, which may outlive the guard.
    struct UndoRedoFlag {
        bool set{false};
        std::uint64_t generation{0};
    };

    EventLoop& loop_;
    bool applying_remote_{false};
    std::shared_ptr<UndoRedoFlag> undo_redo_;
};

}  // namespace oplog_cpp
