/// @file session.hpp
/// @brief The editing session: the API the UI layer talks to.

#pragma once

#include <oplog-cpp/document_store.hpp>
#include <oplog-cpp/event_loop.hpp>
#include <oplog-cpp/guard.hpp>
#include <oplog-cpp/ids.hpp>
#include <oplog-cpp/ledger.hpp>
#include <oplog-cpp/op.hpp>
#include <oplog-cpp/operation_queue.hpp>
#include <oplog-cpp/ordering_filter.hpp>
#include <oplog-cpp/recorder.hpp>
#include <oplog-cpp/remote_dispatcher.hpp>
#include <oplog-cpp/transport.hpp>
#include <oplog-cpp/types.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace oplog_cpp {

/// Construction options of a Session.
struct SessionOptions {
    ActorId actor_id;                         ///< The local actor.
    std::size_t ledger_capacity{100};         ///< Undo depth when the session owns its ledger.
    QueueOptions queue{};                     ///< Retry policy of the outbox.
    Clock clock{};                            ///< Timestamp source; system clock if empty.
    std::optional<std::string> log_level;     ///< Applied with set_log_level() if set.
};

/// One actor editing one document at a time.
///
/// Wires the recorder, remote dispatcher, operation queue, guard,
/// ordering filter and ledger to a document store and a transport. The
/// ledger is owned by default; pass a shared one to keep the histories
/// of several actors in the same place, as a multi-account client does.
///
/// The session registers itself as the transport's handler for every
/// inbound event and unregisters on destruction. It is neither copyable
/// nor movable.
///
/// @code
/// auto session = Session{store, transport, loop, SessionOptions{.actor_id = "alice"}};
/// session.open_document("doc-1");
/// session.recorder().record_move("b1", {0, 0}, {10, 10});
/// session.undo();
/// loop.run_microtasks();
/// @endcode
class Session {
public:
    Session(DocumentStore& store, Transport& transport, EventLoop& loop,
            SessionOptions options, std::shared_ptr<Ledger> ledger = nullptr);
    ~Session();

    Session(const Session&) = delete;
    auto operator=(const Session&) -> Session& = delete;
    Session(Session&&) = delete;
    auto operator=(Session&&) -> Session& = delete;

    // -- Document lifecycle ---------------------------------------------------

    /// Make `document_id` the active document. Switching away from another
    /// document closes it first.
    void open_document(DocumentId document_id);

    /// Clear this actor's history and the ordering table of the active
    /// document, cancel its queued retries, and deactivate it.
    void close_document();

    auto active_document() const -> const std::optional<DocumentId>& { return active_.document_id; }
    auto actor_id() const -> const ActorId& { return active_.actor_id; }

    // -- Undo / redo ----------------------------------------------------------

    /// Replay the inverse of the newest undo entry.
    ///
    /// Returns the entry, now on the redo stack, or nullopt if there was
    /// nothing to undo or a replay is already in progress. A replay whose
    /// target no longer exists is skipped with a warning and the entries
    /// that can no longer be replayed are pruned; undo never throws.
    auto undo() -> std::optional<OperationEntry>;

    /// Replay the operation of the newest redo entry. Mirrors undo().
    auto redo() -> std::optional<OperationEntry>;

    auto can_undo() const -> bool { return stack_sizes().undo_size > 0; }
    auto can_redo() const -> bool { return stack_sizes().redo_size > 0; }

    /// Stack sizes of this actor on the active document.
    auto stack_sizes() const -> StackSizes;

    /// Drop this actor's history of the active document.
    void clear_stacks();

    // -- Components -----------------------------------------------------------

    auto recorder() -> Recorder& { return recorder_; }
    auto dispatcher() -> RemoteDispatcher& { return dispatcher_; }
    auto queue() -> OperationQueue& { return queue_; }
    auto queue() const -> const OperationQueue& { return queue_; }
    auto guard() const -> const RemoteApplicationGuard& { return guard_; }
    auto ordering() const -> const OrderingFilter& { return ordering_; }
    auto ledger() -> Ledger& { return *ledger_; }
    auto ledger() const -> const Ledger& { return *ledger_; }
    auto store() -> DocumentStore& { return store_; }

private:
    auto replay(const Operation& action, std::string_view direction) -> bool;
    void register_handlers();
    void unregister_handlers();

    DocumentStore& store_;
    Transport& transport_;
    EventLoop& loop_;
    Clock clock_;
    std::shared_ptr<Ledger> ledger_;
    ActiveDocument active_;
    RemoteApplicationGuard guard_;
    OrderingFilter ordering_;
    OperationQueue queue_;
    Recorder recorder_;
    RemoteDispatcher dispatcher_;
};

}  // namespace oplog_cpp
