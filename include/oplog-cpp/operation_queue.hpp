/// @file operation_queue.hpp
/// @brief Client-side outbox of operations awaiting server confirmation.

#pragma once

#include <oplog-cpp/error.hpp>
#include <oplog-cpp/event_loop.hpp>
#include <oplog-cpp/op.hpp>
#include <oplog-cpp/transport.hpp>
#include <oplog-cpp/types.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace oplog_cpp {

/// Lifecycle state of a queued operation.
enum class QueueState : std::uint8_t {
    pending,    ///< Sent or waiting to be sent.
    confirmed,  ///< Acknowledged by the server.
    failed,     ///< Terminally failed.
};

constexpr auto to_string_view(QueueState state) noexcept -> std::string_view {
    switch (state) {
        case QueueState::pending:   return "pending";
        case QueueState::confirmed: return "confirmed";
        case QueueState::failed:    return "failed";
    }
    return "unknown";
}

/// An outbox entry.
struct QueuedOperation {
    OperationId id;
    Operation operation;
    DocumentId document_id;
    ActorId actor_id;
    QueueState state{QueueState::pending};
    bool retryable{true};         ///< False to fail terminally on the first failure.
    std::uint32_t attempts{0};    ///< Number of times the operation was emitted.
    std::optional<Error> error;   ///< Set once the entry failed terminally.

    auto operator==(const QueuedOperation&) const -> bool = default;
};

/// Wrap an operation into a pending outbox entry.
auto make_queued(Operation op, bool retryable = true) -> QueuedOperation;

struct QueueOptions {
    std::uint32_t max_retries{3};         ///< Retries after the first emission.
    std::int64_t base_backoff_ms{1000};   ///< Delay before the first retry.
    std::int64_t max_backoff_ms{10000};   ///< Upper bound on the delay.
};

/// Retry delay before retry number `attempt` (1-based).
auto backoff_delay(const QueueOptions& options, std::uint32_t attempt) -> std::int64_t;

/// Ordered outbox between the recorder and the transport.
///
/// Operations are applied locally before they are confirmed (optimistic
/// UI) and emitted as soon as they are enqueued. A failed emission is
/// retried with exponential backoff on the event loop. While an entry
/// waits for its retry, later entries touching the same entity are held
/// back, including ones already sent: those are sent again right after
/// the retried entry, so the last operation the server sees for an
/// entity is always the last one enqueued. A confirmation of a held
/// entry's earlier attempt is ignored.
///
/// An operation the transport cannot send at all (anything thrown other
/// than TransportError) fails terminally with `invalid_operation`. A
/// terminal failure leaves the optimistic local mutation in place and is
/// reported to the failure handler.
class OperationQueue {
public:
    using LocalAction = std::function<void()>;
    using FailureHandler = std::function<void(const QueuedOperation&)>;

    OperationQueue(Transport& transport, EventLoop& loop, QueueOptions options = {});
    ~OperationQueue();

    OperationQueue(const OperationQueue&) = delete;
    auto operator=(const OperationQueue&) -> OperationQueue& = delete;

    /// Run `local_action`, append `op` to the outbox and emit it.
    void enqueue(QueuedOperation op, const LocalAction& local_action = {});

    /// The server acknowledged an operation. Unknown ids are ignored.
    void confirm(const OperationId& id);

    /// The server or transport reported a failure.
    ///
    /// Retryable failures are re-emitted after a backoff delay until
    /// max_retries is reached; anything else fails terminally.
    void fail(const OperationId& id, bool retryable, std::string message = {});

    /// Remove every outbox entry that mentions `entity_id`.
    /// @return The number of entries removed.
    auto cancel_operations_for_entity(const EntityId& entity_id) -> std::size_t;

    /// Outbox entries in enqueue order.
    auto pending() const -> std::vector<QueuedOperation>;

    /// True if `id` is still in the outbox.
    auto contains(const OperationId& id) const -> bool;

    auto size() const -> std::size_t { return outbox_.size(); }
    auto empty() const -> bool { return outbox_.empty(); }

    /// Terminally failed entries not yet dismissed.
    auto failed_operations() const -> const std::vector<QueuedOperation>& { return failed_; }

    /// Forget a terminally failed entry once the UI has shown it.
    auto dismiss_failed(const OperationId& id) -> bool;

    /// Drop the outbox and cancel pending retries.
    void clear();

    void set_failure_handler(FailureHandler handler) { on_failure_ = std::move(handler); }

    auto options() const -> const QueueOptions& { return options_; }

private:
    enum class Emission : std::uint8_t {
        in_flight,       // emitted, awaiting ack
        awaiting_retry,  // failed, retry timer armed
        held,            // waiting to be (re-)emitted behind an earlier entry for its entity
    };

    struct Slot {
        QueuedOperation op;
        Emission emission{Emission::held};
        std::optional<EventLoop::TimerId> retry_timer;
    };

    auto find(const OperationId& id) -> std::deque<Slot>::iterator;
    auto blocked(std::deque<Slot>::const_iterator slot) const -> bool;
    void emit(std::deque<Slot>::iterator slot);
    void retry(const OperationId& id);
    void hold_followers(std::deque<Slot>::iterator slot);
    void fail_terminally(std::deque<Slot>::iterator slot, Error error);
    void release_held();

    Transport& transport_;
    EventLoop& loop_;
    QueueOptions options_;
    std::deque<Slot> outbox_;
    std::vector<QueuedOperation> failed_;
    FailureHandler on_failure_;
};

}  // namespace oplog_cpp
