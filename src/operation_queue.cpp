#include <oplog-cpp/operation_queue.hpp>

#include <oplog-cpp/referents.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <iterator>

namespace oplog_cpp {

namespace {

auto shares_entity(const EntityRefs& a, const EntityRefs& b) -> bool {
    auto in_b = [&](const EntityId& id) { return b.contains(id); };
    return std::ranges::any_of(a.blocks, in_b)
        || std::ranges::any_of(a.edges, in_b)
        || std::ranges::any_of(a.variables, in_b);
}

}  // anonymous namespace

auto make_queued(Operation op, bool retryable) -> QueuedOperation {
    auto queued = QueuedOperation{};
    queued.id = op.id;
    queued.document_id = op.document_id;
    queued.actor_id = op.actor_id;
    queued.retryable = retryable;
    queued.operation = std::move(op);
    return queued;
}

auto backoff_delay(const QueueOptions& options, std::uint32_t attempt) -> std::int64_t {
    if (attempt == 0) return 0;
    auto delay = options.base_backoff_ms;
    for (auto i = std::uint32_t{1}; i < attempt && delay < options.max_backoff_ms; ++i) {
        delay *= 2;
    }
    return std::min(delay, options.max_backoff_ms);
}

OperationQueue::OperationQueue(Transport& transport, EventLoop& loop, QueueOptions options)
    : transport_{transport}, loop_{loop}, options_{options} {}

OperationQueue::~OperationQueue() {
    clear();
}

void OperationQueue::enqueue(QueuedOperation op, const LocalAction& local_action) {
    if (contains(op.id)) {
        spdlog::warn("operation {} is already queued, ignoring", op.id);
        return;
    }
    if (local_action) local_action();

    op.state = QueueState::pending;
    outbox_.push_back(Slot{.op = std::move(op), .emission = Emission::held, .retry_timer = {}});
    auto slot = std::prev(outbox_.end());
    if (blocked(slot)) {
        spdlog::debug("holding {} behind an earlier operation on the same entity", slot->op.id);
        return;
    }
    emit(slot);
}

void OperationQueue::confirm(const OperationId& id) {
    auto it = find(id);
    if (it == outbox_.end()) {
        spdlog::debug("confirmation for unknown operation {}", id);
        return;
    }
    if (it->emission == Emission::held) {
        // Acknowledges an attempt that was pulled back behind a retry; the
        // entry goes out again once the retried entry has been re-sent.
        spdlog::debug("ignoring confirmation of {}, held for re-emission", id);
        return;
    }
    if (it->retry_timer) loop_.cancel(*it->retry_timer);
    outbox_.erase(it);
    release_held();
}

void OperationQueue::fail(const OperationId& id, bool retryable, std::string message) {
    auto it = find(id);
    if (it == outbox_.end()) {
        spdlog::debug("failure for unknown operation {}: {}", id, message);
        return;
    }
    if (it->emission != Emission::in_flight) return;

    if (!retryable || !it->op.retryable) {
        fail_terminally(it, Error{ErrorKind::rejected_operation, std::move(message)});
        release_held();
        return;
    }
    if (it->op.attempts > options_.max_retries) {
        fail_terminally(it, Error{ErrorKind::transient_network,
                                  "retries exhausted: " + message});
        release_held();
        return;
    }

    auto delay = backoff_delay(options_, it->op.attempts);
    spdlog::info("operation {} failed ({}), retry {} in {} ms",
                 id, message, it->op.attempts, delay);
    it->emission = Emission::awaiting_retry;
    it->retry_timer = loop_.post_after(delay, [this, id] { retry(id); });
    hold_followers(it);
}

auto OperationQueue::cancel_operations_for_entity(const EntityId& entity_id) -> std::size_t {
    auto removed = std::erase_if(outbox_, [&](const Slot& slot) {
        if (!references_entity(slot.op.operation, entity_id)) return false;
        if (slot.retry_timer) loop_.cancel(*slot.retry_timer);
        return true;
    });
    if (removed > 0) {
        spdlog::debug("cancelled {} queued operations for {}", removed, entity_id);
        release_held();
    }
    return removed;
}

auto OperationQueue::pending() const -> std::vector<QueuedOperation> {
    auto result = std::vector<QueuedOperation>{};
    result.reserve(outbox_.size());
    for (const auto& slot : outbox_) result.push_back(slot.op);
    return result;
}

auto OperationQueue::contains(const OperationId& id) const -> bool {
    return std::ranges::any_of(outbox_, [&](const Slot& s) { return s.op.id == id; });
}

auto OperationQueue::dismiss_failed(const OperationId& id) -> bool {
    return std::erase_if(failed_, [&](const QueuedOperation& op) { return op.id == id; }) > 0;
}

void OperationQueue::clear() {
    for (const auto& slot : outbox_) {
        if (slot.retry_timer) loop_.cancel(*slot.retry_timer);
    }
    outbox_.clear();
}

auto OperationQueue::find(const OperationId& id) -> std::deque<Slot>::iterator {
    return std::ranges::find_if(outbox_, [&](const Slot& s) { return s.op.id == id; });
}

auto OperationQueue::blocked(std::deque<Slot>::const_iterator slot) const -> bool {
    auto refs = referenced_entities(slot->op.operation);
    for (auto it = outbox_.cbegin(); it != slot; ++it) {
        if (it->emission == Emission::in_flight) continue;
        if (shares_entity(referenced_entities(it->op.operation), refs)) return true;
    }
    return false;
}

void OperationQueue::emit(std::deque<Slot>::iterator slot) {
    slot->emission = Emission::in_flight;
    slot->retry_timer.reset();
    ++slot->op.attempts;

    // The transport may report back synchronously; nothing below may touch
    // `slot` once the operation has been handed over.
    auto id = slot->op.id;
    try {
        transport_.emit_operation(slot->op.operation);
    } catch (const TransportError& e) {
        fail(id, true, e.what());
    } catch (const std::exception& e) {
        // The operation itself cannot be sent (e.g. it does not encode);
        // retrying would fail the same way.
        if (auto it = find(id); it != outbox_.end() && it->emission == Emission::in_flight) {
            fail_terminally(it, Error{ErrorKind::invalid_operation, e.what()});
            release_held();
        }
    }
}

void OperationQueue::retry(const OperationId& id) {
    auto it = find(id);
    if (it == outbox_.end() || it->emission != Emission::awaiting_retry) return;
    spdlog::debug("retrying operation {} (attempt {})", id, it->op.attempts + 1);
    emit(it);
    release_held();
}

void OperationQueue::hold_followers(std::deque<Slot>::iterator slot) {
    // Entries already sent after `slot` for the same entities would land
    // before its retry; pull them back so they are sent again after it.
    // Sharing is transitive: a pulled-back entry holds its own followers.
    auto refs = referenced_entities(slot->op.operation);
    for (auto it = std::next(slot); it != outbox_.end(); ++it) {
        auto other = referenced_entities(it->op.operation);
        if (!shares_entity(other, refs)) continue;
        if (it->emission == Emission::in_flight) {
            spdlog::debug("holding {} until {} is re-sent", it->op.id, slot->op.id);
            it->emission = Emission::held;
        }
        refs.blocks.insert(refs.blocks.end(), other.blocks.begin(), other.blocks.end());
        refs.edges.insert(refs.edges.end(), other.edges.begin(), other.edges.end());
        refs.variables.insert(refs.variables.end(), other.variables.begin(), other.variables.end());
    }
}

void OperationQueue::fail_terminally(std::deque<Slot>::iterator slot, Error error) {
    if (slot->retry_timer) loop_.cancel(*slot->retry_timer);
    auto op = std::move(slot->op);
    outbox_.erase(slot);

    spdlog::warn("operation {} ({}) failed: {}", op.id, to_string_view(op.operation.kind()),
                 error.message);
    op.state = QueueState::failed;
    op.error = std::move(error);
    failed_.push_back(op);
    if (on_failure_) on_failure_(op);
}

void OperationQueue::release_held() {
    // Emitting may fail terminally and reshape the outbox, so rescan after each.
    for (;;) {
        auto it = std::ranges::find_if(outbox_, [&](const Slot& s) {
            return s.emission == Emission::held;
        });
        while (it != outbox_.end() && (it->emission != Emission::held || blocked(it))) ++it;
        if (it == outbox_.end()) return;
        emit(it);
    }
}

}  // namespace oplog_cpp
