#include <oplog-cpp/session.hpp>

#include <oplog-cpp/apply.hpp>
#include <oplog-cpp/logging.hpp>
#include <oplog-cpp/referents.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace oplog_cpp {

Session::Session(DocumentStore& store, Transport& transport, EventLoop& loop,
                 SessionOptions options, std::shared_ptr<Ledger> ledger)
    : store_{store},
      transport_{transport},
      loop_{loop},
      clock_{options.clock ? std::move(options.clock) : Clock{system_clock_ms}},
      ledger_{ledger ? std::move(ledger)
                     : std::make_shared<Ledger>(LedgerOptions{.capacity = options.ledger_capacity})},
      active_{.document_id = std::nullopt, .actor_id = std::move(options.actor_id)},
      guard_{loop},
      ordering_{},
      queue_{transport, loop, options.queue},
      recorder_{store, *ledger_, queue_, guard_, active_, clock_},
      dispatcher_{store, *ledger_, queue_, ordering_, guard_, active_} {
    if (options.log_level && !set_log_level(*options.log_level)) {
        spdlog::warn("unknown log level '{}'", *options.log_level);
    }
    register_handlers();
}

Session::~Session() {
    unregister_handlers();
}

// -- Document lifecycle -------------------------------------------------------

void Session::open_document(DocumentId document_id) {
    if (active_.document_id == document_id) return;
    if (active_.document_id) close_document();

    spdlog::info("{} opened document {}", active_.actor_id, document_id);
    active_.document_id = std::move(document_id);
    ordering_.clear();
}

void Session::close_document() {
    if (!active_.document_id) return;

    spdlog::info("{} closed document {}", active_.actor_id, *active_.document_id);
    ledger_->clear(*active_.document_id, active_.actor_id);
    ordering_.clear();
    queue_.clear();
    guard_.release();
    active_.document_id.reset();
}

// -- Undo / redo --------------------------------------------------------------

auto Session::undo() -> std::optional<OperationEntry> {
    if (!active_.document_id) return std::nullopt;
    if (auto context = guard_.context(); context != ApplyContext::local) {
        spdlog::debug("undo ignored during {} application", to_string_view(context));
        return std::nullopt;
    }
    auto entry = ledger_->undo(*active_.document_id, active_.actor_id);
    if (!entry) return std::nullopt;
    replay(entry->inverse, "undo");
    return entry;
}

auto Session::redo() -> std::optional<OperationEntry> {
    if (!active_.document_id) return std::nullopt;
    if (auto context = guard_.context(); context != ApplyContext::local) {
        spdlog::debug("redo ignored during {} application", to_string_view(context));
        return std::nullopt;
    }
    auto entry = ledger_->redo(*active_.document_id, active_.actor_id);
    if (!entry) return std::nullopt;
    replay(entry->operation, "redo");
    return entry;
}

auto Session::stack_sizes() const -> StackSizes {
    if (!active_.document_id) return {};
    return ledger_->stack_sizes(*active_.document_id, active_.actor_id);
}

void Session::clear_stacks() {
    if (!active_.document_id) return;
    ledger_->clear(*active_.document_id, active_.actor_id);
}

auto Session::replay(const Operation& action, std::string_view direction) -> bool {
    if (!guard_.begin_undo_redo()) return false;

    auto op = action;
    op.id = generate_operation_id();
    op.timestamp = clock_();

    if (auto missing = missing_referents(op, store_); !missing.empty()) {
        spdlog::warn("{} of {} skipped: {} referenced entities no longer exist", direction,
                     to_string_view(op.kind()),
                     missing.blocks.size() + missing.edges.size() + missing.variables.size());
        ledger_->prune_invalid_entries(op.document_id, active_.actor_id, store_.graph());
        return false;
    }

    auto removed = removed_entities(op);
    for (const auto& id : removed.blocks) queue_.cancel_operations_for_entity(id);
    for (const auto& id : removed.edges) queue_.cancel_operations_for_entity(id);
    for (const auto& id : removed.variables) queue_.cancel_operations_for_entity(id);

    queue_.enqueue(make_queued(op), [&] {
        auto result = apply_operation(store_, op);
        if (!result.applied()) {
            spdlog::warn("{} of {} was {}", direction, to_string_view(op.kind()),
                         to_string_view(result.status));
        }
    });
    if (!removed.empty()) ledger_->prune_invalid_entries(op.document_id, store_.graph());
    spdlog::debug("{} replayed {} as {}", direction, to_string_view(op.kind()), op.id);
    return true;
}

// -- Transport wiring ---------------------------------------------------------

void Session::register_handlers() {
    transport_.on_operation([this](const Operation& op) { dispatcher_.handle_operation(op); });
    transport_.on_operation_confirmed([this](const OperationId& id) { queue_.confirm(id); });
    transport_.on_operation_failed([this](const OperationFailure& failure) {
        queue_.fail(failure.operation_id, failure.retryable, failure.message);
    });
    transport_.on_remote_entity_deleted([this](const EntityDeletion& deletion) {
        dispatcher_.handle_entity_deleted(deletion);
    });
    transport_.on_document_reverted([this](const DocumentRevert& revert) {
        dispatcher_.handle_document_reverted(revert);
    });
}

void Session::unregister_handlers() {
    transport_.on_operation({});
    transport_.on_operation_confirmed({});
    transport_.on_operation_failed({});
    transport_.on_remote_entity_deleted({});
    transport_.on_document_reverted({});
}

}  // namespace oplog_cpp
