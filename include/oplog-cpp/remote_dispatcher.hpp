/// @file remote_dispatcher.hpp
/// @brief Applies inbound operations and control events to the document.

#pragma once

#include <oplog-cpp/document_store.hpp>
#include <oplog-cpp/guard.hpp>
#include <oplog-cpp/ledger.hpp>
#include <oplog-cpp/op.hpp>
#include <oplog-cpp/operation_queue.hpp>
#include <oplog-cpp/ordering_filter.hpp>
#include <oplog-cpp/referents.hpp>
#include <oplog-cpp/transport.hpp>
#include <oplog-cpp/types.hpp>

#include <optional>

namespace oplog_cpp {

/// Applies what other clients did.
///
/// Every mutation runs under the guard's remote scope so the recorder
/// stays silent. Position updates pass through the ordering filter.
/// After anything destructive, queued local operations on the removed
/// entities are cancelled and the ledger is pruned for every actor of
/// the document.
class RemoteDispatcher {
public:
    RemoteDispatcher(DocumentStore& store, Ledger& ledger, OperationQueue& queue,
                     OrderingFilter& ordering, RemoteApplicationGuard& guard,
                     const ActiveDocument& active);

    RemoteDispatcher(const RemoteDispatcher&) = delete;
    auto operator=(const RemoteDispatcher&) -> RemoteDispatcher& = delete;

    /// Apply an operation another client issued.
    void handle_operation(const Operation& op);

    /// Remove an entity another client deleted.
    void handle_entity_deleted(const EntityDeletion& deletion);

    /// Drop the acting actor's history of a reverted document.
    void handle_document_reverted(const DocumentRevert& revert);

private:
    auto is_active(const DocumentId& document_id) const -> bool;
    auto filter_positions(const Operation& op) -> std::optional<Operation>;
    void after_removal(const DocumentId& document_id, const EntityRefs& removed);

    DocumentStore& store_;
    Ledger& ledger_;
    OperationQueue& queue_;
    OrderingFilter& ordering_;
    RemoteApplicationGuard& guard_;
    const ActiveDocument& active_;
};

}  // namespace oplog_cpp
