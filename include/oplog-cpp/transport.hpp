/// @file transport.hpp
/// @brief The transport collaborator that carries operations to and from the server.

#pragma once

#include <oplog-cpp/op.hpp>
#include <oplog-cpp/types.hpp>

#include <functional>
#include <string>

namespace oplog_cpp {

/// The server refused or could not process an operation.
struct OperationFailure {
    OperationId operation_id;
    bool retryable{false};  ///< True for transient failures worth retrying.
    std::string message;

    auto operator==(const OperationFailure&) const -> bool = default;
};

/// Another client deleted an entity outside the operation stream.
struct EntityDeletion {
    DocumentId document_id;
    EntityKind kind{EntityKind::block};
    EntityId entity_id;

    auto operator==(const EntityDeletion&) const -> bool = default;
};

/// A document was reverted to an earlier version or deleted.
struct DocumentRevert {
    DocumentId document_id;
    ActorId actor_id;  ///< The actor whose history is no longer meaningful.

    auto operator==(const DocumentRevert&) const -> bool = default;
};

/// Delivers operations between a client and the server.
///
/// emit_operation() sends; the on_* registrations install the single
/// handler for each inbound event kind, replacing any previous one (an
/// empty function unregisters). Handlers are invoked on the session's
/// thread.
class Transport {
public:
    using OperationHandler = std::function<void(const Operation&)>;
    using ConfirmedHandler = std::function<void(const OperationId&)>;
    using FailedHandler = std::function<void(const OperationFailure&)>;
    using EntityDeletedHandler = std::function<void(const EntityDeletion&)>;
    using DocumentRevertedHandler = std::function<void(const DocumentRevert&)>;

    virtual ~Transport() = default;

    /// Send an operation to the server.
    /// @throws TransportError if the send fails.
    virtual void emit_operation(const Operation& op) = 0;

    virtual void on_operation(OperationHandler handler) = 0;
    virtual void on_operation_confirmed(ConfirmedHandler handler) = 0;
    virtual void on_operation_failed(FailedHandler handler) = 0;
    virtual void on_remote_entity_deleted(EntityDeletedHandler handler) = 0;
    virtual void on_document_reverted(DocumentRevertedHandler handler) = 0;
};

}  // namespace oplog_cpp
