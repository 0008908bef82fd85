/// @file local_server.hpp
/// @brief An in-process server and transport for examples and tests.

#pragma once

#include <oplog-cpp/document_store.hpp>
#include <oplog-cpp/op.hpp>
#include <oplog-cpp/transport.hpp>
#include <oplog-cpp/types.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>

namespace oplog_cpp {

class LocalTransport;

/// A server that lives in the same process as its clients.
///
/// Clients connect to get a LocalTransport. Operations they emit travel
/// as encoded JSON and are processed by pump(): the server decodes each
/// one, validates it against its own copy of the document, applies it,
/// acknowledges the sender and relays it to every other client. An
/// operation whose required entities are missing on the server is
/// rejected without retry.
///
/// @code
/// auto server = LocalServer{};
/// auto alice = server.connect("alice");
/// auto bob = server.connect("bob");
/// // ... sessions emit through alice / bob ...
/// server.pump();
/// @endcode
class LocalServer {
public:
    LocalServer() = default;
    ~LocalServer();

    LocalServer(const LocalServer&) = delete;
    auto operator=(const LocalServer&) -> LocalServer& = delete;

    /// Connect a new client.
    auto connect(std::string name) -> std::unique_ptr<LocalTransport>;

    /// While offline, every emit throws TransportError.
    void set_offline(bool offline) { offline_ = offline; }
    auto offline() const -> bool { return offline_; }

    /// Fail the next `count` submitted operations with the given failure.
    void fail_next(std::size_t count, bool retryable, std::string message = "injected failure");

    /// Process submitted operations and deliver every resulting message,
    /// until nothing is left in flight.
    /// @return The number of messages delivered to clients.
    auto pump() -> std::size_t;

    /// Delete an entity on the server and tell every client.
    void delete_entity(const EntityDeletion& deletion);

    /// Tell every client that a document was reverted.
    void revert_document(const DocumentRevert& revert);

    /// The server's copy of a document, created empty on first access.
    auto document(const DocumentId& document_id) -> InMemoryDocumentStore&;

    /// Number of operations the server has applied.
    auto applied_count() const -> std::size_t { return applied_count_; }

private:
    friend class LocalTransport;

    struct Submission {
        std::uint64_t client_id;
        std::string encoded;
    };

    struct InjectedFailure {
        bool retryable;
        std::string message;
    };

    void submit(std::uint64_t client_id, std::string encoded);
    void detach(std::uint64_t client_id);
    void process(const Submission& submission);
    void deliver(std::uint64_t client_id, std::function<void(LocalTransport&)> message);

    std::map<std::uint64_t, LocalTransport*> clients_;
    std::map<DocumentId, InMemoryDocumentStore> documents_;
    std::deque<Submission> inbound_;
    std::deque<std::function<void()>> outbound_;
    std::deque<InjectedFailure> injected_failures_;
    std::uint64_t next_client_id_{1};
    std::size_t applied_count_{0};
    bool offline_{false};
};

/// A client's end of a LocalServer connection.
class LocalTransport : public Transport {
public:
    ~LocalTransport() override;

    LocalTransport(const LocalTransport&) = delete;
    auto operator=(const LocalTransport&) -> LocalTransport& = delete;

    void emit_operation(const Operation& op) override;
    void on_operation(OperationHandler handler) override { on_operation_ = std::move(handler); }
    void on_operation_confirmed(ConfirmedHandler handler) override { on_confirmed_ = std::move(handler); }
    void on_operation_failed(FailedHandler handler) override { on_failed_ = std::move(handler); }
    void on_remote_entity_deleted(EntityDeletedHandler handler) override { on_deleted_ = std::move(handler); }
    void on_document_reverted(DocumentRevertedHandler handler) override { on_reverted_ = std::move(handler); }

    auto name() const -> const std::string& { return name_; }

    /// Number of operations emitted through this transport.
    auto emitted_count() const -> std::size_t { return emitted_count_; }

private:
    friend class LocalServer;

    LocalTransport(LocalServer& server, std::uint64_t client_id, std::string name)
        : server_{&server}, client_id_{client_id}, name_{std::move(name)} {}

    LocalServer* server_;
    std::uint64_t client_id_;
    std::string name_;
    std::size_t emitted_count_{0};
    OperationHandler on_operation_;
    ConfirmedHandler on_confirmed_;
    FailedHandler on_failed_;
    EntityDeletedHandler on_deleted_;
    DocumentRevertedHandler on_reverted_;
};

}  // namespace oplog_cpp
