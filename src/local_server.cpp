#include <oplog-cpp/local_server.hpp>

#include <oplog-cpp/apply.hpp>
#include <oplog-cpp/error.hpp>
#include <oplog-cpp/json.hpp>

#include <spdlog/spdlog.h>

#include <exception>

namespace oplog_cpp {

namespace {

// Removing something that is already gone leaves the document as requested.
auto is_removal(OpKind kind) -> bool {
    return kind == OpKind::remove_block || kind == OpKind::batch_remove_blocks
        || kind == OpKind::remove_edge || kind == OpKind::remove_variable;
}

}  // anonymous namespace

// -- LocalServer ----------------------------------------------------------------

LocalServer::~LocalServer() {
    for (auto& [id, client] : clients_) client->server_ = nullptr;
}

auto LocalServer::connect(std::string name) -> std::unique_ptr<LocalTransport> {
    auto id = next_client_id_++;
    // The constructor is private to LocalServer, which make_unique cannot reach.
    auto transport = std::unique_ptr<LocalTransport>{new LocalTransport{*this, id, std::move(name)}};
    clients_[id] = transport.get();
    return transport;
}

void LocalServer::fail_next(std::size_t count, bool retryable, std::string message) {
    for (std::size_t i = 0; i < count; ++i) {
        injected_failures_.push_back(InjectedFailure{.retryable = retryable, .message = message});
    }
}

auto LocalServer::pump() -> std::size_t {
    auto delivered = std::size_t{0};
    while (!inbound_.empty() || !outbound_.empty()) {
        while (!inbound_.empty()) {
            auto submission = std::move(inbound_.front());
            inbound_.pop_front();
            process(submission);
        }
        while (!outbound_.empty()) {
            auto message = std::move(outbound_.front());
            outbound_.pop_front();
            message();
            ++delivered;
        }
    }
    return delivered;
}

void LocalServer::delete_entity(const EntityDeletion& deletion) {
    auto& store = document(deletion.document_id);
    switch (deletion.kind) {
        case EntityKind::block:    store.remove_block(deletion.entity_id); break;
        case EntityKind::edge:     store.remove_edge(deletion.entity_id); break;
        case EntityKind::variable: store.remove_variable(deletion.entity_id); break;
    }
    for (const auto& [id, client] : clients_) {
        deliver(id, [deletion](LocalTransport& t) {
            if (t.on_deleted_) t.on_deleted_(deletion);
        });
    }
}

void LocalServer::revert_document(const DocumentRevert& revert) {
    for (const auto& [id, client] : clients_) {
        deliver(id, [revert](LocalTransport& t) {
            if (t.on_reverted_) t.on_reverted_(revert);
        });
    }
}

auto LocalServer::document(const DocumentId& document_id) -> InMemoryDocumentStore& {
    return documents_[document_id];
}

void LocalServer::submit(std::uint64_t client_id, std::string encoded) {
    inbound_.push_back(Submission{.client_id = client_id, .encoded = std::move(encoded)});
}

void LocalServer::detach(std::uint64_t client_id) {
    clients_.erase(client_id);
}

void LocalServer::process(const Submission& submission) {
    auto op = decode_operation(submission.encoded);
    if (!op) return;

    auto reject = [&](bool retryable, std::string message) {
        deliver(submission.client_id,
                [failure = OperationFailure{op->id, retryable, std::move(message)}](LocalTransport& t) {
                    if (t.on_failed_) t.on_failed_(failure);
                });
    };
    auto acknowledge = [&] {
        deliver(submission.client_id, [id = op->id](LocalTransport& t) {
            if (t.on_confirmed_) t.on_confirmed_(id);
        });
    };

    if (!injected_failures_.empty()) {
        auto failure = std::move(injected_failures_.front());
        injected_failures_.pop_front();
        reject(failure.retryable, std::move(failure.message));
        return;
    }

    auto result = ApplyResult{};
    try {
        result = apply_operation(document(op->document_id), *op);
    } catch (const std::exception& e) {
        reject(false, e.what());
        return;
    }

    if (!result.applied()) {
        if (is_removal(op->kind())) {
            acknowledge();
            return;
        }
        spdlog::debug("server rejects {} {}: missing referents", to_string_view(op->kind()), op->id);
        reject(false, std::string{to_string_view(ErrorKind::missing_referent)});
        return;
    }

    ++applied_count_;
    acknowledge();
    for (const auto& [id, client] : clients_) {
        if (id == submission.client_id) continue;
        deliver(id, [relayed = *op](LocalTransport& t) {
            if (t.on_operation_) t.on_operation_(relayed);
        });
    }
}

void LocalServer::deliver(std::uint64_t client_id, std::function<void(LocalTransport&)> message) {
    outbound_.push_back([this, client_id, message = std::move(message)] {
        // The client may have disconnected since the message was queued.
        if (auto it = clients_.find(client_id); it != clients_.end()) message(*it->second);
    });
}

// -- LocalTransport -------------------------------------------------------------

LocalTransport::~LocalTransport() {
    if (server_) server_->detach(client_id_);
}

void LocalTransport::emit_operation(const Operation& op) {
    if (!server_) throw TransportError{"transport " + name_ + " is disconnected"};
    if (server_->offline()) throw TransportError{"server is offline"};
    ++emitted_count_;
    server_->submit(client_id_, encode_operation(op));
}

}  // namespace oplog_cpp
