#pragma once

// Builders and a scriptable transport shared by the test suites.

#include <oplog-cpp/error.hpp>
#include <oplog-cpp/graph.hpp>
#include <oplog-cpp/op.hpp>
#include <oplog-cpp/transport.hpp>

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace oplog_cpp::test {

inline auto block(EntityId id, Position position = {}, std::optional<EntityId> parent = {})
    -> BlockState {
    auto b = BlockState{};
    b.id = std::move(id);
    b.type = "agent";
    b.name = b.id;
    b.position = position;
    b.parent_id = std::move(parent);
    return b;
}

inline auto edge(EntityId id, EntityId source, EntityId target) -> EdgeState {
    return EdgeState{.id = std::move(id),
                     .source = std::move(source),
                     .target = std::move(target),
                     .source_handle = "out",
                     .target_handle = "in"};
}

inline auto variable(EntityId id, std::string name, FieldValue value = Null{}) -> VariableState {
    return VariableState{.id = std::move(id),
                         .name = std::move(name),
                         .type = "string",
                         .value = std::move(value)};
}

inline auto make_op(Payload payload, OperationId id = "op-1",
                    std::optional<std::int64_t> timestamp = 1,
                    ActorId actor = "alice", DocumentId document = "doc") -> Operation {
    return Operation{.id = std::move(id),
                     .timestamp = timestamp,
                     .document_id = std::move(document),
                     .actor_id = std::move(actor),
                     .payload = std::move(payload)};
}

/// Records emitted operations and lets a test fire inbound events.
class FakeTransport : public Transport {
public:
    void emit_operation(const Operation& op) override {
        if (failing_emits > 0) {
            --failing_emits;
            throw TransportError{"connection reset"};
        }
        if (unsendable_emits > 0) {
            --unsendable_emits;
            throw std::invalid_argument{"cannot encode operation"};
        }
        emitted.push_back(op);
    }

    void on_operation(OperationHandler handler) override { operation_handler = std::move(handler); }
    void on_operation_confirmed(ConfirmedHandler handler) override { confirmed_handler = std::move(handler); }
    void on_operation_failed(FailedHandler handler) override { failed_handler = std::move(handler); }
    void on_remote_entity_deleted(EntityDeletedHandler handler) override { deleted_handler = std::move(handler); }
    void on_document_reverted(DocumentRevertedHandler handler) override { reverted_handler = std::move(handler); }

    auto emitted_ids() const -> std::vector<OperationId> {
        auto ids = std::vector<OperationId>{};
        for (const auto& op : emitted) ids.push_back(op.id);
        return ids;
    }

    std::vector<Operation> emitted;
    std::size_t failing_emits{0};     ///< Number of upcoming emits that throw TransportError.
    std::size_t unsendable_emits{0};  ///< Then, number that throw a non-transport error.

    OperationHandler operation_handler;
    ConfirmedHandler confirmed_handler;
    FailedHandler failed_handler;
    EntityDeletedHandler deleted_handler;
    DocumentRevertedHandler reverted_handler;
};

}  // namespace oplog_cpp::test
