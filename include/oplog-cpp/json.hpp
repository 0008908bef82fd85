/// @file json.hpp
/// @brief nlohmann/json wire format for operations and session options.
///
/// Provides ADL serialization (to_json/from_json) for every model type,
/// string encode/decode of operations for transports, and loading of
/// SessionOptions from configuration.

#pragma once

#include <oplog-cpp/graph.hpp>
#include <oplog-cpp/op.hpp>
#include <oplog-cpp/operation_queue.hpp>
#include <oplog-cpp/session.hpp>
#include <oplog-cpp/types.hpp>
#include <oplog-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace oplog_cpp {

// -- Values and snapshots -----------------------------------------------------

void to_json(nlohmann::json& j, const Position& p);
void from_json(const nlohmann::json& j, Position& p);

void to_json(nlohmann::json& j, const FieldValue& v);
void from_json(const nlohmann::json& j, FieldValue& v);

void to_json(nlohmann::json& j, SubflowKind kind);
void from_json(const nlohmann::json& j, SubflowKind& kind);

void to_json(nlohmann::json& j, const BlockState& b);
void from_json(const nlohmann::json& j, BlockState& b);

void to_json(nlohmann::json& j, const EdgeState& e);
void from_json(const nlohmann::json& j, EdgeState& e);

void to_json(nlohmann::json& j, const VariableState& v);
void from_json(const nlohmann::json& j, VariableState& v);

void to_json(nlohmann::json& j, const BlockMove& m);
void from_json(const nlohmann::json& j, BlockMove& m);

// -- Operations ---------------------------------------------------------------

/// Serializes the active payload alternative (without its kind tag).
void to_json(nlohmann::json& j, const Payload& payload);

/// `{"id", "kind", "timestamp"?, "document_id", "actor_id", "payload"}`.
void to_json(nlohmann::json& j, const Operation& op);

/// @throws std::runtime_error on an unknown kind, nlohmann::json::exception
///   on missing or mistyped fields.
void from_json(const nlohmann::json& j, Operation& op);

void to_json(nlohmann::json& j, const OperationEntry& entry);
void from_json(const nlohmann::json& j, OperationEntry& entry);

/// Encode an operation for the wire.
auto encode_operation(const Operation& op) -> std::string;

/// Decode an operation from the wire.
/// @return The operation, or nullopt (with a warning logged) if the text
///   is not valid JSON or does not describe an operation.
auto decode_operation(std::string_view text) -> std::optional<Operation>;

// -- Configuration ------------------------------------------------------------

/// Reads `max_retries`, `base_backoff_ms`, `max_backoff_ms`; missing keys
/// keep their defaults.
void from_json(const nlohmann::json& j, QueueOptions& options);

/// Reads `actor_id`, `ledger_capacity`, `queue`, `log_level`; missing keys
/// keep their defaults.
void from_json(const nlohmann::json& j, SessionOptions& options);

}  // namespace oplog_cpp
