#include <oplog-cpp/json.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <stdexcept>
#include <utility>
#include <variant>

namespace oplog_cpp {

namespace {

auto field_map_to_json(const FieldMap& map) -> nlohmann::json {
    auto j = nlohmann::json::object();
    for (const auto& [key, value] : map) {
        auto v = nlohmann::json{};
        to_json(v, value);
        j[key] = std::move(v);
    }
    return j;
}

auto field_map_from_json(const nlohmann::json& j) -> FieldMap {
    if (!j.is_object()) throw std::runtime_error{"field map must be a JSON object"};
    auto map = FieldMap{};
    for (const auto& [key, value] : j.items()) {
        auto v = FieldValue{};
        from_json(value, v);
        map.emplace(key, std::move(v));
    }
    return map;
}

auto optional_id_to_json(const std::optional<EntityId>& id) -> nlohmann::json {
    return id ? nlohmann::json(*id) : nlohmann::json(nullptr);
}

auto optional_id_from_json(const nlohmann::json& j, const char* key) -> std::optional<EntityId> {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return j.at(key).get<EntityId>();
}

template <typename T>
auto list_or_empty(const nlohmann::json& j, const char* key) -> std::vector<T> {
    if (!j.contains(key)) return {};
    return j.at(key).get<std::vector<T>>();
}

auto payload_from_json(OpKind kind, const nlohmann::json& j) -> Payload {
    switch (kind) {
        case OpKind::add_block:
            return AddBlockPayload{.block = j.at("block").get<BlockState>(),
                                   .edges = list_or_empty<EdgeState>(j, "edges"),
                                   .children = list_or_empty<BlockState>(j, "children")};
        case OpKind::remove_block:
            return RemoveBlockPayload{.block = j.at("block").get<BlockState>(),
                                      .edges = list_or_empty<EdgeState>(j, "edges"),
                                      .children = list_or_empty<BlockState>(j, "children")};
        case OpKind::duplicate_block:
            return DuplicateBlockPayload{.source_id = j.at("source_id").get<EntityId>(),
                                         .block = j.at("block").get<BlockState>(),
                                         .edges = list_or_empty<EdgeState>(j, "edges")};
        case OpKind::move_block:
            return MoveBlockPayload{.block_id = j.at("block_id").get<EntityId>(),
                                    .before = j.at("before").get<Position>(),
                                    .after = j.at("after").get<Position>()};
        case OpKind::batch_move_blocks:
            return BatchMoveBlocksPayload{.moves = j.at("moves").get<std::vector<BlockMove>>()};
        case OpKind::batch_add_blocks:
            return BatchAddBlocksPayload{.blocks = j.at("blocks").get<std::vector<BlockState>>(),
                                         .edges = list_or_empty<EdgeState>(j, "edges")};
        case OpKind::batch_remove_blocks:
            return BatchRemoveBlocksPayload{.blocks = j.at("blocks").get<std::vector<BlockState>>(),
                                            .edges = list_or_empty<EdgeState>(j, "edges")};
        case OpKind::add_edge:
            return AddEdgePayload{.edge = j.at("edge").get<EdgeState>()};
        case OpKind::remove_edge:
            return RemoveEdgePayload{.edge = j.at("edge").get<EdgeState>()};
        case OpKind::update_parent:
            return UpdateParentPayload{
                .block_id = j.at("block_id").get<EntityId>(),
                .old_parent = optional_id_from_json(j, "old_parent"),
                .new_parent = optional_id_from_json(j, "new_parent"),
                .old_position = j.at("old_position").get<Position>(),
                .new_position = j.at("new_position").get<Position>(),
                .detached_edges = list_or_empty<EdgeState>(j, "detached_edges"),
                .attached_edges = list_or_empty<EdgeState>(j, "attached_edges")};
        case OpKind::update_subflow_config:
            return UpdateSubflowConfigPayload{.block_id = j.at("block_id").get<EntityId>(),
                                              .subflow = j.at("subflow").get<SubflowKind>(),
                                              .before = field_map_from_json(j.at("before")),
                                              .after = field_map_from_json(j.at("after"))};
        case OpKind::add_variable:
            return AddVariablePayload{.variable = j.at("variable").get<VariableState>()};
        case OpKind::remove_variable:
            return RemoveVariablePayload{.variable = j.at("variable").get<VariableState>()};
        case OpKind::update_variable:
            return UpdateVariablePayload{.variable_id = j.at("variable_id").get<EntityId>(),
                                         .field = j.at("field").get<std::string>(),
                                         .before = j.at("before").get<FieldValue>(),
                                         .after = j.at("after").get<FieldValue>()};
    }
    throw std::runtime_error{"unhandled operation kind"};
}

}  // anonymous namespace

// -- Values and snapshots -----------------------------------------------------

void to_json(nlohmann::json& j, const Position& p) {
    j = nlohmann::json{{"x", p.x}, {"y", p.y}};
}

void from_json(const nlohmann::json& j, Position& p) {
    j.at("x").get_to(p.x);
    j.at("y").get_to(p.y);
}

void to_json(nlohmann::json& j, const FieldValue& v) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](std::int64_t i) { j = i; },
        [&](double d) { j = d; },
        [&](const std::string& s) { j = s; },
    }, v);
}

void from_json(const nlohmann::json& j, FieldValue& v) {
    if (j.is_null()) {
        v = Null{};
    } else if (j.is_boolean()) {
        v = j.get<bool>();
    } else if (j.is_number_integer()) {
        v = j.get<std::int64_t>();
    } else if (j.is_number_float()) {
        v = j.get<double>();
    } else if (j.is_string()) {
        v = j.get<std::string>();
    } else {
        throw std::runtime_error{"cannot convert JSON to FieldValue"};
    }
}

void to_json(nlohmann::json& j, SubflowKind kind) {
    j = std::string{to_string_view(kind)};
}

void from_json(const nlohmann::json& j, SubflowKind& kind) {
    auto name = j.get<std::string>();
    if (name == "loop") {
        kind = SubflowKind::loop;
    } else if (name == "parallel") {
        kind = SubflowKind::parallel;
    } else {
        throw std::runtime_error{"unknown subflow kind: " + name};
    }
}

void to_json(nlohmann::json& j, const BlockState& b) {
    j = nlohmann::json{
        {"id", b.id},
        {"type", b.type},
        {"name", b.name},
        {"position", b.position},
        {"parent_id", optional_id_to_json(b.parent_id)},
        {"enabled", b.enabled},
        {"subblocks", field_map_to_json(b.subblocks)},
        {"data", field_map_to_json(b.data)},
    };
}

void from_json(const nlohmann::json& j, BlockState& b) {
    j.at("id").get_to(b.id);
    j.at("type").get_to(b.type);
    b.name = j.value("name", std::string{});
    j.at("position").get_to(b.position);
    b.parent_id = optional_id_from_json(j, "parent_id");
    b.enabled = j.value("enabled", true);
    b.subblocks = j.contains("subblocks") ? field_map_from_json(j.at("subblocks")) : FieldMap{};
    b.data = j.contains("data") ? field_map_from_json(j.at("data")) : FieldMap{};
}

void to_json(nlohmann::json& j, const EdgeState& e) {
    j = nlohmann::json{
        {"id", e.id},
        {"source", e.source},
        {"target", e.target},
        {"source_handle", e.source_handle},
        {"target_handle", e.target_handle},
    };
}

void from_json(const nlohmann::json& j, EdgeState& e) {
    j.at("id").get_to(e.id);
    j.at("source").get_to(e.source);
    j.at("target").get_to(e.target);
    e.source_handle = j.value("source_handle", std::string{});
    e.target_handle = j.value("target_handle", std::string{});
}

void to_json(nlohmann::json& j, const VariableState& v) {
    j = nlohmann::json{{"id", v.id}, {"name", v.name}, {"type", v.type}, {"value", v.value}};
}

void from_json(const nlohmann::json& j, VariableState& v) {
    j.at("id").get_to(v.id);
    j.at("name").get_to(v.name);
    j.at("type").get_to(v.type);
    v.value = j.contains("value") ? j.at("value").get<FieldValue>() : FieldValue{Null{}};
}

void to_json(nlohmann::json& j, const BlockMove& m) {
    j = nlohmann::json{{"block_id", m.block_id}, {"before", m.before}, {"after", m.after}};
}

void from_json(const nlohmann::json& j, BlockMove& m) {
    j.at("block_id").get_to(m.block_id);
    j.at("before").get_to(m.before);
    j.at("after").get_to(m.after);
}

// -- Operations ---------------------------------------------------------------

void to_json(nlohmann::json& j, const Payload& payload) {
    std::visit(overload{
        [&](const AddBlockPayload& p) {
            j = nlohmann::json{{"block", p.block}, {"edges", p.edges}, {"children", p.children}};
        },
        [&](const RemoveBlockPayload& p) {
            j = nlohmann::json{{"block", p.block}, {"edges", p.edges}, {"children", p.children}};
        },
        [&](const DuplicateBlockPayload& p) {
            j = nlohmann::json{{"source_id", p.source_id}, {"block", p.block}, {"edges", p.edges}};
        },
        [&](const MoveBlockPayload& p) {
            j = nlohmann::json{{"block_id", p.block_id}, {"before", p.before}, {"after", p.after}};
        },
        [&](const BatchMoveBlocksPayload& p) {
            j = nlohmann::json{{"moves", p.moves}};
        },
        [&](const BatchAddBlocksPayload& p) {
            j = nlohmann::json{{"blocks", p.blocks}, {"edges", p.edges}};
        },
        [&](const BatchRemoveBlocksPayload& p) {
            j = nlohmann::json{{"blocks", p.blocks}, {"edges", p.edges}};
        },
        [&](const AddEdgePayload& p) { j = nlohmann::json{{"edge", p.edge}}; },
        [&](const RemoveEdgePayload& p) { j = nlohmann::json{{"edge", p.edge}}; },
        [&](const UpdateParentPayload& p) {
            j = nlohmann::json{
                {"block_id", p.block_id},
                {"old_parent", optional_id_to_json(p.old_parent)},
                {"new_parent", optional_id_to_json(p.new_parent)},
                {"old_position", p.old_position},
                {"new_position", p.new_position},
                {"detached_edges", p.detached_edges},
                {"attached_edges", p.attached_edges},
            };
        },
        [&](const UpdateSubflowConfigPayload& p) {
            j = nlohmann::json{
                {"block_id", p.block_id},
                {"subflow", p.subflow},
                {"before", field_map_to_json(p.before)},
                {"after", field_map_to_json(p.after)},
            };
        },
        [&](const AddVariablePayload& p) { j = nlohmann::json{{"variable", p.variable}}; },
        [&](const RemoveVariablePayload& p) { j = nlohmann::json{{"variable", p.variable}}; },
        [&](const UpdateVariablePayload& p) {
            j = nlohmann::json{
                {"variable_id", p.variable_id},
                {"field", p.field},
                {"before", p.before},
                {"after", p.after},
            };
        },
    }, payload);
}

void to_json(nlohmann::json& j, const Operation& op) {
    j = nlohmann::json{
        {"id", op.id},
        {"kind", std::string{to_string_view(op.kind())}},
        {"document_id", op.document_id},
        {"actor_id", op.actor_id},
        {"payload", op.payload},
    };
    if (op.timestamp) {
        j["timestamp"] = *op.timestamp;
    }
}

void from_json(const nlohmann::json& j, Operation& op) {
    auto kind_name = j.at("kind").get<std::string>();
    auto kind = op_kind_from_string(kind_name);
    if (!kind) throw std::runtime_error{"unknown operation kind: " + kind_name};

    j.at("id").get_to(op.id);
    j.at("document_id").get_to(op.document_id);
    j.at("actor_id").get_to(op.actor_id);
    if (j.contains("timestamp") && !j.at("timestamp").is_null()) {
        op.timestamp = j.at("timestamp").get<std::int64_t>();
    } else {
        op.timestamp.reset();
    }
    op.payload = payload_from_json(*kind, j.at("payload"));
}

void to_json(nlohmann::json& j, const OperationEntry& entry) {
    j = nlohmann::json{{"id", entry.id}, {"operation", entry.operation}, {"inverse", entry.inverse}};
}

void from_json(const nlohmann::json& j, OperationEntry& entry) {
    j.at("id").get_to(entry.id);
    j.at("operation").get_to(entry.operation);
    j.at("inverse").get_to(entry.inverse);
}

auto encode_operation(const Operation& op) -> std::string {
    return nlohmann::json(op).dump();
}

auto decode_operation(std::string_view text) -> std::optional<Operation> {
    try {
        return nlohmann::json::parse(text).get<Operation>();
    } catch (const std::exception& e) {
        spdlog::warn("undecodable operation: {}", e.what());
        return std::nullopt;
    }
}

// -- Configuration ------------------------------------------------------------

void from_json(const nlohmann::json& j, QueueOptions& options) {
    options.max_retries = j.value("max_retries", options.max_retries);
    options.base_backoff_ms = j.value("base_backoff_ms", options.base_backoff_ms);
    options.max_backoff_ms = j.value("max_backoff_ms", options.max_backoff_ms);
}

void from_json(const nlohmann::json& j, SessionOptions& options) {
    options.actor_id = j.value("actor_id", options.actor_id);
    options.ledger_capacity = j.value("ledger_capacity", options.ledger_capacity);
    if (j.contains("queue")) {
        from_json(j.at("queue"), options.queue);
    }
    if (j.contains("log_level")) {
        options.log_level = j.at("log_level").get<std::string>();
    }
}

}  // namespace oplog_cpp
