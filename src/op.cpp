#include <oplog-cpp/op.hpp>

#include <array>

namespace oplog_cpp {

namespace {

constexpr auto all_kinds = std::array{
    OpKind::add_block,
    OpKind::remove_block,
    OpKind::duplicate_block,
    OpKind::move_block,
    OpKind::batch_move_blocks,
    OpKind::batch_add_blocks,
    OpKind::batch_remove_blocks,
    OpKind::add_edge,
    OpKind::remove_edge,
    OpKind::update_parent,
    OpKind::update_subflow_config,
    OpKind::add_variable,
    OpKind::remove_variable,
    OpKind::update_variable,
};

static_assert(all_kinds.size() == std::variant_size_v<Payload>,
              "every payload alternative needs an OpKind");

}  // anonymous namespace

auto op_kind_from_string(std::string_view name) -> std::optional<OpKind> {
    for (auto kind : all_kinds) {
        if (to_string_view(kind) == name) return kind;
    }
    return std::nullopt;
}

auto kind_of(const Payload& payload) noexcept -> OpKind {
    return std::visit(overload{
        [](const AddBlockPayload&) { return OpKind::add_block; },
        [](const RemoveBlockPayload&) { return OpKind::remove_block; },
        [](const DuplicateBlockPayload&) { return OpKind::duplicate_block; },
        [](const MoveBlockPayload&) { return OpKind::move_block; },
        [](const BatchMoveBlocksPayload&) { return OpKind::batch_move_blocks; },
        [](const BatchAddBlocksPayload&) { return OpKind::batch_add_blocks; },
        [](const BatchRemoveBlocksPayload&) { return OpKind::batch_remove_blocks; },
        [](const AddEdgePayload&) { return OpKind::add_edge; },
        [](const RemoveEdgePayload&) { return OpKind::remove_edge; },
        [](const UpdateParentPayload&) { return OpKind::update_parent; },
        [](const UpdateSubflowConfigPayload&) { return OpKind::update_subflow_config; },
        [](const AddVariablePayload&) { return OpKind::add_variable; },
        [](const RemoveVariablePayload&) { return OpKind::remove_variable; },
        [](const UpdateVariablePayload&) { return OpKind::update_variable; },
    }, payload);
}

}  // namespace oplog_cpp
