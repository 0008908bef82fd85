#include <oplog-cpp/document_store.hpp>

#include <algorithm>
#include <ranges>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace oplog_cpp {

auto InMemoryDocumentStore::get_block(const EntityId& id) const -> std::optional<BlockState> {
    auto it = blocks_.find(id);
    if (it == blocks_.end()) return std::nullopt;
    return it->second;
}

auto InMemoryDocumentStore::get_edge(const EntityId& id) const -> std::optional<EdgeState> {
    auto it = edges_.find(id);
    if (it == edges_.end()) return std::nullopt;
    return it->second;
}

auto InMemoryDocumentStore::get_edges() const -> std::vector<EdgeState> {
    auto result = std::vector<EdgeState>{};
    result.reserve(edges_.size());
    for (const auto& [id, edge] : edges_) result.push_back(edge);
    std::ranges::sort(result, {}, &EdgeState::id);
    return result;
}

auto InMemoryDocumentStore::get_variable(const EntityId& id) const -> std::optional<VariableState> {
    auto it = variables_.find(id);
    if (it == variables_.end()) return std::nullopt;
    return it->second;
}

auto InMemoryDocumentStore::children_of(const EntityId& id) const -> std::vector<EntityId> {
    auto result = std::vector<EntityId>{};
    for (const auto& [child_id, block] : blocks_) {
        if (block.parent_id == id) result.push_back(child_id);
    }
    std::ranges::sort(result);
    return result;
}

auto InMemoryDocumentStore::graph() const -> GraphView {
    auto view = GraphView{};
    for (const auto& [id, block] : blocks_) {
        auto merged = block;
        if (auto it = subblock_values_.find(id); it != subblock_values_.end()) {
            for (const auto& [key, value] : it->second) merged.subblocks[key] = value;
        }
        view.blocks_by_id.emplace(id, std::move(merged));
    }
    view.edges_by_id = edges_;
    view.variables_by_id = variables_;
    return view;
}

auto InMemoryDocumentStore::merge_subblock_state(const DocumentId& /*document_id*/,
                                                 const EntityId& block_id) const
    -> std::optional<BlockState> {
    auto block = get_block(block_id);
    if (!block) return std::nullopt;
    if (auto it = subblock_values_.find(block_id); it != subblock_values_.end()) {
        for (const auto& [key, value] : it->second) block->subblocks[key] = value;
    }
    return block;
}

void InMemoryDocumentStore::add_block(const BlockState& block) {
    blocks_[block.id] = block;
    subblock_values_.erase(block.id);
}

void InMemoryDocumentStore::remove_block(const EntityId& id) {
    if (!blocks_.contains(id)) return;

    // Collect the block and all of its descendants.
    auto doomed = std::unordered_set<EntityId>{id};
    auto frontier = std::vector<EntityId>{id};
    while (!frontier.empty()) {
        auto current = std::move(frontier.back());
        frontier.pop_back();
        for (auto& child : children_of(current)) {
            if (doomed.insert(child).second) frontier.push_back(std::move(child));
        }
    }

    for (const auto& block_id : doomed) {
        blocks_.erase(block_id);
        subblock_values_.erase(block_id);
    }
    std::erase_if(edges_, [&](const auto& kv) {
        return doomed.contains(kv.second.source) || doomed.contains(kv.second.target);
    });
}

void InMemoryDocumentStore::add_edge(const EdgeState& edge) {
    edges_[edge.id] = edge;
}

void InMemoryDocumentStore::remove_edge(const EntityId& id) {
    edges_.erase(id);
}

void InMemoryDocumentStore::update_parent(const EntityId& block_id,
                                          const std::optional<EntityId>& parent_id) {
    if (auto it = blocks_.find(block_id); it != blocks_.end()) {
        it->second.parent_id = parent_id;
    }
}

void InMemoryDocumentStore::update_position(const EntityId& block_id, Position position) {
    if (auto it = blocks_.find(block_id); it != blocks_.end()) {
        it->second.position = position;
    }
}

// Loop and parallel configuration share the block's data map here.
void InMemoryDocumentStore::update_subflow_config(const EntityId& block_id, SubflowKind /*kind*/,
                                                  const FieldMap& config) {
    if (auto it = blocks_.find(block_id); it != blocks_.end()) {
        it->second.data = config;
    }
}

void InMemoryDocumentStore::add_variable(const VariableState& variable) {
    variables_[variable.id] = variable;
}

void InMemoryDocumentStore::remove_variable(const EntityId& id) {
    variables_.erase(id);
}

void InMemoryDocumentStore::update_variable(const EntityId& id, std::string_view field,
                                            const FieldValue& value) {
    auto it = variables_.find(id);
    if (it == variables_.end()) return;
    auto& variable = it->second;

    if (field == "value") {
        variable.value = value;
        return;
    }
    const auto* text = std::get_if<std::string>(&value);
    if (!text) {
        throw std::invalid_argument{"variable " + std::string{field} + " must be a string"};
    }
    if (field == "name") {
        variable.name = *text;
    } else if (field == "type") {
        variable.type = *text;
    } else {
        throw std::invalid_argument{"unknown variable field: " + std::string{field}};
    }
}

void InMemoryDocumentStore::set_subblock_value(const EntityId& block_id, std::string key,
                                               FieldValue value) {
    if (!blocks_.contains(block_id)) return;
    subblock_values_[block_id][std::move(key)] = std::move(value);
}

}  // namespace oplog_cpp
