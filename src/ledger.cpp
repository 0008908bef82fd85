#include <oplog-cpp/ledger.hpp>

#include "presence_overlay.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace oplog_cpp {

namespace {

// Walks `stack` from its top (back) and keeps entries whose replay action
// still finds what it needs. `action` picks the operation replayed from
// this stack.
template <typename Action>
auto prune_stack(std::deque<OperationEntry>& stack, const GraphView& graph, Action action)
    -> std::size_t {
    auto overlay = detail::PresenceOverlay{graph};
    auto kept = std::deque<OperationEntry>{};
    auto dropped = std::size_t{0};

    for (auto it = stack.rbegin(); it != stack.rend(); ++it) {
        const auto& replayed = action(*it);
        if (!missing_referents(replayed, overlay).empty()) {
            ++dropped;
            continue;
        }
        overlay.apply_effects(replayed);
        kept.push_front(std::move(*it));
    }

    stack = std::move(kept);
    return dropped;
}

}  // anonymous namespace

void Ledger::push(const DocumentId& document_id, const ActorId& actor_id, OperationEntry entry) {
    auto& stacks = stacks_[LedgerKey{document_id, actor_id}];
    stacks.undo_stack.push_back(std::move(entry));
    stacks.redo_stack.clear();
    while (stacks.undo_stack.size() > options_.capacity) {
        stacks.undo_stack.pop_front();
    }
}

auto Ledger::undo(const DocumentId& document_id, const ActorId& actor_id)
    -> std::optional<OperationEntry> {
    auto it = stacks_.find(LedgerKey{document_id, actor_id});
    if (it == stacks_.end() || it->second.undo_stack.empty()) return std::nullopt;

    auto& stacks = it->second;
    auto entry = std::move(stacks.undo_stack.back());
    stacks.undo_stack.pop_back();
    stacks.redo_stack.push_back(entry);
    return entry;
}

auto Ledger::redo(const DocumentId& document_id, const ActorId& actor_id)
    -> std::optional<OperationEntry> {
    auto it = stacks_.find(LedgerKey{document_id, actor_id});
    if (it == stacks_.end() || it->second.redo_stack.empty()) return std::nullopt;

    auto& stacks = it->second;
    auto entry = std::move(stacks.redo_stack.back());
    stacks.redo_stack.pop_back();
    stacks.undo_stack.push_back(entry);
    return entry;
}

auto Ledger::prune_invalid_entries(const DocumentId& document_id, const ActorId& actor_id,
                                   const GraphView& graph) -> std::size_t {
    auto it = stacks_.find(LedgerKey{document_id, actor_id});
    if (it == stacks_.end()) return 0;

    auto& stacks = it->second;
    auto dropped = prune_stack(stacks.undo_stack, graph,
                               [](const OperationEntry& e) -> const Operation& { return e.inverse; });
    dropped += prune_stack(stacks.redo_stack, graph,
                           [](const OperationEntry& e) -> const Operation& { return e.operation; });
    if (dropped > 0) {
        spdlog::debug("pruned {} entries from history of {} on {}", dropped, actor_id, document_id);
    }
    return dropped;
}

auto Ledger::prune_invalid_entries(const DocumentId& document_id, const GraphView& graph)
    -> std::size_t {
    auto dropped = std::size_t{0};
    for (const auto& actor_id : actors(document_id)) {
        dropped += prune_invalid_entries(document_id, actor_id, graph);
    }
    return dropped;
}

auto Ledger::find(const DocumentId& document_id, const ActorId& actor_id) const -> const Stacks* {
    auto it = stacks_.find(LedgerKey{document_id, actor_id});
    return it != stacks_.end() ? &it->second : nullptr;
}

auto Ledger::stack_sizes(const DocumentId& document_id, const ActorId& actor_id) const
    -> StackSizes {
    const auto* stacks = find(document_id, actor_id);
    if (!stacks) return {};
    return StackSizes{.undo_size = stacks->undo_stack.size(),
                      .redo_size = stacks->redo_stack.size()};
}

auto Ledger::undo_entries(const DocumentId& document_id, const ActorId& actor_id) const
    -> std::vector<OperationEntry> {
    const auto* stacks = find(document_id, actor_id);
    if (!stacks) return {};
    return {stacks->undo_stack.begin(), stacks->undo_stack.end()};
}

auto Ledger::redo_entries(const DocumentId& document_id, const ActorId& actor_id) const
    -> std::vector<OperationEntry> {
    const auto* stacks = find(document_id, actor_id);
    if (!stacks) return {};
    return {stacks->redo_stack.begin(), stacks->redo_stack.end()};
}

auto Ledger::actors(const DocumentId& document_id) const -> std::vector<ActorId> {
    auto result = std::vector<ActorId>{};
    for (const auto& [key, stacks] : stacks_) {
        if (key.document_id == document_id) result.push_back(key.actor_id);
    }
    std::ranges::sort(result);
    return result;
}

void Ledger::clear(const DocumentId& document_id, const ActorId& actor_id) {
    stacks_.erase(LedgerKey{document_id, actor_id});
}

void Ledger::clear_document(const DocumentId& document_id) {
    std::erase_if(stacks_, [&](const auto& kv) { return kv.first.document_id == document_id; });
}

}  // namespace oplog_cpp
