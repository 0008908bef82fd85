/// @file ledger.hpp
/// @brief Per-(document, actor) undo/redo stacks.

#pragma once

#include <oplog-cpp/graph.hpp>
#include <oplog-cpp/op.hpp>
#include <oplog-cpp/types.hpp>

#include <cstddef>
#include <deque>
#include <optional>
#include <unordered_map>
#include <vector>

namespace oplog_cpp {

/// Sizes of one stack pair, for enabling undo/redo buttons.
struct StackSizes {
    std::size_t undo_size{0};
    std::size_t redo_size{0};

    auto operator==(const StackSizes&) const -> bool = default;
};

struct LedgerOptions {
    /// Maximum undo entries per key. The oldest entry is evicted beyond it.
    std::size_t capacity{100};
};

/// The undo/redo history of every actor of every open document.
///
/// Each (document, actor) key owns an undo stack and a redo stack of
/// OperationEntry. An entry lives on exactly one of them until it is
/// invalidated by a new push, evicted by capacity, or pruned because
/// the entities it needs have been deleted.
///
/// @code
/// auto ledger = Ledger{};
/// ledger.push("doc", "alice", make_entry(op));
/// if (auto entry = ledger.undo("doc", "alice")) {
///     apply_operation(store, entry->inverse);
/// }
/// @endcode
class Ledger {
public:
    explicit Ledger(LedgerOptions options = {}) : options_{options} {}

    /// Append to the undo stack and clear the redo stack.
    void push(const DocumentId& document_id, const ActorId& actor_id, OperationEntry entry);

    /// Move the top undo entry to the redo stack and return it.
    /// @return nullopt if there is nothing to undo.
    auto undo(const DocumentId& document_id, const ActorId& actor_id)
        -> std::optional<OperationEntry>;

    /// Move the top redo entry to the undo stack and return it.
    /// @return nullopt if there is nothing to redo.
    auto redo(const DocumentId& document_id, const ActorId& actor_id)
        -> std::optional<OperationEntry>;

    /// Drop entries of one key that can no longer be replayed on `graph`.
    ///
    /// Each stack is walked from its top, in replay order, against a
    /// presence overlay of `graph`: an entry is kept iff the operation it
    /// would replay (the inverse on the undo stack, the operation on the
    /// redo stack) finds its required referents, and a kept entry's
    /// creations and removals are folded into the overlay for the entries
    /// beneath it. An entry that re-creates a deleted entity is therefore
    /// kept, and so is an older entry that needs that entity, because the
    /// newer one restores it first.
    /// @return The number of entries dropped.
    auto prune_invalid_entries(const DocumentId& document_id, const ActorId& actor_id,
                               const GraphView& graph) -> std::size_t;

    /// prune_invalid_entries() for every actor of the document.
    auto prune_invalid_entries(const DocumentId& document_id, const GraphView& graph)
        -> std::size_t;

    auto stack_sizes(const DocumentId& document_id, const ActorId& actor_id) const
        -> StackSizes;

    /// Entries of the undo stack, oldest first.
    auto undo_entries(const DocumentId& document_id, const ActorId& actor_id) const
        -> std::vector<OperationEntry>;

    /// Entries of the redo stack, oldest first (the next redo is last).
    auto redo_entries(const DocumentId& document_id, const ActorId& actor_id) const
        -> std::vector<OperationEntry>;

    /// Actors with a stack pair for the document.
    auto actors(const DocumentId& document_id) const -> std::vector<ActorId>;

    /// Drop both stacks of one key.
    void clear(const DocumentId& document_id, const ActorId& actor_id);

    /// Drop the stacks of every actor of a document.
    void clear_document(const DocumentId& document_id);

    auto options() const -> const LedgerOptions& { return options_; }

private:
    struct Stacks {
        std::deque<OperationEntry> undo_stack;
        std::deque<OperationEntry> redo_stack;
    };

    auto find(const DocumentId& document_id, const ActorId& actor_id) const -> const Stacks*;

    LedgerOptions options_;
    std::unordered_map<LedgerKey, Stacks> stacks_;
};

}  // namespace oplog_cpp
