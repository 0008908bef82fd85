// collaborative_canvas: two clients editing one workflow through a server
//
// Shows remote application, per-actor undo, history pruning when a peer
// deletes a block, and a document revert.
//
// Build: cmake --build build
// Run:   ./build/collaborative_canvas

#include <oplog-cpp/oplog.hpp>

#include <cstdio>
#include <string>

namespace op = oplog_cpp;

namespace {

auto make_block(std::string id, op::Position position) -> op::BlockState {
    auto block = op::BlockState{};
    block.id = id;
    block.type = "agent";
    block.name = std::move(id);
    block.position = position;
    return block;
}

void print_position(const char* who, const op::InMemoryDocumentStore& store, const op::EntityId& id) {
    if (auto block = store.get_block(id)) {
        std::printf("  %s sees %s at (%.0f, %.0f)\n", who, id.c_str(), block->position.x,
                    block->position.y);
    } else {
        std::printf("  %s has no %s\n", who, id.c_str());
    }
}

void print_stacks(const char* who, const op::Session& session) {
    auto sizes = session.stack_sizes();
    std::printf("  %s: %zu undo, %zu redo\n", who, sizes.undo_size, sizes.redo_size);
}

}  // anonymous namespace

int main() {
    op::set_log_level("info");

    auto server = op::LocalServer{};
    auto loop = op::EventLoop{};
    auto alice_link = server.connect("alice");
    auto bob_link = server.connect("bob");
    auto alice_store = op::InMemoryDocumentStore{};
    auto bob_store = op::InMemoryDocumentStore{};
    auto alice = op::Session{alice_store, *alice_link, loop, op::SessionOptions{.actor_id = "alice"}};
    auto bob = op::Session{bob_store, *bob_link, loop, op::SessionOptions{.actor_id = "bob"}};
    alice.open_document("canvas");
    bob.open_document("canvas");

    // -- Both clients build the canvas ----------------------------------------
    alice.recorder().record_add_block(make_block("fetch", {0, 0}));
    bob.recorder().record_add_block(make_block("summarize", {300, 0}));
    server.pump();
    alice.recorder().record_move("summarize", {300, 0}, {300, 120});
    bob.recorder().record_move("fetch", {0, 0}, {-40, 60});
    server.pump();

    std::printf("After concurrent edits:\n");
    print_position("alice", alice_store, "fetch");
    print_position("bob", bob_store, "summarize");
    print_stacks("alice", alice);
    print_stacks("bob", bob);

    // -- Undo only touches the undoing actor's own history --------------------
    alice.undo();
    loop.run_microtasks();
    server.pump();

    std::printf("After alice undoes her move:\n");
    print_position("bob", bob_store, "summarize");
    print_stacks("alice", alice);
    print_stacks("bob", bob);

    // -- A peer deletes a block out of band -----------------------------------
    server.delete_entity(op::EntityDeletion{.document_id = "canvas",
                                            .kind = op::EntityKind::block,
                                            .entity_id = "fetch"});
    server.pump();

    std::printf("After the server deletes 'fetch':\n");
    print_position("alice", alice_store, "fetch");
    print_stacks("alice", alice);
    print_stacks("bob", bob);

    // -- The document is reverted for bob -------------------------------------
    server.revert_document(op::DocumentRevert{.document_id = "canvas", .actor_id = "bob"});
    server.pump();

    std::printf("After a revert:\n");
    print_stacks("alice", alice);
    print_stacks("bob", bob);

    return 0;
}
