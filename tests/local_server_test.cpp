#include <oplog-cpp/local_server.hpp>
#include <oplog-cpp/session.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <memory>

using namespace oplog_cpp;
using namespace oplog_cpp::test;

namespace {

struct TwoClients {
    LocalServer server;
    EventLoop loop;
    std::unique_ptr<LocalTransport> alice_link{server.connect("alice")};
    std::unique_ptr<LocalTransport> bob_link{server.connect("bob")};
    InMemoryDocumentStore alice_store;
    InMemoryDocumentStore bob_store;
    Session alice{alice_store, *alice_link, loop, SessionOptions{.actor_id = "alice"}};
    Session bob{bob_store, *bob_link, loop, SessionOptions{.actor_id = "bob"}};

    TwoClients() {
        alice.open_document("doc");
        bob.open_document("doc");
    }
};

}  // anonymous namespace

TEST(LocalServer, edits_converge_across_clients) {
    auto c = TwoClients{};
    c.alice.recorder().record_add_block(block("b1"));
    c.alice.recorder().record_add_block(block("b2", {50, 0}));
    c.server.pump();
    c.bob.recorder().record_add_edge(edge("e1", "b1", "b2"));
    c.alice.recorder().record_move("b1", {0, 0}, {10, 10});
    c.server.pump();

    EXPECT_EQ(c.server.applied_count(), 4u);
    EXPECT_EQ(c.alice_store.graph(), c.bob_store.graph());
    EXPECT_EQ(c.server.document("doc").graph(), c.alice_store.graph());
    EXPECT_TRUE(c.alice.queue().empty());
    EXPECT_TRUE(c.bob.queue().empty());
    EXPECT_EQ(c.bob.stack_sizes(), (StackSizes{1, 0}));
    EXPECT_EQ(c.alice.stack_sizes(), (StackSizes{3, 0}));
}

TEST(LocalServer, sender_is_not_relayed_its_own_operation) {
    auto server = LocalServer{};
    auto sender = server.connect("sender");
    auto peer = server.connect("peer");
    auto sender_seen = 0;
    auto peer_seen = 0;
    auto confirmed = 0;
    sender->on_operation([&](const Operation&) { ++sender_seen; });
    sender->on_operation_confirmed([&](const OperationId&) { ++confirmed; });
    peer->on_operation([&](const Operation&) { ++peer_seen; });

    sender->emit_operation(make_op(AddBlockPayload{.block = block("b1")}));
    server.pump();

    EXPECT_EQ(sender_seen, 0);
    EXPECT_EQ(peer_seen, 1);
    EXPECT_EQ(confirmed, 1);
    EXPECT_EQ(sender->emitted_count(), 1u);
}

TEST(LocalServer, missing_referent_is_rejected_without_retry) {
    auto c = TwoClients{};
    c.alice_store.add_block(block("local-only"));

    c.alice.recorder().record_move("local-only", {0, 0}, {5, 5});
    c.server.pump();

    EXPECT_TRUE(c.alice.queue().empty());
    ASSERT_EQ(c.alice.queue().failed_operations().size(), 1u);
    const auto& failed = c.alice.queue().failed_operations().front();
    EXPECT_EQ(failed.error->kind, ErrorKind::rejected_operation);
    EXPECT_EQ(failed.error->message, "missing_referent");
    EXPECT_EQ(c.loop.pending_timers(), 0u);
    EXPECT_FALSE(c.bob_store.has_block("local-only"));
}

TEST(LocalServer, removing_an_absent_entity_is_acknowledged) {
    auto c = TwoClients{};
    c.alice_store.add_block(block("local-only"));

    c.alice.recorder().record_remove_block("local-only");
    c.server.pump();

    EXPECT_TRUE(c.alice.queue().empty());
    EXPECT_TRUE(c.alice.queue().failed_operations().empty());
    EXPECT_EQ(c.server.applied_count(), 0u);
}

TEST(LocalServer, offline_emits_are_retried_after_backoff) {
    auto c = TwoClients{};
    c.server.set_offline(true);

    c.alice.recorder().record_add_block(block("b1"));
    EXPECT_TRUE(c.alice_store.has_block("b1"));
    EXPECT_EQ(c.alice_link->emitted_count(), 0u);
    EXPECT_EQ(c.loop.pending_timers(), 1u);

    c.server.set_offline(false);
    c.loop.advance(c.alice.queue().options().base_backoff_ms);
    c.server.pump();

    EXPECT_EQ(c.alice_link->emitted_count(), 1u);
    EXPECT_TRUE(c.alice.queue().empty());
    EXPECT_TRUE(c.bob_store.has_block("b1"));
}

TEST(LocalServer, injected_transient_failure_is_retried) {
    auto c = TwoClients{};
    c.server.fail_next(1, true, "busy");

    c.alice.recorder().record_add_block(block("b1"));
    c.server.pump();
    EXPECT_EQ(c.alice.queue().size(), 1u);
    EXPECT_FALSE(c.bob_store.has_block("b1"));

    c.loop.advance(c.alice.queue().options().base_backoff_ms);
    c.server.pump();

    EXPECT_TRUE(c.alice.queue().empty());
    EXPECT_TRUE(c.bob_store.has_block("b1"));
    EXPECT_EQ(c.alice_link->emitted_count(), 2u);
}

TEST(LocalServer, injected_terminal_failure_keeps_the_local_edit) {
    auto c = TwoClients{};
    c.server.fail_next(1, false);

    c.alice.recorder().record_add_block(block("b1"));
    c.server.pump();

    ASSERT_EQ(c.alice.queue().failed_operations().size(), 1u);
    EXPECT_EQ(c.alice.queue().failed_operations().front().error->message, "injected failure");
    EXPECT_TRUE(c.alice_store.has_block("b1"));
    EXPECT_EQ(c.alice.stack_sizes(), (StackSizes{1, 0}));
}

TEST(LocalServer, operation_that_cannot_be_encoded_fails_terminally) {
    auto c = TwoClients{};
    auto named = block("b1");
    named.name = "\xff";

    EXPECT_NO_THROW(c.alice.recorder().record_add_block(named));
    c.server.pump();

    ASSERT_EQ(c.alice.queue().failed_operations().size(), 1u);
    EXPECT_EQ(c.alice.queue().failed_operations().front().error->kind,
              ErrorKind::invalid_operation);
    EXPECT_TRUE(c.alice.queue().empty());
    EXPECT_TRUE(c.alice_store.has_block("b1"));
    EXPECT_FALSE(c.bob_store.has_block("b1"));
    EXPECT_EQ(c.loop.pending_timers(), 0u);
}

TEST(LocalServer, entity_deletion_reaches_every_client) {
    auto c = TwoClients{};
    c.alice.recorder().record_add_block(block("b1"));
    c.server.pump();
    c.bob.recorder().record_move("b1", {0, 0}, {3, 3});
    c.server.pump();

    c.server.delete_entity(EntityDeletion{.document_id = "doc", .kind = EntityKind::block, .entity_id = "b1"});
    c.server.pump();

    EXPECT_FALSE(c.server.document("doc").has_block("b1"));
    EXPECT_FALSE(c.alice_store.has_block("b1"));
    EXPECT_FALSE(c.bob_store.has_block("b1"));
    EXPECT_EQ(c.alice.stack_sizes(), (StackSizes{0, 0}));
    EXPECT_EQ(c.bob.stack_sizes(), (StackSizes{0, 0}));
}

TEST(LocalServer, document_revert_clears_history) {
    auto c = TwoClients{};
    c.alice.recorder().record_add_block(block("b1"));
    c.server.pump();

    c.server.revert_document(DocumentRevert{.document_id = "doc", .actor_id = "alice"});
    c.server.pump();

    EXPECT_EQ(c.alice.stack_sizes(), (StackSizes{0, 0}));
}

TEST(LocalServer, undo_travels_to_peers) {
    auto c = TwoClients{};
    c.alice.recorder().record_add_block(block("b1"));
    c.server.pump();
    c.alice.recorder().record_move("b1", {0, 0}, {40, 40});
    c.server.pump();
    ASSERT_EQ(c.bob_store.get_block("b1")->position, (Position{40, 40}));

    c.alice.undo();
    c.loop.run_microtasks();
    c.server.pump();

    EXPECT_EQ(c.bob_store.get_block("b1")->position, (Position{0, 0}));
    EXPECT_EQ(c.bob.stack_sizes(), (StackSizes{0, 0}));
}

TEST(LocalServer, transport_outliving_its_server_throws_on_emit) {
    auto link = std::unique_ptr<LocalTransport>{};
    {
        auto server = LocalServer{};
        link = server.connect("orphan");
    }
    EXPECT_THROW(link->emit_operation(make_op(AddBlockPayload{.block = block("b1")})), TransportError);
}
