#include <oplog-cpp/operation_queue.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace oplog_cpp;
using namespace oplog_cpp::test;

namespace {

auto move_op(const EntityId& block_id, OperationId id) -> Operation {
    return make_op(MoveBlockPayload{.block_id = block_id, .before = {}, .after = {1, 1}}, std::move(id));
}

}  // anonymous namespace

TEST(QueueState, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(QueueState::pending),   "pending");
    EXPECT_EQ(to_string_view(QueueState::confirmed), "confirmed");
    EXPECT_EQ(to_string_view(QueueState::failed),    "failed");
}

TEST(Backoff, doubles_from_the_base_up_to_the_cap) {
    const auto options = QueueOptions{};

    EXPECT_EQ(backoff_delay(options, 1), 1000);
    EXPECT_EQ(backoff_delay(options, 2), 2000);
    EXPECT_EQ(backoff_delay(options, 3), 4000);
    EXPECT_EQ(backoff_delay(options, 4), 8000);
    EXPECT_EQ(backoff_delay(options, 5), 10000);
    EXPECT_EQ(backoff_delay(options, 40), 10000);
}

TEST(MakeQueued, copies_identity_from_the_operation) {
    const auto queued = make_queued(move_op("b1", "op-1"), false);

    EXPECT_EQ(queued.id, "op-1");
    EXPECT_EQ(queued.document_id, "doc");
    EXPECT_EQ(queued.actor_id, "alice");
    EXPECT_FALSE(queued.retryable);
    EXPECT_EQ(queued.state, QueueState::pending);
}

TEST(OperationQueue, enqueue_applies_locally_then_emits) {
    auto transport = FakeTransport{};
    auto loop = EventLoop{};
    auto queue = OperationQueue{transport, loop};
    auto order = std::vector<std::string>{};

    queue.enqueue(make_queued(move_op("b1", "op-1")), [&] {
        order.push_back("local");
        EXPECT_TRUE(transport.emitted.empty());
    });

    EXPECT_EQ(order, (std::vector<std::string>{"local"}));
    EXPECT_EQ(transport.emitted_ids(), (std::vector<OperationId>{"op-1"}));
    EXPECT_TRUE(queue.contains("op-1"));
}

TEST(OperationQueue, confirm_removes_and_tolerates_duplicates) {
    auto transport = FakeTransport{};
    auto loop = EventLoop{};
    auto queue = OperationQueue{transport, loop};
    queue.enqueue(make_queued(move_op("b1", "op-1")));

    queue.confirm("op-1");
    queue.confirm("op-1");

    EXPECT_TRUE(queue.empty());
}

TEST(OperationQueue, duplicate_ids_are_not_enqueued_twice) {
    auto transport = FakeTransport{};
    auto loop = EventLoop{};
    auto queue = OperationQueue{transport, loop};
    auto local_runs = 0;

    queue.enqueue(make_queued(move_op("b1", "op-1")), [&] { ++local_runs; });
    queue.enqueue(make_queued(move_op("b1", "op-1")), [&] { ++local_runs; });

    EXPECT_EQ(local_runs, 1);
    EXPECT_EQ(queue.size(), 1u);
}

TEST(OperationQueue, retryable_failure_is_re_emitted_after_backoff) {
    auto transport = FakeTransport{};
    auto loop = EventLoop{};
    auto queue = OperationQueue{transport, loop};
    queue.enqueue(make_queued(move_op("b1", "op-1")));

    queue.fail("op-1", true, "timeout");
    loop.advance(999);
    EXPECT_EQ(transport.emitted.size(), 1u);

    loop.advance(1);
    EXPECT_EQ(transport.emitted.size(), 2u);
    EXPECT_EQ(queue.pending().front().attempts, 2u);
}

TEST(OperationQueue, transport_errors_are_retried) {
    auto transport = FakeTransport{};
    transport.failing_emits = 1;
    auto loop = EventLoop{};
    auto queue = OperationQueue{transport, loop};

    queue.enqueue(make_queued(move_op("b1", "op-1")));
    EXPECT_TRUE(transport.emitted.empty());

    loop.advance(1000);
    EXPECT_EQ(transport.emitted_ids(), (std::vector<OperationId>{"op-1"}));
}

TEST(OperationQueue, exhausted_retries_fail_terminally) {
    auto transport = FakeTransport{};
    auto loop = EventLoop{};
    auto queue = OperationQueue{transport, loop,
                                QueueOptions{.max_retries = 2, .base_backoff_ms = 100, .max_backoff_ms = 1000}};
    auto reported = std::vector<QueuedOperation>{};
    queue.set_failure_handler([&](const QueuedOperation& op) { reported.push_back(op); });

    queue.enqueue(make_queued(move_op("b1", "op-1")));
    queue.fail("op-1", true, "timeout");
    loop.advance(100);
    queue.fail("op-1", true, "timeout");
    loop.advance(200);
    queue.fail("op-1", true, "timeout");

    EXPECT_EQ(transport.emitted.size(), 3u);
    EXPECT_TRUE(queue.empty());
    ASSERT_EQ(reported.size(), 1u);
    EXPECT_EQ(reported[0].state, QueueState::failed);
    ASSERT_TRUE(reported[0].error.has_value());
    EXPECT_EQ(reported[0].error->kind, ErrorKind::transient_network);
    EXPECT_EQ(queue.failed_operations().size(), 1u);
}

TEST(OperationQueue, non_retryable_failure_is_surfaced_immediately) {
    auto transport = FakeTransport{};
    auto loop = EventLoop{};
    auto queue = OperationQueue{transport, loop};
    queue.enqueue(make_queued(move_op("b1", "op-1")));

    queue.fail("op-1", false, "validation failed");

    ASSERT_EQ(queue.failed_operations().size(), 1u);
    const auto& failed = queue.failed_operations().front();
    EXPECT_EQ(failed.error, (Error{ErrorKind::rejected_operation, "validation failed"}));
    EXPECT_EQ(loop.pending_timers(), 0u);

    EXPECT_TRUE(queue.dismiss_failed("op-1"));
    EXPECT_FALSE(queue.dismiss_failed("op-1"));
    EXPECT_TRUE(queue.failed_operations().empty());
}

TEST(OperationQueue, entries_marked_not_retryable_ignore_retryable_failures) {
    auto transport = FakeTransport{};
    auto loop = EventLoop{};
    auto queue = OperationQueue{transport, loop};
    queue.enqueue(make_queued(move_op("b1", "op-1"), false));

    queue.fail("op-1", true, "timeout");

    EXPECT_EQ(queue.failed_operations().size(), 1u);
}

TEST(OperationQueue, later_operations_on_a_retrying_entity_are_held) {
    auto transport = FakeTransport{};
    auto loop = EventLoop{};
    auto queue = OperationQueue{transport, loop};

    queue.enqueue(make_queued(move_op("b1", "op-a")));
    queue.fail("op-a", true, "timeout");
    queue.enqueue(make_queued(move_op("b1", "op-b")));
    queue.enqueue(make_queued(move_op("b2", "op-c")));

    EXPECT_EQ(transport.emitted_ids(), (std::vector<OperationId>{"op-a", "op-c"}));

    loop.advance(1000);

    EXPECT_EQ(transport.emitted_ids(),
              (std::vector<OperationId>{"op-a", "op-c", "op-a", "op-b"}));
}

TEST(OperationQueue, operations_already_sent_are_resent_after_an_earlier_retry) {
    auto transport = FakeTransport{};
    auto loop = EventLoop{};
    auto queue = OperationQueue{transport, loop};
    queue.enqueue(make_queued(move_op("b1", "op-a")));
    queue.enqueue(make_queued(move_op("b1", "op-b")));
    queue.enqueue(make_queued(move_op("b2", "op-c")));
    ASSERT_EQ(transport.emitted_ids(), (std::vector<OperationId>{"op-a", "op-b", "op-c"}));

    queue.fail("op-a", true, "timeout");
    // The first attempt of op-b was acknowledged, but op-a will land after it.
    queue.confirm("op-b");
    EXPECT_TRUE(queue.contains("op-b"));
    loop.advance(1000);

    EXPECT_EQ(transport.emitted_ids(),
              (std::vector<OperationId>{"op-a", "op-b", "op-c", "op-a", "op-b"}));

    queue.confirm("op-a");
    queue.confirm("op-b");
    queue.confirm("op-c");
    EXPECT_TRUE(queue.empty());
}

TEST(OperationQueue, resending_follows_entities_shared_through_later_operations) {
    auto transport = FakeTransport{};
    auto loop = EventLoop{};
    auto queue = OperationQueue{transport, loop};
    queue.enqueue(make_queued(move_op("b1", "op-a")));
    queue.enqueue(make_queued(make_op(AddEdgePayload{.edge = edge("e1", "b1", "b2")}, "op-b")));
    queue.enqueue(make_queued(move_op("b2", "op-c")));
    queue.enqueue(make_queued(move_op("b3", "op-d")));

    queue.fail("op-a", true, "timeout");
    loop.advance(1000);

    EXPECT_EQ(transport.emitted_ids(),
              (std::vector<OperationId>{"op-a", "op-b", "op-c", "op-d", "op-a", "op-b", "op-c"}));
}

TEST(OperationQueue, late_failure_of_a_held_attempt_is_ignored) {
    auto transport = FakeTransport{};
    auto loop = EventLoop{};
    auto queue = OperationQueue{transport, loop};
    queue.enqueue(make_queued(move_op("b1", "op-a")));
    queue.enqueue(make_queued(move_op("b1", "op-b")));

    queue.fail("op-a", true, "timeout");
    queue.fail("op-b", false, "stale attempt");

    EXPECT_TRUE(queue.failed_operations().empty());
    EXPECT_EQ(queue.size(), 2u);
}

TEST(OperationQueue, unsendable_operation_fails_terminally_without_retry) {
    auto transport = FakeTransport{};
    transport.unsendable_emits = 1;
    auto loop = EventLoop{};
    auto queue = OperationQueue{transport, loop};
    auto reported = std::vector<QueuedOperation>{};
    queue.set_failure_handler([&](const QueuedOperation& op) { reported.push_back(op); });

    EXPECT_NO_THROW(queue.enqueue(make_queued(move_op("b1", "op-1"))));
    queue.enqueue(make_queued(move_op("b1", "op-2")));

    EXPECT_EQ(loop.pending_timers(), 0u);
    ASSERT_EQ(reported.size(), 1u);
    EXPECT_EQ(reported[0].id, "op-1");
    EXPECT_EQ(reported[0].error, (Error{ErrorKind::invalid_operation, "cannot encode operation"}));
    EXPECT_EQ(transport.emitted_ids(), (std::vector<OperationId>{"op-2"}));
}

TEST(OperationQueue, terminal_failure_releases_held_operations) {
    auto transport = FakeTransport{};
    transport.failing_emits = 3;
    auto loop = EventLoop{};
    auto queue = OperationQueue{transport, loop,
                                QueueOptions{.max_retries = 2, .base_backoff_ms = 100, .max_backoff_ms = 1000}};

    queue.enqueue(make_queued(move_op("b1", "op-a")));
    queue.enqueue(make_queued(move_op("b1", "op-b")));
    loop.advance(100);
    EXPECT_TRUE(transport.emitted.empty());

    loop.advance(200);

    EXPECT_EQ(transport.emitted_ids(), (std::vector<OperationId>{"op-b"}));
    ASSERT_EQ(queue.failed_operations().size(), 1u);
    EXPECT_EQ(queue.failed_operations().front().id, "op-a");
}

TEST(OperationQueue, cancel_removes_operations_for_an_entity) {
    auto transport = FakeTransport{};
    auto loop = EventLoop{};
    auto queue = OperationQueue{transport, loop};
    queue.enqueue(make_queued(move_op("b1", "op-1")));
    queue.fail("op-1", true, "timeout");
    queue.enqueue(make_queued(move_op("b1", "op-2")));
    queue.enqueue(make_queued(make_op(AddEdgePayload{.edge = edge("e1", "b1", "b2")}, "op-3")));
    queue.enqueue(make_queued(move_op("b2", "op-4")));

    EXPECT_EQ(queue.cancel_operations_for_entity("b1"), 3u);

    ASSERT_EQ(queue.size(), 1u);
    EXPECT_EQ(queue.pending().front().id, "op-4");
    EXPECT_EQ(loop.pending_timers(), 0u);
}

TEST(OperationQueue, clear_cancels_retry_timers) {
    auto transport = FakeTransport{};
    auto loop = EventLoop{};
    auto queue = OperationQueue{transport, loop};
    queue.enqueue(make_queued(move_op("b1", "op-1")));
    queue.fail("op-1", true, "timeout");

    queue.clear();
    loop.advance(60'000);

    EXPECT_TRUE(queue.empty());
    EXPECT_EQ(transport.emitted.size(), 1u);
}
