// offline_retry: operations survive a dropped connection
//
// Emits while the server is offline, lets the retry timers fire once it
// is back, and shows a terminal rejection reported to the application.
//
// Build: cmake --build build
// Run:   ./build/offline_retry

#include <oplog-cpp/oplog.hpp>

#include <cstdio>
#include <string>

namespace op = oplog_cpp;

int main() {
    op::set_log_level("info");

    auto server = op::LocalServer{};
    auto loop = op::EventLoop{};
    auto link = server.connect("alice");
    auto store = op::InMemoryDocumentStore{};
    auto session = op::Session{store, *link, loop,
                               op::SessionOptions{.actor_id = "alice",
                                                  .queue = {.max_retries = 4,
                                                            .base_backoff_ms = 500,
                                                            .max_backoff_ms = 4000},
                                                  .clock = [&loop] { return loop.now_ms(); }}};
    session.queue().set_failure_handler([](const op::QueuedOperation& failed) {
        std::printf("  !! %s %s failed: %s\n",
                    std::string{op::to_string_view(failed.operation.kind())}.c_str(),
                    failed.id.c_str(), failed.error ? failed.error->message.c_str() : "");
    });
    session.open_document("doc");

    // -- Edits made while offline apply locally at once -----------------------
    server.set_offline(true);
    auto block = op::BlockState{};
    block.id = "b1";
    block.type = "agent";
    block.name = "b1";
    session.recorder().record_add_block(block);
    session.recorder().record_move("b1", {0, 0}, {25, 25});

    std::printf("offline: local block exists=%d, queued=%zu, server has it=%d\n",
                store.has_block("b1"), session.queue().size(),
                server.document("doc").has_block("b1"));

    // -- Two retries fail, the third goes through -----------------------------
    for (int tick = 0; tick < 3; ++tick) {
        if (tick == 2) server.set_offline(false);
        loop.advance(op::backoff_delay(session.queue().options(), tick + 1));
        server.pump();
        std::printf("t=%lld ms: queued=%zu, sent=%zu\n", static_cast<long long>(loop.now_ms()),
                    session.queue().size(), link->emitted_count());
    }
    loop.advance(4000);
    server.pump();
    std::printf("online: queued=%zu, server applied=%zu\n", session.queue().size(),
                server.applied_count());

    // -- A rejected operation stays applied locally and is reported -----------
    server.fail_next(1, false, "permission denied");
    session.recorder().record_move("b1", {25, 25}, {90, 90});
    server.pump();

    std::printf("failed operations: %zu, local position (%.0f, %.0f)\n",
                session.queue().failed_operations().size(), store.get_block("b1")->position.x,
                store.get_block("b1")->position.y);

    return 0;
}
