// oplog-cpp benchmarks: throughput of recording, history and the wire codec.

#include <oplog-cpp/json.hpp>
#include <oplog-cpp/oplog.hpp>

#include <benchmark/benchmark.h>

#include <spdlog/spdlog.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace oplog_cpp;

namespace {

// Accepts everything and acknowledges nothing.
class NullTransport : public Transport {
public:
    void emit_operation(const Operation&) override {}
    void on_operation(OperationHandler) override {}
    void on_operation_confirmed(ConfirmedHandler) override {}
    void on_operation_failed(FailedHandler) override {}
    void on_remote_entity_deleted(EntityDeletedHandler) override {}
    void on_document_reverted(DocumentRevertedHandler) override {}
};

auto make_block(const std::string& id, Position position = {}) -> BlockState {
    auto block = BlockState{};
    block.id = id;
    block.type = "agent";
    block.name = id;
    block.position = position;
    return block;
}

auto move_entry(const std::string& block_id, std::int64_t n) -> OperationEntry {
    auto op = Operation{.id = "op-" + std::to_string(n),
                        .timestamp = n,
                        .document_id = "doc",
                        .actor_id = "alice",
                        .payload = MoveBlockPayload{.block_id = block_id,
                                                    .before = {0, 0},
                                                    .after = {static_cast<double>(n), 0}}};
    return OperationEntry{.id = op.id, .operation = op, .inverse = make_inverse(op)};
}

auto populated_store(int blocks) -> InMemoryDocumentStore {
    auto store = InMemoryDocumentStore{};
    for (int i = 0; i < blocks; ++i) store.add_block(make_block("b" + std::to_string(i)));
    return store;
}

[[maybe_unused]] const auto quiet = [] {
    spdlog::set_level(spdlog::level::off);
    return true;
}();

}  // anonymous namespace

// =============================================================================
// Ledger
// =============================================================================

static void bm_ledger_push(benchmark::State& state) {
    auto ledger = Ledger{};
    std::int64_t n = 0;
    for (auto _ : state) {
        ledger.push("doc", "alice", move_entry("b1", n++));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_ledger_push);

static void bm_ledger_undo_redo(benchmark::State& state) {
    auto ledger = Ledger{};
    for (std::int64_t i = 0; i < 100; ++i) ledger.push("doc", "alice", move_entry("b1", i));
    for (auto _ : state) {
        auto undone = ledger.undo("doc", "alice");
        auto redone = ledger.redo("doc", "alice");
        benchmark::DoNotOptimize(undone);
        benchmark::DoNotOptimize(redone);
    }
    state.SetItemsProcessed(state.iterations() * 2);
}
BENCHMARK(bm_ledger_undo_redo);

static void bm_ledger_prune(benchmark::State& state) {
    const auto blocks = static_cast<int>(state.range(0));
    auto store = populated_store(blocks);
    const auto graph = store.graph();

    for (auto _ : state) {
        state.PauseTiming();
        auto ledger = Ledger{};
        for (std::int64_t i = 0; i < 100; ++i) {
            // Every other entry targets a block that does not exist.
            auto id = (i % 2 == 0) ? "b" + std::to_string(i % blocks) : "gone-" + std::to_string(i);
            ledger.push("doc", "alice", move_entry(id, i));
        }
        state.ResumeTiming();

        auto pruned = ledger.prune_invalid_entries("doc", "alice", graph);
        benchmark::DoNotOptimize(pruned);
    }
    state.SetItemsProcessed(state.iterations() * 100);
}
BENCHMARK(bm_ledger_prune)->Arg(10)->Arg(1000);

// =============================================================================
// Recording
// =============================================================================

static void bm_record_move(benchmark::State& state) {
    auto store = populated_store(1);
    auto transport = NullTransport{};
    auto loop = EventLoop{};
    auto session = Session{store, transport, loop, SessionOptions{.actor_id = "alice"}};
    session.open_document("doc");

    double x = 0;
    for (auto _ : state) {
        auto id = session.recorder().record_move("b0", {x, 0}, {x + 1, 0});
        benchmark::DoNotOptimize(id);
        x += 1;
        state.PauseTiming();
        session.queue().clear();
        state.ResumeTiming();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_record_move);

static void bm_undo_redo_cycle(benchmark::State& state) {
    auto store = populated_store(1);
    auto transport = NullTransport{};
    auto loop = EventLoop{};
    auto session = Session{store, transport, loop, SessionOptions{.actor_id = "alice"}};
    session.open_document("doc");
    session.recorder().record_move("b0", {0, 0}, {10, 10});

    for (auto _ : state) {
        session.undo();
        loop.run_microtasks();
        session.redo();
        loop.run_microtasks();
        state.PauseTiming();
        session.queue().clear();
        state.ResumeTiming();
    }
    state.SetItemsProcessed(state.iterations() * 2);
}
BENCHMARK(bm_undo_redo_cycle);

// =============================================================================
// Remote application
// =============================================================================

static void bm_remote_batch_move(benchmark::State& state) {
    const auto n = static_cast<int>(state.range(0));
    auto store = populated_store(n);
    auto transport = NullTransport{};
    auto loop = EventLoop{};
    auto session = Session{store, transport, loop, SessionOptions{.actor_id = "alice"}};
    session.open_document("doc");

    std::int64_t ts = 0;
    for (auto _ : state) {
        state.PauseTiming();
        auto moves = std::vector<BlockMove>{};
        for (int i = 0; i < n; ++i) {
            moves.push_back(BlockMove{.block_id = "b" + std::to_string(i),
                                      .before = {},
                                      .after = {static_cast<double>(ts), 0}});
        }
        auto op = Operation{.id = "remote-" + std::to_string(ts),
                            .timestamp = ts,
                            .document_id = "doc",
                            .actor_id = "bob",
                            .payload = BatchMoveBlocksPayload{.moves = std::move(moves)}};
        ++ts;
        state.ResumeTiming();

        session.dispatcher().handle_operation(op);
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(bm_remote_batch_move)->Range(8, 512);

// =============================================================================
// Wire codec
// =============================================================================

static void bm_encode_operation(benchmark::State& state) {
    auto op = move_entry("b1", 1).operation;
    for (auto _ : state) {
        auto text = encode_operation(op);
        benchmark::DoNotOptimize(text);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_encode_operation);

static void bm_decode_remove_block(benchmark::State& state) {
    auto block = make_block("b1");
    block.subblocks["prompt"] = std::string(200, 'p');
    block.subblocks["temperature"] = 0.7;
    auto edges = std::vector<EdgeState>{};
    for (int i = 0; i < 8; ++i) {
        edges.push_back(EdgeState{.id = "e" + std::to_string(i), .source = "b1",
                                  .target = "t" + std::to_string(i),
                                  .source_handle = "out", .target_handle = "in"});
    }
    auto text = encode_operation(Operation{.id = "op-1",
                                           .timestamp = 1,
                                           .document_id = "doc",
                                           .actor_id = "alice",
                                           .payload = RemoveBlockPayload{.block = block,
                                                                         .edges = edges,
                                                                         .children = {}}});
    for (auto _ : state) {
        auto op = decode_operation(text);
        benchmark::DoNotOptimize(op);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_decode_remove_block);
