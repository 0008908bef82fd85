// basic_usage: one session editing a canvas with undo and redo
//
// Records block, edge and variable edits against an in-memory document,
// then walks the history back and forth.
//
// Build: cmake --build build
// Run:   ./build/basic_usage

#include <oplog-cpp/oplog.hpp>

#include <cstdio>
#include <memory>
#include <string>

namespace op = oplog_cpp;

namespace {

void print_canvas(const char* label, const op::InMemoryDocumentStore& store) {
    const auto graph = store.graph();
    std::printf("%s\n", label);
    for (const auto& [id, block] : graph.blocks_by_id) {
        std::printf("  block %-8s at (%5.1f, %5.1f) in %s\n", id.c_str(), block.position.x,
                    block.position.y, block.parent_id ? block.parent_id->c_str() : "root");
    }
    for (const auto& [id, edge] : graph.edges_by_id) {
        std::printf("  edge  %-8s %s -> %s\n", id.c_str(), edge.source.c_str(), edge.target.c_str());
    }
}

auto make_block(std::string id, std::string type, op::Position position) -> op::BlockState {
    auto block = op::BlockState{};
    block.id = id;
    block.type = std::move(type);
    block.name = std::move(id);
    block.position = position;
    return block;
}

}  // anonymous namespace

int main() {
    op::set_log_level("warn");

    auto server = op::LocalServer{};
    auto link = server.connect("alice");
    auto loop = op::EventLoop{};
    auto store = op::InMemoryDocumentStore{};
    auto session = op::Session{store, *link, loop, op::SessionOptions{.actor_id = "alice"}};
    session.open_document("workflow-1");

    // -- Record some edits ----------------------------------------------------
    auto& recorder = session.recorder();
    recorder.record_add_block(make_block("start", "starter", {0, 0}));
    recorder.record_add_block(make_block("agent", "agent", {200, 0}));
    recorder.record_add_edge(op::EdgeState{.id = "e1", .source = "start", .target = "agent",
                                           .source_handle = "out", .target_handle = "in"});
    recorder.record_move("agent", {200, 0}, {240, 80});
    recorder.record_add_variable(op::VariableState{.id = "v1", .name = "apiKey",
                                                   .type = "string", .value = std::string{"secret"}});
    server.pump();

    print_canvas("After editing:", store);
    std::printf("server applied %zu operations\n", server.applied_count());

    // -- Undo twice -----------------------------------------------------------
    for (int i = 0; i < 2; ++i) {
        if (auto entry = session.undo()) {
            std::printf("undid %s\n", std::string{op::to_string_view(entry->operation.kind())}.c_str());
        }
        loop.run_microtasks();
    }
    server.pump();
    print_canvas("After two undos:", store);

    // -- Redo once ------------------------------------------------------------
    if (auto entry = session.redo()) {
        std::printf("redid %s\n", std::string{op::to_string_view(entry->operation.kind())}.c_str());
    }
    loop.run_microtasks();
    server.pump();

    auto sizes = session.stack_sizes();
    std::printf("undo stack: %zu, redo stack: %zu\n", sizes.undo_size, sizes.redo_size);
    std::printf("variable v1 %s\n", store.has_variable("v1") ? "exists" : "is gone");

    return 0;
}
