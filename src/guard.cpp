#include <oplog-cpp/guard.hpp>

#include <spdlog/spdlog.h>

namespace oplog_cpp {

auto RemoteApplicationGuard::context() const -> ApplyContext {
    if (applying_remote_) return ApplyContext::remote;
    if (undo_redo_->set) return ApplyContext::undo_redo;
    return ApplyContext::local;
}

auto RemoteApplicationGuard::begin_remote_apply() -> bool {
    if (applying_remote_) return false;
    applying_remote_ = true;
    return true;
}

void RemoteApplicationGuard::end_remote_apply() {
    applying_remote_ = false;
}

auto RemoteApplicationGuard::begin_undo_redo() -> bool {
    if (undo_redo_->set) return false;
    undo_redo_->set = true;
    auto generation = ++undo_redo_->generation;
    loop_.post([weak = std::weak_ptr<UndoRedoFlag>{undo_redo_}, generation] {
        auto flag = weak.lock();
        // A release() followed by a new begin_undo_redo() owns the flag now.
        if (flag && flag->generation == generation) flag->set = false;
    });
    return true;
}

void RemoteApplicationGuard::release() {
    if (applying_remote_ || undo_redo_->set) {
        spdlog::debug("guard released while {} was active", to_string_view(context()));
    }
    applying_remote_ = false;
    undo_redo_->set = false;
    ++undo_redo_->generation;
}

}  // namespace oplog_cpp
