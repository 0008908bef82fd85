#include <oplog-cpp/guard.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

using namespace oplog_cpp;

TEST(ApplyContext, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ApplyContext::local),     "local");
    EXPECT_EQ(to_string_view(ApplyContext::remote),    "remote");
    EXPECT_EQ(to_string_view(ApplyContext::undo_redo), "undo_redo");
}

TEST(RemoteApplicationGuard, starts_in_local_context) {
    auto loop = EventLoop{};
    auto guard = RemoteApplicationGuard{loop};

    EXPECT_EQ(guard.context(), ApplyContext::local);
    EXPECT_FALSE(guard.applying_remote());
    EXPECT_FALSE(guard.undo_redo_in_progress());
}

TEST(RemoteApplicationGuard, remote_flag_is_a_boolean_not_a_counter) {
    auto loop = EventLoop{};
    auto guard = RemoteApplicationGuard{loop};

    EXPECT_TRUE(guard.begin_remote_apply());
    EXPECT_FALSE(guard.begin_remote_apply());
    EXPECT_EQ(guard.context(), ApplyContext::remote);

    guard.end_remote_apply();
    EXPECT_EQ(guard.context(), ApplyContext::local);
}

TEST(RemoteApplicationGuard, scoped_apply_releases_only_what_it_set) {
    auto loop = EventLoop{};
    auto guard = RemoteApplicationGuard{loop};
    {
        auto outer = RemoteApplicationGuard::ScopedRemoteApply{guard};
        EXPECT_TRUE(outer.owns());
        {
            auto inner = RemoteApplicationGuard::ScopedRemoteApply{guard};
            EXPECT_FALSE(inner.owns());
        }
        EXPECT_TRUE(guard.applying_remote());
    }
    EXPECT_FALSE(guard.applying_remote());
}

TEST(RemoteApplicationGuard, scoped_apply_releases_on_exception) {
    auto loop = EventLoop{};
    auto guard = RemoteApplicationGuard{loop};

    try {
        auto scope = RemoteApplicationGuard::ScopedRemoteApply{guard};
        throw std::runtime_error{"store failure"};
    } catch (const std::runtime_error&) {
    }

    EXPECT_FALSE(guard.applying_remote());
}

TEST(RemoteApplicationGuard, undo_redo_flag_survives_until_the_next_microtask) {
    auto loop = EventLoop{};
    auto guard = RemoteApplicationGuard{loop};

    EXPECT_TRUE(guard.begin_undo_redo());
    EXPECT_FALSE(guard.begin_undo_redo());
    EXPECT_EQ(guard.context(), ApplyContext::undo_redo);

    loop.run_microtasks();
    EXPECT_EQ(guard.context(), ApplyContext::local);
}

TEST(RemoteApplicationGuard, remote_wins_when_both_flags_are_set) {
    auto loop = EventLoop{};
    auto guard = RemoteApplicationGuard{loop};

    guard.begin_undo_redo();
    guard.begin_remote_apply();

    EXPECT_EQ(guard.context(), ApplyContext::remote);
}

TEST(RemoteApplicationGuard, stale_release_does_not_clear_a_newer_replay) {
    auto loop = EventLoop{};
    auto guard = RemoteApplicationGuard{loop};

    guard.begin_undo_redo();
    guard.release();
    guard.begin_undo_redo();
    EXPECT_EQ(loop.pending_microtasks(), 2u);

    // Drains both releases; only the second one owns the flag.
    loop.run_microtasks();
    EXPECT_FALSE(guard.undo_redo_in_progress());
}

TEST(RemoteApplicationGuard, release_clears_both_flags) {
    auto loop = EventLoop{};
    auto guard = RemoteApplicationGuard{loop};
    guard.begin_remote_apply();
    guard.begin_undo_redo();

    guard.release();

    EXPECT_EQ(guard.context(), ApplyContext::local);
}

TEST(RemoteApplicationGuard, pending_release_outliving_the_guard_is_harmless) {
    auto loop = EventLoop{};
    {
        auto guard = std::make_unique<RemoteApplicationGuard>(loop);
        guard->begin_undo_redo();
    }
    EXPECT_EQ(loop.run_microtasks(), 1u);
}
