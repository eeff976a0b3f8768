#include <gtest/gtest.h>

#include <warden/cancellation.hpp>

#include <atomic>
#include <thread>

namespace warden {
namespace {

using std::chrono::milliseconds;

TEST(cancellation, background_never_cancels) {
    auto root = cancellation_t::background();

    EXPECT_FALSE(root->done());
    EXPECT_FALSE(root->error());
    EXPECT_FALSE(root->wait_for(milliseconds(20)));
}

TEST(cancellation, cancel) {
    auto token = cancellation_t::with_cancel(cancellation_t::background());

    token->cancel();

    EXPECT_TRUE(token->done());
    EXPECT_EQ(std::error_code(error::canceled), token->error());
    EXPECT_TRUE(token->wait_for(milliseconds(0)));

    // Idempotent.
    token->cancel();
    EXPECT_EQ(std::error_code(error::canceled), token->error());
}

TEST(cancellation, propagates_to_children_only) {
    auto parent = cancellation_t::with_cancel(cancellation_t::background());
    auto child = cancellation_t::with_cancel(parent);
    auto sibling = cancellation_t::with_cancel(parent);

    child->cancel();

    EXPECT_TRUE(child->done());
    EXPECT_FALSE(parent->done());
    EXPECT_FALSE(sibling->done());

    parent->cancel();

    EXPECT_TRUE(sibling->done());
    EXPECT_EQ(std::error_code(error::canceled), sibling->error());
}

TEST(cancellation, child_of_cancelled_parent) {
    auto parent = cancellation_t::with_cancel(cancellation_t::background());

    parent->cancel();

    auto child = cancellation_t::with_cancel(parent);

    EXPECT_TRUE(child->done());
}

TEST(cancellation, deadline) {
    auto token = cancellation_t::with_timeout(cancellation_t::background(), milliseconds(50));

    EXPECT_FALSE(token->done());
    EXPECT_TRUE(token->wait_for(std::chrono::seconds(5)));
    EXPECT_EQ(std::error_code(error::deadline_exceeded), token->error());
}

TEST(cancellation, deadline_propagates) {
    auto token = cancellation_t::with_timeout(cancellation_t::background(), milliseconds(30));
    auto child = cancellation_t::with_cancel(token);

    child->wait();

    EXPECT_EQ(std::error_code(error::deadline_exceeded), child->error());
}

TEST(cancellation, explicit_cancel_before_deadline) {
    auto token = cancellation_t::with_timeout(cancellation_t::background(), std::chrono::seconds(60));

    token->cancel();

    EXPECT_EQ(std::error_code(error::canceled), token->error());
}

TEST(cancellation, subscribe) {
    auto token = cancellation_t::with_cancel(cancellation_t::background());

    std::atomic<int> calls(0);

    token->subscribe([&]() { calls++; });
    token->subscribe([&]() { calls++; });

    const auto id = token->subscribe([&]() { calls += 100; });
    token->unsubscribe(id);

    token->cancel();
    token->cancel();

    EXPECT_EQ(2, calls);

    // Invoked immediately once cancelled.
    token->subscribe([&]() { calls++; });

    EXPECT_EQ(3, calls);
}

TEST(cancellation, wait_from_another_thread) {
    auto token = cancellation_t::with_cancel(cancellation_t::background());

    std::thread canceller([&]() {
        std::this_thread::sleep_for(milliseconds(20));
        token->cancel();
    });

    token->wait();
    canceller.join();

    EXPECT_TRUE(token->done());
}

TEST(cancellation, destroyed_before_deadline) {
    auto token = cancellation_t::with_timeout(cancellation_t::background(), std::chrono::seconds(60));

    const auto started = std::chrono::steady_clock::now();

    token.reset();

    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
}

} // namespace
} // namespace warden
