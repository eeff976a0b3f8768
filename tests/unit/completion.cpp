#include <gtest/gtest.h>

#include <warden/cancellation.hpp>
#include <warden/process/completion.hpp>

#include <thread>

#include <csignal>

namespace warden {
namespace {

using process::completion_status;
using process::completion_t;

TEST(completion, delivers_in_order_then_closes) {
    completion_t completion(3);

    EXPECT_TRUE(completion.deliver(error::make_exit_error(1)));
    EXPECT_TRUE(completion.deliver(error::make_exit_error(2)));
    EXPECT_TRUE(completion.deliver(std::error_code()));
    EXPECT_TRUE(completion.close());

    std::error_code outcome;

    ASSERT_EQ(completion_status::ready, completion.next(outcome));
    EXPECT_EQ(error::make_exit_error(1), outcome);

    ASSERT_EQ(completion_status::ready, completion.next(outcome));
    EXPECT_EQ(error::make_exit_error(2), outcome);

    ASSERT_EQ(completion_status::ready, completion.next(outcome));
    EXPECT_FALSE(outcome);

    EXPECT_EQ(completion_status::closed, completion.next(outcome));
    EXPECT_EQ(3u, completion.delivered());
}

TEST(completion, bounded) {
    completion_t completion(1);

    EXPECT_TRUE(completion.deliver(std::error_code()));
    EXPECT_FALSE(completion.deliver(std::error_code()));
    EXPECT_EQ(1u, completion.delivered());
}

TEST(completion, closed_once) {
    completion_t completion(1);

    EXPECT_TRUE(completion.close());
    EXPECT_FALSE(completion.close());
    EXPECT_TRUE(completion.closed());
    EXPECT_FALSE(completion.deliver(std::error_code()));
}

TEST(completion, next_for_times_out) {
    completion_t completion(1);

    std::error_code outcome;

    EXPECT_EQ(completion_status::timeout, completion.next_for(std::chrono::milliseconds(20), outcome));
}

TEST(completion, next_blocks_until_delivery) {
    completion_t completion(1);

    std::thread producer([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        completion.deliver(error::make_signal_error(SIGKILL));
        completion.close();
    });

    std::error_code outcome;

    EXPECT_EQ(completion_status::ready, completion.next(outcome));
    EXPECT_EQ(error::make_signal_error(SIGKILL), outcome);

    producer.join();
}

TEST(completion, next_is_cancellable) {
    completion_t completion(1);

    auto token = cancellation_t::with_timeout(cancellation_t::background(),
        std::chrono::milliseconds(30));

    std::error_code outcome;

    EXPECT_EQ(completion_status::canceled, completion.next(*token, outcome));
    EXPECT_EQ(std::error_code(error::deadline_exceeded), token->error());
}

TEST(completion, delivered_outcome_wins_over_cancellation) {
    completion_t completion(1);

    completion.deliver(std::error_code());

    auto token = cancellation_t::with_cancel(cancellation_t::background());
    token->cancel();

    std::error_code outcome = error::make_exit_error(1);

    EXPECT_EQ(completion_status::ready, completion.next(*token, outcome));
    EXPECT_FALSE(outcome);
}

} // namespace
} // namespace warden
