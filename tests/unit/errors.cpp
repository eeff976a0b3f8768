#include <gtest/gtest.h>

#include <warden/errors.hpp>

#include <atomic>
#include <thread>
#include <vector>

#include <csignal>

namespace warden {
namespace {

TEST(errors, exit_status) {
    const auto ec = error::make_exit_error(7);

    EXPECT_EQ(7, ec.value());
    EXPECT_EQ("exit status 7", ec.message());
    EXPECT_EQ(&error::exit_category(), &ec.category());
    EXPECT_NE(error::make_exit_error(7), error::make_signal_error(7));
}

TEST(errors, signal) {
    const auto ec = error::make_signal_error(SIGKILL);

    EXPECT_EQ(SIGKILL, ec.value());
    EXPECT_EQ("signal: Killed", ec.message());
    EXPECT_EQ("signal: Terminated", error::make_signal_error(SIGTERM).message());
    EXPECT_EQ("signal: 1000", error::make_signal_error(1000).message());
}

TEST(errors, signal_messages_from_many_threads) {
    std::vector<std::thread> threads;
    std::atomic<int> mismatches(0);

    for(int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i]() {
            const int signum = i % 2 ? SIGKILL : SIGINT;
            const std::string expected = i % 2 ? "signal: Killed" : "signal: Interrupt";

            for(int j = 0; j < 1000; ++j) {
                if(error::make_signal_error(signum).message() != expected) {
                    ++mismatches;
                }
            }
        });
    }

    for(auto& thread: threads) {
        thread.join();
    }

    EXPECT_EQ(0, mismatches.load());
}

TEST(errors, messages) {
    EXPECT_EQ("process already running", std::error_code(error::already_running).message());
    EXPECT_EQ("file already closed", std::error_code(error::stream_closed).message());
    EXPECT_EQ("context deadline exceeded", std::error_code(error::deadline_exceeded).message());
    EXPECT_EQ("command not found", std::error_code(error::command_not_found).message());
}

TEST(errors, exception) {
    try {
        throw error_t(error::already_started, "process {} has already been started", 42);
    } catch(const std::system_error& e) {
        EXPECT_EQ(std::error_code(error::already_started), e.code());
        EXPECT_NE(std::string::npos, std::string(e.what()).find("process 42 has already been started"));
        EXPECT_EQ(0u, error::to_string(e).find("[1] "));
    }
}

TEST(errors, exception_without_code) {
    const error_t e("invalid {}", "argument");

    EXPECT_EQ(std::make_error_code(std::errc::invalid_argument), e.code());
}

} // namespace
} // namespace warden
