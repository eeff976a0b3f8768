#include <gtest/gtest.h>

#include <warden/cancellation.hpp>
#include <warden/errors.hpp>
#include <warden/process/runner.hpp>

#include <boost/filesystem/operations.hpp>

#include <fstream>
#include <thread>

#include <csignal>

namespace warden {
namespace {

namespace fs = boost::filesystem;

using process::runner_t;

using std::chrono::milliseconds;

// A zombie awaiting its reaper counts as gone.
bool
alive(pid_t pid) {
    if(::kill(pid, 0) != 0) {
        return false;
    }

    std::ifstream stream("/proc/" + std::to_string(pid) + "/stat");
    std::string line;

    if(!std::getline(stream, line)) {
        return false;
    }

    const auto state = line.rfind(')');

    return state == std::string::npos || state + 2 >= line.size() || line[state + 2] != 'Z';
}

class runner_test:
    public ::testing::Test
{
protected:
    runner_test():
        directory(fs::temp_directory_path() / fs::unique_path("warden-runner-%%%%%%%%")),
        runner(directory, milliseconds(1000))
    { }

    void
    TearDown() {
        boost::system::error_code ec;
        fs::remove_all(directory, ec);
    }

    const fs::path directory;
    runner_t runner;
};

TEST_F(runner_test, captures_output) {
    const auto result = runner.run(cancellation_t::background(), "echo hello");

    EXPECT_FALSE(result.error);
    EXPECT_EQ(0, result.exit_code);

    ASSERT_TRUE(result.output);
    EXPECT_EQ("hello\n", *result.output);
}

TEST_F(runner_test, captures_both_streams) {
    const auto result = runner.run(cancellation_t::background(), "echo out\necho err >&2\n");

    EXPECT_FALSE(result.error);

    ASSERT_TRUE(result.output);
    EXPECT_EQ("out\nerr\n", *result.output);
}

TEST_F(runner_test, failure) {
    const auto result = runner.run(cancellation_t::background(), "echo failing\nexit 1");

    EXPECT_EQ(error::make_exit_error(1), result.error);
    EXPECT_EQ(1, result.exit_code);

    ASSERT_TRUE(result.output);
    EXPECT_EQ("failing\n", *result.output);
}

TEST_F(runner_test, leaves_no_files_behind) {
    runner.run(cancellation_t::background(), "echo hello");

    EXPECT_TRUE(fs::exists(directory));
    EXPECT_TRUE(fs::is_empty(directory));
    EXPECT_FALSE(runner.running());
}

TEST_F(runner_test, sequential_runs) {
    for(int i = 0; i < 3; ++i) {
        const auto result = runner.run(cancellation_t::background(), "echo run");

        EXPECT_FALSE(result.error);
        ASSERT_TRUE(result.output);
        EXPECT_EQ("run\n", *result.output);
    }
}

TEST_F(runner_test, rejects_concurrent_run) {
    std::thread first([&]() {
        runner.run(cancellation_t::background(), "sleep 1");
    });

    while(!runner.running()) {
        std::this_thread::yield();
    }

    try {
        runner.run(cancellation_t::background(), "echo second");
        ADD_FAILURE() << "a concurrent run must be rejected";
    } catch(const std::system_error& e) {
        EXPECT_EQ(std::error_code(error::already_running), e.code());
    }

    first.join();

    EXPECT_FALSE(runner.running());

    const auto result = runner.run(cancellation_t::background(), "echo third");

    EXPECT_FALSE(result.error);
}

TEST_F(runner_test, cancellation) {
    auto token = cancellation_t::with_timeout(cancellation_t::background(), milliseconds(200));

    const auto started = std::chrono::steady_clock::now();
    const auto result = runner.run(token, "sleep 100");

    EXPECT_EQ(std::error_code(error::deadline_exceeded), result.error);
    EXPECT_FALSE(result.output);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
    EXPECT_FALSE(runner.running());
}

TEST_F(runner_test, configure_callback) {
    const auto result = runner.run(cancellation_t::background(), "echo $WARDEN_RUNNER_VALUE",
        [](process::builder_t& builder) {
            builder.environment("WARDEN_RUNNER_VALUE=configured");
        });

    EXPECT_FALSE(result.error);
    ASSERT_TRUE(result.output);
    EXPECT_EQ("configured\n", *result.output);
}

TEST_F(runner_test, detached_run) {
    const auto pid_file = directory / "pid";

    const auto result = runner.run(cancellation_t::background(),
        "sleep 100 > /dev/null 2>&1 &\necho $! > " + pid_file.string() + "\necho done",
        [](process::builder_t& builder) {
            builder.detached(true);
        });

    EXPECT_FALSE(result.error);
    ASSERT_TRUE(result.output);
    EXPECT_EQ("done\n", *result.output);

    std::ifstream stream(pid_file.string());

    pid_t pid = 0;

    ASSERT_TRUE(stream >> pid);
    EXPECT_TRUE(alive(pid));

    ::kill(pid, SIGKILL);
}

TEST_F(runner_test, delayed_action_runs) {
    const auto marker = directory / "marker";

    const auto result = runner.run(cancellation_t::background(),
        "(sleep 1; touch " + marker.string() + ") >/dev/null 2>&1 &\necho scheduled");

    EXPECT_FALSE(result.error);
    ASSERT_TRUE(result.output);
    EXPECT_EQ("scheduled\n", *result.output);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);

    while(!fs::exists(marker) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(milliseconds(50));
    }

    EXPECT_TRUE(fs::exists(marker));
}

TEST_F(runner_test, cancellation_kills_background_actions) {
    const auto pid_file = directory / "pid";

    auto token = cancellation_t::with_timeout(cancellation_t::background(), milliseconds(500));

    const auto result = runner.run(token,
        "sleep 100 > /dev/null 2>&1 &\necho $! > " + pid_file.string() + "\nsleep 100");

    EXPECT_EQ(std::error_code(error::deadline_exceeded), result.error);

    std::ifstream stream(pid_file.string());

    pid_t pid = 0;

    ASSERT_TRUE(stream >> pid);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);

    while(alive(pid) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(milliseconds(20));
    }

    EXPECT_FALSE(alive(pid));
}

} // namespace
} // namespace warden
