#include <gtest/gtest.h>

#include <warden/cancellation.hpp>
#include <warden/process/process.hpp>
#include <warden/process/reader.hpp>

#include <boost/filesystem/operations.hpp>

#include <fstream>
#include <string>
#include <thread>

#include <csignal>

namespace warden {
namespace {

namespace fs = boost::filesystem;

using process::builder_t;
using process::completion_status;
using process::process_t;

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

// Polls until the pid disappears or the timeout expires.
bool
wait_gone(pid_t pid, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while(std::chrono::steady_clock::now() < deadline) {
        if(!alive(pid)) {
            return true;
        }

        std::this_thread::sleep_for(milliseconds(20));
    }

    return !alive(pid);
}

std::vector<pid_t>
read_pids(const fs::path& path, std::size_t count, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    std::vector<pid_t> pids;

    while(std::chrono::steady_clock::now() < deadline) {
        pids.clear();

        std::ifstream stream(path.string());

        pid_t pid;

        while(stream >> pid) {
            pids.push_back(pid);
        }

        if(pids.size() >= count) {
            break;
        }

        std::this_thread::sleep_for(milliseconds(20));
    }

    return pids;
}

std::shared_ptr<cancellation_t>
background() {
    return cancellation_t::background();
}

class process_test:
    public ::testing::Test
{
protected:
    void
    SetUp() {
        directory = fs::temp_directory_path() / fs::unique_path("warden-process-%%%%%%%%");
        fs::create_directories(directory);
    }

    void
    TearDown() {
        boost::system::error_code ec;
        fs::remove_all(directory, ec);
    }

    fs::path directory;
};

TEST_F(process_test, start_twice_is_noop) {
    process_t process(builder_t().command({"sleep", "10"}).build());

    process.start(background());

    const auto pid = process.pid();

    EXPECT_GT(pid, 0);
    EXPECT_TRUE(process.started());

    process.start(background());

    EXPECT_EQ(pid, process.pid());
    EXPECT_TRUE(process.started());
    EXPECT_FALSE(process.closed());

    process.close();
}

TEST_F(process_test, close_before_start) {
    process_t process(builder_t().command({"echo", "hello"}).build());

    process.close();
    process.close();

    EXPECT_FALSE(process.started());
    EXPECT_FALSE(process.closed());
    EXPECT_EQ(0, process.pid());
}

TEST_F(process_test, close_is_idempotent) {
    process_t process(builder_t().command({"sleep", "10"}).build());

    process.start(background());
    process.close();

    EXPECT_TRUE(process.closed());

    process.close();

    EXPECT_TRUE(process.closed());
    EXPECT_TRUE(wait_gone(process.pid(), milliseconds(5000)));
}

TEST_F(process_test, start_after_close_is_noop) {
    process_t process(builder_t().command({"sleep", "10"}).build());

    process.start(background());
    process.close();

    const auto pid = process.pid();

    process.start(background());

    EXPECT_EQ(pid, process.pid());
    EXPECT_TRUE(process.closed());
}

TEST_F(process_test, clean_exit) {
    process_t process(builder_t().command({"true"}).build());

    process.start(background());

    std::error_code outcome = error::make_exit_error(42);

    ASSERT_EQ(completion_status::ready, process.wait().next(outcome));
    EXPECT_FALSE(outcome);
    EXPECT_EQ(completion_status::closed, process.wait().next(outcome));
    EXPECT_EQ(0, process.exit_code());

    process.close();
}

TEST_F(process_test, exit_code) {
    process_t process(builder_t().script("exit 3").inline_script().build());

    process.start(background());

    std::error_code outcome;

    ASSERT_EQ(completion_status::ready, process.wait().next(outcome));
    EXPECT_EQ(error::make_exit_error(3), outcome);
    EXPECT_EQ("exit status 3", outcome.message());
    EXPECT_EQ(3, process.exit_code());

    process.close();
}

TEST_F(process_test, restart_delivers_every_outcome) {
    const unsigned int limit = 3;
    const milliseconds interval(100);

    process_t process(builder_t()
        .command({"false"})
        .restart(limit, interval)
        .build());

    const auto started = std::chrono::steady_clock::now();

    process.start(background());

    std::vector<std::error_code> outcomes;
    std::error_code outcome;

    while(process.wait().next(outcome) == completion_status::ready) {
        outcomes.push_back(outcome);
    }

    EXPECT_GE(std::chrono::steady_clock::now() - started, interval * limit);

    ASSERT_EQ(limit + 1, outcomes.size());

    for(auto it = outcomes.begin(); it != outcomes.end(); ++it) {
        EXPECT_EQ(error::make_exit_error(1), *it);
    }

    EXPECT_EQ(limit, process.restarts());
    EXPECT_TRUE(process.wait().closed());

    process.close();
}

TEST_F(process_test, restart_stops_after_success) {
    const auto marker = directory / "marker";

    // Fails on the first run only.
    process_t process(builder_t()
        .script("if [ -e " + marker.string() + " ]; then exit 0; fi; touch " + marker.string() + "; exit 1")
        .inline_script()
        .restart(5, milliseconds(10))
        .build());

    process.start(background());

    std::vector<std::error_code> outcomes;
    std::error_code outcome;

    while(process.wait().next(outcome) == completion_status::ready) {
        outcomes.push_back(outcome);
    }

    ASSERT_EQ(2u, outcomes.size());
    EXPECT_TRUE(outcomes[0]);
    EXPECT_FALSE(outcomes[1]);
    EXPECT_EQ(1u, process.restarts());

    process.close();
}

TEST_F(process_test, close_stops_restarts) {
    process_t process(builder_t()
        .command({"false"})
        .restart(100, milliseconds(5000))
        .build());

    process.start(background());

    std::error_code outcome;

    ASSERT_EQ(completion_status::ready, process.wait().next(outcome));

    process.close();

    EXPECT_EQ(completion_status::closed,
        process.wait().next_for(std::chrono::seconds(5), outcome));
    EXPECT_EQ(0u, process.restarts());
}

TEST_F(process_test, close_kills_whole_group) {
    const auto pids = directory / "pids";

    process_t process(builder_t()
        .script("sleep 100 & echo $! >> " + pids.string() + "\n"
                "sleep 100 & echo $! >> " + pids.string() + "\n"
                "wait\n")
        .staging_directory(directory)
        .build());

    process.start(background());

    const auto children = read_pids(pids, 2, milliseconds(5000));

    ASSERT_EQ(2u, children.size());

    process.close();

    for(auto it = children.begin(); it != children.end(); ++it) {
        EXPECT_TRUE(wait_gone(*it, milliseconds(5000))) << "pid " << *it;
    }
}

TEST_F(process_test, release_after_exit_spares_background) {
    const auto pids = directory / "pids";

    process_t process(builder_t()
        .script("sleep 100 > /dev/null 2>&1 &\necho $! >> " + pids.string() + "\n")
        .staging_directory(directory)
        .build());

    process.start(background());

    std::error_code outcome;

    ASSERT_EQ(completion_status::ready, process.wait().next_for(std::chrono::seconds(5), outcome));
    EXPECT_FALSE(outcome);

    const auto children = read_pids(pids, 1, milliseconds(5000));

    ASSERT_EQ(1u, children.size());

    process.release();

    EXPECT_TRUE(process.closed());
    EXPECT_FALSE(process.staged_script());
    EXPECT_TRUE(alive(children.front()));

    ::kill(children.front(), SIGKILL);
}

TEST_F(process_test, release_while_running_terminates) {
    process_t process(builder_t().command({"sleep", "100"}).grace(milliseconds(200)).build());

    process.start(background());

    const auto pid = process.pid();

    process.release();

    EXPECT_TRUE(process.closed());
    EXPECT_TRUE(wait_gone(pid, milliseconds(5000)));
}

TEST_F(process_test, detached_children_survive) {
    const auto pids = directory / "pids";

    process_t process(builder_t()
        .script("sleep 100 & echo $! >> " + pids.string() + "\nwait\n")
        .staging_directory(directory)
        .detached(true)
        .build());

    process.start(background());

    const auto children = read_pids(pids, 1, milliseconds(5000));

    ASSERT_EQ(1u, children.size());

    process.close();

    std::error_code outcome;
    process.wait().next_for(std::chrono::seconds(5), outcome);

    EXPECT_TRUE(alive(children.front()));

    ::kill(children.front(), SIGKILL);
}

TEST_F(process_test, cancellation_kills_process) {
    auto token = cancellation_t::with_cancel(background());

    process_t process(builder_t().command({"sleep", "100"}).build());

    process.start(token);

    const auto started = std::chrono::steady_clock::now();

    token->cancel();

    std::error_code outcome;

    ASSERT_EQ(completion_status::ready, process.wait().next_for(std::chrono::seconds(5), outcome));

    EXPECT_EQ(error::make_signal_error(SIGKILL), outcome);
    EXPECT_EQ(-1, process.exit_code());
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(3));

    process.close();
}

TEST_F(process_test, cancelled_context_before_start) {
    auto token = cancellation_t::with_cancel(background());

    token->cancel();

    process_t process(builder_t().command({"sleep", "100"}).build());

    process.start(token);

    std::error_code outcome;

    ASSERT_EQ(completion_status::ready, process.wait().next_for(std::chrono::seconds(5), outcome));
    EXPECT_EQ(error::make_signal_error(SIGKILL), outcome);
}

TEST_F(process_test, staged_script_is_removed_on_close) {
    process_t process(builder_t()
        .command({"echo", "hello"})
        .file_script()
        .staging_directory(directory)
        .build());

    const auto staged = process.staged_script();

    ASSERT_TRUE(staged);
    EXPECT_TRUE(fs::exists(*staged));
    EXPECT_EQ(directory, staged->parent_path());

    process.start(background());

    std::error_code outcome;
    process.wait().next(outcome);

    EXPECT_FALSE(outcome);

    process.close();

    EXPECT_FALSE(fs::exists(*staged));
    EXPECT_FALSE(process.staged_script());
}

TEST_F(process_test, inline_mode_stages_nothing) {
    process_t process(builder_t()
        .command({"echo", "hello"})
        .inline_script()
        .staging_directory(directory)
        .build());

    EXPECT_FALSE(process.staged_script());
    EXPECT_TRUE(fs::is_empty(directory));

    const auto result = process.start_and_wait(background());

    EXPECT_FALSE(result.error);
    EXPECT_EQ("hello\n", result.output);
}

TEST_F(process_test, strict_mode_header) {
    process_t process(builder_t()
        .command({"echo", "$UNDEFINED_WARDEN_VARIABLE"})
        .command({"echo", "unreachable"})
        .inline_script()
        .build());

    const auto result = process.start_and_wait(background());

    EXPECT_TRUE(result.error);
    EXPECT_EQ(std::string::npos, result.output.find("unreachable"));
}

TEST_F(process_test, environment_reaches_child) {
    process_t process(builder_t()
        .command({"sh", "-c", "echo $WARDEN_TEST_VALUE"})
        .environment("WARDEN_TEST_VALUE=forty-two")
        .build());

    const auto result = process.start_and_wait(background());

    EXPECT_FALSE(result.error);
    EXPECT_EQ("forty-two\n", result.output);
}

TEST_F(process_test, start_and_wait_combines_output) {
    process_t process(builder_t()
        .script("echo out; echo err >&2; exit 4")
        .inline_script()
        .build());

    const auto result = process.start_and_wait(background());

    EXPECT_EQ(error::make_exit_error(4), result.error);
    EXPECT_EQ("out\nerr\n", result.output);
    EXPECT_EQ(4, process.exit_code());
}

TEST_F(process_test, start_and_wait_rejects_started) {
    process_t process(builder_t().command({"sleep", "10"}).build());

    process.start(background());

    try {
        process.start_and_wait(background());
        FAIL() << "start_and_wait must fail on a started process";
    } catch(const std::system_error& e) {
        EXPECT_EQ(std::error_code(error::already_started), e.code());
    }

    process.close();
}

TEST_F(process_test, launch_failure) {
    // The executable is resolved on every launch.
    process_t missing([&]() {
        auto spec = builder_t().command({"/bin/sh"}).build();
        spec.commands.front().front() = (directory / "missing").string();
        return spec;
    }());

    EXPECT_THROW(missing.start(background()), std::system_error);
    EXPECT_FALSE(missing.started());
}

TEST_F(process_test, output_file) {
    const auto output = directory / "output";

    process_t process(builder_t()
        .script("echo out; echo err >&2")
        .inline_script()
        .output_file(output.string())
        .build());

    process.start(background());

    std::error_code outcome;
    process.wait().next(outcome);

    EXPECT_FALSE(outcome);
    EXPECT_EQ(process.stdout_stream(), process.stderr_stream());

    std::vector<std::string> lines;

    process::read_options_t options;

    options.read_stdout = true;
    options.on_line = [&](const std::string& line) {
        lines.push_back(line);
    };

    EXPECT_FALSE(process::read(background(), process, options));
    EXPECT_EQ(std::vector<std::string>({"out", "err"}), lines);

    process.close();
}

TEST_F(process_test, streams_many_lines) {
    process_t process(builder_t()
        .script("for i in $(seq 1 1000); do echo line-$i; done")
        .inline_script()
        .build());

    process.start(background());

    std::vector<std::string> lines;

    process::read_options_t options;

    options.read_stdout = true;
    options.wait_for_completion = true;
    options.on_line = [&](const std::string& line) {
        lines.push_back(line);
    };

    EXPECT_FALSE(process::read(background(), process, options));

    ASSERT_EQ(1000u, lines.size());
    EXPECT_EQ("line-1", lines.front());
    EXPECT_EQ("line-1000", lines.back());

    process.close();
}

TEST_F(process_test, close_unblocks_reader) {
    process_t process(builder_t().command({"sleep", "100"}).build());

    process.start(background());

    std::error_code ec = error::make_exit_error(42);

    std::thread reader([&]() {
        process::read_options_t options;
        options.read_stdout = true;
        ec = process::read(background(), process, options);
    });

    std::this_thread::sleep_for(milliseconds(100));

    process.close();
    reader.join();

    EXPECT_FALSE(ec);
}

TEST_F(process_test, grace_window_is_honoured) {
    process_t process(builder_t()
        .script("trap 'exit 0' TERM; sleep 100 & wait")
        .inline_script()
        .grace(milliseconds(2000))
        .build());

    process.start(background());

    std::this_thread::sleep_for(milliseconds(200));

    const auto started = std::chrono::steady_clock::now();

    process.close();

    // Both the shell and the sleep stop on SIGTERM, long before the grace window expires.
    EXPECT_LT(std::chrono::steady_clock::now() - started, milliseconds(1500));
}

} // namespace
} // namespace warden
