#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <warden/detail/process/group.hpp>
#include <warden/detail/process/launcher.hpp>

#include <chrono>
#include <thread>

#include <csignal>

#include <sys/wait.h>
#include <unistd.h>

namespace warden {
namespace {

using detail::process::launch;
using detail::process::launch_options_t;
using detail::process::launched_t;
using detail::process::merge_environment;
using detail::process::process_group_t;

launched_t
spawn(const std::vector<std::string>& argv, bool group) {
    launch_options_t options;

    options.argv = argv;
    options.environment = merge_environment({});
    options.group = group;

    return launch(options);
}

int
reap(pid_t pid) {
    int status = 0;
    while(::waitpid(pid, &status, 0) < 0 && errno == EINTR);
    return status;
}

TEST(group, empty_target) {
    process_group_t group;

    EXPECT_TRUE(group.empty());
    EXPECT_FALSE(group.is_alive());
    EXPECT_FALSE(group.terminate());
    EXPECT_FALSE(group.kill());
}

TEST(group, leads_new_group) {
    const auto launched = spawn({"sleep", "30"}, true);

    EXPECT_EQ(launched.pid, ::getpgid(launched.pid));

    process_group_t group(launched.pid, true);

    EXPECT_TRUE(group.is_alive());
    EXPECT_FALSE(group.kill());

    const int status = reap(launched.pid);

    ASSERT_TRUE(WIFSIGNALED(status));
    EXPECT_EQ(SIGKILL, WTERMSIG(status));

    ::close(launched.output);
    ::close(launched.error);
}

TEST(group, vanished_target_is_not_an_error) {
    const auto launched = spawn({"true"}, true);

    reap(launched.pid);

    process_group_t group(launched.pid, true);

    EXPECT_FALSE(group.is_alive());
    EXPECT_FALSE(group.terminate());
    EXPECT_FALSE(group.kill());

    ::close(launched.output);
    ::close(launched.error);
}

TEST(group, unreaped_leader_is_not_alive) {
    const auto launched = spawn({"sh", "-c", "exit 0"}, true);

    process_group_t group(launched.pid, true);

    // The leader turns into a zombie as soon as it exits, since nobody reaps it yet.
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);

    while(group.is_alive() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    EXPECT_FALSE(group.is_alive());
    EXPECT_EQ(0, ::kill(launched.pid, 0));

    const int status = reap(launched.pid);

    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(0, WEXITSTATUS(status));

    ::close(launched.output);
    ::close(launched.error);
}

TEST(group, direct_child_only) {
    const auto launched = spawn({"sleep", "30"}, false);

    EXPECT_NE(launched.pid, ::getpgid(launched.pid));

    process_group_t target(launched.pid, false);

    EXPECT_FALSE(target.group());
    EXPECT_FALSE(target.terminate());

    const int status = reap(launched.pid);

    ASSERT_TRUE(WIFSIGNALED(status));
    EXPECT_EQ(SIGTERM, WTERMSIG(status));

    ::close(launched.output);
    ::close(launched.error);
}

TEST(launcher, exec_failure_is_reported) {
    EXPECT_THROW(spawn({"/nonexistent/warden-binary"}, true), std::system_error);
}

TEST(launcher, resolve) {
    EXPECT_TRUE(detail::process::resolve("sh"));
    EXPECT_FALSE(detail::process::resolve("warden-definitely-not-a-command-4f1c"));
    EXPECT_FALSE(detail::process::resolve("sh", "/nonexistent"));
}

TEST(launcher, environment_overrides_are_merged) {
    ::setenv("WARDEN_TEST_INHERITED", "inherited", 1);
    ::setenv("WARDEN_TEST_OVERRIDDEN", "old", 1);

    const auto environment = merge_environment({"WARDEN_TEST_OVERRIDDEN=new", "WARDEN_TEST_ADDED=1"});

    EXPECT_THAT(environment, ::testing::Contains("WARDEN_TEST_INHERITED=inherited"));
    EXPECT_THAT(environment, ::testing::Contains("WARDEN_TEST_OVERRIDDEN=new"));
    EXPECT_THAT(environment, ::testing::Contains("WARDEN_TEST_ADDED=1"));
    EXPECT_THAT(environment, ::testing::Not(::testing::Contains("WARDEN_TEST_OVERRIDDEN=old")));
}

} // namespace
} // namespace warden
