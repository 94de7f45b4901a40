#include "sandbox_config.hh"

#include <chrono>
#include <csignal>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <jailer/process_supervisor.hh>
#include <sys/prctl.h>

using jailer::ExecutionResult;
using jailer::SupervisorState;
using jailer::TerminationCause;

// NOLINTNEXTLINE
TEST(sandbox, true_completes) {
    auto res = run(host_options(), {.argv = {"/bin/true"}});
    EXPECT_EQ(res.cause, TerminationCause::COMPLETED) << res.description();
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_EQ(res.signal, std::nullopt);
    ASSERT_TRUE(res.duration.has_value());
    EXPECT_GE(res.duration->count(), 0);
    EXPECT_FALSE(res.limit_was_cause);
    EXPECT_EQ(res.diagnostics, "");
}

// NOLINTNEXTLINE
TEST(sandbox, exit_code_is_passed_through) {
    auto res = run(host_options(), sh("exit 42"));
    EXPECT_EQ(res.cause, TerminationCause::COMPLETED) << res.description();
    EXPECT_EQ(res.exit_code, 42);
}

// NOLINTNEXTLINE
TEST(sandbox, death_by_signal) {
    auto res = run(host_options(), sh("kill -SEGV $$"));
    EXPECT_EQ(res.cause, TerminationCause::COMPLETED) << res.description();
    EXPECT_EQ(res.signal, SIGSEGV);
    EXPECT_EQ(res.exit_code, 128 + SIGSEGV);
}

// NOLINTNEXTLINE
TEST(sandbox, executable_differs_from_argv0) {
    auto res = run(
        host_options(),
        {.argv = {"not-a-shell", "-c", "test \"$0\" = not-a-shell && exit 7"},
         .executable = "/bin/sh"}
    );
    EXPECT_EQ(res.cause, TerminationCause::COMPLETED) << res.description();
    EXPECT_EQ(res.exit_code, 7);
}

// NOLINTNEXTLINE
TEST(sandbox, working_directory) {
    auto opts = host_options();
    opts.working_dir = "/tmp";
    auto res = run(std::move(opts), sh("test \"$(pwd)\" = /tmp"));
    EXPECT_EQ(res.cause, TerminationCause::COMPLETED) << res.description();
    EXPECT_EQ(res.exit_code, 0);
}

// NOLINTNEXTLINE
TEST(sandbox, new_session) {
    auto opts = host_options();
    opts.security.new_session = true;
    // The shell is the session leader: its pid is the session id
    auto res = run(
        opts,
        sh("command -v ps >/dev/null || exit 127; "
           "test \"$(ps -o sid= -p $$ | tr -d ' ')\" = $$")
    );
    if (res.exit_code == 127) {
        GTEST_SKIP() << "ps is not available";
    }
    EXPECT_EQ(res.exit_code, 0) << res.description();

    opts.security.new_session = false;
    res = run(opts, sh("test \"$(ps -o sid= -p $$ | tr -d ' ')\" != $$"));
    EXPECT_EQ(res.exit_code, 0) << res.description();
}

// NOLINTNEXTLINE
TEST(sandbox, no_new_privs) {
    auto opts = host_options();
    auto res = run(opts, sh("grep -q '^NoNewPrivs:[[:space:]]*1$' /proc/self/status"));
    EXPECT_EQ(res.exit_code, 0) << res.description();

    if (prctl(PR_GET_NO_NEW_PRIVS, 0, 0, 0, 0) == 1) {
        GTEST_SKIP() << "no_new_privs is already set for this process";
    }
    opts.security.no_new_privs = false;
    res = run(opts, sh("grep -q '^NoNewPrivs:[[:space:]]*0$' /proc/self/status"));
    EXPECT_EQ(res.exit_code, 0) << res.description();
}

// NOLINTNEXTLINE
TEST(sandbox, supervisor_states) {
    auto plan = jailer::build_plan(make_config(host_options()));
    ASSERT_TRUE(plan.is_ok()) << plan.err().description();

    auto first = jailer::ProcessSupervisor::run(plan.ok(), sh("exit 0"), {});
    auto second = jailer::ProcessSupervisor::run(plan.ok(), sh("exit 1"), {});
    EXPECT_EQ(first.state(), SupervisorState::COMPLETED);
    EXPECT_EQ(second.state(), SupervisorState::COMPLETED);
    EXPECT_GT(second.id(), first.id());
    EXPECT_GT(first.pid(), 0);
    // Descriptors are released once the execution is over
    EXPECT_EQ(first.pidfd(), -1);
    ASSERT_TRUE(first.si().has_value());
    EXPECT_EQ(first.si()->description(), "exited with 0");
    EXPECT_EQ(second.si()->description(), "exited with 1");
    ASSERT_TRUE(first.start_time().has_value());
    ASSERT_TRUE(first.end_time().has_value());
}

// NOLINTNEXTLINE
TEST(sandbox, init_process_death_is_a_supervision_failure) {
    // Without the PID namespace the command's parent is an ordinary process
    auto res = run(host_options(), sh("kill -KILL $PPID; sleep 10"));
    EXPECT_EQ(res.cause, TerminationCause::SUPERVISION_FAILED) << res.description();
    EXPECT_EQ(res.exit_code, std::nullopt);
    EXPECT_THAT(
        res.diagnostics, testing::HasSubstr("sandbox init process killed by signal SIGKILL")
    );
    ASSERT_TRUE(res.duration.has_value());
    EXPECT_LT(*res.duration, std::chrono::seconds{10});
}
