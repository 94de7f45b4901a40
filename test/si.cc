#include <csignal>
#include <gtest/gtest.h>
#include <jailer/si.hh>
#include <sys/wait.h>

using jailer::Si;

// NOLINTNEXTLINE
TEST(si, description_exited) {
    EXPECT_EQ((Si{.code = CLD_EXITED, .status = 0}).description(), "exited with 0");
    EXPECT_EQ((Si{.code = CLD_EXITED, .status = 42}).description(), "exited with 42");
}

// NOLINTNEXTLINE
TEST(si, description_killed) {
    EXPECT_EQ(
        (Si{.code = CLD_KILLED, .status = SIGKILL}).description(),
        "killed by signal SIGKILL - Killed"
    );
    EXPECT_EQ(
        (Si{.code = CLD_KILLED, .status = SIGSEGV}).description(),
        "killed by signal SIGSEGV - Segmentation fault"
    );
    EXPECT_EQ(
        (Si{.code = CLD_KILLED, .status = 0}).description(), "killed by signal with number 0"
    );
}

// NOLINTNEXTLINE
TEST(si, description_dumped) {
    EXPECT_EQ(
        (Si{.code = CLD_DUMPED, .status = SIGABRT}).description(),
        "killed and dumped by signal SIGABRT - Aborted"
    );
}

// NOLINTNEXTLINE
TEST(si, description_invalid) {
    EXPECT_EQ(
        (Si{.code = 6135, .status = 18258}).description(),
        "unable to describe (code 6135, status 18258)"
    );
}

// NOLINTNEXTLINE
TEST(si, predicates) {
    EXPECT_TRUE((Si{.code = CLD_EXITED, .status = 1}).exited());
    EXPECT_FALSE((Si{.code = CLD_EXITED, .status = 1}).killed_by_signal());
    EXPECT_TRUE((Si{.code = CLD_KILLED, .status = SIGTERM}).killed_by_signal());
    EXPECT_TRUE((Si{.code = CLD_DUMPED, .status = SIGSEGV}).killed_by_signal());
    EXPECT_FALSE((Si{.code = CLD_TRAPPED, .status = SIGTRAP}).killed_by_signal());
}
