#pragma once

#include <chrono>
#include <jailer/sandbox_process.hh>
#include <optional>
#include <string>

namespace jailer {

enum class TerminationCause {
    COMPLETED,
    TIMED_OUT,
    LIMIT_EXCEEDED,
    KILLED,
    SPAWN_FAILED,
    SUPERVISION_FAILED,
};

[[nodiscard]] const char* to_str(TerminationCause cause) noexcept;

// Exit codes reported when the sandbox terminated the command
namespace exit_code {
constexpr int TIMED_OUT = 124;
constexpr int LIMIT_EXCEEDED = 125;
constexpr int KILLED = 128 + 9; // as if killed by SIGKILL
} // namespace exit_code

struct ExecutionResult {
    TerminationCause cause;
    std::optional<int> exit_code; // not set iff the cause is SPAWN_FAILED or SUPERVISION_FAILED
    std::optional<int> signal; // signal that killed the command, if it was killed by one
    std::optional<std::chrono::nanoseconds> duration; // from execve() to the command's death
    std::optional<LimitKind> limit;
    bool limit_was_cause;
    std::string diagnostics;

    // E.g. "time limit exceeded after 2.001 s (exit code 124)"
    [[nodiscard]] std::string description() const;
};

// Turns a process in a terminal state into its result
[[nodiscard]] ExecutionResult report(SandboxProcess&& process);

} // namespace jailer
