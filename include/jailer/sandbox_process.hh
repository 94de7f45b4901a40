#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <jailer/file_descriptor.hh>
#include <jailer/si.hh>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>

namespace jailer {

enum class SupervisorState {
    PREPARING,
    RUNNING,
    COMPLETED,
    TIMED_OUT,
    LIMIT_EXCEEDED,
    KILLED,
    SPAWN_FAILED,
    // The command ran, but its fate could not be determined (e.g. the init process died)
    SUPERVISION_FAILED,
};

[[nodiscard]] const char* to_str(SupervisorState state) noexcept;

[[nodiscard]] constexpr bool is_terminal(SupervisorState state) noexcept {
    return state != SupervisorState::PREPARING and state != SupervisorState::RUNNING;
}

enum class LimitKind {
    CPU_TIME,
    MEMORY,
    FILE_SIZE,
};

[[nodiscard]] const char* to_str(LimitKind kind) noexcept;

// Copies share the state, cancelling any of them cancels all
class CancellationToken {
    std::shared_ptr<FileDescriptor> eventfd_;

public:
    // Throws std::runtime_error if eventfd() fails
    CancellationToken();

    // Safe to call from any thread, more than once
    void cancel() noexcept;

    [[nodiscard]] bool is_cancelled() const noexcept;

    // Becomes readable (POLLIN) once cancelled
    [[nodiscard]] int fd() const noexcept { return *eventfd_; }
};

struct AppliedLimits {
    std::optional<std::chrono::nanoseconds> wall_time_limit;
    std::chrono::nanoseconds grace_period{0};
    std::optional<uint64_t> cpu_time_limit_sec; // soft RLIMIT_CPU
    std::optional<uint64_t> file_size_limit; // soft RLIMIT_FSIZE
    std::optional<uint64_t> memory_limit; // soft RLIMIT_AS or cgroup memory.max
};

// One execution, driven through its states by the ProcessSupervisor
class SandboxProcess {
    uint64_t id_;
    CancellationToken cancellation_token_;
    AppliedLimits limits_;
    SupervisorState state_ = SupervisorState::PREPARING;
    pid_t pid_ = -1;
    FileDescriptor pidfd_;
    std::optional<timespec> start_time_;
    std::optional<timespec> end_time_;
    std::optional<Si> si_;
    std::optional<uint64_t> cpu_time_usec_;
    std::optional<LimitKind> limit_kind_;
    std::string diagnostics_;

public:
    SandboxProcess(uint64_t id, CancellationToken cancellation_token, AppliedLimits limits) noexcept
    : id_(id)
    , cancellation_token_(std::move(cancellation_token))
    , limits_(std::move(limits)) {}

    SandboxProcess(const SandboxProcess&) = delete;
    SandboxProcess(SandboxProcess&&) noexcept = default;
    SandboxProcess& operator=(const SandboxProcess&) = delete;
    SandboxProcess& operator=(SandboxProcess&&) noexcept = default;
    ~SandboxProcess() = default;

    [[nodiscard]] uint64_t id() const noexcept { return id_; }

    [[nodiscard]] SupervisorState state() const noexcept { return state_; }

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

    [[nodiscard]] int pidfd() const noexcept { return pidfd_; }

    [[nodiscard]] const CancellationToken& cancellation_token() const noexcept {
        return cancellation_token_;
    }

    [[nodiscard]] const AppliedLimits& limits() const noexcept { return limits_; }

    // CLOCK_MONOTONIC just before the command's execve()
    [[nodiscard]] const std::optional<timespec>& start_time() const noexcept {
        return start_time_;
    }

    // CLOCK_MONOTONIC after the command was reaped
    [[nodiscard]] const std::optional<timespec>& end_time() const noexcept { return end_time_; }

    [[nodiscard]] std::optional<std::chrono::nanoseconds> runtime() const noexcept;

    // A command that exits at or after its wall time limit timed out, however it exited
    [[nodiscard]] bool wall_time_limit_reached() const noexcept;

    // How the command died, if it was reaped
    [[nodiscard]] const std::optional<Si>& si() const noexcept { return si_; }

    [[nodiscard]] const std::optional<uint64_t>& cpu_time_usec() const noexcept {
        return cpu_time_usec_;
    }

    [[nodiscard]] const std::optional<LimitKind>& limit_kind() const noexcept {
        return limit_kind_;
    }

    [[nodiscard]] const std::string& diagnostics() const noexcept { return diagnostics_; }

    std::string& diagnostics() noexcept { return diagnostics_; }

    // Terminal states are final: returns false and changes nothing if the
    // current state is terminal or @p new_state does not follow it
    bool transition_to(SupervisorState new_state);

    void set_spawned(pid_t pid, FileDescriptor pidfd) noexcept {
        pid_ = pid;
        pidfd_ = std::move(pidfd);
    }

    void record_start(timespec start_time) noexcept { start_time_ = start_time; }

    void record_exit(
        std::optional<Si> si,
        std::optional<timespec> end_time,
        std::optional<uint64_t> cpu_time_usec
    ) noexcept {
        si_ = si;
        end_time_ = end_time;
        cpu_time_usec_ = cpu_time_usec;
    }

    void record_limit_breach(LimitKind kind) noexcept {
        if (!limit_kind_) {
            limit_kind_ = kind;
        }
    }

    void release_pidfd() noexcept { (void)pidfd_.close(); }
};

} // namespace jailer
