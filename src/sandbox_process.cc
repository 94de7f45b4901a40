#include <cerrno>
#include <jailer/errmsg.hh>
#include <jailer/logger.hh>
#include <jailer/macros/throw.hh>
#include <jailer/sandbox_process.hh>
#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

namespace jailer {

const char* to_str(SupervisorState state) noexcept {
    switch (state) {
    case SupervisorState::PREPARING: return "PREPARING";
    case SupervisorState::RUNNING: return "RUNNING";
    case SupervisorState::COMPLETED: return "COMPLETED";
    case SupervisorState::TIMED_OUT: return "TIMED_OUT";
    case SupervisorState::LIMIT_EXCEEDED: return "LIMIT_EXCEEDED";
    case SupervisorState::KILLED: return "KILLED";
    case SupervisorState::SPAWN_FAILED: return "SPAWN_FAILED";
    case SupervisorState::SUPERVISION_FAILED: return "SUPERVISION_FAILED";
    }
    __builtin_unreachable();
}

const char* to_str(LimitKind kind) noexcept {
    switch (kind) {
    case LimitKind::CPU_TIME: return "cpu time";
    case LimitKind::MEMORY: return "memory";
    case LimitKind::FILE_SIZE: return "file size";
    }
    __builtin_unreachable();
}

CancellationToken::CancellationToken()
: eventfd_(std::make_shared<FileDescriptor>(eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK))) {
    if (!eventfd_->is_open()) {
        THROW("eventfd()", errmsg());
    }
}

void CancellationToken::cancel() noexcept {
    uint64_t one = 1;
    // Only EAGAIN (counter overflow) is possible, the token stays cancelled then
    (void)write(*eventfd_, &one, sizeof(one));
}

bool CancellationToken::is_cancelled() const noexcept {
    pollfd pfd = {.fd = *eventfd_, .events = POLLIN, .revents = 0};
    return poll(&pfd, 1, 0) == 1;
}

std::optional<std::chrono::nanoseconds> SandboxProcess::runtime() const noexcept {
    if (!start_time_ or !end_time_) {
        return std::nullopt;
    }
    auto to_ns = [](const timespec& ts) {
        return std::chrono::seconds{ts.tv_sec} + std::chrono::nanoseconds{ts.tv_nsec};
    };
    auto res = to_ns(*end_time_) - to_ns(*start_time_);
    return res.count() < 0 ? std::chrono::nanoseconds{0} : res;
}

bool SandboxProcess::wall_time_limit_reached() const noexcept {
    auto elapsed = runtime();
    return limits_.wall_time_limit and elapsed and *elapsed >= *limits_.wall_time_limit;
}

bool SandboxProcess::transition_to(SupervisorState new_state) {
    bool allowed = [&] {
        switch (state_) {
        case SupervisorState::PREPARING:
            return new_state == SupervisorState::RUNNING or
                new_state == SupervisorState::SPAWN_FAILED;
        case SupervisorState::RUNNING:
            return is_terminal(new_state) and new_state != SupervisorState::SPAWN_FAILED;
        default: return false;
        }
    }();
    if (!allowed) {
        return false;
    }
    stdlog("execution #", id_, ": ", to_str(state_), " -> ", to_str(new_state));
    state_ = new_state;
    return true;
}

} // namespace jailer
