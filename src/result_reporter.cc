#include <cstdio>
#include <jailer/concat_tostr.hh>
#include <jailer/macros/throw.hh>
#include <jailer/result_reporter.hh>

namespace jailer {

const char* to_str(TerminationCause cause) noexcept {
    switch (cause) {
    case TerminationCause::COMPLETED: return "completed";
    case TerminationCause::TIMED_OUT: return "timed out";
    case TerminationCause::LIMIT_EXCEEDED: return "limit exceeded";
    case TerminationCause::KILLED: return "killed";
    case TerminationCause::SPAWN_FAILED: return "spawn failed";
    case TerminationCause::SUPERVISION_FAILED: return "supervision failed";
    }
    __builtin_unreachable();
}

ExecutionResult report(SandboxProcess&& process) {
    ExecutionResult res = {
        .cause = TerminationCause::SPAWN_FAILED,
        .exit_code = std::nullopt,
        .signal = std::nullopt,
        .duration = process.runtime(),
        .limit = process.limit_kind(),
        .limit_was_cause = false,
        .diagnostics = std::move(process.diagnostics()),
    };
    if (const auto& si = process.si(); si && si->killed_by_signal()) {
        res.signal = si->status;
    }

    switch (process.state()) {
    case SupervisorState::PREPARING:
    case SupervisorState::RUNNING:
        THROW("execution #", process.id(), " is not finished: ", to_str(process.state()));
    case SupervisorState::COMPLETED: {
        res.cause = TerminationCause::COMPLETED;
        const auto& si = process.si();
        if (!si) {
            THROW("execution #", process.id(), " completed without an exit status");
        }
        res.exit_code = si->exited() ? si->status : 128 + si->status;
        break;
    }
    case SupervisorState::TIMED_OUT:
        res.cause = TerminationCause::TIMED_OUT;
        res.exit_code = exit_code::TIMED_OUT;
        break;
    case SupervisorState::LIMIT_EXCEEDED:
        res.cause = TerminationCause::LIMIT_EXCEEDED;
        res.exit_code = exit_code::LIMIT_EXCEEDED;
        res.limit_was_cause = true;
        break;
    case SupervisorState::KILLED:
        res.cause = TerminationCause::KILLED;
        res.exit_code = exit_code::KILLED;
        break;
    case SupervisorState::SPAWN_FAILED:
        res.cause = TerminationCause::SPAWN_FAILED;
        res.signal = std::nullopt;
        res.duration = std::nullopt;
        res.limit = std::nullopt;
        break;
    case SupervisorState::SUPERVISION_FAILED:
        res.cause = TerminationCause::SUPERVISION_FAILED;
        break;
    }
    return res;
}

std::string ExecutionResult::description() const {
    std::string res = [&]() -> std::string {
        switch (cause) {
        case TerminationCause::COMPLETED:
            return signal ? concat_tostr("killed by signal ", *signal) : "completed";
        case TerminationCause::TIMED_OUT: return "time limit exceeded";
        case TerminationCause::LIMIT_EXCEEDED:
            return limit ? concat_tostr(to_str(*limit), " limit exceeded")
                         : std::string{"limit exceeded"};
        case TerminationCause::KILLED: return "killed";
        case TerminationCause::SPAWN_FAILED: return "failed to start";
        case TerminationCause::SUPERVISION_FAILED: return "supervision failed";
        }
        __builtin_unreachable();
    }();
    if (duration) {
        char buff[32];
        (void)snprintf(
            buff,
            sizeof(buff),
            "%.3f",
            std::chrono::duration<double>(*duration).count()
        );
        back_insert(res, " after ", buff, " s");
    }
    if (exit_code) {
        back_insert(res, " (exit code ", *exit_code, ')');
    }
    if (!diagnostics.empty()) {
        back_insert(res, ": ", diagnostics);
    }
    return res;
}

} // namespace jailer
