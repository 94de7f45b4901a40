#pragma once

#include <atomic>
#include <cstdint>
#include <jailer/command.hh>
#include <jailer/environment_plan.hh>
#include <jailer/sandbox_process.hh>

namespace jailer {

// Spawns the command inside the environment described by a plan and drives
// it to a terminal state. Separate executions may run concurrently, each
// on its own thread.
class ProcessSupervisor {
    static inline std::atomic<uint64_t> next_execution_id{1};

public:
    // Every failure, including the ones while preparing the environment, is
    // reported through the state and diagnostics of the returned process.
    // The returned process is always in a terminal state.
    static SandboxProcess
    run(const EnvironmentPlan& plan, const Command& command, CancellationToken cancellation_token);
};

} // namespace jailer
