#pragma once

#include <future>
#include <jailer/command.hh>
#include <jailer/config_model.hh>
#include <jailer/environment_builder.hh>
#include <jailer/result.hh>
#include <jailer/result_reporter.hh>
#include <jailer/sandbox_process.hh>
#include <memory>

namespace jailer {

// Builds the plan for @p config, runs @p command in it on the calling thread
// and reports the result. Nothing is created if the plan cannot be built.
Result<ExecutionResult, PlanError> execute(
    const ConfigModel& config,
    const Command& command,
    const CancellationToken& cancellation_token = CancellationToken{}
);

// Like execute(), but on a separate thread. @p config may be shared between
// any number of executions.
std::future<Result<ExecutionResult, PlanError>> execute_async(
    std::shared_ptr<const ConfigModel> config,
    Command command,
    CancellationToken cancellation_token = CancellationToken{}
);

} // namespace jailer
