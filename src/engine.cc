#include <jailer/engine.hh>
#include <jailer/logger.hh>
#include <jailer/process_supervisor.hh>

namespace jailer {

Result<ExecutionResult, PlanError> execute(
    const ConfigModel& config, const Command& command, const CancellationToken& cancellation_token
) {
    auto plan = build_plan(config);
    if (plan.is_err()) {
        auto err = std::move(plan).unwrap_err();
        errlog("cannot run ", command.argv.empty() ? "" : command.argv[0], ": ", err.description());
        return Err{std::move(err)};
    }
    auto process = ProcessSupervisor::run(plan.ok(), command, cancellation_token);
    return Ok{report(std::move(process))};
}

std::future<Result<ExecutionResult, PlanError>> execute_async(
    std::shared_ptr<const ConfigModel> config, Command command, CancellationToken cancellation_token
) {
    return std::async(
        std::launch::async,
        [config = std::move(config),
         command = std::move(command),
         cancellation_token = std::move(cancellation_token)] {
            return execute(*config, command, cancellation_token);
        }
    );
}

} // namespace jailer
