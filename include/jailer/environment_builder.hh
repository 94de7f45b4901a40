#pragma once

#include <jailer/config_model.hh>
#include <jailer/environment_plan.hh>
#include <jailer/result.hh>
#include <string>
#include <vector>

namespace jailer {

// Configuration that is valid on its own, but cannot be realized on this host
struct PlanError {
    std::vector<std::string> problems;

    [[nodiscard]] std::string description() const;
};

// Translates @p config into ordered actions. Only inspects the host (stat(),
// getrlimit(), environment variables), nothing is created or modified.
Result<EnvironmentPlan, PlanError> build_plan(const ConfigModel& config);

} // namespace jailer
