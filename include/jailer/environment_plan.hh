#pragma once

#include <chrono>
#include <cstdint>
#include <jailer/config_model.hh>
#include <optional>
#include <string>
#include <sys/resource.h>
#include <sys/types.h>
#include <variant>
#include <vector>

namespace jailer {

// Actions are executed stage by stage, in the order of this enum
enum class PlanStage {
    NAMESPACES,
    ROOT,
    MOUNTS,
    PROC,
    PRIVILEGES,
};

namespace plan {

struct CreateNamespaces {
    uint64_t clone_flags; // CLONE_NEW* flags
};

struct SetHostname {
    std::string hostname;
};

struct BringUpLoopback {};

struct EstablishRoot {
    std::optional<std::string> source; // tmpfs if not set
    // Applied after all mounts, so that mount points can be created
    bool read_only;
};

struct BindMount {
    std::string source;
    std::string dest;
    bool read_only;
};

struct MountTmpfs {
    std::string dest;
    std::string options;
    bool read_only;
};

struct MountFilesystem {
    std::string source;
    std::string dest;
    std::string fs_type;
    std::string options;
    bool read_only;
};

struct CreateSymlink {
    std::string target;
    std::string link_path;
};

struct MountProc {
    std::string path;
    bool read_only;
};

struct ResourceLimit {
    int resource; // RLIMIT_*
    rlim_t soft;
    rlim_t hard;
};

struct ApplyResourceLimits {
    std::vector<ResourceLimit> limits;
};

struct SetNiceLevel {
    int nice_level;
};

struct EnterNewSession {};

struct SetCpuAffinity {
    std::vector<int> cpus; // subset of the caller's affinity mask
};

struct DisableTsc {};

struct SetIdentity {
    uid_t uid;
    gid_t gid;
    // Ids are provided by a nested user namespace instead of setresuid() / setresgid()
    bool via_user_namespace;
};

struct SetEnvironment {
    std::vector<std::string> vars; // "NAME=value"
};

struct ChangeWorkingDirectory {
    std::string path;
};

struct DropCapabilities {
    std::vector<std::string> retained;
    bool keep_all;
    bool no_new_privs;
};

struct InstallSeccompFilter {
    SeccompPolicy policy;
};

} // namespace plan

using PlanAction = std::variant<
    plan::CreateNamespaces,
    plan::SetHostname,
    plan::BringUpLoopback,
    plan::EstablishRoot,
    plan::BindMount,
    plan::MountTmpfs,
    plan::MountFilesystem,
    plan::CreateSymlink,
    plan::MountProc,
    plan::ApplyResourceLimits,
    plan::SetNiceLevel,
    plan::EnterNewSession,
    plan::SetCpuAffinity,
    plan::DisableTsc,
    plan::SetIdentity,
    plan::SetEnvironment,
    plan::ChangeWorkingDirectory,
    plan::DropCapabilities,
    plan::InstallSeccompFilter>;

[[nodiscard]] PlanStage stage_of(const PlanAction& action) noexcept;

// Human readable form, e.g. "bind_mount /usr -> /usr (ro)"
[[nodiscard]] std::string describe(const PlanAction& action);

struct EnvironmentPlan {
    std::vector<PlanAction> actions;
    Timing timing;
    Cgroup cgroup;

    template <class T>
    [[nodiscard]] const T* find() const noexcept {
        for (const auto& action : actions) {
            if (const auto* res = std::get_if<T>(&action)) {
                return res;
            }
        }
        return nullptr;
    }

    template <class T>
    [[nodiscard]] std::vector<const T*> find_all() const {
        std::vector<const T*> res;
        for (const auto& action : actions) {
            if (const auto* x = std::get_if<T>(&action)) {
                res.emplace_back(x);
            }
        }
        return res;
    }
};

} // namespace jailer
