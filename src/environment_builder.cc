#include <algorithm>
#include <cstring>
#include <jailer/concat_tostr.hh>
#include <jailer/environment_builder.hh>
#include <jailer/errmsg.hh>
#include <jailer/overloaded.hh>
#include <sched.h>
#include <set>
#include <sys/stat.h>
#include <unistd.h>

extern char** environ; // NOLINT(readability-redundant-declaration)

using std::optional;
using std::string;
using std::vector;

namespace jailer {

namespace {

uint64_t clone_flags_of(const Namespaces& ns) noexcept {
    uint64_t flags = 0;
    flags |= ns.net ? CLONE_NEWNET : 0;
    flags |= ns.user ? CLONE_NEWUSER : 0;
    flags |= ns.mount ? CLONE_NEWNS : 0;
    flags |= ns.pid ? CLONE_NEWPID : 0;
    flags |= ns.ipc ? CLONE_NEWIPC : 0;
    flags |= ns.uts ? CLONE_NEWUTS : 0;
    flags |= ns.cgroup ? CLONE_NEWCGROUP : 0;
    flags |= ns.time ? CLONE_NEWTIME : 0;
    return flags;
}

struct LimitResolver {
    vector<string>& problems;
    bool privileged = geteuid() == 0;

    optional<plan::ResourceLimit>
    resolve(const char* name, int resource, const optional<LimitValue>& value) {
        if (!value) {
            return std::nullopt;
        }
        struct rlimit current = {};
        if (getrlimit(resource, &current)) {
            problems.emplace_back(concat_tostr("cannot read the current limit ", name));
            return std::nullopt;
        }
        rlim_t limit = std::visit(
            overloaded{
                [](uint64_t val) -> rlim_t { return val; },
                [&](LimitPolicy policy) -> rlim_t {
                    switch (policy) {
                    case LimitPolicy::CURRENT_MAX: return current.rlim_max;
                    case LimitPolicy::CURRENT_SOFT: return current.rlim_cur;
                    case LimitPolicy::UNBOUNDED: return RLIM_INFINITY;
                    }
                    __builtin_unreachable();
                },
            },
            *value
        );
        if (!privileged and limit > current.rlim_max) {
            problems.emplace_back(concat_tostr(
                "limit ",
                name,
                " exceeds the current hard limit and raising it requires privileges"
            ));
            return std::nullopt;
        }
        return plan::ResourceLimit{.resource = resource, .soft = limit, .hard = limit};
    }
};

plan::ApplyResourceLimits resolve_limits(const ResourceLimits& limits, vector<string>& problems) {
    LimitResolver resolver{.problems = problems};
    plan::ApplyResourceLimits res;
    auto add = [&](const char* name, int resource, const optional<LimitValue>& value) {
        if (auto limit = resolver.resolve(name, resource, value)) {
            res.limits.emplace_back(*limit);
        }
    };

    add("cpu_time", RLIMIT_CPU, limits.cpu_time);
    if (!res.limits.empty() and res.limits.back().soft != RLIM_INFINITY) {
        // SIGXCPU is sent at the soft limit and SIGKILL at the hard one, the
        // extra second makes breaching the limit distinguishable from kill()
        auto& cpu = res.limits.back();
        struct rlimit current = {};
        if (getrlimit(RLIMIT_CPU, &current) == 0 and
            (resolver.privileged or cpu.soft < current.rlim_max))
        {
            cpu.hard = cpu.soft + 1;
        }
    }
    add("memory", RLIMIT_AS, limits.memory);
    add("file_size", RLIMIT_FSIZE, limits.file_size);
    add("process_count", RLIMIT_NPROC, limits.process_count);
    add("open_files", RLIMIT_NOFILE, limits.open_files);
    add("core_size", RLIMIT_CORE, limits.core_size);
    add("stack_size", RLIMIT_STACK, limits.stack_size);
    add("locked_memory", RLIMIT_MEMLOCK, limits.locked_memory);
    add("realtime_priority", RLIMIT_RTPRIO, limits.realtime_priority);
    add("message_queue", RLIMIT_MSGQUEUE, limits.message_queue);
    return res;
}

vector<string> render_environment(const EnvironmentPolicy& policy) {
    vector<string> vars;
    auto set_var = [&vars](std::string_view name, std::string_view value) {
        auto it = std::find_if(vars.begin(), vars.end(), [&](const string& var) {
            return var.size() > name.size() and var.starts_with(name) and
                var[name.size()] == '=';
        });
        auto rendered = concat_tostr(name, '=', value);
        if (it == vars.end()) {
            vars.emplace_back(std::move(rendered));
        } else {
            *it = std::move(rendered);
        }
    };

    if (policy.inherit_all) {
        for (char** env = environ; env and *env; ++env) {
            vars.emplace_back(*env);
        }
    } else {
        for (const auto& name : policy.allow) {
            if (const char* value = getenv(name.c_str())) {
                set_var(name, value);
            }
        }
    }
    for (const auto& [name, value] : policy.overrides) {
        set_var(name, value);
    }
    return vars;
}

bool path_exists(const string& path, bool must_be_dir = false) noexcept {
    struct stat st = {};
    if (stat(path.c_str(), &st)) {
        return false;
    }
    return !must_be_dir or S_ISDIR(st.st_mode);
}

// The first @p max_cpus CPUs the caller may run on
vector<int> pick_cpus(uint32_t max_cpus, vector<string>& problems) {
    cpu_set_t allowed;
    CPU_ZERO(&allowed);
    if (sched_getaffinity(0, sizeof(allowed), &allowed)) {
        problems.emplace_back(concat_tostr("sched_getaffinity()", errmsg()));
        return {};
    }
    vector<int> cpus;
    for (int cpu = 0; cpu < CPU_SETSIZE and cpus.size() < max_cpus; ++cpu) {
        if (CPU_ISSET(cpu, &allowed)) {
            cpus.emplace_back(cpu);
        }
    }
    return cpus;
}

} // namespace

string PlanError::description() const {
    string res;
    for (const auto& problem : problems) {
        back_insert(res, problem, '\n');
    }
    return res;
}

Result<EnvironmentPlan, PlanError> build_plan(const ConfigModel& config) {
    vector<string> problems;
    EnvironmentPlan res{
        .timing = config.timing(),
        .cgroup = config.cgroup(),
    };
    auto add = [&res](PlanAction action) { res.actions.emplace_back(std::move(action)); };
    const auto& ns = config.namespaces();
    const auto& fs = config.filesystem();

    // Namespaces
    add(plan::CreateNamespaces{.clone_flags = clone_flags_of(ns)});
    if (ns.uts) {
        add(plan::SetHostname{.hostname = config.hostname()});
    }
    if (ns.net and config.network().loopback) {
        add(plan::BringUpLoopback{});
    }

    // Root and mounts
    if (ns.mount) {
        bool host_root = fs.root.source.has_value();
        if (host_root and !path_exists(*fs.root.source, true)) {
            problems.emplace_back(
                concat_tostr("root source is not an existing directory: ", *fs.root.source)
            );
            host_root = false;
        }
        add(plan::EstablishRoot{.source = fs.root.source, .read_only = fs.root.read_only});
        // Nothing is created inside a host root directory, mount points have to exist there
        auto check_mount_point = [&](const string& dest, bool must_be_dir) {
            if (host_root and !path_exists(concat_tostr(*fs.root.source, dest), must_be_dir)) {
                problems.emplace_back(
                    concat_tostr("mount point does not exist in the root source: ", dest)
                );
            }
        };

        std::set<string> read_only_dests;
        for (const auto& m : fs.mounts) {
            if (m.kind == MountSpec::Kind::BIND and m.read_only) {
                read_only_dests.emplace(m.dest);
            }
        }

        auto add_mounts = [&](auto&& predicate, auto&& make_action) {
            for (const auto& m : fs.mounts) {
                if (predicate(m)) {
                    if (!m.read_only and read_only_dests.contains(m.dest)) {
                        problems.emplace_back(concat_tostr(
                            "writable mount would shadow the read-only bind mount at ", m.dest
                        ));
                    }
                    bool dir_dest = m.kind != MountSpec::Kind::BIND or path_exists(m.source, true);
                    check_mount_point(m.dest, dir_dest);
                    add(make_action(m));
                }
            }
        };
        using Kind = MountSpec::Kind;
        auto make_bind = [&](const MountSpec& m) {
            if (!path_exists(m.source)) {
                problems.emplace_back(concat_tostr("bind mount source does not exist: ", m.source)
                );
            }
            return plan::BindMount{.source = m.source, .dest = m.dest, .read_only = m.read_only};
        };
        add_mounts(
            [](const MountSpec& m) { return m.kind == Kind::BIND and m.read_only; }, make_bind
        );
        add_mounts(
            [](const MountSpec& m) { return m.kind == Kind::BIND and !m.read_only; }, make_bind
        );
        add_mounts(
            [](const MountSpec& m) { return m.kind == Kind::TMPFS; },
            [](const MountSpec& m) {
                return plan::MountTmpfs{
                    .dest = m.dest, .options = m.options, .read_only = m.read_only};
            }
        );
        add_mounts(
            [](const MountSpec& m) { return m.kind == Kind::OTHER; },
            [](const MountSpec& m) {
                return plan::MountFilesystem{
                    .source = m.source,
                    .dest = m.dest,
                    .fs_type = m.fs_type,
                    .options = m.options,
                    .read_only = m.read_only,
                };
            }
        );
        for (const auto& link : fs.symlinks) {
            if (host_root) {
                problems.emplace_back(concat_tostr(
                    "symlink cannot be created inside the root source: ", link.dest
                ));
            }
            add(plan::CreateSymlink{.target = link.source, .link_path = link.dest});
        }

        if (fs.proc.enabled) {
            if (ns.user and !ns.pid) {
                problems.emplace_back(
                    "mounting proc inside a user namespace requires the PID namespace"
                );
            }
            check_mount_point(fs.proc.path, true);
            add(plan::MountProc{.path = fs.proc.path, .read_only = fs.proc.read_only});
        }
    }

    // Privileges
    if (!config.limits().disabled) {
        if (auto limits = resolve_limits(config.limits(), problems); !limits.limits.empty()) {
            add(std::move(limits));
        }
    }
    const auto& security = config.security();
    if (security.nice_level) {
        add(plan::SetNiceLevel{.nice_level = *security.nice_level});
    }
    if (security.new_session) {
        add(plan::EnterNewSession{});
    }
    if (security.max_cpus) {
        if (auto cpus = pick_cpus(*security.max_cpus, problems); !cpus.empty()) {
            add(plan::SetCpuAffinity{.cpus = std::move(cpus)});
        }
    }
    if (security.disable_tsc) {
        add(plan::DisableTsc{});
    }

    uid_t uid = config.identity().uid.value_or(geteuid());
    gid_t gid = config.identity().gid.value_or(getegid());
    if (!ns.user and geteuid() != 0 and (uid != geteuid() or gid != getegid())) {
        problems.emplace_back("changing identity without the user namespace requires root");
    }
    add(plan::SetIdentity{.uid = uid, .gid = gid, .via_user_namespace = ns.user});
    add(plan::SetEnvironment{.vars = render_environment(config.environment())});
    add(plan::ChangeWorkingDirectory{.path = config.working_dir()});
    add(plan::DropCapabilities{
        .retained = config.capabilities().retain,
        .keep_all = config.capabilities().keep_all,
        .no_new_privs = security.no_new_privs,
    });
    if (security.seccomp) {
        add(plan::InstallSeccompFilter{.policy = *security.seccomp});
    }

    if (!problems.empty()) {
        return Err{PlanError{.problems = std::move(problems)}};
    }
    return Ok{std::move(res)};
}

PlanStage stage_of(const PlanAction& action) noexcept {
    return std::visit(
        overloaded{
            [](const plan::CreateNamespaces&) { return PlanStage::NAMESPACES; },
            [](const plan::SetHostname&) { return PlanStage::NAMESPACES; },
            [](const plan::BringUpLoopback&) { return PlanStage::NAMESPACES; },
            [](const plan::EstablishRoot&) { return PlanStage::ROOT; },
            [](const plan::BindMount&) { return PlanStage::MOUNTS; },
            [](const plan::MountTmpfs&) { return PlanStage::MOUNTS; },
            [](const plan::MountFilesystem&) { return PlanStage::MOUNTS; },
            [](const plan::CreateSymlink&) { return PlanStage::MOUNTS; },
            [](const plan::MountProc&) { return PlanStage::PROC; },
            [](const auto&) { return PlanStage::PRIVILEGES; },
        },
        action
    );
}

string describe(const PlanAction& action) {
    auto ro = [](bool read_only) { return read_only ? " (ro)" : " (rw)"; };
    return std::visit(
        overloaded{
            [](const plan::CreateNamespaces& a) {
                return concat_tostr("create_namespaces flags=", a.clone_flags);
            },
            [](const plan::SetHostname& a) { return concat_tostr("set_hostname ", a.hostname); },
            [](const plan::BringUpLoopback&) { return string{"bring_up_loopback"}; },
            [&](const plan::EstablishRoot& a) {
                return concat_tostr(
                    "establish_root ", a.source ? *a.source : string{"tmpfs"}, ro(a.read_only)
                );
            },
            [&](const plan::BindMount& a) {
                return concat_tostr("bind_mount ", a.source, " -> ", a.dest, ro(a.read_only));
            },
            [&](const plan::MountTmpfs& a) {
                return concat_tostr("mount_tmpfs ", a.dest, ro(a.read_only));
            },
            [&](const plan::MountFilesystem& a) {
                return concat_tostr(
                    "mount ", a.fs_type, ' ', a.source, " -> ", a.dest, ro(a.read_only)
                );
            },
            [](const plan::CreateSymlink& a) {
                return concat_tostr("create_symlink ", a.link_path, " -> ", a.target);
            },
            [&](const plan::MountProc& a) {
                return concat_tostr("mount_proc ", a.path, ro(a.read_only));
            },
            [](const plan::ApplyResourceLimits& a) {
                return concat_tostr("apply_resource_limits count=", a.limits.size());
            },
            [](const plan::SetNiceLevel& a) {
                return concat_tostr("set_nice_level ", a.nice_level);
            },
            [](const plan::EnterNewSession&) { return string{"enter_new_session"}; },
            [](const plan::SetCpuAffinity& a) {
                string res = "set_cpu_affinity";
                for (int cpu : a.cpus) {
                    back_insert(res, ' ', cpu);
                }
                return res;
            },
            [](const plan::DisableTsc&) { return string{"disable_tsc"}; },
            [](const plan::SetIdentity& a) {
                return concat_tostr(
                    "set_identity uid=",
                    a.uid,
                    " gid=",
                    a.gid,
                    a.via_user_namespace ? " (user namespace)" : ""
                );
            },
            [](const plan::SetEnvironment& a) {
                return concat_tostr("set_environment count=", a.vars.size());
            },
            [](const plan::ChangeWorkingDirectory& a) {
                return concat_tostr("change_working_directory ", a.path);
            },
            [](const plan::DropCapabilities& a) {
                return concat_tostr(
                    "drop_capabilities retained=",
                    a.keep_all ? string{"all"}
                               : string{std::string_view{::to_string(a.retained.size())}},
                    a.no_new_privs ? " no_new_privs" : ""
                );
            },
            [](const plan::InstallSeccompFilter& a) {
                return concat_tostr("install_seccomp_filter syscalls=", a.policy.syscalls.size());
            },
        },
        action
    );
}

} // namespace jailer
