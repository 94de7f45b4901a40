#include <algorithm>
#include <chrono>
#include <jailer/concat_tostr.hh>
#include <jailer/config_loader.hh>
#include <jailer/string_transform.hh>
#include <string_view>

using std::optional;
using std::string;
using std::string_view;
using std::vector;

namespace jailer {

namespace {

// Splits on ':' into at most @p max_parts parts, the last part keeps the remaining colons
vector<string> split_colon(string_view str, size_t max_parts) {
    vector<string> res;
    while (res.size() + 1 < max_parts) {
        auto pos = str.find(':');
        if (pos == string_view::npos) {
            break;
        }
        res.emplace_back(str.substr(0, pos));
        str.remove_prefix(pos + 1);
    }
    res.emplace_back(str);
    return res;
}

class Loader {
    const ConfigFile& cf_;
    vector<ConfigError::Violation> violations_;

public:
    explicit Loader(const ConfigFile& cf) noexcept : cf_(cf) {}

    template <class... Args>
    void add_violation(const char* name, Args&&... msg) {
        violations_.push_back({name, concat_tostr(std::forward<Args>(msg)...)});
    }

    [[nodiscard]] vector<ConfigError::Violation>& violations() noexcept { return violations_; }

    [[nodiscard]] bool is_set(const char* name) const noexcept { return cf_[name].is_set(); }

    // Scalar or array variable as a list
    [[nodiscard]] vector<string> values(const char* name) const {
        const auto& var = cf_[name];
        if (!var.is_set()) {
            return {};
        }
        if (var.is_array()) {
            return var.as_array();
        }
        return {var.as_string()};
    }

    void load_bool(const char* name, bool& dest) const {
        if (is_set(name)) {
            dest = cf_[name].as_bool();
        }
    }

    void load_string(const char* name, string& dest) const {
        if (is_set(name)) {
            dest = cf_[name].as_string();
        }
    }

    template <class T>
    optional<T> load_number(const char* name) {
        if (!is_set(name)) {
            return std::nullopt;
        }
        const auto& var = cf_[name];
        auto res = var.as<T>();
        if (!res || var.is_array()) {
            add_violation(name, "invalid number: ", var.as_string());
            return std::nullopt;
        }
        return res;
    }

    // Values above Timing::max_duration are violations
    template <class Duration>
    optional<Duration> load_duration(const char* name) {
        auto val = load_number<uint64_t>(name);
        if (!val) {
            return std::nullopt;
        }
        constexpr auto max_val = static_cast<uint64_t>(
            std::chrono::duration_cast<Duration>(Timing::max_duration).count()
        );
        if (*val > max_val) {
            add_violation(name, "cannot exceed ", max_val);
            return std::nullopt;
        }
        return Duration{*val};
    }

    optional<LimitValue> load_limit(const char* name) {
        if (!is_set(name)) {
            return std::nullopt;
        }
        const auto& str = cf_[name].as_string();
        if (str == "max") {
            return LimitPolicy::CURRENT_MAX;
        }
        if (str == "soft") {
            return LimitPolicy::CURRENT_SOFT;
        }
        if (str == "inf") {
            return LimitPolicy::UNBOUNDED;
        }
        if (auto val = str2num<uint64_t>(str)) {
            return *val;
        }
        add_violation(name, "expected a number, \"max\", \"soft\" or \"inf\", got: ", str);
        return std::nullopt;
    }
};

void load_namespaces(Loader& ld, Namespaces& ns) {
    ld.load_bool("clone_newnet", ns.net);
    ld.load_bool("clone_newuser", ns.user);
    ld.load_bool("clone_newns", ns.mount);
    ld.load_bool("clone_newpid", ns.pid);
    ld.load_bool("clone_newipc", ns.ipc);
    ld.load_bool("clone_newuts", ns.uts);
    ld.load_bool("clone_newcgroup", ns.cgroup);
    ld.load_bool("clone_newtime", ns.time);
}

void load_filesystem(Loader& ld, Filesystem& fs) {
    if (ld.is_set("chroot")) {
        string root;
        ld.load_string("chroot", root);
        fs.root.source = std::move(root);
    }
    bool rw = false;
    ld.load_bool("rw", rw);
    fs.root.read_only = !rw;

    auto load_binds = [&](const char* name, bool read_only) {
        for (const auto& val : ld.values(name)) {
            auto parts = split_colon(val, 2);
            fs.mounts.push_back({
                .kind = MountSpec::Kind::BIND,
                .source = parts[0],
                .dest = parts.size() > 1 ? parts[1] : parts[0],
                .fs_type = {},
                .options = {},
                .read_only = read_only,
            });
        }
    };
    load_binds("bindmount_ro", true);
    load_binds("bindmount", false);

    for (const auto& val : ld.values("tmpfsmount")) {
        auto parts = split_colon(val, 2);
        fs.mounts.push_back({
            .kind = MountSpec::Kind::TMPFS,
            .source = {},
            .dest = parts[0],
            .fs_type = {},
            .options = parts.size() > 1 ? parts[1] : string{},
            .read_only = false,
        });
    }
    for (const auto& val : ld.values("mount")) {
        auto parts = split_colon(val, 4);
        if (parts.size() < 3) {
            ld.add_violation("mount", "expected src:dst:fstype[:options], got: ", val);
            continue;
        }
        fs.mounts.push_back({
            .kind = MountSpec::Kind::OTHER,
            .source = parts[0],
            .dest = parts[1],
            .fs_type = parts[2],
            .options = parts.size() > 3 ? parts[3] : string{},
            .read_only = false,
        });
    }
    for (const auto& val : ld.values("symlink")) {
        auto parts = split_colon(val, 2);
        if (parts.size() != 2) {
            ld.add_violation("symlink", "expected src:dst, got: ", val);
            continue;
        }
        fs.symlinks.push_back({.source = parts[0], .dest = parts[1]});
    }

    bool disable_proc = false;
    ld.load_bool("disable_proc", disable_proc);
    fs.proc.enabled = !disable_proc;
    ld.load_string("proc_path", fs.proc.path);
    bool proc_rw = false;
    ld.load_bool("proc_rw", proc_rw);
    fs.proc.read_only = !proc_rw;
}

void load_limits(Loader& ld, ConfigModel::Options& opts) {
    auto& limits = opts.limits;
    limits.cpu_time = ld.load_limit("rlimit_cpu");
    limits.memory = ld.load_limit("rlimit_as");
    limits.file_size = ld.load_limit("rlimit_fsize");
    limits.process_count = ld.load_limit("rlimit_nproc");
    limits.open_files = ld.load_limit("rlimit_nofile");
    limits.core_size = ld.load_limit("rlimit_core");
    limits.stack_size = ld.load_limit("rlimit_stack");
    limits.locked_memory = ld.load_limit("rlimit_memlock");
    limits.realtime_priority = ld.load_limit("rlimit_rtprio");
    limits.message_queue = ld.load_limit("rlimit_msgqueue");
    ld.load_bool("disable_rlimits", limits.disabled);

    // 0 means no limit
    if (auto secs = ld.load_duration<std::chrono::seconds>("time_limit"); secs && secs->count()) {
        opts.timing.wall_time_limit = *secs;
    }
    if (auto ms = ld.load_duration<std::chrono::milliseconds>("grace_period_ms")) {
        opts.timing.grace_period = *ms;
    }
    if (auto ms = ld.load_duration<std::chrono::milliseconds>("preparation_timeout_ms")) {
        opts.timing.preparation_timeout = *ms;
    }

    if (ld.is_set("cgroup_parent")) {
        string parent;
        ld.load_string("cgroup_parent", parent);
        opts.cgroup.parent = std::move(parent);
    }
    opts.cgroup.memory_max = ld.load_number<uint64_t>("cgroup_mem_max");
    opts.cgroup.memory_swap_max = ld.load_number<uint64_t>("cgroup_mem_swap_max");
    opts.cgroup.pids_max = ld.load_number<uint64_t>("cgroup_pids_max");
    opts.cgroup.cpu_ms_per_sec = ld.load_number<uint32_t>("cgroup_cpu_ms_per_sec");
}

void load_process(Loader& ld, ConfigModel::Options& opts) {
    opts.identity.uid = ld.load_number<uid_t>("user");
    opts.identity.gid = ld.load_number<gid_t>("group");
    ld.load_string("cwd", opts.working_dir);
    ld.load_string("hostname", opts.hostname);

    ld.load_bool("keep_env", opts.environment.inherit_all);
    for (const auto& val : ld.values("env")) {
        auto pos = val.find('=');
        if (pos == string::npos) {
            opts.environment.allow.emplace_back(val);
        } else {
            opts.environment.overrides.emplace_back(val.substr(0, pos), val.substr(pos + 1));
        }
    }

    ld.load_bool("keep_caps", opts.capabilities.keep_all);
    opts.capabilities.retain = ld.values("cap");

    bool disable_no_new_privs = false;
    ld.load_bool("disable_no_new_privs", disable_no_new_privs);
    opts.security.no_new_privs = !disable_no_new_privs;
    bool skip_setsid = false;
    ld.load_bool("skip_setsid", skip_setsid);
    opts.security.new_session = !skip_setsid;
    opts.security.nice_level = ld.load_number<int>("nice_level");
    // 0 means no limit
    if (auto cpus = ld.load_number<uint32_t>("max_cpus"); cpus && *cpus > 0) {
        opts.security.max_cpus = *cpus;
    }
    ld.load_bool("disable_tsc", opts.security.disable_tsc);

    if (ld.is_set("seccomp_mode") || ld.is_set("seccomp_syscalls")) {
        SeccompPolicy policy;
        auto mode = ld.values("seccomp_mode");
        if (mode.empty() || mode.front() == "deny") {
            policy.mode = SeccompPolicy::Mode::DENY_LISTED;
        } else if (mode.front() == "allow") {
            policy.mode = SeccompPolicy::Mode::ALLOW_LISTED;
        } else {
            ld.add_violation("seccomp_mode", "expected \"deny\" or \"allow\", got: ", mode.front());
        }
        policy.syscalls = ld.values("seccomp_syscalls");
        policy.errno_value = ld.load_number<int>("seccomp_errno");
        ld.load_bool("seccomp_log", policy.log);
        opts.security.seccomp = std::move(policy);
    }

    bool iface_no_lo = false;
    ld.load_bool("iface_no_lo", iface_no_lo);
    opts.network.loopback = !iface_no_lo;
}

} // namespace

const vector<const char*>& config_variable_names() {
    static const vector<const char*> names = {
        "clone_newnet",
        "clone_newuser",
        "clone_newns",
        "clone_newpid",
        "clone_newipc",
        "clone_newuts",
        "clone_newcgroup",
        "clone_newtime",
        "chroot",
        "rw",
        "bindmount_ro",
        "bindmount",
        "tmpfsmount",
        "mount",
        "symlink",
        "disable_proc",
        "proc_path",
        "proc_rw",
        "time_limit",
        "grace_period_ms",
        "preparation_timeout_ms",
        "rlimit_cpu",
        "rlimit_as",
        "rlimit_fsize",
        "rlimit_nproc",
        "rlimit_nofile",
        "rlimit_core",
        "rlimit_stack",
        "rlimit_memlock",
        "rlimit_rtprio",
        "rlimit_msgqueue",
        "disable_rlimits",
        "cgroup_parent",
        "cgroup_mem_max",
        "cgroup_mem_swap_max",
        "cgroup_pids_max",
        "cgroup_cpu_ms_per_sec",
        "user",
        "group",
        "cwd",
        "hostname",
        "keep_env",
        "env",
        "keep_caps",
        "cap",
        "disable_no_new_privs",
        "skip_setsid",
        "nice_level",
        "max_cpus",
        "disable_tsc",
        "seccomp_mode",
        "seccomp_syscalls",
        "seccomp_errno",
        "seccomp_log",
        "iface_no_lo",
    };
    return names;
}

Result<ConfigModel, ConfigError> load_config_model(const ConfigFile& cf) {
    Loader ld{cf};
    ConfigModel::Options opts;
    load_namespaces(ld, opts.namespaces);
    load_filesystem(ld, opts.filesystem);
    load_limits(ld, opts);
    load_process(ld, opts);

    if (!ld.violations().empty()) {
        auto violations = std::move(ld.violations());
        for (auto& v : ConfigModel::validate(opts)) {
            violations.emplace_back(std::move(v));
        }
        return Err{ConfigError{.violations = std::move(violations)}};
    }
    return ConfigModel::create(std::move(opts));
}

Result<ConfigModel, ConfigError> load_config_model_from_file(const char* path) {
    ConfigFile cf;
    for (const auto* name : config_variable_names()) {
        cf.add_vars(name);
    }
    cf.load_config_from_file(path);
    return load_config_model(cf);
}

} // namespace jailer
