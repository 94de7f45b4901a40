#include <chrono>
#include <climits>
#include <fstream>
#include <jailer/concat_tostr.hh>
#include <jailer/config_model.hh>
#include <jailer/logger.hh>
#include <jailer/string_transform.hh>
#include <seccomp.h>
#include <string_view>
#include <sys/capability.h>
#include <sys/resource.h>
#include <unistd.h>

using std::optional;
using std::string;
using std::string_view;
using std::vector;

namespace {

// Absolute and without ".." components, so it cannot escape the sandbox root
bool is_confined_absolute_path(string_view path) noexcept {
    if (path.empty() or path.front() != '/') {
        return false;
    }
    size_t beg = 0;
    while (beg < path.size()) {
        size_t end = path.find('/', beg);
        if (end == string_view::npos) {
            end = path.size();
        }
        if (path.substr(beg, end - beg) == "..") {
            return false;
        }
        beg = end + 1;
    }
    return true;
}

bool is_root_path(string_view path) noexcept {
    return path.find_first_not_of('/') == string_view::npos;
}

optional<uint64_t> read_nr_open() {
    std::ifstream file("/proc/sys/fs/nr_open");
    uint64_t val = 0;
    if (file >> val) {
        return val;
    }
    return std::nullopt;
}

struct ViolationCollector {
    vector<jailer::ConfigError::Violation> violations;

    template <class... Args>
    void add(string field, Args&&... msg) {
        violations.push_back({
            .field = std::move(field),
            .message = concat_tostr(std::forward<Args>(msg)...),
        });
    }
};

void validate_filesystem(
    const jailer::ConfigModel::Options& opts, ViolationCollector& vc
) {
    using jailer::MountSpec;
    const auto& fs = opts.filesystem;
    bool mount_ns = opts.namespaces.mount;

    if (fs.root.source) {
        if (!mount_ns) {
            vc.add("filesystem.root", "custom root requires the mount namespace");
        }
        if (fs.root.source->empty() or fs.root.source->front() != '/') {
            vc.add("filesystem.root", "root source has to be an absolute path");
        }
    }

    for (size_t i = 0; i < fs.mounts.size(); ++i) {
        const auto& m = fs.mounts[i];
        auto field = concat_tostr("filesystem.mounts[", i, ']');
        if (!mount_ns) {
            vc.add(field, "mount of ", m.dest, " requires the mount namespace");
        }
        if (!is_confined_absolute_path(m.dest)) {
            vc.add(field, "destination has to be an absolute path without \"..\": ", m.dest);
        } else if (is_root_path(m.dest)) {
            vc.add(field, "destination cannot be the sandbox root");
        }
        switch (m.kind) {
        case MountSpec::Kind::BIND:
            if (m.source.empty() or m.source.front() != '/') {
                vc.add(field, "bind mount source has to be an absolute path: ", m.source);
            }
            break;
        case MountSpec::Kind::TMPFS:
            if (!m.source.empty()) {
                vc.add(field, "tmpfs mount cannot have a source");
            }
            break;
        case MountSpec::Kind::OTHER:
            if (m.fs_type.empty()) {
                vc.add(field, "filesystem type is required");
            }
            break;
        }
    }

    for (size_t i = 0; i < fs.symlinks.size(); ++i) {
        const auto& link = fs.symlinks[i];
        auto field = concat_tostr("filesystem.symlinks[", i, ']');
        if (!mount_ns) {
            vc.add(field, "symlink ", link.dest, " requires the mount namespace");
        }
        if (link.source.empty()) {
            vc.add(field, "symlink target cannot be empty");
        }
        if (!is_confined_absolute_path(link.dest) or is_root_path(link.dest)) {
            vc.add(field, "link path has to be an absolute path without \"..\": ", link.dest);
        }
    }

    if (fs.proc.enabled) {
        bool customized = fs.proc.path != jailer::Filesystem::Proc{}.path or !fs.proc.read_only;
        if (!mount_ns and customized) {
            vc.add("filesystem.proc", "custom proc mount requires the mount namespace");
        }
        if (!is_confined_absolute_path(fs.proc.path) or is_root_path(fs.proc.path)) {
            vc.add(
                "filesystem.proc", "path has to be an absolute path without \"..\": ", fs.proc.path
            );
        }
    }
}

void validate_limits(const jailer::ConfigModel::Options& opts, ViolationCollector& vc) {
    auto check = [&](const char* name, const optional<jailer::LimitValue>& limit) {
        if (!limit) {
            return;
        }
        if (const auto* val = std::get_if<uint64_t>(&*limit); val and *val >= RLIM_INFINITY) {
            vc.add(
                concat_tostr("limits.", name),
                "value ",
                *val,
                " is out of range (use LimitPolicy::UNBOUNDED for no limit)"
            );
        }
    };
    const auto& l = opts.limits;
    check("cpu_time", l.cpu_time);
    check("memory", l.memory);
    check("file_size", l.file_size);
    check("process_count", l.process_count);
    check("open_files", l.open_files);
    check("core_size", l.core_size);
    check("stack_size", l.stack_size);
    check("locked_memory", l.locked_memory);
    check("realtime_priority", l.realtime_priority);
    check("message_queue", l.message_queue);

    if (l.open_files) {
        const auto* val = std::get_if<uint64_t>(&*l.open_files);
        auto nr_open = read_nr_open();
        if (val and nr_open and *val > *nr_open) {
            vc.add("limits.open_files", "value ", *val, " exceeds fs.nr_open = ", *nr_open);
        }
        const auto* policy = std::get_if<jailer::LimitPolicy>(&*l.open_files);
        if (policy and *policy == jailer::LimitPolicy::UNBOUNDED) {
            // RLIMIT_NOFILE cannot be set to RLIM_INFINITY
            vc.add("limits.open_files", "cannot be unbounded");
        }
    }

    const auto& timing = opts.timing;
    constexpr auto max_duration = jailer::Timing::max_duration;
    auto check_upper_bound = [&](const char* field, std::chrono::nanoseconds val) {
        if (val > max_duration) {
            vc.add(field, "cannot exceed ", max_duration.count(), " s");
        }
    };
    if (timing.wall_time_limit) {
        if (timing.wall_time_limit->count() <= 0) {
            vc.add("timing.wall_time_limit", "has to be positive");
        }
        check_upper_bound("timing.wall_time_limit", *timing.wall_time_limit);
    }
    if (timing.grace_period.count() < 0) {
        vc.add("timing.grace_period", "cannot be negative");
    }
    check_upper_bound("timing.grace_period", timing.grace_period);
    if (timing.preparation_timeout.count() <= 0) {
        vc.add("timing.preparation_timeout", "has to be positive");
    }
    check_upper_bound("timing.preparation_timeout", timing.preparation_timeout);

    const auto& cg = opts.cgroup;
    if (cg.parent) {
        if (cg.parent->empty() or cg.parent->front() != '/') {
            vc.add("cgroup.parent", "has to be an absolute path");
        }
    } else if (cg.has_limits()) {
        vc.add("cgroup.parent", "cgroup limits require a delegated parent cgroup");
    }
    if (cg.cpu_ms_per_sec and (*cg.cpu_ms_per_sec == 0 or *cg.cpu_ms_per_sec > 1'000'000)) {
        vc.add("cgroup.cpu_ms_per_sec", "has to lie in range [1, 1000000]");
    }
    if (cg.pids_max and *cg.pids_max == 0) {
        vc.add("cgroup.pids_max", "has to be positive");
    }
}

void validate_process(const jailer::ConfigModel::Options& opts, ViolationCollector& vc) {
    if (!is_confined_absolute_path(opts.working_dir)) {
        vc.add("working_dir", "has to be an absolute path without \"..\": ", opts.working_dir);
    }

    if (opts.hostname.empty() or opts.hostname.size() > HOST_NAME_MAX) {
        vc.add("hostname", "length has to lie in range [1, ", HOST_NAME_MAX, ']');
    }
    if (!opts.namespaces.uts and opts.hostname != jailer::ConfigModel::Options{}.hostname) {
        vc.add("hostname", "setting the hostname requires the UTS namespace");
    }

    const auto& env = opts.environment;
    if (env.inherit_all and !env.allow.empty()) {
        vc.add("environment.allow", "explicit allow list conflicts with inherit_all");
    }
    auto check_env_name = [&](const char* field, const string& name) {
        if (name.empty() or name.find('=') != string::npos) {
            vc.add(field, "invalid variable name: \"", name, '"');
        }
    };
    for (const auto& name : env.allow) {
        check_env_name("environment.allow", name);
    }
    for (const auto& [name, value] : env.overrides) {
        check_env_name("environment.overrides", name);
    }

    const auto& caps = opts.capabilities;
    if (caps.keep_all and !caps.retain.empty()) {
        vc.add("capabilities", "keep_all conflicts with an explicit list of capabilities");
    }
    for (const auto& name : caps.retain) {
        cap_value_t cap;
        if (cap_from_name(name.c_str(), &cap) != 0) {
            vc.add("capabilities.retain", "unknown capability: ", name);
        }
    }

    const auto& sec = opts.security;
    if (sec.nice_level and (*sec.nice_level < -20 or *sec.nice_level > 19)) {
        vc.add("security.nice_level", "has to lie in range [-20, 19]");
    }
    if (sec.max_cpus and *sec.max_cpus == 0) {
        vc.add("security.max_cpus", "has to be positive");
    }
    if (sec.seccomp) {
        for (const auto& name : sec.seccomp->syscalls) {
            if (seccomp_syscall_resolve_name(name.c_str()) == __NR_SCMP_ERROR) {
                vc.add("security.seccomp", "unknown syscall: ", name);
            }
        }
        if (sec.seccomp->errno_value and
            (*sec.seccomp->errno_value <= 0 or *sec.seccomp->errno_value > 4095))
        {
            vc.add("security.seccomp", "errno value has to lie in range [1, 4095]");
        }
    }
}

} // namespace

namespace jailer {

string ConfigError::description() const {
    string res;
    for (const auto& v : violations) {
        back_insert(res, v.field, ": ", v.message, '\n');
    }
    return res;
}

bool ConfigError::mentions(string_view field) const noexcept {
    for (const auto& v : violations) {
        if (v.field == field or
            (v.field.size() > field.size() and v.field.starts_with(field) and
             (v.field[field.size()] == '.' or v.field[field.size()] == '[')))
        {
            return true;
        }
    }
    return false;
}

vector<ConfigError::Violation> ConfigModel::validate(const Options& opts) {
    ViolationCollector vc;
    validate_filesystem(opts, vc);
    validate_limits(opts, vc);
    validate_process(opts, vc);
    return std::move(vc.violations);
}

Result<ConfigModel, ConfigError> ConfigModel::create(Options opts) {
    auto violations = validate(opts);
    if (!violations.empty()) {
        return Err{ConfigError{.violations = std::move(violations)}};
    }

    if (!opts.namespaces.user and !opts.capabilities.retain.empty()) {
        errlog(
            "warning: capabilities are retained without the user namespace, they stay effective "
            "against the host"
        );
    }
    const auto& l = opts.limits;
    if (l.disabled and
        (l.cpu_time or l.memory or l.file_size or l.process_count or l.open_files or
         l.core_size or l.stack_size or l.locked_memory or l.realtime_priority or
         l.message_queue))
    {
        errlog("warning: resource limits are disabled, the configured ones are ignored");
    }
    return Ok{ConfigModel{std::move(opts)}};
}

} // namespace jailer
