#pragma once

#include <chrono>
#include <cstdint>
#include <jailer/result.hh>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <utility>
#include <variant>
#include <vector>

namespace jailer {

struct Namespaces {
    bool net = true;
    bool user = true;
    bool mount = true;
    bool pid = true;
    bool ipc = true;
    bool uts = true;
    bool cgroup = true;
    bool time = false;
};

struct MountSpec {
    enum class Kind {
        BIND,
        TMPFS,
        OTHER,
    };

    Kind kind = Kind::BIND;
    std::string source; // Empty for tmpfs
    std::string dest; // Absolute path inside the sandbox
    std::string fs_type; // Only for Kind::OTHER
    std::string options; // Passed as mount(2) data, e.g. "size=64m"
    bool read_only = true;
};

struct Symlink {
    std::string source; // Target of the link
    std::string dest; // Path of the link inside the sandbox
};

struct Filesystem {
    struct Root {
        // Host directory to use as the root, tmpfs if not set
        std::optional<std::string> source;
        bool read_only = true;
    };

    struct Proc {
        bool enabled = true;
        std::string path = "/proc";
        bool read_only = true;
    };

    Root root;
    std::vector<MountSpec> mounts;
    std::vector<Symlink> symlinks;
    Proc proc;
};

// Symbolic rlimit values, resolved against the caller's limits when the plan is built
enum class LimitPolicy {
    CURRENT_MAX, // Caller's hard limit
    CURRENT_SOFT, // Caller's soft limit
    UNBOUNDED, // RLIM_INFINITY
};

using LimitValue = std::variant<uint64_t, LimitPolicy>;

// Absent value means the limit is inherited unchanged
struct ResourceLimits {
    std::optional<LimitValue> cpu_time; // in seconds
    std::optional<LimitValue> memory; // address space in bytes
    std::optional<LimitValue> file_size; // in bytes
    std::optional<LimitValue> process_count;
    std::optional<LimitValue> open_files;
    std::optional<LimitValue> core_size; // in bytes
    std::optional<LimitValue> stack_size; // in bytes
    std::optional<LimitValue> locked_memory; // in bytes
    std::optional<LimitValue> realtime_priority;
    std::optional<LimitValue> message_queue; // POSIX message queues, in bytes
    // No limit is applied at all, the ones above are ignored
    bool disabled = false;
};

struct Timing {
    // Upper bound of every duration below
    static constexpr std::chrono::seconds max_duration{365 * 24 * 3600};

    std::optional<std::chrono::nanoseconds> wall_time_limit;
    // Time between SIGTERM and SIGKILL during termination
    std::chrono::nanoseconds grace_period = std::chrono::seconds{1};
    // Time from spawning the sandbox to the command's execve()
    std::chrono::nanoseconds preparation_timeout = std::chrono::seconds{10};
};

// Limits applied through a fresh child of the delegated cgroup v2 directory @p parent
struct Cgroup {
    std::optional<std::string> parent;
    std::optional<uint64_t> memory_max; // in bytes
    std::optional<uint64_t> memory_swap_max; // in bytes
    std::optional<uint64_t> pids_max;
    std::optional<uint32_t> cpu_ms_per_sec;

    [[nodiscard]] bool has_limits() const noexcept {
        return memory_max or memory_swap_max or pids_max or cpu_ms_per_sec;
    }
};

// Ids the command runs as, caller's effective ids if not set
struct Identity {
    std::optional<uid_t> uid;
    std::optional<gid_t> gid;
};

struct EnvironmentPolicy {
    bool inherit_all = false;
    // Names of the caller's variables passed through (if not inherit_all)
    std::vector<std::string> allow;
    // Applied in order after allow / inherit_all
    std::vector<std::pair<std::string, std::string>> overrides;
};

struct Capabilities {
    bool keep_all = false;
    std::vector<std::string> retain; // e.g. "cap_net_raw"
};

struct SeccompPolicy {
    enum class Mode {
        DENY_LISTED, // listed syscalls fail, everything else is allowed
        ALLOW_LISTED, // only listed syscalls are allowed
    };

    Mode mode = Mode::DENY_LISTED;
    std::vector<std::string> syscalls;
    // Disallowed syscalls return this errno instead of killing the process
    std::optional<int> errno_value;
    bool log = false;
};

struct Security {
    bool no_new_privs = true;
    bool new_session = true;
    std::optional<int> nice_level;
    // Pins the command to this many of the caller's CPUs
    std::optional<uint32_t> max_cpus;
    // rdtsc / rdtscp raise SIGSEGV (x86 only)
    bool disable_tsc = false;
    std::optional<SeccompPolicy> seccomp;
};

struct Network {
    // Only meaningful with the network namespace
    bool loopback = true;
};

class ConfigError {
public:
    struct Violation {
        std::string field;
        std::string message;

        friend bool operator==(const Violation&, const Violation&) = default;
    };

    std::vector<Violation> violations;

    // One "field: message" line per violation
    [[nodiscard]] std::string description() const;

    [[nodiscard]] bool mentions(std::string_view field) const noexcept;
};

class ConfigModel {
public:
    struct Options {
        Namespaces namespaces;
        Filesystem filesystem;
        ResourceLimits limits;
        Timing timing;
        Cgroup cgroup;
        Identity identity;
        std::string working_dir = "/";
        std::string hostname = "jailer";
        EnvironmentPolicy environment;
        Capabilities capabilities;
        Security security;
        Network network;
    };

private:
    Options opts_;

    explicit ConfigModel(Options opts) noexcept : opts_(std::move(opts)) {}

public:
    // Pure: returns all violations of @p opts, the same on every call
    static std::vector<ConfigError::Violation> validate(const Options& opts);

    // Logs warnings for valid but suspicious settings
    static Result<ConfigModel, ConfigError> create(Options opts);

    [[nodiscard]] const Options& options() const noexcept { return opts_; }

    [[nodiscard]] const Namespaces& namespaces() const noexcept { return opts_.namespaces; }

    [[nodiscard]] const Filesystem& filesystem() const noexcept { return opts_.filesystem; }

    [[nodiscard]] const ResourceLimits& limits() const noexcept { return opts_.limits; }

    [[nodiscard]] const Timing& timing() const noexcept { return opts_.timing; }

    [[nodiscard]] const Cgroup& cgroup() const noexcept { return opts_.cgroup; }

    [[nodiscard]] const Identity& identity() const noexcept { return opts_.identity; }

    [[nodiscard]] const std::string& working_dir() const noexcept { return opts_.working_dir; }

    [[nodiscard]] const std::string& hostname() const noexcept { return opts_.hostname; }

    [[nodiscard]] const EnvironmentPolicy& environment() const noexcept {
        return opts_.environment;
    }

    [[nodiscard]] const Capabilities& capabilities() const noexcept {
        return opts_.capabilities;
    }

    [[nodiscard]] const Security& security() const noexcept { return opts_.security; }

    [[nodiscard]] const Network& network() const noexcept { return opts_.network; }
};

} // namespace jailer
