#include "cgroup/scoped_cgroup.hh"
#include "communication/shared_mem_state.hh"
#include "pid1/pid1.hh"
#include "seccomp/bpf_builder.hh"
#include "tracee/tracee.hh"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <climits>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <fcntl.h>
#include <jailer/concat_tostr.hh>
#include <jailer/errmsg.hh>
#include <jailer/logger.hh>
#include <jailer/macros/throw.hh>
#include <jailer/overloaded.hh>
#include <jailer/pipe.hh>
#include <jailer/process_supervisor.hh>
#include <jailer/syscalls.hh>
#include <memory>
#include <optional>
#include <poll.h>
#include <sched.h>
#include <string>
#include <sys/capability.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

using std::optional;
using std::string;
using std::vector;

namespace {

using namespace jailer; // NOLINT(google-build-using-namespace)

struct CapFree {
    void operator()(cap_t caps) const noexcept { (void)cap_free(caps); }
};

using CapsPtr = std::unique_ptr<std::remove_pointer_t<cap_t>, CapFree>;

class SharedMemory {
    void* mem_ = nullptr;

public:
    SharedMemory() {
        mem_ = mmap(
            nullptr,
            communication::shared_mem_state_sizeof,
            PROT_READ | PROT_WRITE,
            MAP_SHARED | MAP_ANONYMOUS,
            -1,
            0
        );
        if (mem_ == MAP_FAILED) { // NOLINT(performance-no-int-to-ptr)
            mem_ = nullptr;
            THROW("mmap()", errmsg());
        }
    }

    SharedMemory(const SharedMemory&) = delete;
    SharedMemory(SharedMemory&&) = delete;
    SharedMemory& operator=(const SharedMemory&) = delete;
    SharedMemory& operator=(SharedMemory&&) = delete;

    [[nodiscard]] void* get() const noexcept { return mem_; }

    ~SharedMemory() {
        if (mem_ && munmap(mem_, communication::shared_mem_state_sizeof)) {
            errlog("munmap()", errmsg());
        }
    }
};

// Empty directory on the host, the new root is assembled on top of it inside the mount namespace
class StagingDir {
    string path_;

public:
    StagingDir() {
        char templ[] = "/tmp/jailer-root-XXXXXX";
        if (mkdtemp(templ) == nullptr) {
            THROW("mkdtemp()", errmsg());
        }
        path_ = templ;
    }

    StagingDir(const StagingDir&) = delete;
    StagingDir(StagingDir&&) = delete;
    StagingDir& operator=(const StagingDir&) = delete;
    StagingDir& operator=(StagingDir&&) = delete;

    [[nodiscard]] const string& path() const noexcept { return path_; }

    // Returns the error message on failure
    optional<string> remove() {
        if (path_.empty()) {
            return std::nullopt;
        }
        if (rmdir(path_.c_str())) {
            return concat_tostr("rmdir(", path_, ")", errmsg());
        }
        path_.clear();
        return std::nullopt;
    }

    ~StagingDir() {
        if (!path_.empty() && rmdir(path_.c_str())) {
            errlog("rmdir(", path_, ")", errmsg());
        }
    }
};

timespec monotonic_now() {
    timespec ts;
    if (clock_gettime(CLOCK_MONOTONIC, &ts)) {
        THROW("clock_gettime()", errmsg());
    }
    return ts;
}

std::chrono::nanoseconds to_duration(const timespec& ts) noexcept {
    return std::chrono::seconds{ts.tv_sec} + std::chrono::nanoseconds{ts.tv_nsec};
}

// Rounded up, clamped so that it never becomes negative (infinite) for poll()
int to_poll_timeout(std::chrono::nanoseconds timeout) noexcept {
    return static_cast<int>(std::clamp<int64_t>(
        std::chrono::ceil<std::chrono::milliseconds>(timeout).count(), 0, INT_MAX
    ));
}

FileDescriptor duplicate_above_std_fds(int fd) {
    FileDescriptor res{fcntl(fd, F_DUPFD_CLOEXEC, STDERR_FILENO + 1)};
    if (!res.is_open()) {
        THROW("fcntl(", fd, ", F_DUPFD_CLOEXEC)", errmsg());
    }
    return res;
}

AppliedLimits applied_limits_of(const EnvironmentPlan& plan) {
    AppliedLimits res = {
        .wall_time_limit = plan.timing.wall_time_limit,
        .grace_period = plan.timing.grace_period,
        .cpu_time_limit_sec = std::nullopt,
        .file_size_limit = std::nullopt,
        .memory_limit = plan.cgroup.memory_max,
    };
    if (const auto* limits = plan.find<plan::ApplyResourceLimits>()) {
        for (const auto& limit : limits->limits) {
            if (limit.soft == RLIM_INFINITY) {
                continue;
            }
            switch (limit.resource) {
            case RLIMIT_CPU: res.cpu_time_limit_sec = limit.soft; break;
            case RLIMIT_FSIZE: res.file_size_limit = limit.soft; break;
            case RLIMIT_AS:
                if (!res.memory_limit) {
                    res.memory_limit = limit.soft;
                }
                break;
            default: break;
            }
        }
    }
    return res;
}

// One execution: the resources it holds and the phases it goes through
class Execution {
    const EnvironmentPlan& plan_;
    const Command& command_;
    SandboxProcess& process_;

    std::optional<SharedMemory> shared_mem_;
    volatile communication::SharedMemState* shared_mem_state_ = nullptr;
    std::optional<cgroup::ScopedCgroup> cgroup_;
    std::optional<StagingDir> staging_dir_;
    FileDescriptor supervisor_pidfd_;
    FileDescriptor dev_null_;
    FileDescriptor stdin_fd_;
    FileDescriptor stdout_fd_;
    FileDescriptor stderr_fd_;
    std::optional<Pipe> exec_notify_pipe_;
    CapsPtr caps_;
    std::optional<pid1::Args> pid1_args_;
    uint64_t pid1_clone_flags_ = 0;
    uint64_t initial_oom_kill_count_ = 0;
    bool pid1_reaped_ = false;
    optional<Si> pid1_si_;

public:
    Execution(const EnvironmentPlan& plan, const Command& command, SandboxProcess& process) noexcept
    : plan_(plan)
    , command_(command)
    , process_(process) {}

    template <class... Args>
    void add_problem(Args&&... msg) {
        DoubleAppender(errlog, process_.diagnostics(), std::forward<Args>(msg)...);
    }

    void prepare();

    // Returns false if clone3() failed
    bool spawn();

    void supervise();

    // Kills whatever is left and reaps pid1 if it is still unreaped
    void kill_and_reap() noexcept;

    void release_resources();

private:
    void build_pid1_args();

    void build_capabilities(pid1::Args& args, const plan::DropCapabilities& drop);

    [[nodiscard]] int wait_for_events(vector<pollfd>& pfds, int timeout_ms) const;

    void reap_pid1();

    [[nodiscard]] optional<timespec> exec_start_time() const noexcept {
        return communication::read(shared_mem_state_->tracee_exec_start_time);
    }

    void record_exit();

    void finish_preparing_without_exec(const char* reason);

    // SIGTERM, then SIGKILL once the grace period passes
    void terminate();

    void classify_natural_exit();

    [[nodiscard]] bool oom_kill_happened() const noexcept {
        if (!cgroup_ || cgroup_->memory_events_fd() < 0) {
            return false;
        }
        auto count = cgroup_->read_oom_kill_count();
        return count && *count > initial_oom_kill_count_;
    }
};

void Execution::prepare() {
    if (command_.argv.empty()) {
        THROW("argv is empty");
    }

    shared_mem_.emplace();
    shared_mem_state_ = communication::initialize(shared_mem_->get());

    exec_notify_pipe_ = make_pipe(O_CLOEXEC);
    if (!exec_notify_pipe_) {
        THROW("pipe2()", errmsg());
    }

    dev_null_ = FileDescriptor{"/dev/null", O_RDWR | O_CLOEXEC};
    if (!dev_null_.is_open()) {
        THROW("open(/dev/null)", errmsg());
    }
    // Above the std fds, so that dup3() in the tracee cannot clobber one with another
    stdin_fd_ = duplicate_above_std_fds(command_.stdin_fd.value_or(dev_null_));
    stdout_fd_ = duplicate_above_std_fds(command_.stdout_fd.value_or(dev_null_));
    stderr_fd_ = duplicate_above_std_fds(command_.stderr_fd.value_or(dev_null_));

    supervisor_pidfd_ = FileDescriptor{syscalls::pidfd_open(getpid(), 0)};
    if (!supervisor_pidfd_.is_open()) {
        THROW("pidfd_open()", errmsg());
    }

    if (plan_.cgroup.parent) {
        cgroup_.emplace(cgroup::ScopedCgroup::create(plan_.cgroup, process_.id()));
        if (cgroup_->memory_events_fd() >= 0) {
            initial_oom_kill_count_ = cgroup_->read_oom_kill_count().value_or(0);
        }
    }

    build_pid1_args();
}

void Execution::build_capabilities(pid1::Args& args, const plan::DropCapabilities& drop) {
    auto& caps = args.tracee.capabilities;
    caps.keep_all = drop.keep_all;
    caps.drop_bounding_set = args.user_ns.enabled || geteuid() == 0;
    if (drop.keep_all) {
        caps.caps = nullptr;
        return;
    }
    caps_.reset(cap_init());
    if (!caps_) {
        THROW("cap_init()", errmsg());
    }
    for (const auto& name : drop.retained) {
        cap_value_t cap;
        if (cap_from_name(name.c_str(), &cap)) {
            THROW("unknown capability: ", name);
        }
        caps.retained.emplace_back(cap);
    }
    if (!caps.retained.empty()) {
        for (auto flag : {CAP_EFFECTIVE, CAP_PERMITTED, CAP_INHERITABLE}) {
            if (cap_set_flag(
                    caps_.get(),
                    flag,
                    static_cast<int>(caps.retained.size()),
                    caps.retained.data(),
                    CAP_SET
                ))
            {
                THROW("cap_set_flag()", errmsg());
            }
        }
    }
    caps.caps = caps_.get();
}

void Execution::build_pid1_args() {
    auto& args = pid1_args_.emplace();
    args.shared_mem_state = shared_mem_state_;
    args.supervisor_pidfd = supervisor_pidfd_;
    args.user_ns = {.enabled = false, .outside_uid = geteuid(), .outside_gid = getegid()};
    args.bring_up_loopback = false;
    args.mount.enabled = false;
    args.mount.root_read_only = false;
    args.tracee_clone_flags = 0;

    auto& tracee = args.tracee;
    tracee.shared_mem_state = shared_mem_state_;
    tracee.pid1_pid = -1;
    tracee.proc_dirfd = -1;
    tracee.exec_notify_fd = exec_notify_pipe_->writable;
    tracee.stdin_fd = stdin_fd_;
    tracee.stdout_fd = stdout_fd_;
    tracee.stderr_fd = stderr_fd_;
    tracee.pass_fds = command_.pass_fds;
    std::sort(tracee.pass_fds.begin(), tracee.pass_fds.end());
    tracee.new_session = false;
    tracee.user_ns = {.enabled = false, .inside_uid = 0, .inside_gid = 0};
    tracee.identity = {.change = false, .uid = 0, .gid = 0, .keep_caps = false};
    tracee.disable_tsc = false;
    tracee.working_dir = "/";
    tracee.capabilities = {
        .keep_all = true,
        .caps = nullptr,
        .retained = {},
        .drop_bounding_set = false,
    };
    tracee.no_new_privs = false;
    tracee.executable = command_.executable.value_or(command_.argv.front());
    for (const auto& arg : command_.argv) {
        tracee.argv.emplace_back(const_cast<char*>(arg.c_str())); // NOLINT
    }
    tracee.argv.emplace_back(nullptr);

    auto in_new_root = [&](const string& path) {
        return concat_tostr(staging_dir_->path(), path);
    };
    for (const auto& action : plan_.actions) {
        std::visit(
            overloaded{
                [&](const plan::CreateNamespaces& a) {
                    pid1_clone_flags_ = a.clone_flags;
                    args.user_ns.enabled = a.clone_flags & CLONE_NEWUSER;
                    if (a.clone_flags & CLONE_NEWNS) {
                        args.mount.enabled = true;
                        staging_dir_.emplace();
                        args.mount.new_root_path = staging_dir_->path();
                    }
                },
                [&](const plan::SetHostname& a) { args.hostname = a.hostname; },
                [&](const plan::BringUpLoopback&) { args.bring_up_loopback = true; },
                [&](const plan::EstablishRoot& a) {
                    args.mount.root.source = a.source;
                    args.mount.root_read_only = a.read_only;
                },
                [&](const plan::BindMount& a) {
                    struct stat st = {};
                    if (stat(a.source.c_str(), &st)) {
                        THROW("stat(", a.source, ")", errmsg());
                    }
                    args.mount.operations.emplace_back(pid1::Args::Mount::BindMount{
                        .source = a.source,
                        .dest = in_new_root(a.dest),
                        .source_is_dir = S_ISDIR(st.st_mode),
                        .read_only = a.read_only,
                    });
                },
                [&](const plan::MountTmpfs& a) {
                    args.mount.operations.emplace_back(pid1::Args::Mount::MountTmpfs{
                        .dest = in_new_root(a.dest),
                        .options = a.options,
                        .read_only = a.read_only,
                    });
                },
                [&](const plan::MountFilesystem& a) {
                    args.mount.operations.emplace_back(pid1::Args::Mount::MountFilesystem{
                        .source = a.source,
                        .dest = in_new_root(a.dest),
                        .fs_type = a.fs_type,
                        .options = a.options,
                        .read_only = a.read_only,
                    });
                },
                [&](const plan::CreateSymlink& a) {
                    args.mount.operations.emplace_back(pid1::Args::Mount::CreateSymlink{
                        .target = a.target,
                        .link_path = in_new_root(a.link_path),
                    });
                },
                [&](const plan::MountProc& a) {
                    args.mount.operations.emplace_back(pid1::Args::Mount::MountProc{
                        .path = in_new_root(a.path),
                        .read_only = a.read_only,
                    });
                },
                [&](const plan::ApplyResourceLimits& a) { tracee.limits = a.limits; },
                [&](const plan::SetNiceLevel& a) { tracee.nice_level = a.nice_level; },
                [&](const plan::EnterNewSession&) { tracee.new_session = true; },
                [&](const plan::SetCpuAffinity& a) {
                    cpu_set_t set;
                    CPU_ZERO(&set);
                    for (int cpu : a.cpus) {
                        CPU_SET(cpu, &set);
                    }
                    tracee.cpu_affinity = set;
                },
                [&](const plan::DisableTsc&) { tracee.disable_tsc = true; },
                [&](const plan::SetIdentity& a) {
                    if (a.via_user_namespace) {
                        tracee.user_ns = {
                            .enabled = true, .inside_uid = a.uid, .inside_gid = a.gid};
                    } else if (a.uid != geteuid() || a.gid != getegid() || geteuid() == 0) {
                        tracee.identity = {
                            .change = true,
                            .uid = a.uid,
                            .gid = a.gid,
                            .keep_caps = false,
                        };
                    }
                },
                [&](const plan::SetEnvironment& a) {
                    for (const auto& var : a.vars) {
                        tracee.env.emplace_back(const_cast<char*>(var.c_str())); // NOLINT
                    }
                },
                [&](const plan::ChangeWorkingDirectory& a) { tracee.working_dir = a.path; },
                [&](const plan::DropCapabilities& a) {
                    tracee.no_new_privs = a.no_new_privs;
                    build_capabilities(args, a);
                },
                [&](const plan::InstallSeccompFilter& a) {
                    tracee.seccomp_filter = seccomp::compile(a.policy);
                },
            },
            action
        );
    }
    tracee.env.emplace_back(nullptr);
    tracee.identity.keep_caps = tracee.identity.change && !tracee.capabilities.retained.empty();

    if (args.user_ns.enabled) {
        // The nested namespaces lock the mount tree and provide the command's ids
        args.tracee_clone_flags = CLONE_NEWUSER | (args.mount.enabled ? CLONE_NEWNS : 0);
    }

    args.surviving_fds = {
        args.supervisor_pidfd,
        tracee.exec_notify_fd,
        tracee.stdin_fd,
        tracee.stdout_fd,
        tracee.stderr_fd,
    };
    args.surviving_fds.insert(
        args.surviving_fds.end(), tracee.pass_fds.begin(), tracee.pass_fds.end()
    );
    std::sort(args.surviving_fds.begin(), args.surviving_fds.end());
}

bool Execution::spawn() {
    int pidfd = -1;
    clone_args cl_args = {};
    cl_args.flags = CLONE_PIDFD | pid1_clone_flags_;
    cl_args.pidfd = reinterpret_cast<uint64_t>(&pidfd);
    cl_args.exit_signal = SIGCHLD;
    if (cgroup_) {
        cl_args.flags |= CLONE_INTO_CGROUP;
        cl_args.cgroup = static_cast<uint64_t>(cgroup_->dir_fd());
    }

    auto pid = syscalls::clone3(&cl_args);
    if (pid == -1) {
        add_problem("clone3()", errmsg());
        return false;
    }
    if (pid == 0) {
        pid1::main(*pid1_args_);
    }

    process_.set_spawned(static_cast<pid_t>(pid), FileDescriptor{pidfd});
    stdlog("execution #", process_.id(), ": spawned sandbox init process (pid ", pid, ")");
    // Only the tracee may keep the pipe open from now on
    if (exec_notify_pipe_->writable.close()) {
        THROW("close()", errmsg());
    }
    return true;
}

int Execution::wait_for_events(vector<pollfd>& pfds, int timeout_ms) const {
    for (;;) {
        int rc = poll(pfds.data(), pfds.size(), timeout_ms);
        if (rc >= 0) {
            return rc;
        }
        if (errno != EINTR) {
            THROW("poll()", errmsg());
        }
    }
}

void Execution::reap_pid1() {
    if (pid1_reaped_) {
        return;
    }
    siginfo_t si;
    for (;;) {
        if (syscalls::waitid(P_PIDFD, process_.pidfd(), &si, __WALL | WEXITED, nullptr) == 0) {
            break;
        }
        if (errno != EINTR) {
            THROW("waitid()", errmsg());
        }
    }
    pid1_reaped_ = true;
    pid1_si_ = Si{.code = si.si_code, .status = si.si_status};
}

void Execution::record_exit() {
    auto end_time = communication::read(shared_mem_state_->tracee_waitid_time);
    if (!end_time) {
        end_time = monotonic_now();
    }
    process_.record_exit(
        communication::read_tracee_si(shared_mem_state_),
        end_time,
        communication::read_tracee_cpu_time_usec(shared_mem_state_)
    );
}

void Execution::finish_preparing_without_exec(const char* reason) {
    reap_pid1();
    if (auto error = communication::read_error(shared_mem_state_)) {
        add_problem(*error);
    } else if (pid1_si_ && *pid1_si_ != Si{.code = CLD_EXITED, .status = 0}) {
        add_problem("sandbox init process ", pid1_si_->description());
    }
    add_problem(reason);
    process_.transition_to(SupervisorState::SPAWN_FAILED);
}

void Execution::terminate() {
    if (syscalls::pidfd_send_signal(process_.pidfd(), SIGTERM, nullptr, 0) && errno != ESRCH) {
        add_problem("pidfd_send_signal(SIGTERM)", errmsg());
    }
    vector<pollfd> pfds = {{.fd = process_.pidfd(), .events = POLLIN, .revents = 0}};
    if (wait_for_events(pfds, to_poll_timeout(process_.limits().grace_period)) == 0) {
        stdlog(
            "execution #", process_.id(), ": grace period passed, killing the command forcibly"
        );
        kill_and_reap();
    } else {
        reap_pid1();
    }
    record_exit();
}

void Execution::classify_natural_exit() {
    reap_pid1();
    record_exit();
    const auto& si = process_.si();
    if (!si) {
        // pid1 died without reporting the command's status
        if (oom_kill_happened()) {
            process_.record_limit_breach(LimitKind::MEMORY);
            process_.transition_to(SupervisorState::LIMIT_EXCEEDED);
            return;
        }
        if (auto error = communication::read_error(shared_mem_state_)) {
            add_problem(*error);
        } else if (pid1_si_) {
            add_problem("sandbox init process ", pid1_si_->description());
        }
        process_.transition_to(SupervisorState::SUPERVISION_FAILED);
        return;
    }

    const auto& limits = process_.limits();
    if (process_.wall_time_limit_reached()) {
        process_.transition_to(SupervisorState::TIMED_OUT);
        return;
    }
    if (si->killed_by_signal()) {
        if (si->status == SIGXCPU) {
            process_.record_limit_breach(LimitKind::CPU_TIME);
        } else if (si->status == SIGXFSZ) {
            process_.record_limit_breach(LimitKind::FILE_SIZE);
        } else if (si->status == SIGKILL && limits.cpu_time_limit_sec &&
                   process_.cpu_time_usec() &&
                   *process_.cpu_time_usec() >= *limits.cpu_time_limit_sec * 1'000'000)
        {
            // Hard RLIMIT_CPU is reached after the ignored SIGXCPU
            process_.record_limit_breach(LimitKind::CPU_TIME);
        }
    }
    if (oom_kill_happened()) {
        process_.record_limit_breach(LimitKind::MEMORY);
    }
    process_.transition_to(
        process_.limit_kind() ? SupervisorState::LIMIT_EXCEEDED : SupervisorState::COMPLETED
    );
}

void Execution::supervise() {
    const int cancel_fd = process_.cancellation_token().fd();
    // Preparing: wait until execve() succeeds or the tracee dies
    {
        vector<pollfd> pfds = {
            {.fd = exec_notify_pipe_->readable, .events = POLLIN, .revents = 0},
            {.fd = process_.pidfd(), .events = POLLIN, .revents = 0},
            {.fd = cancel_fd, .events = POLLIN, .revents = 0},
        };
        auto deadline = to_duration(monotonic_now()) + plan_.timing.preparation_timeout;
        for (;;) {
            auto remaining = deadline - to_duration(monotonic_now());
            if (wait_for_events(pfds, to_poll_timeout(remaining)) == 0) {
                if (remaining.count() > 0) {
                    continue; // rounding
                }
                stdlog("execution #", process_.id(), ": preparation timed out");
                kill_and_reap();
                if (auto start_time = exec_start_time()) {
                    process_.record_start(*start_time);
                    process_.transition_to(SupervisorState::RUNNING);
                    add_problem("the command started after the preparation timed out");
                    process_.transition_to(SupervisorState::SUPERVISION_FAILED);
                    record_exit();
                    return;
                }
                finish_preparing_without_exec("preparation timed out");
                return;
            }
            if (pfds[0].revents) {
                char c;
                auto rc = read(exec_notify_pipe_->readable, &c, 1);
                if (rc < 0 && errno != EINTR) {
                    THROW("read()", errmsg());
                }
                if (rc == 0) {
                    break; // EOF
                }
            }
            if (pfds[1].revents) {
                break; // pid1 died, exec_start_time tells whether the command ran
            }
            if (pfds[2].revents) {
                kill_and_reap();
                if (auto start_time = exec_start_time()) {
                    process_.record_start(*start_time);
                    process_.transition_to(SupervisorState::RUNNING);
                    process_.transition_to(SupervisorState::KILLED);
                    record_exit();
                    return;
                }
                finish_preparing_without_exec("cancelled before the command started");
                return;
            }
        }
    }

    auto start_time = exec_start_time();
    if (!start_time) {
        finish_preparing_without_exec("the command did not start");
        return;
    }
    process_.record_start(*start_time);
    process_.transition_to(SupervisorState::RUNNING);

    // Running
    optional<std::chrono::nanoseconds> deadline;
    if (process_.limits().wall_time_limit) {
        deadline = to_duration(*start_time) + *process_.limits().wall_time_limit;
    }
    vector<pollfd> pfds = {
        {.fd = process_.pidfd(), .events = POLLIN, .revents = 0},
        {.fd = cancel_fd, .events = POLLIN, .revents = 0},
    };
    if (cgroup_ && cgroup_->memory_events_fd() >= 0) {
        pfds.push_back({.fd = cgroup_->memory_events_fd(), .events = POLLPRI, .revents = 0});
    }
    for (;;) {
        int timeout_ms = -1;
        if (deadline) {
            timeout_ms = to_poll_timeout(*deadline - to_duration(monotonic_now()));
        }
        int rc = wait_for_events(pfds, timeout_ms);
        if (pfds[0].revents) {
            classify_natural_exit();
            return;
        }
        if (rc == 0) {
            if (deadline && to_duration(monotonic_now()) >= *deadline) {
                process_.transition_to(SupervisorState::TIMED_OUT);
                terminate();
                return;
            }
            continue;
        }
        if (pfds[1].revents) {
            stdlog("execution #", process_.id(), ": cancellation requested");
            process_.transition_to(SupervisorState::KILLED);
            terminate();
            return;
        }
        if (pfds.size() > 2 && pfds[2].revents && oom_kill_happened()) {
            process_.record_limit_breach(LimitKind::MEMORY);
            process_.transition_to(SupervisorState::LIMIT_EXCEEDED);
            terminate();
            return;
        }
    }
}

void Execution::kill_and_reap() noexcept {
    if (process_.pidfd() < 0) {
        return;
    }
    if (!pid1_reaped_ && syscalls::pidfd_send_signal(process_.pidfd(), SIGKILL, nullptr, 0) &&
        errno != ESRCH)
    {
        errlog("execution #", process_.id(), ": pidfd_send_signal(SIGKILL)", errmsg());
    }
    if (cgroup_) {
        if (int err = cgroup_->kill_all(); err != 0) {
            errlog("execution #", process_.id(), ": killing the cgroup failed", errmsg(err));
        }
    }
    try {
        reap_pid1();
    } catch (const std::exception& e) {
        errlog("execution #", process_.id(), ": ", e.what());
    }
}

void Execution::release_resources() {
    if (cgroup_) {
        if (auto error = cgroup_->destroy()) {
            add_problem("cleanup: ", *error);
        }
    }
    if (staging_dir_) {
        if (auto error = staging_dir_->remove()) {
            add_problem("cleanup: ", *error);
        }
    }
    process_.release_pidfd();
}

} // namespace

namespace jailer {

SandboxProcess ProcessSupervisor::run(
    const EnvironmentPlan& plan, const Command& command, CancellationToken cancellation_token
) {
    SandboxProcess process{
        next_execution_id.fetch_add(1, std::memory_order_relaxed),
        std::move(cancellation_token),
        applied_limits_of(plan),
    };
    stdlog(
        "execution #",
        process.id(),
        ": preparing ",
        command.argv.empty() ? std::string_view{"(empty argv)"} : std::string_view{command.argv[0]}
    );

    Execution execution{plan, command, process};
    if (process.cancellation_token().is_cancelled()) {
        execution.add_problem("cancelled before the command started");
        process.transition_to(SupervisorState::SPAWN_FAILED);
        return process;
    }

    try {
        execution.prepare();
        if (execution.spawn()) {
            execution.supervise();
        } else {
            process.transition_to(SupervisorState::SPAWN_FAILED);
        }
    } catch (const std::exception& e) {
        execution.add_problem(e.what());
        execution.kill_and_reap();
        if (!process.transition_to(SupervisorState::SPAWN_FAILED)) {
            process.transition_to(SupervisorState::SUPERVISION_FAILED);
        }
    }

    try {
        execution.release_resources();
    } catch (const std::exception& e) {
        execution.add_problem("cleanup: ", e.what());
    }
    return process;
}

} // namespace jailer
