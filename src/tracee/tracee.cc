#include "tracee.hh"

#include <cerrno>
#include <climits>
#include <ctime>
#include <fcntl.h>
#include <jailer/errmsg.hh>
#include <jailer/noexcept_concat.hh>
#include <jailer/syscalls.hh>
#include <linux/seccomp.h>
#include <sched.h>
#include <string_view>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <unistd.h>

namespace jailer::tracee {

[[noreturn]] void main(Args& args) noexcept {
    auto die_with_msg = [&] [[noreturn]] (const auto&... msg) noexcept {
        communication::write_error(args.shared_mem_state, "tracee: ", msg...);
        _exit(1);
    };
    auto die_with_error = [&] [[noreturn]] (const auto&... msg) noexcept {
        die_with_msg(msg..., errmsg());
    };
    auto setup_kill_on_pid1_death = [&]() noexcept {
        if (prctl(PR_SET_PDEATHSIG, SIGKILL, 0, 0, 0)) {
            die_with_error("prctl(PR_SET_PDEATHSIG)");
        }
        // pid1 might have died just before prctl()
        if (getppid() != args.pid1_pid) {
            die_with_msg("pid1 died");
        }
    };
    auto write_file_at = [&](int dirfd, const char* file_path, std::string_view data) noexcept {
        auto fd = openat(dirfd, file_path, O_WRONLY | O_TRUNC | O_CLOEXEC);
        if (fd == -1) {
            die_with_error("openat(", file_path, ")");
        }
        if (write(fd, data.data(), data.size()) != static_cast<ssize_t>(data.size())) {
            die_with_error("write(", file_path, ")");
        }
        if (close(fd)) {
            die_with_error("close()");
        }
    };
    auto setup_user_namespace = [&]() noexcept {
        if (!args.user_ns.enabled) {
            return;
        }
        // pid1 is root in its namespace, so 0 is our outside id
        write_file_at(
            args.proc_dirfd, "self/uid_map", noexcept_concat(args.user_ns.inside_uid, " 0 1")
        );
        write_file_at(args.proc_dirfd, "self/setgroups", "deny");
        write_file_at(
            args.proc_dirfd, "self/gid_map", noexcept_concat(args.user_ns.inside_gid, " 0 1")
        );
    };
    auto setup_identity = [&]() noexcept {
        if (!args.identity.change) {
            return;
        }
        if (args.identity.keep_caps && prctl(PR_SET_KEEPCAPS, 1, 0, 0, 0)) {
            die_with_error("prctl(PR_SET_KEEPCAPS)");
        }
        if (syscalls::setgroups(0, nullptr)) {
            die_with_error("setgroups()");
        }
        if (syscalls::setresgid(args.identity.gid, args.identity.gid, args.identity.gid)) {
            die_with_error("setresgid()");
        }
        if (syscalls::setresuid(args.identity.uid, args.identity.uid, args.identity.uid)) {
            die_with_error("setresuid()");
        }
    };
    auto setup_std_fds = [&]() noexcept {
        if (dup3(args.stdin_fd, STDIN_FILENO, 0) < 0) {
            die_with_error("dup3(stdin)");
        }
        if (dup3(args.stdout_fd, STDOUT_FILENO, 0) < 0) {
            die_with_error("dup3(stdout)");
        }
        if (dup3(args.stderr_fd, STDERR_FILENO, 0) < 0) {
            die_with_error("dup3(stderr)");
        }
    };
    auto close_other_fds = [&]() noexcept {
        auto prev_fd = STDERR_FILENO;
        auto keep = [&](int fd) noexcept {
            if (fd <= prev_fd) {
                return;
            }
            if (prev_fd + 1 < fd &&
                syscalls::close_range(
                    static_cast<unsigned>(prev_fd + 1), static_cast<unsigned>(fd - 1), 0
                ))
            {
                die_with_error("close_range()");
            }
            prev_fd = fd;
        };
        bool exec_notify_fd_kept = false;
        for (int fd : args.pass_fds) {
            if (!exec_notify_fd_kept && args.exec_notify_fd < fd) {
                keep(args.exec_notify_fd);
                exec_notify_fd_kept = true;
            }
            keep(fd);
        }
        if (!exec_notify_fd_kept) {
            keep(args.exec_notify_fd);
        }
        if (syscalls::close_range(static_cast<unsigned>(prev_fd + 1), ~0U, 0)) {
            die_with_error("close_range()");
        }
        for (int fd : args.pass_fds) {
            if (fd > STDERR_FILENO && fcntl(fd, F_SETFD, 0)) {
                die_with_error("fcntl(", fd, ", F_SETFD)");
            }
        }
    };
    auto setup_prlimit = [&]() noexcept {
        for (const auto& limit : args.limits) {
            rlimit64 rlim = {.rlim_cur = limit.soft, .rlim_max = limit.hard};
            if (prlimit64(0, limit.resource, &rlim, nullptr)) {
                die_with_error("prlimit(", limit.resource, ")");
            }
        }
    };
    auto setup_nice_level = [&]() noexcept {
        if (args.nice_level && setpriority(PRIO_PROCESS, 0, *args.nice_level)) {
            die_with_error("setpriority(", *args.nice_level, ")");
        }
    };
    auto setup_cpu_affinity = [&]() noexcept {
        if (args.cpu_affinity &&
            sched_setaffinity(0, sizeof(*args.cpu_affinity), &*args.cpu_affinity))
        {
            die_with_error("sched_setaffinity()");
        }
    };
    auto is_retained = [&](cap_value_t cap) noexcept {
        for (auto r : args.capabilities.retained) {
            if (r == cap) {
                return true;
            }
        }
        return false;
    };
    // Needs CAP_SETPCAP, so it goes before the identity change
    auto drop_bounding_set = [&]() noexcept {
        if (args.capabilities.keep_all || !args.capabilities.drop_bounding_set) {
            return;
        }
        // PR_CAPBSET_READ fails past the last capability known to the kernel
        for (cap_value_t cap = 0; prctl(PR_CAPBSET_READ, cap, 0, 0, 0) >= 0; ++cap) {
            if (!is_retained(cap) && cap_drop_bound(cap)) {
                die_with_error("cap_drop_bound(", cap, ")");
            }
        }
    };
    auto drop_capabilities = [&]() noexcept {
        if (args.capabilities.keep_all) {
            return;
        }
        if (cap_set_proc(args.capabilities.caps)) {
            die_with_error("cap_set_proc()");
        }
        // Ambient capabilities survive execve() of a non-root user
        for (auto cap : args.capabilities.retained) {
            if (prctl(PR_CAP_AMBIENT, PR_CAP_AMBIENT_RAISE, cap, 0, 0)) {
                die_with_error("prctl(PR_CAP_AMBIENT_RAISE, ", cap, ")");
            }
        }
    };
    auto install_seccomp_filter = [&]() noexcept {
        if (args.seccomp_filter.empty()) {
            return;
        }
        if (args.seccomp_filter.size() > USHRT_MAX) {
            die_with_msg("seccomp filter is too big");
        }
        auto fprog = sock_fprog{
            .len = static_cast<unsigned short>(args.seccomp_filter.size()),
            .filter = args.seccomp_filter.data(),
        };
        if (syscall(SYS_seccomp, SECCOMP_SET_MODE_FILTER, 0, &fprog)) {
            die_with_error("seccomp()");
        }
    };
    auto save_exec_start_time = [&]() noexcept {
        timespec ts;
        if (clock_gettime(CLOCK_MONOTONIC, &ts)) {
            die_with_error("clock_gettime()");
        }
        communication::write(args.shared_mem_state->tracee_exec_start_time, ts);
    };

    setup_kill_on_pid1_death();
    if (args.new_session && setsid() < 0) {
        die_with_error("setsid()");
    }
    setup_user_namespace();
    if (close(args.proc_dirfd)) {
        die_with_error("close()");
    }
    setup_std_fds();
    close_other_fds();
    setup_prlimit();
    setup_nice_level();
    setup_cpu_affinity();
    drop_bounding_set();
    setup_identity();
    if (chdir(args.working_dir.c_str())) {
        die_with_error("chdir(\"", args.working_dir.c_str(), "\")");
    }
    drop_capabilities();
    if (args.no_new_privs && prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0)) {
        die_with_error("prctl(PR_SET_NO_NEW_PRIVS)");
    }
    if (args.disable_tsc && prctl(PR_SET_TSC, PR_TSC_SIGSEGV, 0, 0, 0)) {
        die_with_error("prctl(PR_SET_TSC)");
    }

    if (args.argv.empty() || args.argv.back() != nullptr) {
        die_with_msg("BUG: argv array does not contain nullptr as the last element");
    }
    if (args.env.empty() || args.env.back() != nullptr) {
        die_with_msg("BUG: env array does not contain nullptr as the last element");
    }

    save_exec_start_time();
    install_seccomp_filter();
    execve(args.executable.c_str(), args.argv.data(), args.env.data());
    // The start time is void, the command never ran
    args.shared_mem_state->tracee_exec_start_time.seconds = -1;
    die_with_error("execve(\"", args.executable.c_str(), "\")");
}

} // namespace jailer::tracee
