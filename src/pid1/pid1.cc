#include "../communication/shared_mem_state.hh"
#include "../tracee/tracee.hh"
#include "pid1.hh"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <jailer/errmsg.hh>
#include <jailer/noexcept_concat.hh>
#include <jailer/overloaded.hh>
#include <jailer/syscalls.hh>
#include <net/if.h>
#include <poll.h>
#include <sched.h>
#include <string_view>
#include <sys/ioctl.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
volatile jailer::communication::SharedMemState* shared_mem_state;
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
volatile sig_atomic_t tracee_pid = 0;

template <class... Args>
[[noreturn]] void die_with_msg(const Args&... msg) noexcept {
    jailer::communication::write_error(shared_mem_state, "pid1: ", msg...);
    _exit(1);
}

template <class... Args>
[[noreturn]] void die_with_error(const Args&... msg) noexcept {
    die_with_msg(msg..., errmsg());
}

void set_process_name() noexcept {
    if (prctl(PR_SET_NAME, "pid1", 0, 0, 0)) {
        die_with_error("prctl(SET_NAME)");
    }
}

void setup_kill_on_supervisor_death(int supervisor_pidfd) noexcept {
    // Make kernel send us SIGKILL when the parent process (= supervisor) dies
    if (prctl(PR_SET_PDEATHSIG, SIGKILL, 0, 0, 0)) {
        die_with_error("prctl(PR_SET_PDEATHSIG)");
    }
    // The supervisor might have died just before prctl(). getppid() returns 0 in a new PID
    // namespace, so we poll() on the supervisor's pidfd.
    pollfd pfd = {
        .fd = supervisor_pidfd,
        .events = POLLIN,
        .revents = 0,
    };
    if (poll(&pfd, 1, 0) == 1) {
        die_with_msg("supervisor died");
    }
    // It could be used to send signals to the supervisor
    if (close(supervisor_pidfd)) {
        die_with_error("close()");
    }
}

void close_all_non_std_file_descriptors_except(const std::vector<int>& surviving_fds) noexcept {
    auto prev_fd = STDERR_FILENO;
    for (auto fd : surviving_fds) {
        if (fd <= prev_fd) {
            continue;
        }
        if (prev_fd + 1 < fd &&
            syscalls::close_range(
                static_cast<unsigned>(prev_fd + 1), static_cast<unsigned>(fd - 1), 0
            ))
        {
            die_with_error("close_range()");
        }
        prev_fd = fd;
    }
    if (syscalls::close_range(static_cast<unsigned>(prev_fd + 1), ~0U, 0)) {
        die_with_error("close_range()");
    }
}

void write_file(const char* file_path, std::string_view data) noexcept {
    auto fd = open(file_path, O_WRONLY | O_TRUNC | O_CLOEXEC);
    if (fd == -1) {
        die_with_error("open(", file_path, ")");
    }
    if (write(fd, data.data(), data.size()) != static_cast<ssize_t>(data.size())) {
        die_with_error("write(", file_path, ")");
    }
    if (close(fd)) {
        die_with_error("close()");
    }
}

void setup_user_namespace(const jailer::pid1::Args::UserNamespace& user_ns) noexcept {
    if (!user_ns.enabled) {
        return;
    }
    write_file("/proc/self/uid_map", noexcept_concat("0 ", user_ns.outside_uid, " 1"));
    write_file("/proc/self/setgroups", "deny");
    write_file("/proc/self/gid_map", noexcept_concat("0 ", user_ns.outside_gid, " 1"));
    if (syscalls::setresuid(0, 0, 0) != 0) {
        die_with_error("setresuid()");
    }
    if (syscalls::setresgid(0, 0, 0) != 0) {
        die_with_error("setresgid()");
    }
}

// Creates missing directories of @p path, the last component too iff @p including_last
void create_directories(std::string& path, bool including_last) noexcept {
    auto try_mkdir = [&](const char* dir) noexcept {
        if (mkdir(dir, 0755) && errno != EEXIST) {
            die_with_error("mkdir(\"", dir, "\")");
        }
    };
    for (size_t i = 1; i < path.size(); ++i) {
        if (path[i] == '/') {
            path[i] = '\0';
            try_mkdir(path.c_str());
            path[i] = '/';
        }
    }
    if (including_last) {
        try_mkdir(path.c_str());
    }
}

void create_file(std::string& path) noexcept {
    create_directories(path, false);
    int fd = open(path.c_str(), O_CREAT | O_WRONLY | O_CLOEXEC, 0644);
    if (fd < 0) {
        die_with_error("open(\"", path.c_str(), "\", O_CREAT)");
    }
    if (close(fd)) {
        die_with_error("close()");
    }
}

void make_read_only(const char* path, bool recursive) noexcept {
    mount_attr mattr = {};
    mattr.attr_set = MOUNT_ATTR_RDONLY;
    if (mount_setattr(AT_FDCWD, path, recursive ? AT_RECURSIVE : 0, &mattr, sizeof(mattr))) {
        die_with_error("mount_setattr(\"", path, "\", MOUNT_ATTR_RDONLY)");
    }
}

void setup_mount_namespace(jailer::pid1::Args::Mount& mount_ns) noexcept {
    if (!mount_ns.enabled) {
        return;
    }
    // Do not propagate our mounts back to the host
    if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr)) {
        die_with_error("mount(\"/\", MS_PRIVATE)");
    }

    const char* new_root = mount_ns.new_root_path.c_str();
    if (mount_ns.root.source) {
        if (mount(mount_ns.root.source->c_str(), new_root, nullptr, MS_BIND | MS_REC, nullptr)) {
            die_with_error("mount(bind \"", mount_ns.root.source->c_str(), "\" as root)");
        }
    } else if (mount(nullptr, new_root, "tmpfs", MS_NOSUID | MS_SILENT, "mode=0755")) {
        die_with_error("mount(tmpfs as root)");
    }

    // A host root directory must not be modified, its mount points already exist
    const bool create_mount_points = !mount_ns.root.source;
    auto make_dir = [&](std::string& path) noexcept {
        if (create_mount_points) {
            create_directories(path, true);
        }
    };

    using Mount = jailer::pid1::Args::Mount;
    for (auto& oper : mount_ns.operations) {
        std::visit(
            overloaded{
                [&](Mount::BindMount& bind_mount) {
                    int mount_fd = open_tree(
                        AT_FDCWD,
                        bind_mount.source.c_str(),
                        OPEN_TREE_CLOEXEC | OPEN_TREE_CLONE | AT_RECURSIVE
                    );
                    if (mount_fd < 0) {
                        die_with_error("open_tree(\"", bind_mount.source.c_str(), "\")");
                    }
                    if (bind_mount.read_only) {
                        mount_attr mattr = {};
                        mattr.attr_set = MOUNT_ATTR_RDONLY;
                        if (mount_setattr(
                                mount_fd, "", AT_EMPTY_PATH | AT_RECURSIVE, &mattr, sizeof(mattr)
                            ))
                        {
                            die_with_error("mount_setattr()");
                        }
                    }
                    if (bind_mount.source_is_dir) {
                        make_dir(bind_mount.dest);
                    } else if (create_mount_points) {
                        create_file(bind_mount.dest);
                    }
                    if (move_mount(
                            mount_fd, "", AT_FDCWD, bind_mount.dest.c_str(), MOVE_MOUNT_F_EMPTY_PATH
                        ))
                    {
                        die_with_error("move_mount(dest: \"", bind_mount.dest.c_str(), "\")");
                    }
                    if (close(mount_fd)) {
                        die_with_error("close()");
                    }
                },
                [&](Mount::MountTmpfs& mount_tmpfs) {
                    make_dir(mount_tmpfs.dest);
                    auto flags = MS_NOSUID | MS_NODEV | MS_SILENT;
                    if (mount_tmpfs.read_only) {
                        flags |= MS_RDONLY;
                    }
                    if (mount(
                            nullptr,
                            mount_tmpfs.dest.c_str(),
                            "tmpfs",
                            flags,
                            mount_tmpfs.options.empty() ? nullptr : mount_tmpfs.options.c_str()
                        ))
                    {
                        die_with_error("mount(tmpfs at \"", mount_tmpfs.dest.c_str(), "\")");
                    }
                },
                [&](Mount::MountFilesystem& mount_fs) {
                    make_dir(mount_fs.dest);
                    auto flags = MS_SILENT;
                    if (mount_fs.read_only) {
                        flags |= MS_RDONLY;
                    }
                    if (mount(
                            mount_fs.source.empty() ? nullptr : mount_fs.source.c_str(),
                            mount_fs.dest.c_str(),
                            mount_fs.fs_type.c_str(),
                            flags,
                            mount_fs.options.empty() ? nullptr : mount_fs.options.c_str()
                        ))
                    {
                        die_with_error(
                            "mount(",
                            mount_fs.fs_type.c_str(),
                            " at \"",
                            mount_fs.dest.c_str(),
                            "\")"
                        );
                    }
                },
                [&](Mount::CreateSymlink& create_symlink) {
                    create_directories(create_symlink.link_path, false);
                    if (symlink(create_symlink.target.c_str(), create_symlink.link_path.c_str())) {
                        die_with_error("symlink(\"", create_symlink.link_path.c_str(), "\")");
                    }
                },
                [&](Mount::MountProc& mount_proc) {
                    make_dir(mount_proc.path);
                    auto flags = MS_NOSUID | MS_NODEV | MS_NOEXEC | MS_SILENT;
                    if (mount_proc.read_only) {
                        flags |= MS_RDONLY;
                    }
                    if (mount(nullptr, mount_proc.path.c_str(), "proc", flags, nullptr)) {
                        die_with_error("mount(proc at \"", mount_proc.path.c_str(), "\")");
                    }
                },
            },
            oper
        );
    }

    if (chdir(new_root)) {
        die_with_error("chdir(new_root)");
    }
    // This has to be done within the same user namespace that performed the mounts. After the
    // tracee's clone3 with CLONE_NEWUSER | CLONE_NEWNS the whole mount tree becomes locked.
    if (syscalls::pivot_root(".", ".")) {
        die_with_error(R"(pivot_root(".", "."))");
    }
    // Unmount the old root (also, it is needed for clone3 with CLONE_NEWUSER to succeed)
    if (umount2(".", MNT_DETACH)) {
        die_with_error(R"(umount2("."))");
    }
    if (chdir("/")) {
        die_with_error("chdir(\"/\")");
    }
    if (mount_ns.root_read_only) {
        make_read_only("/", false);
    }
}

void set_hostname(const std::optional<std::string>& hostname) noexcept {
    if (hostname && sethostname(hostname->data(), hostname->size())) {
        die_with_error("sethostname()");
    }
}

void bring_up_loopback() noexcept {
    int sock = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_IP);
    if (sock < 0) {
        die_with_error("socket()");
    }
    ifreq ifr = {};
    strncpy(ifr.ifr_name, "lo", IFNAMSIZ - 1);
    if (ioctl(sock, SIOCGIFFLAGS, &ifr)) {
        die_with_error("ioctl(SIOCGIFFLAGS)");
    }
    ifr.ifr_flags = static_cast<short>(ifr.ifr_flags | IFF_UP | IFF_RUNNING);
    if (ioctl(sock, SIOCSIFFLAGS, &ifr)) {
        die_with_error("ioctl(SIOCSIFFLAGS)");
    }
    if (close(sock)) {
        die_with_error("close()");
    }
}

void forward_signal_to_tracee(int sig) noexcept {
    int saved_errno = errno;
    pid_t pid = tracee_pid;
    if (pid > 0) {
        (void)kill(pid, sig);
    } else {
        // There is no tracee yet, so there is nothing to wait for
        _exit(1);
    }
    errno = saved_errno;
}

void install_signal_forwarding() noexcept {
    struct sigaction sa = {};
    sa.sa_handler = &forward_signal_to_tracee;
    sa.sa_flags = SA_RESTART;
    if (sigemptyset(&sa.sa_mask)) {
        die_with_error("sigemptyset()");
    }
    if (sigaction(SIGTERM, &sa, nullptr)) {
        die_with_error("sigaction(SIGTERM)");
    }
    if (sigaction(SIGINT, &sa, nullptr)) {
        die_with_error("sigaction(SIGINT)");
    }
}

timespec get_current_time() noexcept {
    timespec ts;
    if (clock_gettime(CLOCK_MONOTONIC, &ts)) {
        die_with_error("clock_gettime()");
    }
    return ts;
}

} // namespace

namespace jailer::pid1 {

[[noreturn]] void main(Args& args) noexcept {
    shared_mem_state = args.shared_mem_state;

    close_all_non_std_file_descriptors_except(args.surviving_fds);
    set_process_name();
    setup_kill_on_supervisor_death(args.supervisor_pidfd);
    install_signal_forwarding();
    setup_user_namespace(args.user_ns);
    // Opened before the mounts because the tracee needs the host's view of itself
    int proc_dirfd = open("/proc", O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (proc_dirfd < 0) {
        die_with_error("open(\"/proc\")");
    }
    setup_mount_namespace(args.mount);
    set_hostname(args.hostname);
    if (args.bring_up_loopback) {
        bring_up_loopback();
    }

    args.tracee.proc_dirfd = proc_dirfd;
    args.tracee.pid1_pid = getpid();

    clone_args cl_args = {};
    cl_args.flags = args.tracee_clone_flags;
    cl_args.exit_signal = SIGCHLD;
    auto pid = syscalls::clone3(&cl_args);
    if (pid == -1) {
        die_with_error("clone3()");
    }
    if (pid == 0) {
        tracee::main(args.tracee);
    }
    tracee_pid = static_cast<pid_t>(pid);

    // Only the tracee may keep the supervisor waiting for execve()
    if (close(args.tracee.exec_notify_fd)) {
        die_with_error("close()");
    }
    if (close(proc_dirfd)) {
        die_with_error("close()");
    }

    timespec waitid_time;
    siginfo_t si;
    rusage ru;
    for (;;) {
        if (syscalls::waitid(P_ALL, 0, &si, __WALL | WEXITED, &ru)) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == ECHILD) {
                die_with_msg("tracee vanished");
            }
            die_with_error("waitid()");
        }
        waitid_time = get_current_time();
        if (si.si_pid == tracee_pid) {
            // Within a PID namespace the remaining processes are killed on pid1's death
            break;
        }
    }

    communication::write(args.shared_mem_state->tracee_waitid_time, waitid_time);
    auto cpu_time_usec =
        static_cast<uint64_t>(ru.ru_utime.tv_sec + ru.ru_stime.tv_sec) * 1'000'000 +
        static_cast<uint64_t>(ru.ru_utime.tv_usec + ru.ru_stime.tv_usec);
    communication::write_tracee_result(
        args.shared_mem_state, Si{.code = si.si_code, .status = si.si_status}, cpu_time_usec
    );
    _exit(0);
}

} // namespace jailer::pid1
