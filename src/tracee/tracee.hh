#pragma once

#include "../communication/shared_mem_state.hh"

#include <jailer/environment_plan.hh>
#include <linux/filter.h>
#include <optional>
#include <sched.h>
#include <string>
#include <sys/capability.h>
#include <sys/types.h>
#include <vector>

namespace jailer::tracee {

// Everything is rendered before clone3(), the tracee must not allocate
struct Args {
    volatile communication::SharedMemState* shared_mem_state;
    pid_t pid1_pid; // as seen by the tracee, set by pid1
    int proc_dirfd; // set by pid1
    // EOF on the other end tells the supervisor that execve() succeeded or the tracee died
    int exec_notify_fd;
    // All three are > STDERR_FILENO
    int stdin_fd;
    int stdout_fd;
    int stderr_fd;
    std::vector<int> pass_fds; // sorted
    bool new_session;

    struct UserNamespace {
        bool enabled;
        uid_t inside_uid;
        gid_t inside_gid;
    } user_ns;

    // Used only without a user namespace
    struct Identity {
        bool change;
        uid_t uid;
        gid_t gid;
        bool keep_caps;
    } identity;

    std::vector<plan::ResourceLimit> limits;
    std::optional<int> nice_level;
    std::optional<cpu_set_t> cpu_affinity;
    bool disable_tsc;
    std::string working_dir;

    struct Capabilities {
        bool keep_all;
        cap_t caps; // owned by the supervisor, nullptr iff keep_all
        std::vector<cap_value_t> retained;
        bool drop_bounding_set;
    } capabilities;

    bool no_new_privs;
    std::vector<sock_filter> seccomp_filter; // empty means no filter

    std::string executable;
    std::vector<char*> argv; // with a trailing nullptr element
    std::vector<char*> env; // with a trailing nullptr element
};

[[noreturn]] void main(Args& args) noexcept;

} // namespace jailer::tracee
