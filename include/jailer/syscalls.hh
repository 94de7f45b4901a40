#pragma once

#include <csignal>
#include <linux/sched.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>

extern "C" struct rusage;

namespace syscalls {

inline int
waitid(int id_type, pid_t id, siginfo_t* info, int options, struct rusage* usage) noexcept {
    return static_cast<int>(syscall(SYS_waitid, id_type, id, info, options, usage));
}

inline int pidfd_open(pid_t pid, unsigned int flags) noexcept {
    return static_cast<int>(syscall(SYS_pidfd_open, pid, flags));
}

inline int pidfd_send_signal(int pidfd, int sig, siginfo_t* info, unsigned int flags) noexcept {
    return static_cast<int>(syscall(SYS_pidfd_send_signal, pidfd, sig, info, flags));
}

inline int pivot_root(const char* new_root, const char* put_old) noexcept {
    return static_cast<int>(syscall(SYS_pivot_root, new_root, put_old));
}

// NOLINTNEXTLINE(google-runtime-int)
inline long clone3(struct clone_args* cl_args) noexcept {
    return syscall(SYS_clone3, cl_args, sizeof(*cl_args));
}

// The glibc wrappers of the set*id() family synchronize all threads of the process, which
// deadlocks in a child cloned from a multithreaded process. These affect only the caller.
inline int setresuid(uid_t ruid, uid_t euid, uid_t suid) noexcept {
    return static_cast<int>(syscall(SYS_setresuid, ruid, euid, suid));
}

inline int setresgid(gid_t rgid, gid_t egid, gid_t sgid) noexcept {
    return static_cast<int>(syscall(SYS_setresgid, rgid, egid, sgid));
}

inline int setgroups(size_t size, const gid_t* list) noexcept {
    return static_cast<int>(syscall(SYS_setgroups, size, list));
}

inline int close_range(unsigned int first, unsigned int last, unsigned int flags) noexcept {
    return static_cast<int>(syscall(SYS_close_range, first, last, flags));
}

} // namespace syscalls
