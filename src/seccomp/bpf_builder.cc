#include "bpf_builder.hh"

#include <jailer/errmsg.hh>
#include <jailer/macros/throw.hh>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace jailer::seccomp {

BpfBuilder::BpfBuilder(uint32_t def_action) : seccomp_ctx{seccomp_init(def_action)} {
    if (!seccomp_ctx) {
        THROW("seccomp_init() failed");
    }
    // Binary tree sorted syscalls in the filter
    int err = seccomp_attr_set(seccomp_ctx, SCMP_FLTATR_CTL_OPTIMIZE, 2);
    if (err) {
        seccomp_release(seccomp_ctx);
        THROW("seccomp_attr_set()", errmsg(-err));
    }
}

void BpfBuilder::add_rule(uint32_t action, int syscall) {
    int err = seccomp_rule_add(seccomp_ctx, action, syscall, 0);
    if (err) {
        THROW("seccomp_rule_add()", errmsg(-err));
    }
}

void BpfBuilder::log_actions(bool enable) {
    int err = seccomp_attr_set(seccomp_ctx, SCMP_FLTATR_CTL_LOG, enable ? 1 : 0);
    if (err) {
        THROW("seccomp_attr_set(SCMP_FLTATR_CTL_LOG)", errmsg(-err));
    }
}

FileDescriptor BpfBuilder::export_to_fd() const {
    auto mfd = FileDescriptor{memfd_create("seccomp bpf", MFD_CLOEXEC)};
    if (!mfd.is_open()) {
        THROW("memfd_create()", errmsg());
    }
    int err = seccomp_export_bpf(seccomp_ctx, mfd);
    if (err) {
        THROW("seccomp_export_bpf()", errmsg(-err));
    }
    return mfd;
}

std::vector<sock_filter> compile(const SeccompPolicy& policy) {
    uint32_t disallowed_action =
        policy.errno_value ? SCMP_ACT_ERRNO(*policy.errno_value) : SCMP_ACT_KILL_PROCESS;
    bool allow_listed = policy.mode == SeccompPolicy::Mode::ALLOW_LISTED;

    BpfBuilder bpf{allow_listed ? disallowed_action : SCMP_ACT_ALLOW};
    bpf.log_actions(policy.log);
    for (const auto& name : policy.syscalls) {
        int syscall = seccomp_syscall_resolve_name(name.c_str());
        if (syscall == __NR_SCMP_ERROR) {
            THROW("unknown syscall: ", name);
        }
        bpf.add_rule(allow_listed ? SCMP_ACT_ALLOW : disallowed_action, syscall);
    }

    auto fd = bpf.export_to_fd();
    struct stat st = {};
    if (fstat(fd, &st)) {
        THROW("fstat()", errmsg());
    }
    if (st.st_size % sizeof(sock_filter) != 0) {
        THROW("seccomp_export_bpf() produced a truncated program");
    }
    std::vector<sock_filter> prog(st.st_size / sizeof(sock_filter));
    auto len = pread(fd, prog.data(), st.st_size, 0);
    if (len != st.st_size) {
        THROW("pread()", errmsg());
    }
    return prog;
}

} // namespace jailer::seccomp
