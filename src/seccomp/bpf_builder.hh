#pragma once

#include <cstdint>
#include <jailer/config_model.hh>
#include <jailer/file_descriptor.hh>
#include <linux/filter.h>
#include <seccomp.h>
#include <vector>

namespace jailer::seccomp {

class BpfBuilder {
    scmp_filter_ctx seccomp_ctx;

public:
    explicit BpfBuilder(uint32_t def_action);

    BpfBuilder(const BpfBuilder&) = delete;
    BpfBuilder(BpfBuilder&&) = delete;
    BpfBuilder& operator=(const BpfBuilder&) = delete;
    BpfBuilder& operator=(BpfBuilder&&) = delete;

    void add_rule(uint32_t action, int syscall);

    // Makes the kernel log every action other than allow
    void log_actions(bool enable);

    [[nodiscard]] FileDescriptor export_to_fd() const;

    ~BpfBuilder() { seccomp_release(seccomp_ctx); }
};

// Compiles @p policy into a program ready for seccomp(SECCOMP_SET_MODE_FILTER)
std::vector<sock_filter> compile(const SeccompPolicy& policy);

} // namespace jailer::seccomp
