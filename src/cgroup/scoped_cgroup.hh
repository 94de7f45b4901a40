#pragma once

#include <cstdint>
#include <jailer/config_model.hh>
#include <jailer/file_descriptor.hh>
#include <optional>
#include <string>

namespace jailer::cgroup {

// Child cgroup of a delegated cgroup v2 directory, removed on destruction
class ScopedCgroup {
    FileDescriptor parent_fd_;
    FileDescriptor dir_fd_;
    FileDescriptor kill_fd_;
    FileDescriptor memory_events_fd_;
    std::string name_;
    std::string path_;

    ScopedCgroup() = default;

public:
    // Creates the cgroup and writes its limits, throws std::runtime_error on failure
    static ScopedCgroup create(const Cgroup& config, uint64_t execution_id);

    ScopedCgroup(const ScopedCgroup&) = delete;
    ScopedCgroup(ScopedCgroup&&) noexcept = default;
    ScopedCgroup& operator=(const ScopedCgroup&) = delete;
    ScopedCgroup& operator=(ScopedCgroup&&) = delete;

    // Usable as clone_args::cgroup
    [[nodiscard]] int dir_fd() const noexcept { return dir_fd_; }

    // -1 if the memory controller is not enabled, POLLPRI signals a change
    [[nodiscard]] int memory_events_fd() const noexcept { return memory_events_fd_; }

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    // Value of "oom_kill" from memory.events
    [[nodiscard]] std::optional<uint64_t> read_oom_kill_count() const noexcept;

    // Kills every process in the cgroup, returns errno on failure and 0 on success
    [[nodiscard]] int kill_all() const noexcept;

    // Kills the remaining processes and removes the cgroup. Returns the error
    // message on failure. Subsequent calls do nothing.
    std::optional<std::string> destroy() noexcept;

    ~ScopedCgroup();
};

} // namespace jailer::cgroup
