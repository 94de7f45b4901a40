#include "scoped_cgroup.hh"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <jailer/concat_tostr.hh>
#include <jailer/errmsg.hh>
#include <jailer/logger.hh>
#include <jailer/macros/throw.hh>
#include <jailer/string_transform.hh>
#include <string_view>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>

using std::optional;
using std::string;
using std::string_view;

namespace {

void write_file_at(int dirfd, const char* file, string_view data) {
    FileDescriptor fd{openat(dirfd, file, O_WRONLY | O_TRUNC | O_CLOEXEC)};
    if (!fd.is_open()) {
        THROW("openat(", file, ")", errmsg());
    }
    auto rc = write(fd, data.data(), data.size());
    if (rc != static_cast<ssize_t>(data.size())) {
        THROW("write(", file, ", \"", data, "\")", errmsg());
    }
    if (fd.close()) {
        THROW("close()", errmsg());
    }
}

} // namespace

namespace jailer::cgroup {

ScopedCgroup ScopedCgroup::create(const Cgroup& config, uint64_t execution_id) {
    if (!config.parent) {
        THROW("no parent cgroup configured");
    }
    ScopedCgroup cg;
    cg.parent_fd_ = FileDescriptor{open(config.parent->c_str(), O_PATH | O_DIRECTORY | O_CLOEXEC)};
    if (!cg.parent_fd_.is_open()) {
        THROW("open(", *config.parent, ")", errmsg());
    }
    cg.name_ = concat_tostr("jailer-", getpid(), '-', execution_id);
    if (mkdirat(cg.parent_fd_, cg.name_.c_str(), 0755)) {
        THROW("mkdirat(", *config.parent, ", ", cg.name_, ")", errmsg());
    }
    cg.path_ = concat_tostr(*config.parent, '/', cg.name_);
    // From now on the destructor removes the directory
    cg.dir_fd_ =
        FileDescriptor{openat(cg.parent_fd_, cg.name_.c_str(), O_PATH | O_DIRECTORY | O_CLOEXEC)};
    if (!cg.dir_fd_.is_open()) {
        THROW("openat(", cg.path_, ")", errmsg());
    }
    cg.kill_fd_ = FileDescriptor{openat(cg.dir_fd_, "cgroup.kill", O_WRONLY | O_CLOEXEC)};
    if (!cg.kill_fd_.is_open()) {
        THROW("openat(", cg.path_, "/cgroup.kill)", errmsg());
    }
    cg.memory_events_fd_ =
        FileDescriptor{openat(cg.dir_fd_, "memory.events", O_RDONLY | O_CLOEXEC)};
    if (!cg.memory_events_fd_.is_open() and (errno != ENOENT or config.memory_max)) {
        THROW("openat(", cg.path_, "/memory.events)", errmsg());
    }

    if (config.memory_max) {
        write_file_at(cg.dir_fd_, "memory.max", ::to_string(*config.memory_max));
    }
    if (config.memory_swap_max) {
        write_file_at(cg.dir_fd_, "memory.swap.max", ::to_string(*config.memory_swap_max));
    }
    if (config.pids_max) {
        write_file_at(cg.dir_fd_, "pids.max", ::to_string(*config.pids_max));
    }
    if (config.cpu_ms_per_sec) {
        // Quota per 1 second period, in microseconds
        constexpr uint64_t period_usec = 1'000'000;
        write_file_at(
            cg.dir_fd_,
            "cpu.max",
            concat_tostr(uint64_t{*config.cpu_ms_per_sec} * 1000, ' ', period_usec)
        );
    }
    return cg;
}

optional<uint64_t> ScopedCgroup::read_oom_kill_count() const noexcept {
    if (!memory_events_fd_.is_open()) {
        return std::nullopt;
    }
    char buff[512];
    auto len = pread(memory_events_fd_, buff, sizeof(buff), 0);
    if (len <= 0) {
        return std::nullopt;
    }
    string_view contents{buff, static_cast<size_t>(len)};
    constexpr string_view key = "oom_kill ";
    for (size_t pos = 0; pos < contents.size();) {
        size_t end = contents.find('\n', pos);
        if (end == string_view::npos) {
            end = contents.size();
        }
        auto line = contents.substr(pos, end - pos);
        if (line.starts_with(key)) {
            return str2num<uint64_t>(line.substr(key.size()));
        }
        pos = end + 1;
    }
    return std::nullopt;
}

int ScopedCgroup::kill_all() const noexcept {
    if (!kill_fd_.is_open()) {
        return EBADF;
    }
    if (pwrite(kill_fd_, "1", 1, 0) != 1) {
        return errno;
    }
    return 0;
}

optional<string> ScopedCgroup::destroy() noexcept {
    if (!dir_fd_.is_open()) {
        return std::nullopt;
    }
    optional<string> res;
    try {
        if (int errnum = kill_all(); errnum != 0) {
            res = concat_tostr("cgroup ", path_, ": cgroup.kill failed", errmsg(errnum));
        }
        (void)kill_fd_.close();
        (void)memory_events_fd_.close();
        (void)dir_fd_.close();
        // Killed processes leave the cgroup asynchronously
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{2};
        while (unlinkat(parent_fd_, name_.c_str(), AT_REMOVEDIR)) {
            if (errno != EBUSY or std::chrono::steady_clock::now() > deadline) {
                res = concat_tostr("cgroup ", path_, ": rmdir failed", errmsg());
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{1});
        }
    } catch (const std::exception& e) {
        res = e.what();
    }
    return res;
}

ScopedCgroup::~ScopedCgroup() {
    if (auto err = destroy()) {
        try {
            errlog(*err);
        } catch (const std::exception&) { // NOLINT(bugprone-empty-catch)
            // Cannot report anyway
        }
    }
}

} // namespace jailer::cgroup
