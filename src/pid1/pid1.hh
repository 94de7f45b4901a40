#pragma once

#include "../communication/shared_mem_state.hh"
#include "../tracee/tracee.hh"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace jailer::pid1 {

struct Args {
    volatile communication::SharedMemState* shared_mem_state;
    int supervisor_pidfd;
    std::vector<int> surviving_fds; // sorted, all other fds are closed at start

    struct UserNamespace {
        bool enabled;
        uid_t outside_uid;
        gid_t outside_gid;
    } user_ns;

    std::optional<std::string> hostname;
    bool bring_up_loopback;

    struct Mount {
        struct Root {
            std::optional<std::string> source; // tmpfs if not set
        };

        struct BindMount {
            std::string source;
            std::string dest; // mutable: used to create missing directories
            bool source_is_dir;
            bool read_only;
        };

        struct MountTmpfs {
            std::string dest;
            std::string options;
            bool read_only;
        };

        struct MountFilesystem {
            std::string source;
            std::string dest;
            std::string fs_type;
            std::string options;
            bool read_only;
        };

        struct CreateSymlink {
            std::string target;
            std::string link_path;
        };

        struct MountProc {
            std::string path;
            bool read_only;
        };

        using Operation =
            std::variant<BindMount, MountTmpfs, MountFilesystem, CreateSymlink, MountProc>;

        bool enabled;
        std::string new_root_path; // all paths below are inside it
        Root root;
        std::vector<Operation> operations;
        bool root_read_only;
    } mount;

    uint64_t tracee_clone_flags;
    tracee::Args tracee;
};

[[noreturn]] void main(Args& args) noexcept;

} // namespace jailer::pid1
