#pragma once

#include <optional>
#include <string>
#include <vector>

namespace jailer {

struct Command {
    std::vector<std::string> argv;
    // Path inside the sandbox, argv[0] if not set. There is no PATH lookup.
    std::optional<std::string> executable;
    // /dev/null is used for unset descriptors
    std::optional<int> stdin_fd;
    std::optional<int> stdout_fd;
    std::optional<int> stderr_fd;
    // Descriptors inherited by the command under the same numbers
    std::vector<int> pass_fds;
};

} // namespace jailer
