#pragma once

#include <string>

namespace jailer {

// Exit status of a process as reported by waitid()
struct Si {
    int code; // siginfo_t::si_code
    int status; // siginfo_t::si_status

    [[nodiscard]] std::string description() const;

    [[nodiscard]] bool exited() const noexcept;

    [[nodiscard]] bool killed_by_signal() const noexcept;

    friend bool operator==(const Si&, const Si&) = default;
};

} // namespace jailer
