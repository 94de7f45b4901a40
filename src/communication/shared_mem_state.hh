#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <exception>
#include <jailer/si.hh>
#include <jailer/static_cstring_buff.hh>
#include <new>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

// State shared between the supervisor, the sandbox init process and the tracee.
// Children write it without allocating, the supervisor reads it after they die.
namespace jailer::communication {

constexpr size_t shared_mem_state_sizeof = 4096;

struct SharedMemState {
    struct Time {
        int64_t seconds; // < 0 indicates no value
        uint32_t nanoseconds;
    };

    Time tracee_exec_start_time; // CLOCK_MONOTONIC just before execve()
    Time tracee_waitid_time; // CLOCK_MONOTONIC after the tracee was reaped
    uint64_t tracee_cpu_time_usec; // 0 indicates no value, otherwise value + 1
    int32_t tracee_si_code;
    int32_t tracee_si_status;
    int16_t tracee_si_set;
    int16_t error_len;
    char error_description
        [shared_mem_state_sizeof - sizeof(Time) * 2 - sizeof(uint64_t) - sizeof(int32_t) * 2 -
         sizeof(int16_t) * 2];
};

static_assert(sizeof(SharedMemState) == shared_mem_state_sizeof);
static_assert(std::is_trivially_destructible_v<SharedMemState>);

inline volatile SharedMemState* initialize(void* raw) noexcept {
    if (reinterpret_cast<std::uintptr_t>(raw) % alignof(SharedMemState) != 0) {
        std::terminate();
    }
    return new (raw) SharedMemState{
        .tracee_exec_start_time = {.seconds = -1, .nanoseconds = 0},
        .tracee_waitid_time = {.seconds = -1, .nanoseconds = 0},
        .tracee_cpu_time_usec = 0,
        .tracee_si_code = 0,
        .tracee_si_status = 0,
        .tracee_si_set = 0,
        .error_len = 0,
        .error_description = {},
    };
}

inline void write(volatile SharedMemState::Time& time, timespec ts) noexcept {
    time.nanoseconds = static_cast<uint32_t>(ts.tv_nsec);
    time.seconds = ts.tv_sec;
}

inline std::optional<timespec> read(const volatile SharedMemState::Time& time) noexcept {
    if (time.seconds < 0) {
        return std::nullopt;
    }
    return timespec{.tv_sec = time.seconds, .tv_nsec = time.nanoseconds};
}

inline void write_tracee_result(
    volatile SharedMemState* state, const Si& si, std::optional<uint64_t> cpu_time_usec
) noexcept {
    state->tracee_si_code = si.code;
    state->tracee_si_status = si.status;
    state->tracee_cpu_time_usec = cpu_time_usec ? *cpu_time_usec + 1 : 0;
    state->tracee_si_set = 1;
}

inline std::optional<Si> read_tracee_si(const volatile SharedMemState* state) noexcept {
    if (!state->tracee_si_set) {
        return std::nullopt;
    }
    return Si{.code = state->tracee_si_code, .status = state->tracee_si_status};
}

inline std::optional<uint64_t> read_tracee_cpu_time_usec(const volatile SharedMemState* state
) noexcept {
    if (state->tracee_cpu_time_usec == 0) {
        return std::nullopt;
    }
    return state->tracee_cpu_time_usec - 1;
}

namespace detail {

inline std::string_view as_error_piece(const char* str) noexcept { return str; }

template <size_t N>
std::string_view as_error_piece(const StaticCStringBuff<N>& str) noexcept {
    return str;
}

} // namespace detail

// Only the first error is kept, the message is truncated if it does not fit
template <class... Args>
void write_error(volatile SharedMemState* state, const Args&... msg) noexcept {
    if (state->error_len > 0) {
        return;
    }
    size_t len = 0;
    auto append = [&](std::string_view str) noexcept {
        size_t n = std::min(str.size(), sizeof(state->error_description) - len);
        for (size_t i = 0; i < n; ++i) {
            state->error_description[len++] = str[i];
        }
    };
    auto piece = [](const auto& x) noexcept {
        if constexpr (std::is_integral_v<std::remove_cvref_t<decltype(x)>>) {
            return ::to_string(x);
        } else {
            return detail::as_error_piece(x);
        }
    };
    (append(piece(msg)), ...);
    state->error_len = static_cast<int16_t>(len);
}

inline std::optional<std::string> read_error(const volatile SharedMemState* state) {
    if (state->error_len <= 0) {
        return std::nullopt;
    }
    auto len = std::min<size_t>(state->error_len, sizeof(state->error_description));
    std::string res(len, '\0');
    for (size_t i = 0; i < len; ++i) {
        res[i] = state->error_description[i];
    }
    return res;
}

} // namespace jailer::communication
