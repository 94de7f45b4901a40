#pragma once

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <jailer/static_cstring_buff.hh>

// Returns " - <error description> (os error <errnum>)"
inline auto errmsg(int errnum) noexcept {
    constexpr auto prefix = StaticCStringBuff{" - "};
    constexpr size_t max_description_len = 64;
    constexpr auto infix = StaticCStringBuff{" (os error "};
    auto errnum_str = to_string(errnum);
    constexpr auto suffix = StaticCStringBuff{")"};
    StaticCStringBuff<
        prefix.size() + max_description_len + infix.size() + decltype(errnum_str)::max_size() +
        suffix.size()>
        res;
    auto append = [&res](std::string_view s) noexcept {
        for (char c : s) {
            res[res.len_++] = c;
        }
    };
    append(prefix);
    // GNU strerror_r() may or may not use the supplied buffer
    char buff[max_description_len];
    const char* description = strerror_r(errnum, buff, sizeof(buff));
    if (description == nullptr) {
        description = "Unknown error";
    }
    append(std::string_view{description}.substr(0, max_description_len));
    append(infix);
    append(errnum_str);
    append(suffix);
    res[res.len_] = '\0';
    return res;
}

inline auto errmsg() noexcept { return errmsg(errno); }
