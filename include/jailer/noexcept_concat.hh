#pragma once

#include <cstddef>
#include <jailer/static_cstring_buff.hh>
#include <type_traits>

namespace detail {

template <class>
struct NoexceptStringMaxLength {};

template <size_t N>
struct NoexceptStringMaxLength<StaticCStringBuff<N>> : std::integral_constant<size_t, N> {};

template <size_t N>
struct NoexceptStringMaxLength<char[N]> : std::integral_constant<size_t, N - 1> {};

template <class T>
constexpr decltype(auto) noexcept_stringify(T&& x) noexcept {
    if constexpr (std::is_integral_v<std::remove_cv_t<std::remove_reference_t<T>>>) {
        return ::to_string(x);
    } else {
        return std::forward<T>(x);
    }
}

template <size_t N>
constexpr const char* noexcept_data(const StaticCStringBuff<N>& str) noexcept {
    return str.data();
}

template <size_t N>
constexpr size_t noexcept_length(const StaticCStringBuff<N>& str) noexcept {
    return str.size();
}

template <size_t N>
constexpr const char* noexcept_data(const char (&str)[N]) noexcept {
    return str;
}

template <size_t N>
constexpr size_t noexcept_length(const char (&/*str*/)[N]) noexcept {
    return N - 1;
}

} // namespace detail

// Concatenates string literals, StaticCStringBuffs and integers without
// allocating memory, the result has capacity for the longest possible output
template <class... Args>
[[nodiscard]] constexpr auto noexcept_concat(Args&&... args) noexcept {
    return [](auto&&... str) {
        StaticCStringBuff<(
            detail::NoexceptStringMaxLength<std::remove_cvref_t<decltype(str)>>::value + ... + 0
        )>
            res;
        auto append = [&](const auto& s) noexcept {
            const char* data = detail::noexcept_data(s);
            for (size_t len = detail::noexcept_length(s); len > 0; --len) {
                res[res.len_++] = *(data++);
            }
        };
        (append(str), ...);
        res[res.len_] = '\0';
        return res;
    }(detail::noexcept_stringify(std::forward<Args>(args))...);
}
