#pragma once

#include <jailer/static_cstring_buff.hh>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

template <class T>
constexpr decltype(auto) stringify(T&& x) {
    if constexpr (std::is_integral_v<std::remove_cv_t<std::remove_reference_t<T>>>) {
        return ::to_string(x);
    } else {
        return std::forward<T>(x);
    }
}

template <class T>
constexpr inline bool is_string_argument =
    std::is_convertible_v<decltype(stringify(std::declval<T>())), std::string_view>;

template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
std::string concat_tostr(Args&&... args) {
    return [](auto&&... str) {
        size_t total_length = (0 + ... + std::string_view(str).size());
        std::string res;
        res.reserve(total_length);
        (res.append(std::string_view(str)), ...);
        return res;
    }(stringify(std::forward<Args>(args))...);
}

template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
std::string& back_insert(std::string& str, Args&&... args) {
    return [&str](auto&&... xx) -> std::string& {
        str.reserve(str.size() + (0 + ... + std::string_view(xx).size()));
        (str.append(std::string_view(xx)), ...);
        return str;
    }(stringify(std::forward<Args>(args))...);
}
