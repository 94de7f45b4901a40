#pragma once

#include <charconv>
#include <optional>
#include <string_view>
#include <type_traits>

// Parses the whole @p str as a decimal number
template <class T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
constexpr std::optional<T> str2num(std::string_view str) noexcept {
    if (str.empty() or str.front() == '+') {
        return std::nullopt;
    }
    T res{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), res);
    if (ec != std::errc{} or ptr != str.data() + str.size()) {
        return std::nullopt;
    }
    return res;
}
