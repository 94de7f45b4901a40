#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>

// Fixed capacity, null-terminated string usable where allocation is forbidden
// (e.g. between clone() and execve())
template <size_t N>
class StaticCStringBuff {
    std::array<char, N + 1> str_{'\0'};

public:
    size_t len_ = 0;

    StaticCStringBuff() = default;

    template <size_t M, std::enable_if_t<M <= N + 1, int> = 0>
    explicit constexpr StaticCStringBuff(const char (&str)[M]) {
        while (len_ < M - 1) {
            str_[len_] = str[len_];
            ++len_;
        }
        str_[len_] = '\0';
    }

    template <size_t M, std::enable_if_t<M <= N, int> = 0>
    // NOLINTNEXTLINE(google-explicit-constructor)
    constexpr StaticCStringBuff(const StaticCStringBuff<M>& other) noexcept : len_(other.len_) {
        for (size_t i = 0; i < len_; ++i) {
            str_[i] = other[i];
        }
        str_[len_] = '\0';
    }

    StaticCStringBuff(const StaticCStringBuff&) noexcept = default;
    StaticCStringBuff(StaticCStringBuff&&) noexcept = default;
    StaticCStringBuff& operator=(const StaticCStringBuff&) noexcept = default;
    StaticCStringBuff& operator=(StaticCStringBuff&&) noexcept = default;
    ~StaticCStringBuff() = default;

    [[nodiscard]] constexpr bool is_empty() const noexcept { return len_ == 0; }

    [[nodiscard]] constexpr size_t size() const noexcept { return len_; }

    [[nodiscard]] static constexpr size_t max_size() noexcept { return N; }

    constexpr char* data() noexcept { return str_.data(); }

    [[nodiscard]] constexpr const char* data() const noexcept { return str_.data(); }

    [[nodiscard]] constexpr const char* c_str() const noexcept { return data(); }

    // NOLINTNEXTLINE(google-explicit-constructor)
    [[nodiscard]] constexpr operator std::string_view() const noexcept { return {data(), size()}; }

    constexpr auto begin() noexcept { return str_.begin(); }

    [[nodiscard]] constexpr auto begin() const noexcept { return str_.begin(); }

    constexpr auto end() noexcept { return begin() + len_; }

    [[nodiscard]] constexpr auto end() const noexcept { return begin() + len_; }

    constexpr char& operator[](size_t n) noexcept { return str_[n]; }

    constexpr const char& operator[](size_t n) const noexcept { return str_[n]; }
};

template <size_t N>
StaticCStringBuff(const char (&str)[N]) -> StaticCStringBuff<N - 1>;

template <size_t N>
std::string& operator+=(std::string& str, const StaticCStringBuff<N>& buff) {
    return str.append(buff.data(), buff.size());
}

template <
    class T,
    std::enable_if_t<
        std::is_integral_v<T> and !std::is_same_v<T, bool> and !std::is_same_v<T, char>,
        int> = 0>
constexpr auto to_string(T x) noexcept {
    constexpr size_t max_digits = std::numeric_limits<T>::digits10 + 1;
    StaticCStringBuff<max_digits + std::is_signed_v<T>> res;
    if (x == 0) {
        res[res.len_++] = '0';
    }
    bool negative = x < 0;
    while (x != 0) {
        auto digit = x % 10;
        res[res.len_++] = static_cast<char>('0' + (digit < 0 ? -digit : digit));
        x /= 10;
    }
    if (negative) {
        res[res.len_++] = '-';
    }
    std::reverse(res.begin(), res.end());
    res[res.len_] = '\0';
    return res;
}

constexpr auto to_string(char c) noexcept {
    StaticCStringBuff<1> res;
    res[0] = c;
    res[1] = '\0';
    res.len_ = 1;
    return res;
}

constexpr auto to_string(bool x) noexcept {
    return x ? StaticCStringBuff<5>{"true"} : StaticCStringBuff<5>{"false"};
}
