#pragma once

#include <type_traits>
#include <utility>
#include <variant>

template <class T>
struct Ok {
    T val;

    constexpr explicit Ok(T val) noexcept(std::is_nothrow_move_constructible_v<T>)
    : val{std::move(val)} {}
};

template <>
struct Ok<void> {
    constexpr Ok() noexcept = default;
};

Ok() -> Ok<void>;

template <class T>
struct Err {
    T err;

    constexpr explicit Err(T err) noexcept(std::is_nothrow_move_constructible_v<T>)
    : err{std::move(err)} {}
};

template <>
struct Err<void> {
    constexpr Err() noexcept = default;
};

Err() -> Err<void>;

template <class T, class E>
struct Result : std::variant<Ok<T>, Err<E>> {
    // NOLINTNEXTLINE(google-explicit-constructor)
    constexpr Result(Ok<T> ok) : std::variant<Ok<T>, Err<E>>{std::move(ok)} {}

    // NOLINTNEXTLINE(google-explicit-constructor)
    constexpr Result(Err<E> err) : std::variant<Ok<T>, Err<E>>{std::move(err)} {}

    [[nodiscard]] constexpr bool is_ok() const noexcept {
        return std::holds_alternative<Ok<T>>(*this);
    }

    [[nodiscard]] constexpr bool is_err() const noexcept {
        return std::holds_alternative<Err<E>>(*this);
    }

    [[nodiscard]] constexpr decltype(auto) ok() const& { return (std::get<Ok<T>>(*this).val); }

    [[nodiscard]] constexpr decltype(auto) err() const& { return (std::get<Err<E>>(*this).err); }

    constexpr T unwrap() && {
        if constexpr (!std::is_same_v<T, void>) {
            return std::get<Ok<T>>(std::move(*this)).val;
        }
    }

    constexpr E unwrap_err() && {
        if constexpr (!std::is_same_v<E, void>) {
            return std::get<Err<E>>(std::move(*this)).err;
        }
    }
};
