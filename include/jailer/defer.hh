#pragma once

#include <utility>

// Runs @p func on scope exit, @p func must not throw
template <class Func>
class Defer {
    Func func_;

public:
    // NOLINTNEXTLINE(google-explicit-constructor)
    Defer(Func func) : func_(std::move(func)) {}

    Defer(const Defer&) = delete;
    Defer(Defer&&) = delete;
    Defer& operator=(const Defer&) = delete;
    Defer& operator=(Defer&&) = delete;

    ~Defer() { func_(); }
};
