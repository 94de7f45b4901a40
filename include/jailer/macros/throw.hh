#pragma once

#include <jailer/concat_tostr.hh>
#include <jailer/macros/stringify.hh>
#include <stdexcept>

// Appends the place of the throw to the message
#define THROW(...)                                                                     \
    throw std::runtime_error(                                                          \
        concat_tostr(__VA_ARGS__, " (thrown at " __FILE__ ":" STRINGIFY(__LINE__) ")") \
    )
