#pragma once

#include <jailer/file_descriptor.hh>
#include <optional>
#include <unistd.h>

struct Pipe {
    FileDescriptor readable;
    FileDescriptor writable;
};

// Returns std::nullopt on error with errno set appropriately
inline std::optional<Pipe> make_pipe(int flags) noexcept {
    int pfd[2];
    if (pipe2(pfd, flags)) {
        return std::nullopt;
    }
    return Pipe{
        .readable = FileDescriptor{pfd[0]},
        .writable = FileDescriptor{pfd[1]},
    };
}
