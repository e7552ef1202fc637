#pragma once

#include <coderun/file_descriptor.hh>
#include <fcntl.h>
#include <optional>
#include <unistd.h>

// Both ends of a pipe(2), data written to writable can be read from readable
struct Pipe {
    FileDescriptor readable;
    FileDescriptor writable;
};

// Like pipe2(2) with @p flags, returns std::nullopt and sets errno on error
inline std::optional<Pipe> open_pipe(int flags = O_CLOEXEC) noexcept {
    int fds[2];
    if (::pipe2(fds, flags)) {
        return std::nullopt;
    }
    return Pipe{
        .readable = FileDescriptor{fds[0]},
        .writable = FileDescriptor{fds[1]},
    };
}
