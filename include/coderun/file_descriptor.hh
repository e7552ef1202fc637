#pragma once

#include <fcntl.h>
#include <unistd.h>

// Owns a file descriptor and closes it in the destructor. A closed
// FileDescriptor converts to -1, which e.g. poll(2) ignores.
class FileDescriptor {
    int fd_ = -1;

public:
    FileDescriptor() noexcept = default;

    explicit FileDescriptor(int fd) noexcept : fd_{fd} {}

    // Opens @p path like open(2), is_open() tells whether it succeeded
    FileDescriptor(const char* path, int flags, mode_t mode = 0644) noexcept
    : fd_{::open(path, flags, mode)} {}

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_{other.release()} {}

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        reset(other.release());
        return *this;
    }

    FileDescriptor& operator=(int fd) noexcept {
        reset(fd);
        return *this;
    }

    ~FileDescriptor() { reset(); }

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }

    explicit operator bool() const noexcept = delete;

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator int() const noexcept { return fd_; }

    [[nodiscard]] int release() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    // Closes the owned descriptor ignoring errors and takes ownership of @p fd
    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            (void)::close(fd_);
        }
        fd_ = fd;
    }

    // Returns the result of close(2), 0 if nothing was open
    [[nodiscard]] int close() noexcept {
        return is_open() ? ::close(release()) : 0;
    }

    // Adds O_NONBLOCK to the file status flags, returns -1 with errno set on error
    [[nodiscard]] int set_nonblocking() const noexcept {
        int flags = fcntl(fd_, F_GETFL);
        return flags == -1 ? -1 : fcntl(fd_, F_SETFL, flags | O_NONBLOCK);
    }
};
