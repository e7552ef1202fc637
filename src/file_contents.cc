#include <array>
#include <cerrno>
#include <coderun/errmsg.hh>
#include <coderun/file_contents.hh>
#include <coderun/file_descriptor.hh>
#include <coderun/macros/throw.hh>
#include <fcntl.h>
#include <unistd.h>

size_t read_all(int fd, void* buff, size_t count) noexcept {
    size_t pos = 0;
    errno = 0;
    while (pos < count) {
        ssize_t k = read(fd, static_cast<char*>(buff) + pos, count - pos);
        if (k > 0) {
            pos += k;
        } else if (k == 0) {
            errno = 0; // End of file
            break;
        } else if (errno != EINTR) {
            break;
        }
    }
    return pos;
}

size_t write_all(int fd, const void* buff, size_t count) noexcept {
    size_t pos = 0;
    errno = 0;
    while (pos < count) {
        ssize_t k = write(fd, static_cast<const char*>(buff) + pos, count - pos);
        if (k >= 0) {
            pos += k;
        } else if (errno != EINTR) {
            break;
        }
    }
    return pos;
}

std::string get_file_contents(int fd) {
    std::string res;
    std::array<char, 65536> buff{};
    for (;;) {
        size_t len = read_all(fd, buff.data(), buff.size());
        int errnum = errno;
        res.append(buff.data(), len);
        if (len < buff.size()) {
            if (errnum != 0) {
                THROW("read()", errmsg(errnum));
            }
            return res;
        }
    }
}

std::string get_file_contents(const char* file) {
    FileDescriptor fd{file, O_RDONLY | O_CLOEXEC};
    if (not fd.is_open()) {
        THROW("open('", file, "')", errmsg());
    }
    return get_file_contents(fd);
}

void put_file_contents(const char* file, std::string_view data) {
    FileDescriptor fd{file, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC};
    if (not fd.is_open()) {
        THROW("open('", file, "')", errmsg());
    }
    if (write_all(fd, data) != data.size()) {
        THROW("write()", errmsg());
    }
}
