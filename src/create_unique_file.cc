#include <cassert>
#include <cerrno>
#include <coderun/create_unique_file.hh>
#include <coderun/random.hh>
#include <exception>
#include <fcntl.h>

std::optional<FileDescriptor> create_unique_file(
    int dirfd,
    std::string& path,
    size_t random_part_pos,
    size_t random_part_len,
    int open_flags,
    mode_t mode
) noexcept {
    assert(random_part_pos + random_part_len <= path.size());

    FileDescriptor fd;
    const size_t tries = (random_part_len == 0 ? 1 : 256);
    for (size_t try_num = 0; try_num < tries; ++try_num) {
        try {
            for (size_t i = random_part_pos; i < random_part_pos + random_part_len; ++i) {
                path[i] = static_cast<char>(get_random<int>('a', 'z'));
            }
        } catch (const std::exception&) {
            errno = EAGAIN; // getrandom() failed
            return std::nullopt;
        }

        fd = openat(dirfd, path.c_str(), open_flags | O_EXCL | O_CREAT, mode);
        if (fd.is_open()) {
            return fd;
        }
        if (errno == EEXIST) {
            continue;
        }
        break;
    }
    return std::nullopt; // Could not create file or openat() error
}
