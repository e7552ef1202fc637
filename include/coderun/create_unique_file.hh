#pragma once

#include <coderun/file_descriptor.hh>
#include <cstddef>
#include <optional>
#include <string>
#include <sys/types.h>

/**
 * @brief Tries to create a file with path @p path in which bytes in range
 *   [@p random_part_pos, @p random_part_pos + @p random_part_len) are replaced
 *   randomly with lowercase Latin letters.
 *
 * @param dirfd if @p path is relative, then it will be interpreted relative to
 *   the directory referred by the file descriptor @p dirfd.
 * @param path path template, on success it holds the path of the created file
 * @param random_part_pos position of the part to replace randomly
 * @param random_part_len length of the part to replace randomly
 * @param open_flags flags that ORed with (O_EXCL | O_CREAT) will be passed to
 *   openat(2)
 * @param mode specifies the file mode bits applied when a new file is created
 *
 * @return On success file descriptor to the created file is returned. On error,
 *   std::nullopt is returned.
 *
 * @errors On error (std::nullopt is returned) errno is set to:
 *   - EEXIST if the file could not be created after a finite number of tries,
 *   - any other error returned by openat(2)
 */
std::optional<FileDescriptor> create_unique_file(
    int dirfd,
    std::string& path,
    size_t random_part_pos,
    size_t random_part_len,
    int open_flags,
    mode_t mode
) noexcept;
