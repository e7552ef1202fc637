#pragma once

#include <cstddef>
#include <string>
#include <string_view>

/**
 * @brief Reads until @p count bytes are read, end-of-file is reached or an error
 *   occurs; retries on EINTR
 *
 * @return number of bytes read, if it is lower than @p count, errno is set to
 *   0 on end-of-file or to the error reported by read(2)
 */
[[nodiscard]] size_t read_all(int fd, void* buff, size_t count) noexcept;

/**
 * @brief Writes until @p count bytes are written or an error occurs; retries on
 *   EINTR
 *
 * @return number of bytes written, if it is lower than @p count, errno is set
 *   to the error reported by write(2)
 */
[[nodiscard]] size_t write_all(int fd, const void* buff, size_t count) noexcept;

[[nodiscard]] inline size_t write_all(int fd, std::string_view str) noexcept {
    return write_all(fd, str.data(), str.size());
}

// Reads everything until the end-of-file, throws on error
std::string get_file_contents(int fd);

// Reads the whole file @p file, throws on error
std::string get_file_contents(const char* file);

inline std::string get_file_contents(const std::string& file) {
    return get_file_contents(file.c_str());
}

// Creates or truncates @p file and writes @p data to it, throws on error
void put_file_contents(const char* file, std::string_view data);

inline void put_file_contents(const std::string& file, std::string_view data) {
    put_file_contents(file.c_str(), data);
}
