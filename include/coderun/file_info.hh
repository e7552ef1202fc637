#pragma once

#include <string>
#include <sys/stat.h>

inline bool path_exists(const char* path) noexcept {
    struct stat64 st = {};
    return stat64(path, &st) == 0;
}

inline bool is_regular_file(const char* path) noexcept {
    struct stat64 st = {};
    return (stat64(path, &st) == 0 and S_ISREG(st.st_mode));
}

inline bool is_directory(const char* path) noexcept {
    struct stat64 st = {};
    return (stat64(path, &st) == 0 and S_ISDIR(st.st_mode));
}

inline bool path_exists(const std::string& path) noexcept { return path_exists(path.c_str()); }

inline bool is_regular_file(const std::string& path) noexcept {
    return is_regular_file(path.c_str());
}

inline bool is_directory(const std::string& path) noexcept { return is_directory(path.c_str()); }
