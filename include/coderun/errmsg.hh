#pragma once

#include <array>
#include <cerrno>
#include <coderun/concat_tostr.hh>
#include <cstring>
#include <string>

// Returns " - <error description> (os error <errnum>)"
inline std::string errmsg(int errnum) {
    // At the time of writing, the longest error description is 50 bytes in size
    std::array<char, 128> buff{};
    // GNU version of strerror_r() may return a static string instead of filling buff
    const char* errstr = strerror_r(errnum, buff.data(), buff.size());
    if (errstr == nullptr) {
        errstr = "Unknown error";
    }
    return concat_tostr(" - ", errstr, " (os error ", errnum, ')');
}

inline std::string errmsg() { return errmsg(errno); }
