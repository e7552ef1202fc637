#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace detail {

inline std::string_view stringify(const char* str) noexcept { return str; }

inline std::string_view stringify(std::string_view str) noexcept { return str; }

inline const std::string& stringify(const std::string& str) noexcept { return str; }

inline std::string stringify(char c) { return std::string(1, c); }

inline std::string_view stringify(bool b) noexcept { return b ? "true" : "false"; }

template <
    class T,
    std::enable_if_t<
        std::is_integral_v<T> and not std::is_same_v<T, char> and not std::is_same_v<T, bool>,
        int> = 0>
std::string stringify(T x) {
    return std::to_string(x);
}

} // namespace detail

template <class... Args>
std::string concat_tostr(Args&&... args) {
    return [](auto&&... str) {
        size_t total_length = (size_t{0} + ... + std::string_view{str}.size());
        std::string res;
        res.reserve(total_length);
        (res.append(std::string_view{str}), ...);
        return res;
    }(detail::stringify(std::forward<Args>(args))...);
}

template <class... Args>
std::string& back_insert(std::string& str, Args&&... args) {
    return [&str](auto&&... xx) -> std::string& {
        str.reserve(str.size() + (size_t{0} + ... + std::string_view{xx}.size()));
        (str.append(std::string_view{xx}), ...);
        return str;
    }(detail::stringify(std::forward<Args>(args))...);
}
