#pragma once

#include <charconv>
#include <optional>
#include <string_view>
#include <type_traits>

// Converts the whole @p str to a number, returns std::nullopt on any error
template <class T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
constexpr std::optional<T> str2num(std::string_view str) noexcept {
    if (str.empty() or str.front() == '+') {
        return std::nullopt;
    }
    T res{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), res);
    if (ec != std::errc{} or ptr != str.data() + str.size()) {
        return std::nullopt;
    }
    return res;
}

constexpr bool is_space(char c) noexcept {
    return (c == ' ' or c == '\t' or c == '\n' or c == '\r' or c == '\f' or c == '\v');
}

constexpr bool is_alnum(char c) noexcept {
    return ((c >= '0' and c <= '9') or (c >= 'a' and c <= 'z') or (c >= 'A' and c <= 'Z'));
}

constexpr bool is_xdigit(char c) noexcept {
    return ((c >= '0' and c <= '9') or (c >= 'a' and c <= 'f') or (c >= 'A' and c <= 'F'));
}

constexpr int hex2dec(char c) noexcept {
    return (c >= '0' and c <= '9' ? c - '0' : (c >= 'a' and c <= 'f' ? c - 'a' : c - 'A') + 10);
}

constexpr char to_upper(char c) noexcept {
    return (c >= 'a' and c <= 'z' ? static_cast<char>(c - 'a' + 'A') : c);
}
