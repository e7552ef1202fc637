#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace coderun::execute {

enum class Language : uint8_t {
    PHP,
    PYTHON,
    JAVASCRIPT,
    RUBY,
    BASH,
    C,
    CPP,
};

constexpr std::array all_languages = {
    Language::PHP,
    Language::PYTHON,
    Language::JAVASCRIPT,
    Language::RUBY,
    Language::BASH,
    Language::C,
    Language::CPP,
};

// Returns the identifier used in configuration and by callers e.g. "php"
[[nodiscard]] std::string_view to_str(Language language) noexcept;

// Returns std::nullopt if @p str does not name a supported language
[[nodiscard]] std::optional<Language> language_from_str(std::string_view str) noexcept;

} // namespace coderun::execute
