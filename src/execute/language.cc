#include <coderun/execute/language.hh>

namespace coderun::execute {

std::string_view to_str(Language language) noexcept {
    switch (language) {
    case Language::PHP: return "php";
    case Language::PYTHON: return "python";
    case Language::JAVASCRIPT: return "javascript";
    case Language::RUBY: return "ruby";
    case Language::BASH: return "bash";
    case Language::C: return "c";
    case Language::CPP: return "cpp";
    }
    return "unknown";
}

std::optional<Language> language_from_str(std::string_view str) noexcept {
    for (auto language : all_languages) {
        if (to_str(language) == str) {
            return language;
        }
    }
    return std::nullopt;
}

} // namespace coderun::execute
