#include <coderun/execute/language_executor/bash.hh>
#include <coderun/execute/language_executor/c_gcc.hh>
#include <coderun/execute/language_executor/cpp_gcc.hh>
#include <coderun/execute/language_executor/javascript.hh>
#include <coderun/execute/language_executor/php.hh>
#include <coderun/execute/language_executor/python.hh>
#include <coderun/execute/language_executor/ruby.hh>
#include <coderun/execute/registry.hh>
#include <coderun/macros/throw.hh>
#include <type_traits>

namespace coderun::execute {

std::unique_ptr<Executor> make_executor(Language language, const Config& config) {
    using namespace language_executor;
    switch (language) {
    case Language::PHP: return std::make_unique<Php>(config);
    case Language::PYTHON: return std::make_unique<Python>(config);
    case Language::JAVASCRIPT: return std::make_unique<Javascript>(config);
    case Language::RUBY: return std::make_unique<Ruby>(config);
    case Language::BASH: return std::make_unique<Bash>(config);
    case Language::C: return std::make_unique<C_GCC>(config);
    case Language::CPP: return std::make_unique<Cpp_GCC>(config);
    }
    THROW("Unsupported language: ", static_cast<std::underlying_type_t<Language>>(language));
}

Registry::Registry(const Config& config) {
    executors_.reserve(all_languages.size());
    for (auto language : all_languages) {
        executors_.emplace_back(make_executor(language, config));
    }
}

const Executor& Registry::resolve(Language language) const {
    auto idx = static_cast<size_t>(language);
    if (idx >= executors_.size()) {
        THROW("Unsupported language: ", idx);
    }
    return *executors_[idx];
}

} // namespace coderun::execute
