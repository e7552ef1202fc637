#pragma once

#include <coderun/execute/interpreted_language.hh>

namespace coderun::execute::language_executor {

class Bash final : public InterpretedLanguage {
public:
    explicit Bash(const Config& config);
};

} // namespace coderun::execute::language_executor
