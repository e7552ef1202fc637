#pragma once

#include <coderun/execute/interpreted_language.hh>

namespace coderun::execute::language_executor {

class Php final : public InterpretedLanguage {
public:
    explicit Php(const Config& config);
};

} // namespace coderun::execute::language_executor
