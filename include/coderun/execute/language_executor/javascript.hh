#pragma once

#include <coderun/execute/interpreted_language.hh>

namespace coderun::execute::language_executor {

class Javascript final : public InterpretedLanguage {
public:
    explicit Javascript(const Config& config);
};

} // namespace coderun::execute::language_executor
