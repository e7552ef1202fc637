#pragma once

#include <coderun/execute/interpreted_language.hh>

namespace coderun::execute::language_executor {

class Python final : public InterpretedLanguage {
public:
    explicit Python(const Config& config);
};

} // namespace coderun::execute::language_executor
