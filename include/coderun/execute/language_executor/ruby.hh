#pragma once

#include <coderun/execute/interpreted_language.hh>

namespace coderun::execute::language_executor {

class Ruby final : public InterpretedLanguage {
public:
    explicit Ruby(const Config& config);
};

} // namespace coderun::execute::language_executor
