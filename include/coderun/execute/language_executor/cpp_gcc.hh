#pragma once

#include <coderun/execute/compiled_language.hh>

namespace coderun::execute::language_executor {

class Cpp_GCC final : public CompiledLanguage {
public:
    explicit Cpp_GCC(const Config& config);
};

} // namespace coderun::execute::language_executor
