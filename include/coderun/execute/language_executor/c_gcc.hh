#pragma once

#include <coderun/execute/compiled_language.hh>

namespace coderun::execute::language_executor {

// C17 compiled with gcc, linked with libm
class C_GCC final : public CompiledLanguage {
public:
    explicit C_GCC(const Config& config);
};

} // namespace coderun::execute::language_executor
