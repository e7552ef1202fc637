#include <coderun/execute/language_executor/c_gcc.hh>

namespace coderun::execute::language_executor {

C_GCC::C_GCC(const Config& config)
: CompiledLanguage{Language::C, config, ".c", {"gcc", "-std=c17", "-O2"}, {"-lm"}} {}

} // namespace coderun::execute::language_executor
