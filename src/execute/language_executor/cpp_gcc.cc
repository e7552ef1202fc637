#include <coderun/execute/language_executor/cpp_gcc.hh>

namespace coderun::execute::language_executor {

Cpp_GCC::Cpp_GCC(const Config& config)
: CompiledLanguage{Language::CPP, config, ".cpp", {"g++", "-std=c++20", "-O2"}} {}

} // namespace coderun::execute::language_executor
