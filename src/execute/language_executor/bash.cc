#include <coderun/execute/language_executor/bash.hh>

namespace coderun::execute::language_executor {

Bash::Bash(const Config& config)
: InterpretedLanguage{Language::BASH, config, ".sh", {"bash"}} {}

} // namespace coderun::execute::language_executor
