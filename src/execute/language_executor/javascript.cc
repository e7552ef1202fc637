#include <coderun/execute/language_executor/javascript.hh>

namespace coderun::execute::language_executor {

Javascript::Javascript(const Config& config)
: InterpretedLanguage{Language::JAVASCRIPT, config, ".js", {"node"}} {}

} // namespace coderun::execute::language_executor
