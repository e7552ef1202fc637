#include <coderun/execute/language_executor/php.hh>

namespace coderun::execute::language_executor {

Php::Php(const Config& config)
: InterpretedLanguage{Language::PHP, config, ".php", {"php"}} {}

} // namespace coderun::execute::language_executor
