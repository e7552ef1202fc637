#include <coderun/execute/language_executor/ruby.hh>

namespace coderun::execute::language_executor {

Ruby::Ruby(const Config& config)
: InterpretedLanguage{Language::RUBY, config, ".rb", {"ruby"}} {}

} // namespace coderun::execute::language_executor
