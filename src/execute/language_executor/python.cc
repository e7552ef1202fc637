#include <coderun/execute/language_executor/python.hh>

namespace coderun::execute::language_executor {

Python::Python(const Config& config)
: InterpretedLanguage{Language::PYTHON, config, ".py", {"python3"}} {}

} // namespace coderun::execute::language_executor
