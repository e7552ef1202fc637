#include <coderun/execute/interpreted_language.hh>

namespace coderun::execute {

InterpretedLanguage::InterpretedLanguage(
    Language language,
    const Config& config,
    std::string_view extension,
    std::vector<std::string> interpreter_command
)
: Executor{language, config}
, extension_{extension}
, interpreter_command_{std::move(interpreter_command)} {}

std::vector<std::string> InterpretedLanguage::runtime_command(std::string_view source_path
) const {
    auto command = interpreter_command_;
    command.emplace_back(source_path);
    return command;
}

} // namespace coderun::execute
