#include <coderun/concat_tostr.hh>
#include <coderun/execute/compiled_language.hh>

using std::string;
using std::string_view;
using std::vector;

namespace coderun::execute {

CompiledLanguage::CompiledLanguage(
    Language language,
    const Config& config,
    string_view extension,
    vector<string> compiler_command,
    vector<string> link_flags
)
: Executor{language, config}
, extension_{extension}
, compiler_command_{std::move(compiler_command)}
, link_flags_{std::move(link_flags)} {}

vector<string> CompiledLanguage::runtime_command(string_view source_path) const {
    string script;
    for (const auto& arg : compiler_command_) {
        back_insert(script, arg, ' ');
    }
    back_insert(script, "-o ", EXECUTABLE_PATH, ' ', source_path);
    for (const auto& flag : link_flags_) {
        back_insert(script, ' ', flag);
    }
    back_insert(script, " && exec ", EXECUTABLE_PATH);
    return {"sh", "-c", std::move(script)};
}

} // namespace coderun::execute
