#include <coderun/concat_tostr.hh>
#include <coderun/config_file.hh>
#include <coderun/execute/config.hh>
#include <coderun/execute/language.hh>
#include <coderun/execute/registry.hh>
#include <coderun/file_contents.hh>
#include <coderun/file_info.hh>
#include <coderun/logger.hh>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <unistd.h>

using coderun::execute::Config;
using coderun::execute::ExecutionRequest;
using coderun::execute::Registry;
using std::string;
using std::string_view;

namespace {

constexpr const char* DEFAULT_CONFIG_FILE = "coderun.conf";

struct CmdOptions {
    std::optional<string> config_file;
    std::optional<string> log_file;
    bool verbose = false;
    bool show_help = false;
    bool list_languages = false;
};

void help(const char* program_name) {
    if (not program_name) {
        program_name = "coderun";
    }

    // clang-format off
    (void)write_all(STDOUT_FILENO, concat_tostr(
        "Usage: ", program_name, " [options] <language> <source file>\n"
        "Runs the program from <source file> in an isolated container. Standard input\n"
        "is passed to the program, its standard output and standard error are printed.\n"
        "Options:\n"
        "  -c <file>     Read configuration from <file> (default: ", DEFAULT_CONFIG_FILE, " if\n"
        "                  it exists)\n"
        "  -h, --help    Display this information\n"
        "  -l <file>     Append logs to <file> instead of the standard error\n"
        "  --languages   List supported languages\n"
        "  -v            Log every execution\n"
    ));
    // clang-format on
}

// Removes parsed options from argv, returns std::nullopt on invalid options
std::optional<CmdOptions> parse_cmd_options(int& argc, char** argv) {
    CmdOptions cmd_options;
    int new_argc = 1;
    for (int i = 1; i < argc; ++i) {
        string_view arg = argv[i];
        if (arg == "-h" or arg == "--help") {
            cmd_options.show_help = true;
        } else if (arg == "-v") {
            cmd_options.verbose = true;
        } else if (arg == "--languages") {
            cmd_options.list_languages = true;
        } else if (arg == "-c" or arg == "-l") {
            if (i + 1 == argc) {
                errlog("Option ", arg, " requires an argument");
                return std::nullopt;
            }
            (arg == "-c" ? cmd_options.config_file : cmd_options.log_file) = argv[++i];
        } else if (arg.size() > 1 and arg.front() == '-') {
            errlog("Unknown option: ", arg);
            return std::nullopt;
        } else {
            argv[new_argc++] = argv[i];
        }
    }
    argv[new_argc] = nullptr;
    argc = new_argc;
    return cmd_options;
}

std::optional<Config> load_config(const CmdOptions& cmd_options) {
    try {
        if (cmd_options.config_file) {
            return Config::load(*cmd_options.config_file);
        }
        if (path_exists(DEFAULT_CONFIG_FILE)) {
            return Config::load(DEFAULT_CONFIG_FILE);
        }
        return Config::load_without_file();
    } catch (const ConfigFile::ParseError& e) {
        errlog("Invalid configuration file: ", e.what(), '\n', e.diagnostics());
    } catch (const std::exception& e) {
        errlog("Invalid configuration: ", e.what());
    }
    return std::nullopt;
}

} // namespace

int main(int argc, char** argv) {
    auto cmd_options = parse_cmd_options(argc, argv);
    if (not cmd_options) {
        help(argv[0]);
        return 1;
    }
    if (cmd_options->show_help) {
        help(argv[0]);
        return 0;
    }
    if (cmd_options->list_languages) {
        for (auto language : coderun::execute::all_languages) {
            (void)write_all(STDOUT_FILENO, concat_tostr(coderun::execute::to_str(language), '\n'));
        }
        return 0;
    }

    if (cmd_options->log_file) {
        try {
            stdlog.open(cmd_options->log_file->c_str());
            errlog.open(cmd_options->log_file->c_str());
        } catch (const std::exception& e) {
            errlog(e.what());
            return 1;
        }
    }

    if (argc != 3) {
        help(argv[0]);
        return 1;
    }
    auto language = coderun::execute::language_from_str(argv[1]);
    if (not language) {
        errlog("Unsupported language: ", argv[1]);
        return 1;
    }

    auto config = load_config(*cmd_options);
    if (not config) {
        return 1;
    }
    config->log_executions = cmd_options->verbose;

    ExecutionRequest request;
    try {
        request.code = get_file_contents(argv[2]);
        request.stdin_data = get_file_contents(STDIN_FILENO);
    } catch (const std::exception& e) {
        errlog(e.what());
        return 1;
    }

    auto result = [&] {
        try {
            Registry registry{*config};
            return registry.execute(*language, request);
        } catch (const std::exception& e) {
            errlog(e.what());
            return coderun::execute::ExecutionResult{
                .stdout_data = "",
                .stderr_data = concat_tostr("Internal error: ", e.what()),
            };
        }
    }();

    if (write_all(STDOUT_FILENO, result.stdout_data) != result.stdout_data.size()) {
        return 1;
    }
    if (write_all(STDERR_FILENO, result.stderr_data) != result.stderr_data.size()) {
        return 1;
    }
    return 0;
}
