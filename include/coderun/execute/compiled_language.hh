#pragma once

#include <coderun/execute/executor.hh>
#include <string>
#include <string_view>
#include <vector>

namespace coderun::execute {

// Language compiled inside the container to EXECUTABLE_PATH which is then run
// in place of the shell, so the program receives stdin and signals directly
class CompiledLanguage : public Executor {
    std::string_view extension_;
    std::vector<std::string> compiler_command_;
    std::vector<std::string> link_flags_;

protected:
    CompiledLanguage(
        Language language,
        const Config& config,
        std::string_view extension,
        std::vector<std::string> compiler_command,
        std::vector<std::string> link_flags = {}
    );

public:
    static constexpr std::string_view EXECUTABLE_PATH = "/tmp/program";

    [[nodiscard]] std::string_view file_extension() const noexcept final { return extension_; }

    // sh -c '<compiler command> -o EXECUTABLE_PATH <source> <link flags> &&
    // exec EXECUTABLE_PATH'
    [[nodiscard]] std::vector<std::string> runtime_command(std::string_view source_path
    ) const final;
};

} // namespace coderun::execute
