#pragma once

#include <coderun/execute/executor.hh>
#include <string>
#include <string_view>
#include <vector>

namespace coderun::execute {

// Language whose source file is run directly by an interpreter
class InterpretedLanguage : public Executor {
    std::string_view extension_;
    std::vector<std::string> interpreter_command_;

protected:
    // @p interpreter_command gets the source path appended as the last argument
    InterpretedLanguage(
        Language language,
        const Config& config,
        std::string_view extension,
        std::vector<std::string> interpreter_command
    );

public:
    [[nodiscard]] std::string_view file_extension() const noexcept final { return extension_; }

    [[nodiscard]] std::vector<std::string> runtime_command(std::string_view source_path
    ) const final;
};

} // namespace coderun::execute
