#pragma once

#include <string>

namespace coderun::execute {

struct ExecutionRequest {
    std::string code;
    std::string stdin_data;
};

// Both streams are best-effort captures of what the program emitted before it
// terminated; failures are reported in stderr_data
struct ExecutionResult {
    std::string stdout_data;
    std::string stderr_data;
};

} // namespace coderun::execute
