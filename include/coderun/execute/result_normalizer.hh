#pragma once

#include <coderun/execute/spawner.hh>
#include <csignal>
#include <string>
#include <string_view>

namespace coderun::execute {

// Exit status reported by docker for a container killed with SIGKILL, e.g. by
// the OOM killer or by reaching the hard CPU time limit
constexpr int FORCED_TERMINATION_EXIT_CODE = 128 + SIGKILL;
// Exit status of a container whose process did not survive SIGXCPU
constexpr int CPU_TIME_LIMIT_EXIT_CODE = 128 + SIGXCPU;

// Appends @p note to @p stderr_data in a new line
void append_note(std::string& stderr_data, std::string_view note);

/**
 * @brief Explains the forced termination in stderr
 * @details If @p exit_code is FORCED_TERMINATION_EXIT_CODE, a note that the
 *   limits were likely exceeded is appended, otherwise @p stderr_data is
 *   returned unchanged. A program may exit with the same status on its own,
 *   it cannot be told apart by the exit code.
 */
std::string normalize_stderr(int exit_code, std::string stderr_data);

// Like normalize_stderr(int, std::string), but also explains SIGXCPU,
// the real time limit kill and the truncation of the outputs. After the real
// time limit kill only that kill is explained, whatever the exit code.
std::string normalize_stderr(const SpawnResult& res, const SpawnOptions& options);

} // namespace coderun::execute
