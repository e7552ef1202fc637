#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace coderun::execute {

class LaunchError : public std::runtime_error {
public:
    using runtime_error::runtime_error;
};

struct CommandSpec {
    std::string executable; // looked up in PATH if it does not contain '/'
    std::vector<std::string> args; // args[0] is the program name
};

struct SpawnOptions {
    // Wall-clock deadline after which the whole process group of the child is
    // killed with SIGKILL, std::nullopt disables it
    std::optional<std::chrono::nanoseconds> real_time_limit = std::nullopt;
    // Maximum number of bytes captured from each of stdout and stderr, the
    // rest is read and discarded, std::nullopt means no limit
    std::optional<size_t> max_output_size = std::nullopt;
};

struct SpawnResult {
    std::string stdout_data;
    std::string stderr_data;
    // Exit status if the child exited, 128 + signal number if it was killed
    int exit_code = 0;
    std::chrono::nanoseconds runtime{0};
    bool killed_by_real_time_limit = false;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
};

/**
 * @brief Runs @p command with @p stdin_data as its standard input and
 *   captures its standard output and standard error
 * @details The child runs in a new process group. Writing stdin and reading
 *   stdout and stderr are multiplexed, so none of the pipes can fill up and
 *   deadlock the child. The whole @p stdin_data is delivered before the
 *   child's stdin is closed, unless the child stops reading it earlier (then
 *   the rest is dropped). Returns after the child has terminated and both its
 *   output streams reached end-of-file or the child was killed.
 *   This function is thread-safe. SIGPIPE is blocked in the calling thread
 *   for the duration of the call.
 *
 * @errors Throws LaunchError if the child cannot be created or @p command
 *   cannot be executed (e.g. it does not exist) and if any syscall fails
 */
SpawnResult spawn(
    const CommandSpec& command, std::string_view stdin_data, const SpawnOptions& options = {}
);

} // namespace coderun::execute
