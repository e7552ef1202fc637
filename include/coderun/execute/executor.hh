#pragma once

#include <coderun/execute/config.hh>
#include <coderun/execute/execution.hh>
#include <coderun/execute/language.hh>
#include <coderun/execute/spawner.hh>
#include <coderun/execute/workspace.hh>
#include <string>
#include <string_view>
#include <vector>

namespace coderun::execute {

// Runs untrusted code of one language in a fresh, isolated container
class Executor {
    Language language_;
    std::string image_;
    ResourceLimits limits_;
    int pids_limit_;
    std::string docker_executable_;
    Workspace workspace_;
    bool log_executions_;
    SpawnOptions spawn_options_;

protected:
    Executor(Language language, const Config& config);

public:
    Executor(const Executor&) = delete;
    Executor(Executor&&) = delete;
    Executor& operator=(const Executor&) = delete;
    Executor& operator=(Executor&&) = delete;

    virtual ~Executor() = default;

    [[nodiscard]] Language language() const noexcept { return language_; }

    [[nodiscard]] const std::string& image() const noexcept { return image_; }

    [[nodiscard]] const Workspace& workspace() const noexcept { return workspace_; }

    [[nodiscard]] const SpawnOptions& spawn_options() const noexcept { return spawn_options_; }

    // Extension of the source file including the leading dot e.g. ".php"
    [[nodiscard]] virtual std::string_view file_extension() const noexcept = 0;

    // Command run inside the container, @p source_path is the path of the
    // source file inside the container
    [[nodiscard]] virtual std::vector<std::string>
    runtime_command(std::string_view source_path) const = 0;

    // Path at which the source file is visible inside the container
    [[nodiscard]] std::string source_path_in_container() const;

    // Full invocation of the isolation CLI running @p source_file
    [[nodiscard]] CommandSpec docker_command(const WorkspaceFile& source_file) const;

    /**
     * @brief Runs @p request.code with @p request.stdin_data as the input
     * @details The source file is created in the workspace and removed before
     *   returning, whatever the outcome. A failing user program is not an
     *   error: its output and diagnostics are returned. Exit status 125 is
     *   taken as a failure of `docker run` itself (as is a user program
     *   exiting with 125).
     *   This function is thread-safe.
     *
     * @errors Never throws for infrastructure failures, they are logged to
     *   errlog and reported as "Internal error: <description>" in stderr_data
     */
    [[nodiscard]] ExecutionResult execute(const ExecutionRequest& request) const;

private:
    // Stops the container left running after its client was killed
    void kill_container(std::string_view container_name) const noexcept;
};

} // namespace coderun::execute
