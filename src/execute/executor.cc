#include <chrono>
#include <coderun/concat_tostr.hh>
#include <coderun/execute/executor.hh>
#include <coderun/execute/result_normalizer.hh>
#include <coderun/logger.hh>
#include <coderun/macros/throw.hh>
#include <exception>

using std::string;
using std::string_view;
using std::vector;

namespace coderun::execute {

namespace {

constexpr std::chrono::seconds CONTAINER_KILL_TIME_LIMIT{10};
// Exit status of `docker run` failing by itself, e.g. a missing image or an
// unreachable daemon
constexpr int DOCKER_RUN_ERROR_EXIT_CODE = 125;

ExecutionResult internal_error(string_view description) {
    return {
        .stdout_data = "",
        .stderr_data = concat_tostr("Internal error: ", description),
    };
}

} // namespace

Executor::Executor(Language language, const Config& config)
: language_{language}
, image_{config.image(language)}
, limits_{config.limits}
, pids_limit_{config.pids_limit}
, docker_executable_{config.docker_executable}
, workspace_{config.workspace_dir}
, log_executions_{config.log_executions}
, spawn_options_{
      .real_time_limit = config.real_time_limit,
      .max_output_size = config.max_output_size,
  } {}

string Executor::source_path_in_container() const {
    return concat_tostr("/code", file_extension());
}

CommandSpec Executor::docker_command(const WorkspaceFile& source_file) const {
    vector<string> args = {
        "docker",
        "run",
        "-i",
        "--rm",
        "--pull",
        "never",
        "--name",
        string{source_file.stem()},
        "--network",
        "none",
        "--pids-limit",
        concat_tostr(pids_limit_),
        "--ulimit",
        concat_tostr("cpu=", limits_.cpu_time_limit_in_seconds),
        "--memory",
        concat_tostr(limits_.memory_limit_in_megabytes, 'm'),
        "--memory-swap",
        concat_tostr(limits_.memory_limit_in_megabytes, 'm'),
        "--mount",
        concat_tostr(
            "type=bind,source=",
            source_file.path(),
            ",target=",
            source_path_in_container(),
            ",readonly"
        ),
        image_,
    };
    for (auto& arg : runtime_command(source_path_in_container())) {
        args.emplace_back(std::move(arg));
    }
    return {
        .executable = docker_executable_,
        .args = std::move(args),
    };
}

void Executor::kill_container(string_view container_name) const noexcept {
    try {
        auto res = spawn(
            {
                .executable = docker_executable_,
                .args = {"docker", "kill", string{container_name}},
            },
            "",
            {.real_time_limit = CONTAINER_KILL_TIME_LIMIT, .max_output_size = 4096}
        );
        // The container may have stopped already, then there is nothing to kill
        if (res.exit_code != 0) {
            errlog(
                "docker kill ", container_name, " exited with code ", res.exit_code, ": ",
                res.stderr_data
            );
        }
    } catch (const std::exception& e) {
        errlog("Failed to kill container ", container_name, ": ", e.what());
    }
}

ExecutionResult Executor::execute(const ExecutionRequest& request) const {
    try {
        auto source_file = workspace_.create_file(file_extension(), request.code);
        auto res = spawn(docker_command(source_file), request.stdin_data, spawn_options_);
        if (res.killed_by_real_time_limit) {
            errlog(
                "Container ", source_file.stem(), " (", to_str(language_),
                ") exceeded the real time limit, killing it"
            );
            kill_container(source_file.stem());
        }
        if (res.exit_code == DOCKER_RUN_ERROR_EXIT_CODE) {
            if (not res.stderr_data.empty() and res.stderr_data.back() == '\n') {
                res.stderr_data.pop_back();
            }
            THROW_AS(
                LaunchError, "docker run failed with code ", res.exit_code, ": ", res.stderr_data
            );
        }
        if (log_executions_) {
            stdlog(
                "Executed ", to_str(language_), " in container ", source_file.stem(),
                ": exit code ", res.exit_code, ", runtime ",
                std::chrono::duration_cast<std::chrono::milliseconds>(res.runtime).count(), " ms"
            );
        }
        auto stderr_data = normalize_stderr(res, spawn_options_);
        return {
            .stdout_data = std::move(res.stdout_data),
            .stderr_data = std::move(stderr_data),
        };
    } catch (const WorkspaceError& e) {
        errlog("Workspace error (", to_str(language_), "): ", e.what());
        return internal_error(e.what());
    } catch (const LaunchError& e) {
        errlog("Launch error (", to_str(language_), "): ", e.what());
        return internal_error(e.what());
    } catch (const std::exception& e) {
        errlog("Execution error (", to_str(language_), "): ", e.what());
        return internal_error(e.what());
    }
}

} // namespace coderun::execute
