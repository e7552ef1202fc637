#include "../intercept_logger.hh"
#include "fake_docker.hh"

#include <chrono>
#include <coderun/execute/executor.hh>
#include <coderun/execute/language_executor/c_gcc.hh>
#include <coderun/execute/language_executor/cpp_gcc.hh>
#include <coderun/execute/language_executor/php.hh>
#include <coderun/execute/language_executor/python.hh>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using coderun::execute::CompiledLanguage;
using coderun::execute::Config;
using coderun::execute::ExecutionResult;
using coderun::execute::Language;
using coderun::execute::Workspace;
using coderun::execute::language_executor::C_GCC;
using coderun::execute::language_executor::Cpp_GCC;
using coderun::execute::language_executor::Php;
using coderun::execute::language_executor::Python;
using std::string;
using std::vector;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::StartsWith;

constexpr auto forced_termination_note =
    "process exited with code 137. Most likely due to exceeding memory or CPU time limit.";

// NOLINTNEXTLINE
TEST(execute_executor, runtime_commands) {
    auto config = Config::defaults();
    EXPECT_THAT(Php{config}.runtime_command("/code.php"), ElementsAre("php", "/code.php"));
    EXPECT_THAT(Python{config}.runtime_command("/code.py"), ElementsAre("python3", "/code.py"));
    EXPECT_THAT(
        C_GCC{config}.runtime_command("/code.c"),
        ElementsAre(
            "sh", "-c", "gcc -std=c17 -O2 -o /tmp/program /code.c -lm && exec /tmp/program"
        )
    );
    EXPECT_THAT(
        Cpp_GCC{config}.runtime_command("/code.cpp"),
        ElementsAre(
            "sh", "-c", "g++ -std=c++20 -O2 -o /tmp/program /code.cpp && exec /tmp/program"
        )
    );
    EXPECT_EQ(CompiledLanguage::EXECUTABLE_PATH, "/tmp/program");
}

// NOLINTNEXTLINE
TEST(execute_executor, executor_properties) {
    auto config = Config::defaults();
    config.images[Language::PYTHON] = "registry.local/python:3";
    Python python{config};
    EXPECT_EQ(python.language(), Language::PYTHON);
    EXPECT_EQ(python.image(), "registry.local/python:3");
    EXPECT_EQ(python.file_extension(), ".py");
    EXPECT_EQ(python.source_path_in_container(), "/code.py");
    EXPECT_EQ(python.workspace().dir(), "/tmp/");
    EXPECT_EQ(python.spawn_options().real_time_limit, std::chrono::seconds{10});
    EXPECT_EQ(python.spawn_options().max_output_size, size_t{1} << 20);
}

// NOLINTNEXTLINE
TEST(execute_executor, docker_command) {
    auto config = Config::defaults();
    config.limits = {.cpu_time_limit_in_seconds = 3, .memory_limit_in_megabytes = 256};
    config.pids_limit = 32;
    config.docker_executable = "/usr/bin/docker";
    TemporaryDirectory tmp_dir("/tmp/coderun-executor-test.XXXXXX");
    config.workspace_dir = tmp_dir.path();

    Php php{config};
    auto file = php.workspace().create_file(php.file_extension(), "<?php echo 1;");
    auto command = php.docker_command(file);
    EXPECT_EQ(command.executable, "/usr/bin/docker");
    EXPECT_THAT(
        command.args,
        ElementsAre(
            "docker",
            "run",
            "-i",
            "--rm",
            "--pull",
            "never",
            "--name",
            string{file.stem()},
            "--network",
            "none",
            "--pids-limit",
            "32",
            "--ulimit",
            "cpu=3",
            "--memory",
            "256m",
            "--memory-swap",
            "256m",
            "--mount",
            concat_tostr("type=bind,source=", file.path(), ",target=/code.php,readonly"),
            "php:8.3-cli",
            "php",
            "/code.php"
        )
    );
    EXPECT_THAT(string{file.stem()}, StartsWith(Workspace::FILE_NAME_PREFIX));
}

// NOLINTNEXTLINE
TEST(execute_executor, execute_prints_output) {
    FakeDocker docker;
    Php php{docker.config()};
    auto res = php.execute({.code = "printf hi", .stdin_data = ""});
    EXPECT_EQ(res.stdout_data, "hi");
    EXPECT_EQ(res.stderr_data, "");
    EXPECT_THAT(docker.workspace_files(), ElementsAre());
}

// NOLINTNEXTLINE
TEST(execute_executor, execute_forwards_stdin) {
    FakeDocker docker;
    Python python{docker.config()};
    auto res = python.execute({.code = "read line; echo \"got $line\"", .stdin_data = "abc\n"});
    EXPECT_EQ(res.stdout_data, "got abc\n");
    EXPECT_EQ(res.stderr_data, "");
}

// NOLINTNEXTLINE
TEST(execute_executor, runtime_failure_is_returned_verbatim) {
    FakeDocker docker;
    Php php{docker.config()};
    auto res = php.execute({
        .code = "echo partial; echo 'Fatal error' >&2; exit 255",
        .stdin_data = "",
    });
    EXPECT_EQ(res.stdout_data, "partial\n");
    EXPECT_EQ(res.stderr_data, "Fatal error\n");
    EXPECT_THAT(docker.workspace_files(), ElementsAre());
}

// NOLINTNEXTLINE
TEST(execute_executor, forced_termination_is_explained) {
    FakeDocker docker;
    Php php{docker.config()};
    auto res = php.execute({.code = "echo Killed >&2; exit 137", .stdin_data = ""});
    EXPECT_EQ(res.stdout_data, "");
    EXPECT_EQ(res.stderr_data, string{"Killed\n"} + forced_termination_note);
}

// NOLINTNEXTLINE
TEST(execute_executor, real_time_limit_kills_container) {
    FakeDocker docker;
    auto config = docker.config();
    config.real_time_limit = std::chrono::seconds{1};
    Php php{config};
    ExecutionResult res;
    auto logged = intercept_logger(errlog, [&] {
        res = php.execute({.code = "echo started; sleep 10", .stdin_data = ""});
    });
    EXPECT_EQ(res.stdout_data, "started\n");
    EXPECT_EQ(res.stderr_data, "process was killed after exceeding the real time limit of 1 s.");
    EXPECT_THAT(logged, HasSubstr("exceeded the real time limit"));
    EXPECT_THAT(docker.killed_containers(), StartsWith(Workspace::FILE_NAME_PREFIX));
    EXPECT_THAT(docker.workspace_files(), ElementsAre());
}

// NOLINTNEXTLINE
TEST(execute_executor, output_is_truncated) {
    FakeDocker docker;
    auto config = docker.config();
    config.max_output_size = 10;
    Php php{config};
    auto res = php.execute({.code = "echo 0123456789abcdef", .stdin_data = ""});
    EXPECT_EQ(res.stdout_data, "0123456789");
    EXPECT_EQ(res.stderr_data, "stdout was truncated to 10 bytes.");
}

// NOLINTNEXTLINE
TEST(execute_executor, launch_failure_is_internal_error) {
    FakeDocker docker;
    auto config = docker.config();
    config.docker_executable = docker.workspace_dir() + "no_such_docker";
    Php php{config};
    ExecutionResult res;
    auto logged = intercept_logger(errlog, [&] {
        res = php.execute({.code = "echo never", .stdin_data = ""});
    });
    EXPECT_EQ(res.stdout_data, "");
    EXPECT_THAT(res.stderr_data, StartsWith("Internal error: execvp() of '"));
    EXPECT_THAT(logged, StartsWith("Launch error (php): execvp() of '"));
    EXPECT_THAT(docker.workspace_files(), ElementsAre());
}

// NOLINTNEXTLINE
TEST(execute_executor, docker_run_failure_is_internal_error) {
    FakeDocker docker;
    Php php{docker.config()};
    ExecutionResult res;
    auto logged = intercept_logger(errlog, [&] {
        res = php.execute({
            .code = "echo \"Unable to find image 'php:8.3-cli' locally\" >&2; exit 125",
            .stdin_data = "",
        });
    });
    EXPECT_EQ(res.stdout_data, "");
    EXPECT_THAT(
        res.stderr_data,
        StartsWith("Internal error: docker run failed with code 125: Unable to find image "
                   "'php:8.3-cli' locally (thrown at ")
    );
    EXPECT_THAT(
        logged,
        StartsWith("Launch error (php): docker run failed with code 125: Unable to find image")
    );
    EXPECT_THAT(docker.workspace_files(), ElementsAre());
}

// NOLINTNEXTLINE
TEST(execute_executor, executions_are_logged_only_on_request) {
    FakeDocker docker;
    auto config = docker.config();
    auto logged = intercept_logger(stdlog, [&] {
        EXPECT_EQ(Php{config}.execute({.code = "exit 3", .stdin_data = ""}).stdout_data, "");
    });
    EXPECT_EQ(logged, "");

    config.log_executions = true;
    logged = intercept_logger(stdlog, [&] {
        EXPECT_EQ(Php{config}.execute({.code = "exit 3", .stdin_data = ""}).stdout_data, "");
    });
    EXPECT_THAT(logged, StartsWith("Executed php in container coderun-"));
    EXPECT_THAT(logged, HasSubstr(": exit code 3, runtime "));
}

// NOLINTNEXTLINE
TEST(execute_executor, workspace_failure_is_internal_error) {
    FakeDocker docker;
    auto config = docker.config();
    config.workspace_dir = docker.workspace_dir() + "no_such_dir";
    Python python{config};
    ExecutionResult res;
    auto logged = intercept_logger(errlog, [&] {
        res = python.execute({.code = "echo never", .stdin_data = ""});
    });
    EXPECT_EQ(res.stdout_data, "");
    EXPECT_THAT(res.stderr_data, StartsWith("Internal error: create_unique_file("));
    EXPECT_THAT(logged, StartsWith("Workspace error (python): create_unique_file("));
}

// NOLINTNEXTLINE
TEST(execute_executor, source_file_is_mounted_with_language_extension) {
    FakeDocker docker;
    C_GCC c{docker.config()};
    // The fake docker runs the file from the workspace, so $0 is its host path
    auto res = c.execute({.code = "echo \"$0\"", .stdin_data = ""});
    EXPECT_THAT(res.stdout_data, StartsWith(docker.workspace_dir() + "coderun-"));
    EXPECT_EQ(res.stdout_data.size(), docker.workspace_dir().size() + 8 + 16 + 3);
    EXPECT_THAT(res.stdout_data, ::testing::EndsWith(".c\n"));
}
