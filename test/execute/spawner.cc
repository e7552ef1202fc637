#include <chrono>
#include <coderun/execute/spawner.hh>
#include <csignal>
#include <gtest/gtest.h>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

using coderun::execute::CommandSpec;
using coderun::execute::LaunchError;
using coderun::execute::spawn;
using coderun::execute::SpawnOptions;
using std::string;
using std::string_view;

namespace {

CommandSpec sh(string script) {
    return {
        .executable = "/bin/sh",
        .args = {"sh", "-c", std::move(script)},
    };
}

} // namespace

// NOLINTNEXTLINE
TEST(execute_spawner, captures_stdout_and_stderr) {
    auto res = spawn(sh("echo out; echo err >&2; printf 'no newline'"), "");
    EXPECT_EQ(res.stdout_data, "out\nno newline");
    EXPECT_EQ(res.stderr_data, "err\n");
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_FALSE(res.killed_by_real_time_limit);
    EXPECT_FALSE(res.stdout_truncated);
    EXPECT_FALSE(res.stderr_truncated);
}

// NOLINTNEXTLINE
TEST(execute_spawner, looks_up_executable_in_path) {
    auto res = spawn({.executable = "echo", .args = {"echo", "a", "b c"}}, "");
    EXPECT_EQ(res.stdout_data, "a b c\n");
}

// NOLINTNEXTLINE
TEST(execute_spawner, forwards_stdin) {
    auto res = spawn(sh("cat"), "line 1\nline 2");
    EXPECT_EQ(res.stdout_data, "line 1\nline 2");
    EXPECT_EQ(res.stderr_data, "");
}

// NOLINTNEXTLINE
TEST(execute_spawner, empty_stdin_is_end_of_input) {
    auto res = spawn(sh("cat; echo done"), "");
    EXPECT_EQ(res.stdout_data, "done\n");
}

// NOLINTNEXTLINE
TEST(execute_spawner, large_stdin_and_outputs_do_not_deadlock) {
    string input(4 << 20, 'x');
    for (size_t i = 0; i < input.size(); i += 1000) {
        input[i] = '\n';
    }
    // Both outputs get the whole input, so the pipes fill up in every direction
    auto res = spawn(sh("tee /dev/stderr"), input);
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_EQ(res.stdout_data.size(), input.size());
    EXPECT_EQ(res.stdout_data, input);
    EXPECT_EQ(res.stderr_data, input);
}

// NOLINTNEXTLINE
TEST(execute_spawner, child_not_reading_stdin) {
    auto res = spawn(sh("echo ignored"), string(1 << 20, 'a'));
    EXPECT_EQ(res.stdout_data, "ignored\n");
    EXPECT_EQ(res.exit_code, 0);
}

// NOLINTNEXTLINE
TEST(execute_spawner, child_closing_stdin_early) {
    auto res = spawn(sh("head -c 3; exec 0<&-; sleep 0.1; echo end"), string(1 << 20, 'a'));
    EXPECT_EQ(res.stdout_data, "aaaend\n");
    EXPECT_EQ(res.exit_code, 0);
}

// NOLINTNEXTLINE
TEST(execute_spawner, exit_code) {
    EXPECT_EQ(spawn(sh("exit 0"), "").exit_code, 0);
    EXPECT_EQ(spawn(sh("exit 3"), "").exit_code, 3);
    EXPECT_EQ(spawn(sh("exit 137"), "").exit_code, 137);
    EXPECT_EQ(spawn(sh("exit 255"), "").exit_code, 255);
}

// NOLINTNEXTLINE
TEST(execute_spawner, killed_by_signal) {
    EXPECT_EQ(spawn(sh("kill -KILL $$"), "").exit_code, 128 + SIGKILL);
    EXPECT_EQ(spawn(sh("kill -TERM $$"), "").exit_code, 128 + SIGTERM);
    EXPECT_EQ(spawn(sh("kill -XCPU $$"), "").exit_code, 128 + SIGXCPU);
}

// NOLINTNEXTLINE
TEST(execute_spawner, sigpipe_is_not_blocked_in_the_child) {
    auto res = spawn(sh("kill -PIPE $$"), "");
    EXPECT_EQ(res.exit_code, 128 + SIGPIPE);
}

// NOLINTNEXTLINE
TEST(execute_spawner, real_time_limit_kills_process_group) {
    auto start = std::chrono::steady_clock::now();
    auto res = spawn(
        sh("echo started; sleep 10 & sleep 10; echo never"),
        "",
        {.real_time_limit = std::chrono::milliseconds{300}}
    );
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_TRUE(res.killed_by_real_time_limit);
    EXPECT_EQ(res.exit_code, 128 + SIGKILL);
    EXPECT_EQ(res.stdout_data, "started\n");
    EXPECT_LT(elapsed, std::chrono::seconds{5});
    EXPECT_GE(res.runtime, std::chrono::milliseconds{300});
}

// NOLINTNEXTLINE
TEST(execute_spawner, real_time_limit_not_reached) {
    auto res = spawn(sh("echo fast"), "", {.real_time_limit = std::chrono::seconds{10}});
    EXPECT_FALSE(res.killed_by_real_time_limit);
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_EQ(res.stdout_data, "fast\n");
}

// NOLINTNEXTLINE
TEST(execute_spawner, real_time_limit_with_closed_outputs) {
    auto res = spawn(
        sh("exec >&- 2>&-; sleep 10"), "", {.real_time_limit = std::chrono::milliseconds{200}}
    );
    EXPECT_TRUE(res.killed_by_real_time_limit);
    EXPECT_EQ(res.exit_code, 128 + SIGKILL);
}

// NOLINTNEXTLINE
TEST(execute_spawner, max_output_size) {
    auto res = spawn(
        sh("head -c 100000 /dev/zero | tr '\\0' a; echo err >&2"),
        "",
        {.max_output_size = 1000}
    );
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_EQ(res.stdout_data, string(1000, 'a'));
    EXPECT_TRUE(res.stdout_truncated);
    EXPECT_EQ(res.stderr_data, "err\n");
    EXPECT_FALSE(res.stderr_truncated);
}

// NOLINTNEXTLINE
TEST(execute_spawner, output_of_exactly_max_size_is_not_truncated) {
    auto res = spawn(sh("printf abcd"), "", {.max_output_size = 4});
    EXPECT_EQ(res.stdout_data, "abcd");
    EXPECT_FALSE(res.stdout_truncated);
}

// NOLINTNEXTLINE
TEST(execute_spawner, missing_executable) {
    try {
        (void)spawn({.executable = "/no/such/executable", .args = {"executable"}}, "");
        ADD_FAILURE();
    } catch (const LaunchError& e) {
        EXPECT_TRUE(string_view{e.what()}.starts_with(
            "execvp() of '/no/such/executable' - No such file or directory (os error 2)"
        )) << e.what();
    }
}

// NOLINTNEXTLINE
TEST(execute_spawner, invalid_arguments) {
    EXPECT_THROW((void)spawn({.executable = "/bin/sh", .args = {}}, ""), LaunchError);
    EXPECT_THROW(
        (void)spawn(sh("true"), "", {.real_time_limit = std::chrono::nanoseconds{0}}), LaunchError
    );
}

// NOLINTNEXTLINE
TEST(execute_spawner, concurrent_spawns) {
    constexpr int threads_num = 16;
    std::vector<std::thread> threads;
    std::vector<string> outputs(threads_num);
    for (int t = 0; t < threads_num; ++t) {
        threads.emplace_back([&, t] {
            outputs[t] = spawn(sh("cat; echo \" $0\""), std::to_string(t)).stdout_data;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (int t = 0; t < threads_num; ++t) {
        EXPECT_EQ(outputs[t], std::to_string(t) + " sh\n");
    }
}
