#include <chrono>
#include <coderun/concat_tostr.hh>
#include <coderun/execute/result_normalizer.hh>

namespace coderun::execute {

void append_note(std::string& stderr_data, std::string_view note) {
    if (!stderr_data.empty() and stderr_data.back() != '\n') {
        stderr_data += '\n';
    }
    stderr_data += note;
}

std::string normalize_stderr(int exit_code, std::string stderr_data) {
    if (exit_code == FORCED_TERMINATION_EXIT_CODE) {
        append_note(
            stderr_data,
            concat_tostr(
                "process exited with code ",
                exit_code,
                ". Most likely due to exceeding memory or CPU time limit."
            )
        );
    }
    return stderr_data;
}

std::string normalize_stderr(const SpawnResult& res, const SpawnOptions& options) {
    std::string stderr_data;
    if (res.killed_by_real_time_limit) {
        // The exit code comes from our SIGKILL, not from the container limits
        stderr_data = res.stderr_data;
        auto limit = std::chrono::ceil<std::chrono::seconds>(
            options.real_time_limit.value_or(std::chrono::nanoseconds{0})
        );
        append_note(
            stderr_data,
            concat_tostr(
                "process was killed after exceeding the real time limit of ",
                limit.count(),
                " s."
            )
        );
    } else {
        stderr_data = normalize_stderr(res.exit_code, res.stderr_data);
        if (res.exit_code == CPU_TIME_LIMIT_EXIT_CODE) {
            append_note(
                stderr_data,
                concat_tostr(
                    "process exited with code ",
                    res.exit_code,
                    ". The CPU time limit was exceeded."
                )
            );
        }
    }
    if (res.stdout_truncated) {
        append_note(
            stderr_data,
            concat_tostr("stdout was truncated to ", options.max_output_size.value_or(0), " bytes.")
        );
    }
    if (res.stderr_truncated) {
        append_note(
            stderr_data,
            concat_tostr("stderr was truncated to ", options.max_output_size.value_or(0), " bytes.")
        );
    }
    return stderr_data;
}

} // namespace coderun::execute
