#pragma once

#include <chrono>
#include <coderun/config_file.hh>
#include <coderun/execute/language.hh>
#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace coderun::execute {

// Limits of every execution, the same for the whole lifetime of the process
struct ResourceLimits {
    int cpu_time_limit_in_seconds = 2;
    int memory_limit_in_megabytes = 128;
};

// Half of the nanoseconds range, so that a steady_clock deadline does not overflow
constexpr auto MAX_REAL_TIME_LIMIT =
    std::chrono::duration_cast<std::chrono::seconds>(std::chrono::nanoseconds::max()) / 2;

struct Config {
    ResourceLimits limits;
    // Orchestrator-side wall-clock deadline, std::nullopt disables it
    std::optional<std::chrono::seconds> real_time_limit = std::chrono::seconds{10};
    // Bound of each of the captured streams, std::nullopt means no bound
    std::optional<size_t> max_output_size = size_t{1} << 20;
    int pids_limit = 64;
    std::string docker_executable = "docker";
    std::string workspace_dir = "/tmp";
    std::map<Language, std::string> images;
    // Whether to log every execution to stdlog
    bool log_executions = false;

    // Configuration with default values and default images
    static Config defaults();

    /**
     * @brief Loads configuration from the config file @p path
     * @details Variables missing in the file keep their default values. Then
     *   CODERUN_<LANGUAGE>_IMAGE environment variables override the images
     *   and the result is validated.
     *
     * @errors Throws std::runtime_error (ConfigFile::ParseError for syntax
     *   errors) describing the first problem found
     */
    static Config load(const std::string& path);

    // Like load() but with no config file
    static Config load_without_file();

    // Sets variables present in @p config_file, does not validate
    void apply(const ConfigFile& config_file);

    void apply_env_overrides();

    // Throws std::runtime_error if any value is invalid
    void validate() const;

    [[nodiscard]] const std::string& image(Language language) const;
};

[[nodiscard]] std::string_view default_image(Language language) noexcept;

// e.g. "php_image"
[[nodiscard]] std::string image_config_var_name(Language language);

// e.g. "CODERUN_PHP_IMAGE"
[[nodiscard]] std::string image_env_var_name(Language language);

} // namespace coderun::execute
