#include <coderun/concat_tostr.hh>
#include <coderun/env.hh>
#include <coderun/execute/config.hh>
#include <coderun/macros/throw.hh>
#include <coderun/string_transform.hh>
#include <cstdint>
#include <type_traits>

namespace coderun::execute {

std::string_view default_image(Language language) noexcept {
    switch (language) {
    case Language::PHP: return "php:8.3-cli";
    case Language::PYTHON: return "python:3.12-slim";
    case Language::JAVASCRIPT: return "node:20-slim";
    case Language::RUBY: return "ruby:3.3-slim";
    case Language::BASH: return "bash:5.2";
    case Language::C: return "gcc:13";
    case Language::CPP: return "gcc:13";
    }
    return "";
}

std::string image_config_var_name(Language language) {
    return concat_tostr(to_str(language), "_image");
}

std::string image_env_var_name(Language language) {
    std::string name = concat_tostr("CODERUN_", to_str(language), "_IMAGE");
    for (char& c : name) {
        c = to_upper(c);
    }
    return name;
}

Config Config::defaults() {
    Config config;
    for (auto language : all_languages) {
        config.images.emplace(language, default_image(language));
    }
    return config;
}

void Config::apply(const ConfigFile& config_file) {
    auto get_int = [&](std::string_view name, auto& dest) {
        const auto& var = config_file[name];
        if (not var.is_set()) {
            return;
        }
        using T = std::remove_reference_t<decltype(dest)>;
        auto val = var.as<T>();
        if (not val or var.is_array()) {
            THROW(name, ": expected an integer, got: ", var.as_string());
        }
        dest = *val;
    };
    auto get_string = [&](std::string_view name, std::string& dest) {
        const auto& var = config_file[name];
        if (not var.is_set()) {
            return;
        }
        if (var.is_array()) {
            THROW(name, ": expected a string, got an array");
        }
        dest = var.as_string();
    };

    get_int("cpu_time_limit", limits.cpu_time_limit_in_seconds);
    get_int("memory_limit", limits.memory_limit_in_megabytes);
    get_int("pids_limit", pids_limit);

    if (config_file["real_time_limit"].is_set()) {
        int64_t seconds = 0;
        get_int("real_time_limit", seconds);
        if (seconds < 0) {
            THROW("real_time_limit: has to be non-negative, got: ", seconds);
        }
        real_time_limit = (seconds == 0 ? std::nullopt
                                        : std::optional{std::chrono::seconds{seconds}});
    }
    if (config_file["max_output_size"].is_set()) {
        size_t bytes = 0;
        get_int("max_output_size", bytes);
        max_output_size = (bytes == 0 ? std::nullopt : std::optional{bytes});
    }

    get_string("docker_executable", docker_executable);
    get_string("workspace_dir", workspace_dir);
    for (auto language : all_languages) {
        get_string(image_config_var_name(language), images[language]);
    }
}

void Config::apply_env_overrides() {
    for (auto language : all_languages) {
        if (auto image = get_env_var(image_env_var_name(language)); image) {
            images[language] = *image;
        }
    }
}

void Config::validate() const {
    if (limits.cpu_time_limit_in_seconds <= 0) {
        THROW("cpu_time_limit: has to be positive, got: ", limits.cpu_time_limit_in_seconds);
    }
    if (limits.memory_limit_in_megabytes <= 0) {
        THROW("memory_limit: has to be positive, got: ", limits.memory_limit_in_megabytes);
    }
    if (real_time_limit and
        (*real_time_limit <= std::chrono::seconds{0} or *real_time_limit > MAX_REAL_TIME_LIMIT))
    {
        THROW(
            "real_time_limit: has to be in range [1, ",
            MAX_REAL_TIME_LIMIT.count(),
            "], got: ",
            real_time_limit->count()
        );
    }
    if (pids_limit <= 0) {
        THROW("pids_limit: has to be positive, got: ", pids_limit);
    }
    if (docker_executable.empty()) {
        THROW("docker_executable: cannot be empty");
    }
    if (workspace_dir.empty() or workspace_dir.front() != '/') {
        THROW("workspace_dir: has to be an absolute path, got: ", workspace_dir);
    }
    for (auto language : all_languages) {
        auto it = images.find(language);
        if (it == images.end() or it->second.empty()) {
            THROW(image_config_var_name(language), ": cannot be empty");
        }
    }
}

Config Config::load(const std::string& path) {
    ConfigFile config_file;
    config_file.add_vars(
        "cpu_time_limit",
        "memory_limit",
        "real_time_limit",
        "max_output_size",
        "pids_limit",
        "docker_executable",
        "workspace_dir"
    );
    for (auto language : all_languages) {
        config_file.add_vars(image_config_var_name(language));
    }
    config_file.load_config_from_file(path);

    auto config = defaults();
    config.apply(config_file);
    config.apply_env_overrides();
    config.validate();
    return config;
}

Config Config::load_without_file() {
    auto config = defaults();
    config.apply_env_overrides();
    config.validate();
    return config;
}

const std::string& Config::image(Language language) const {
    auto it = images.find(language);
    if (it == images.end()) {
        THROW("No image configured for language: ", to_str(language));
    }
    return it->second;
}

} // namespace coderun::execute
