#pragma once

#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

// Returns the value of the environment variable @p name, std::nullopt if it is
// unset. Thread-safe as long as no thread modifies the environment.
inline std::optional<std::string_view> get_env_var(const std::string& name) noexcept {
    const char* value = std::getenv(name.c_str()); // NOLINT(concurrency-mt-unsafe)
    if (value == nullptr) {
        return std::nullopt;
    }
    return value;
}
