#pragma once

#include <string>

class TemporaryDirectory {
    std::string path_; // absolute path with trailing '/'

public:
    /// Does NOT create a temporary directory
    TemporaryDirectory() = default;

    /// The last six characters of template must be "XXXXXX" and these are
    /// replaced with a string that makes the directory name unique.
    explicit TemporaryDirectory(std::string templ);

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;
    TemporaryDirectory(TemporaryDirectory&& other) noexcept : path_(std::move(other.path_)) {
        other.path_.clear();
    }

    TemporaryDirectory& operator=(TemporaryDirectory&& other) noexcept;

    ~TemporaryDirectory();

    [[nodiscard]] bool exists() const noexcept { return not path_.empty(); }

    /// Path with trailing '/'
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
};
