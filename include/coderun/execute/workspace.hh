#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace coderun::execute {

class WorkspaceError : public std::runtime_error {
public:
    using runtime_error::runtime_error;
};

// Removes the file @p path. Missing file is not an error, other failures are
// logged to errlog and never propagated.
void cleanup_file(const std::string& path) noexcept;

// Owns exactly one file of the workspace, removes it in the destructor
class WorkspaceFile {
    std::string path_;

public:
    WorkspaceFile() noexcept = default;

    explicit WorkspaceFile(std::string path) noexcept : path_{std::move(path)} {}

    WorkspaceFile(const WorkspaceFile&) = delete;
    WorkspaceFile& operator=(const WorkspaceFile&) = delete;

    WorkspaceFile(WorkspaceFile&& other) noexcept : path_{std::move(other.path_)} {
        other.path_.clear();
    }

    WorkspaceFile& operator=(WorkspaceFile&& other) noexcept {
        if (!path_.empty()) {
            cleanup_file(path_);
        }
        path_ = std::move(other.path_);
        other.path_.clear();
        return *this;
    }

    ~WorkspaceFile() {
        if (!path_.empty()) {
            cleanup_file(path_);
        }
    }

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    // File name without the directory part and without the extension
    [[nodiscard]] std::string_view stem() const noexcept;

    // Cancels the removal, returns the path of the file
    std::string release() noexcept {
        std::string path = std::move(path_);
        path_.clear();
        return path;
    }
};

// Directory in which source files of executions are created. Every file gets
// a distinct random name, so concurrent executions never collide.
class Workspace {
    std::string dir_; // with trailing '/'

public:
    static constexpr std::string_view FILE_NAME_PREFIX = "coderun-";
    static constexpr size_t RANDOM_PART_LEN = 16;

    // @p dir has to be an absolute path
    explicit Workspace(std::string dir);

    [[nodiscard]] const std::string& dir() const noexcept { return dir_; }

    /**
     * @brief Creates <dir>/coderun-<random part><extension> and writes
     *   @p contents to it
     *
     * @param extension file extension including the leading dot e.g. ".php"
     * @param contents contents of the file
     *
     * @errors Throws WorkspaceError if the file cannot be created or written;
     *   a partially written file is removed before throwing
     */
    [[nodiscard]] WorkspaceFile
    create_file(std::string_view extension, std::string_view contents) const;
};

} // namespace coderun::execute
