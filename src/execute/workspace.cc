#include <cerrno>
#include <coderun/concat_tostr.hh>
#include <coderun/create_unique_file.hh>
#include <coderun/errmsg.hh>
#include <coderun/execute/workspace.hh>
#include <coderun/file_contents.hh>
#include <coderun/logger.hh>
#include <coderun/macros/throw.hh>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace coderun::execute {

void cleanup_file(const std::string& path) noexcept {
    if (unlink(path.c_str()) and errno != ENOENT) {
        errlog("Failed to remove the workspace file: unlink(", path, ')', errmsg());
    }
}

std::string_view WorkspaceFile::stem() const noexcept {
    std::string_view name = path_;
    auto slash_pos = name.rfind('/');
    if (slash_pos != std::string_view::npos) {
        name.remove_prefix(slash_pos + 1);
    }
    return name.substr(0, name.find('.'));
}

Workspace::Workspace(std::string dir) : dir_{std::move(dir)} {
    if (dir_.empty() or dir_.front() != '/') {
        THROW_AS(WorkspaceError, "Workspace directory has to be an absolute path: ", dir_);
    }
    if (dir_.back() != '/') {
        dir_ += '/';
    }
}

WorkspaceFile Workspace::create_file(std::string_view extension, std::string_view contents) const {
    auto path = concat_tostr(dir_, FILE_NAME_PREFIX, std::string(RANDOM_PART_LEN, 'X'), extension);
    // Readable by everyone, as the user inside the container may differ from ours
    constexpr mode_t mode = S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH;
    auto fd = create_unique_file(
        AT_FDCWD,
        path,
        dir_.size() + FILE_NAME_PREFIX.size(),
        RANDOM_PART_LEN,
        O_WRONLY | O_CLOEXEC,
        mode
    );
    if (not fd) {
        THROW_AS(WorkspaceError, "create_unique_file(", path, ')', errmsg());
    }

    WorkspaceFile file{std::move(path)}; // From now on the file is removed on every exit path
    // The umask must not take the permissions away
    if (fchmod(*fd, mode)) {
        THROW_AS(WorkspaceError, "fchmod(", file.path(), ')', errmsg());
    }
    if (write_all(*fd, contents) != contents.size()) {
        THROW_AS(WorkspaceError, "write(", file.path(), ')', errmsg());
    }
    if (fd->close()) {
        THROW_AS(WorkspaceError, "close(", file.path(), ')', errmsg());
    }
    return file;
}

} // namespace coderun::execute
