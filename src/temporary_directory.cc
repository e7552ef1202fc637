#include <coderun/errmsg.hh>
#include <coderun/logger.hh>
#include <coderun/macros/throw.hh>
#include <coderun/temporary_directory.hh>
#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace {

void remove_directory_tree(const std::string& path) noexcept {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        errlog("Failed to remove directory ", path, ": ", ec.message());
    }
}

} // namespace

TemporaryDirectory::TemporaryDirectory(std::string templ) {
    if (templ.size() < 6 or templ.compare(templ.size() - 6, 6, "XXXXXX") != 0) {
        THROW("TemporaryDirectory: template has to end with XXXXXX: ", templ);
    }
    if (mkdtemp(templ.data()) == nullptr) {
        THROW("mkdtemp()", errmsg());
    }
    path_ = std::move(templ);
    path_ += '/';
}

TemporaryDirectory& TemporaryDirectory::operator=(TemporaryDirectory&& other) noexcept {
    if (exists()) {
        remove_directory_tree(path_);
    }
    path_ = std::move(other.path_);
    other.path_.clear();
    return *this;
}

TemporaryDirectory::~TemporaryDirectory() {
    if (exists()) {
        remove_directory_tree(path_);
    }
}
