#pragma once

#include <coderun/concat_tostr.hh>
#include <coderun/execute/config.hh>
#include <coderun/file_contents.hh>
#include <coderun/file_info.hh>
#include <coderun/macros/throw.hh>
#include <coderun/temporary_directory.hh>
#include <filesystem>
#include <string>
#include <sys/stat.h>
#include <vector>

// Stands in for the docker CLI: `run` executes the mounted source file with
// /bin/sh (whatever the language), `kill` records the container name
class FakeDocker {
    TemporaryDirectory dir_{"/tmp/coderun-fake-docker-test.XXXXXX"};

public:
    FakeDocker() {
        auto script = concat_tostr(
            "#!/bin/sh\n"
            "if [ \"$1\" = kill ]; then\n"
            "    echo \"$2\" >> '",
            killed_containers_file(),
            "'\n"
            "    exit 0\n"
            "fi\n"
            "source=\n"
            "while [ $# -gt 0 ]; do\n"
            "    case \"$1\" in\n"
            "    run|-i|--rm) shift ;;\n"
            "    --pull|--name|--network|--pids-limit|--ulimit|--memory|--memory-swap) shift 2 ;;\n"
            "    --mount) rest=${2#*source=}; source=${rest%%,*}; shift 2 ;;\n"
            "    *) break ;;\n"
            "    esac\n"
            "done\n"
            "if ! [ -f \"$source\" ]; then\n"
            "    echo \"fake docker: missing source file: $source\" >&2\n"
            "    exit 125\n"
            "fi\n"
            "exec /bin/sh \"$source\"\n"
        );
        put_file_contents(executable(), script);
        if (chmod(executable().c_str(), 0755)) {
            THROW("chmod()");
        }
        if (mkdir(workspace_dir().c_str(), 0755)) {
            THROW("mkdir()");
        }
    }

    [[nodiscard]] std::string executable() const { return dir_.path() + "docker"; }

    [[nodiscard]] std::string workspace_dir() const { return dir_.path() + "workspace/"; }

    [[nodiscard]] std::string killed_containers_file() const { return dir_.path() + "killed"; }

    [[nodiscard]] std::string killed_containers() const {
        auto path = killed_containers_file();
        return path_exists(path) ? get_file_contents(path) : "";
    }

    [[nodiscard]] std::vector<std::string> workspace_files() const {
        std::vector<std::string> files;
        for (const auto& entry : std::filesystem::directory_iterator{workspace_dir()}) {
            files.emplace_back(entry.path().string());
        }
        return files;
    }

    [[nodiscard]] coderun::execute::Config config() const {
        auto config = coderun::execute::Config::defaults();
        config.docker_executable = executable();
        config.workspace_dir = workspace_dir();
        return config;
    }
};
