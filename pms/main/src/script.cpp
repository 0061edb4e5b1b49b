#include "script.hpp"

#include "config.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

namespace fs = std::filesystem;

fs::path find_lifecycle_script(const fs::path& base_path) {
    for (const char* ext : {".sh", ".py"}) {
        fs::path candidate = base_path;
        candidate += ext;
        if (fs::is_regular_file(candidate)) {
            return candidate;
        }
    }
    return {};
}

bool run_lifecycle_script(const fs::path& base_path) {
    const fs::path script = find_lifecycle_script(base_path);
    if (script.empty()) return true;

    const std::string script_name = script.filename().string();
    log_info(string_format("info.running_script", script_name));

    std::vector<std::string> args;
    if (script.extension() == ".py") {
        args = {"python3", script.string()};
    } else {
        args = {"/bin/sh", script.string()};
    }
    const std::string root = ROOT_DIR.string();

    pid_t pid = fork();
    if (pid == -1) {
        log_error(string_format("error.script_fork_failed", script_name, std::string(strerror(errno))));
        return false;
    }
    if (pid == 0) {
        if (chdir(script.parent_path().c_str()) != 0) _exit(127);
        setenv("PMS_ROOT", root.c_str(), 1);

        std::vector<char*> c_args;
        for (const auto& arg : args) c_args.push_back(const_cast<char*>(arg.c_str()));
        c_args.push_back(nullptr);

        execvp(c_args[0], c_args.data());
        _exit(127);
    }

    int status;
    if (waitpid(pid, &status, 0) < 0) {
        log_error(string_format("error.script_wait_failed", script_name));
        return false;
    }
    int ret = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

    if (ret != 0) {
        log_error(string_format("error.script_failed", script_name, ret));
        return false;
    }
    return true;
}
