#include "debpack/process.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace debpack {

ExecResult run_process(const ProcessSpec& spec) {
    ExecResult result;

    if (spec.argv.empty() || spec.argv[0].empty()) {
        result.error = "empty command";
        return result;
    }

    // Build C-style argv before forking
    std::vector<char*> argv;
    for (const auto& s : spec.argv) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    spdlog::debug("exec: {}", format_command_line(spec.argv));

    pid_t pid = fork();

    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        return result;
    }

    if (pid == 0) {
        // Child process
        if (!spec.cwd.empty()) {
            if (chdir(spec.cwd.c_str()) != 0) {
                _exit(127);
            }
        }

        execvp(argv[0], argv.data());

        // If execvp returns, it failed
        _exit(127);
    }

    // Parent process
    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited == -1 && errno == EINTR);

    if (waited == -1) {
        result.error = "waitpid failed: " + std::string(strerror(errno));
        return result;
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.ok = true;
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.ok = true;
    } else {
        result.error = "process terminated abnormally";
    }

    return result;
}

ProcessSpec CommandTemplate::expand(
    const std::unordered_map<std::string, std::string>& vars) const {
    ProcessSpec spec;
    spec.argv.push_back(program);
    for (auto& arg : expand_arguments(args, vars)) {
        spec.argv.push_back(std::move(arg));
    }
    return spec;
}

std::vector<std::string> expand_arguments(
    const std::vector<std::string>& args,
    const std::unordered_map<std::string, std::string>& vars) {
    std::vector<std::string> out;
    out.reserve(args.size());

    for (const auto& arg : args) {
        std::string expanded;
        size_t pos = 0;
        while (pos < arg.size()) {
            size_t open = arg.find('{', pos);
            if (open == std::string::npos) {
                expanded += arg.substr(pos);
                break;
            }
            size_t close = arg.find('}', open + 1);
            if (close == std::string::npos) {
                expanded += arg.substr(pos);
                break;
            }
            expanded += arg.substr(pos, open - pos);
            std::string key = arg.substr(open + 1, close - open - 1);
            auto it = vars.find(key);
            if (it != vars.end()) {
                expanded += it->second;
            } else {
                // Unknown placeholders pass through untouched
                expanded += arg.substr(open, close - open + 1);
            }
            pos = close + 1;
        }
        out.push_back(expanded);
    }

    return out;
}

std::string format_command_line(const std::vector<std::string>& argv) {
    std::string cmd;
    for (size_t i = 0; i < argv.size(); i++) {
        if (i > 0) cmd += " ";

        bool needs_quotes = argv[i].empty() ||
                            argv[i].find(' ') != std::string::npos ||
                            argv[i].find('\t') != std::string::npos;

        if (needs_quotes) cmd += "'";
        cmd += argv[i];
        if (needs_quotes) cmd += "'";
    }
    return cmd;
}

} // namespace debpack
