#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace debpack {

// ============================================================================
// Subprocess Execution
// ============================================================================

// A command to spawn. argv[0] is resolved through PATH when it has no slash.
struct ProcessSpec {
    std::vector<std::string> argv;
    std::string cwd;            // Empty: inherit the caller's directory
};

struct ExecResult {
    bool ok = false;            // Process was spawned and reaped
    int exit_code = -1;         // Exit status, or 128 + signal number
    std::string error;          // Set when !ok
};

// A configurable external command with "{key}" placeholders in its arguments
struct CommandTemplate {
    std::string program;
    std::vector<std::string> args;

    ProcessSpec expand(const std::unordered_map<std::string, std::string>& vars) const;
};

// Spawn the process, block until it exits and report its status.
// stdin/stdout/stderr are inherited so interactive tools (sudo) still work.
ExecResult run_process(const ProcessSpec& spec);

// Substitute "{key}" placeholders in each argument
std::vector<std::string> expand_arguments(
    const std::vector<std::string>& args,
    const std::unordered_map<std::string, std::string>& vars);

// Render argv for log messages, quoting arguments that contain spaces
std::string format_command_line(const std::vector<std::string>& argv);

} // namespace debpack
