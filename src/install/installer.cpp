#include "debpack/installer.hpp"
#include "debpack/platform.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace debpack {

CommandTemplate default_installer_command() {
    return CommandTemplate{"sudo", {"apt-get", "install", "{archive}"}};
}

CommandInstaller::CommandInstaller(CommandTemplate command)
    : command_(std::move(command)) {}

InstallResult CommandInstaller::install(const std::string& archive_path) {
    InstallResult result;
    result.error_code = BuildError::InstallFailure;

    if (!is_regular_file(archive_path)) {
        result.error = "archive not found: " + archive_path;
        return result;
    }

    auto spec = command_.expand({{"archive", absolute_path(archive_path)}});

    spdlog::info("installing with {}", format_command_line(spec.argv));
    auto exec = run_process(spec);
    if (!exec.ok) {
        result.error = command_.program + ": " + exec.error;
        return result;
    }

    result.exit_code = exec.exit_code;
    if (exec.exit_code != 0) {
        result.error = format_command_line(spec.argv) + " exited with status " +
                       std::to_string(exec.exit_code);
        return result;
    }

    result.error_code = BuildError::None;
    result.ok = true;
    return result;
}

} // namespace debpack
