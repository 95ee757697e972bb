#pragma once

#include "debpack/process.hpp"
#include "debpack/types.hpp"

#include <string>

namespace debpack {

// ============================================================================
// Installer Capability
// ============================================================================

struct InstallResult {
    bool ok = false;
    BuildError error_code = BuildError::None;
    std::string error;
    int exit_code = -1;
};

// Installs a built archive on the host. Injected into the pipeline so that
// archive building never depends on privileges or a package database.
class Installer {
public:
    virtual ~Installer() = default;
    virtual InstallResult install(const std::string& archive_path) = 0;
};

// sudo apt-get install {archive}
CommandTemplate default_installer_command();

// Runs the host package manager. "{archive}" is replaced with the absolute
// archive path; apt only treats arguments containing a slash as local files.
// The tool may prompt on the inherited terminal.
class CommandInstaller : public Installer {
public:
    explicit CommandInstaller(CommandTemplate command = default_installer_command());

    InstallResult install(const std::string& archive_path) override;

    const CommandTemplate& command() const { return command_; }

private:
    CommandTemplate command_;
};

} // namespace debpack
