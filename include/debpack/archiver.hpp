#pragma once

#include "debpack/process.hpp"
#include "debpack/types.hpp"

#include <string>

namespace debpack {

// ============================================================================
// Archive Naming
// ============================================================================

// <name>_<version>_<architecture>.<extension>, epoch dropped from version.
// A pure function of the metadata: rebuilding overwrites, never accumulates.
std::string archive_file_name(const PackageMetadata& metadata,
                              const std::string& extension = "deb");

std::string archive_output_path(const std::string& output_dir,
                                const PackageMetadata& metadata);

// ============================================================================
// Archiver Interface
// ============================================================================

struct ArchiveRequest {
    std::string staging_root;
    std::string output_path;    // Where the tool must write the archive
};

struct ArchiveResult {
    bool ok = false;
    BuildError error_code = BuildError::None;
    std::string error;
    std::string archive_path;
    int exit_code = -1;
};

// Turns a normalized staging tree into a package archive
class Archiver {
public:
    virtual ~Archiver() = default;
    virtual ArchiveResult build(const ArchiveRequest& request) = 0;
};

// dpkg-deb --root-owner-group --build {staging} {output}
CommandTemplate default_archiver_command();

// Runs an external packaging tool. "{staging}" and "{output}" in the
// arguments are replaced per request.
class CommandArchiver : public Archiver {
public:
    explicit CommandArchiver(CommandTemplate command = default_archiver_command());

    ArchiveResult build(const ArchiveRequest& request) override;

    const CommandTemplate& command() const { return command_; }

private:
    CommandTemplate command_;
};

// Run `archiver` so that the archive appears at `output_path` only on
// success. The tool writes "<output_path>.partial", which is renamed into
// place afterwards; on any failure the partial file is removed and an
// existing archive at `output_path` is left untouched.
ArchiveResult build_archive(Archiver& archiver,
                            const std::string& staging_root,
                            const std::string& output_path);

} // namespace debpack
