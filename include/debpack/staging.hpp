#pragma once

#include "debpack/control.hpp"
#include "debpack/types.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace debpack {

// ============================================================================
// Staging Layout (inputs)
// ============================================================================

struct StagingLayout {
    std::string binary_path;                 // Prebuilt release binary
    std::string install_dir = "usr/bin";     // Package-relative install directory
    std::string install_name;                // Public name; default: package name
    ControlSource control;

    // Maintainer scripts: script name (preinst, postinst, prerm, postrm) -> source
    std::map<std::string, std::string> scripts;

    // Optional documentation installed under usr/share/doc/<name>/
    std::string changelog;                   // Plain text, shipped as changelog.gz
    std::string copyright;
};

// ============================================================================
// Staging Tree (output)
// ============================================================================

struct StagingTree {
    std::string root;
    std::string install_dir;                 // <root>/usr/bin
    std::string control_dir;                 // <root>/DEBIAN
    std::string control_file;                // <root>/DEBIAN/control
    std::string installed_binary;            // <root>/usr/bin/<install_name>
    std::vector<std::string> maintainer_scripts;
    std::vector<std::string> doc_files;
};

struct StagingResult {
    bool ok = false;
    BuildError error_code = BuildError::None;
    std::string error;
    StagingTree tree;
    bool control_generated = false;
};

// Maintainer script names accepted in DEBIAN/
const std::vector<std::string>& maintainer_script_names();

// <output_dir>/.<name>_<version>_<arch>.staging
std::string default_staging_root(const std::string& output_dir,
                                 const PackageMetadata& metadata);

// Fails with MissingArtifact unless `binary_path` is an existing regular file
StageResult check_release_binary(const std::string& binary_path);

// The staging root is deleted before and after every run, so it must not be
// a filesystem root, the working directory, or the archive's directory or
// one of their ancestors. Fails with StagingError.
StageResult check_staging_root(const std::string& staging_root,
                               const std::string& archive_path);

// Payload size in KiB as dpkg reports it (DEBIAN/ excluded)
std::uint64_t installed_size_kib(const std::string& root);

// Build the staging tree at `root`. The release binary is checked before
// anything is written. Any previous tree at `root` is removed first, so an
// interrupted earlier run never leaks into this one.
StagingResult build_staging_tree(const std::string& root,
                                 const PackageMetadata& metadata,
                                 const StagingLayout& layout);

// ============================================================================
// Scoped Staging Ownership
// ============================================================================

// Owns a staging root for the duration of a run and removes it on every exit
// path, including exceptions. The callback observes the removal outcome.
class StagingGuard {
public:
    using CleanupCallback = std::function<void(const StageResult&)>;

    explicit StagingGuard(std::string root, CleanupCallback on_cleanup = nullptr);
    ~StagingGuard();

    StagingGuard(const StagingGuard&) = delete;
    StagingGuard& operator=(const StagingGuard&) = delete;

    const std::string& root() const { return root_; }

    // Leave the tree on disk (debugging aid); cleanup still reports
    void keep() { keep_ = true; }

    // Remove the tree now. Later calls (and the destructor) are no-ops.
    StageResult cleanup();

private:
    std::string root_;
    CleanupCallback on_cleanup_;
    bool keep_ = false;
    bool done_ = false;
};

} // namespace debpack
