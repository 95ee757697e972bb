#pragma once

#include "debpack/archiver.hpp"
#include "debpack/installer.hpp"
#include "debpack/metadata.hpp"
#include "debpack/staging.hpp"
#include "debpack/types.hpp"

#include <string>
#include <vector>

namespace debpack {

// ============================================================================
// Pipeline
// ============================================================================

struct PipelineOptions {
    MetadataRequest metadata;
    StagingLayout layout;
    std::string output_dir = ".";
    std::string staging_root;       // Empty: default_staging_root(output_dir, ...)
    bool keep_staging = false;
};

struct PipelineReport {
    bool ok = false;
    BuildError error_code = BuildError::None;
    std::string error;

    PackageMetadata metadata;
    std::string staging_root;
    std::string archive_path;       // Set once the archive exists
    bool install_attempted = false;
    bool installed = false;

    std::vector<PipelineState> transitions;
    std::vector<std::string> warnings;

    PipelineState state() const {
        return transitions.empty() ? PipelineState::Resolving : transitions.back();
    }

    // 0 on full success, 2 when only installation failed, 1 otherwise
    int exit_code() const;
};

// Resolve -> stage -> normalize -> archive -> [install], then clean up.
// Cleanup runs on every path once staging has begun. Pass a null installer
// to build without installing.
PipelineReport run_pipeline(const PipelineOptions& options,
                            Archiver& archiver,
                            Installer* installer = nullptr);

} // namespace debpack
