#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace debpack {

// ============================================================================
// Package Metadata
// ============================================================================

// Identity of the package being built. Resolved once per run, then immutable.
struct PackageMetadata {
    std::string name;           // Debian package name, e.g. "roextract"
    std::string version;        // Debian version string, e.g. "1.0.4"
    std::string architecture;   // Debian architecture, e.g. "amd64"

    bool operator==(const PackageMetadata& other) const {
        return name == other.name && version == other.version &&
               architecture == other.architecture;
    }
};

// ============================================================================
// Build Errors
// ============================================================================

enum class BuildError {
    None,
    MetadataError,        // Manifest missing/unparsable, invalid name or version
    MissingArtifact,      // Release binary absent
    InvalidControl,       // Control descriptor malformed or contradicts metadata
    StagingError,         // Directory creation or copy failed
    PermissionError,      // Mode change denied or verification failed
    ArchiveBuildFailure,  // Archiver exited non-zero or produced nothing
    InstallFailure,       // Installer exited non-zero or could not be spawned
    CleanupFailure,       // Staging removal failed (warning only)
};

inline const char* build_error_to_string(BuildError e) {
    switch (e) {
        case BuildError::None: return "NONE";
        case BuildError::MetadataError: return "METADATA_ERROR";
        case BuildError::MissingArtifact: return "MISSING_ARTIFACT";
        case BuildError::InvalidControl: return "INVALID_CONTROL";
        case BuildError::StagingError: return "STAGING_ERROR";
        case BuildError::PermissionError: return "PERMISSION_ERROR";
        case BuildError::ArchiveBuildFailure: return "ARCHIVE_BUILD_FAILURE";
        case BuildError::InstallFailure: return "INSTALL_FAILURE";
        case BuildError::CleanupFailure: return "CLEANUP_FAILURE";
    }
    return "UNKNOWN";
}

inline std::optional<BuildError> parse_build_error(const std::string& s) {
    if (s == "NONE") return BuildError::None;
    if (s == "METADATA_ERROR") return BuildError::MetadataError;
    if (s == "MISSING_ARTIFACT") return BuildError::MissingArtifact;
    if (s == "INVALID_CONTROL") return BuildError::InvalidControl;
    if (s == "STAGING_ERROR") return BuildError::StagingError;
    if (s == "PERMISSION_ERROR") return BuildError::PermissionError;
    if (s == "ARCHIVE_BUILD_FAILURE") return BuildError::ArchiveBuildFailure;
    if (s == "INSTALL_FAILURE") return BuildError::InstallFailure;
    if (s == "CLEANUP_FAILURE") return BuildError::CleanupFailure;
    return std::nullopt;
}

// Fatal errors abort the run. InstallFailure and CleanupFailure do not
// invalidate an archive that was already produced.
inline bool is_fatal(BuildError e) {
    return e != BuildError::None &&
           e != BuildError::InstallFailure &&
           e != BuildError::CleanupFailure;
}

// Outcome of a single pipeline stage
struct StageResult {
    bool ok = false;
    BuildError error_code = BuildError::None;
    std::string error;

    static StageResult success() {
        StageResult r;
        r.ok = true;
        return r;
    }

    static StageResult failure(BuildError code, std::string message) {
        StageResult r;
        r.error_code = code;
        r.error = std::move(message);
        return r;
    }
};

// ============================================================================
// Pipeline States
// ============================================================================

enum class PipelineState {
    Resolving,
    Staging,
    Normalizing,
    Archiving,
    Installing,
    CleaningUp,
    Done,
    Failed,
};

inline const char* pipeline_state_to_string(PipelineState s) {
    switch (s) {
        case PipelineState::Resolving: return "resolving";
        case PipelineState::Staging: return "staging";
        case PipelineState::Normalizing: return "normalizing";
        case PipelineState::Archiving: return "archiving";
        case PipelineState::Installing: return "installing";
        case PipelineState::CleaningUp: return "cleaning_up";
        case PipelineState::Done: return "done";
        case PipelineState::Failed: return "failed";
    }
    return "unknown";
}

inline bool is_terminal(PipelineState s) {
    return s == PipelineState::Done || s == PipelineState::Failed;
}

} // namespace debpack
