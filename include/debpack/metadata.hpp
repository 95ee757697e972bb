#pragma once

#include "debpack/types.hpp"

#include <optional>
#include <string>

namespace debpack {

// ============================================================================
// Build Manifest
// ============================================================================

// Identity read from the application's own build descriptor
struct BuildManifest {
    std::string name;
    std::string version;
    std::string source_path;
};

struct ManifestParseResult {
    bool ok = false;
    std::string error;
    BuildManifest manifest;
};

// Parse the [package] table of a Cargo.toml
ManifestParseResult parse_cargo_manifest(const std::string& content,
                                         const std::string& source_path = "");

// Parse a JSON manifest: top-level name/version, or package.name/package.version
ManifestParseResult parse_json_manifest(const std::string& content,
                                        const std::string& source_path = "");

// Read a manifest from disk. *.json files are parsed as JSON, everything
// else as Cargo.toml.
ManifestParseResult read_build_manifest(const std::string& path);

// ============================================================================
// Debian Identity Rules
// ============================================================================

// [a-z0-9][a-z0-9+.-]+
bool is_valid_package_name(const std::string& name);

// [epoch:]upstream[-revision]; upstream starts with a digit
bool is_valid_debian_version(const std::string& version);

// Map an upstream version to a Debian version. SemVer pre-releases use '~'
// so that 1.0.0-rc.1 sorts before 1.0.0. Non-SemVer strings pass through.
std::string to_debian_version(const std::string& upstream);

// Version with any epoch removed, as used in archive file names
std::string strip_epoch(const std::string& version);

// Map a uname(2) machine name to a Debian architecture, nullopt if unknown
std::optional<std::string> debian_architecture_for_machine(const std::string& machine);

// Architecture of the running host, "amd64" if it cannot be mapped
std::string host_architecture();

// ============================================================================
// Metadata Resolution
// ============================================================================

struct MetadataRequest {
    std::string manifest_path;      // Authoritative version source
    std::string name;               // Optional override; default: manifest name
    std::string architecture;       // Optional override; default: host
};

struct MetadataResult {
    bool ok = false;
    BuildError error_code = BuildError::None;
    std::string error;
    PackageMetadata metadata;
    std::string upstream_version;   // Version exactly as the manifest states it
};

// Resolve PackageMetadata. Pure read: never mutates the filesystem.
MetadataResult resolve_metadata(const MetadataRequest& request);

} // namespace debpack
