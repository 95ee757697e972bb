#pragma once

#include "debpack/pipeline.hpp"
#include "debpack/process.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace debpack {

// ============================================================================
// Build Configuration (debpack.json)
// ============================================================================

constexpr const char* kDefaultConfigFile = "debpack.json";

struct BuildConfig {
    std::string source_path;            // Config file this was read from, if any

    std::string manifest = "Cargo.toml";

    struct {
        std::string name;
        std::string architecture;
        std::string maintainer;
        std::string description;
        std::string section;
        std::string priority = "optional";
        std::string homepage;
    } package;

    struct {
        std::string path;
        std::string install_dir = "usr/bin";
        std::string install_name;
    } binary;

    std::string control;                // Static control file (optional)
    std::map<std::string, std::string> scripts;

    struct {
        std::string changelog;
        std::string copyright;
    } docs;

    std::string output_dir = ".";
    std::string staging_dir;

    CommandTemplate archiver;
    CommandTemplate installer;
    bool install = false;

    BuildConfig();
};

struct ConfigLoadResult {
    bool ok = false;
    std::string error;
    BuildConfig config;
    std::vector<std::string> warnings;  // Unknown keys and similar
};

// Parse a config document. Relative paths resolve against `base_dir`.
ConfigLoadResult parse_build_config(const std::string& json_str,
                                    const std::string& base_dir,
                                    const std::string& source_path = "");

ConfigLoadResult load_build_config(const std::string& path);

// Config file to use. Priority: explicit path > DEBPACK_CONFIG >
// ./debpack.json if present. nullopt means built-in defaults.
std::optional<std::string> find_config_path(const std::optional<std::string>& override_path);

// Apply DEBPACK_OUTPUT_DIR and DEBPACK_ARCH on top of the file values
void apply_environment(BuildConfig& config);

PipelineOptions to_pipeline_options(const BuildConfig& config);

// Starter debpack.json for `debpack init`
std::string render_starter_config(const std::string& name);

// Starter DEBIAN/control template for `debpack init`
std::string render_starter_control(const std::string& maintainer);

} // namespace debpack
