#pragma once

#include "debpack/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace debpack {

// ============================================================================
// Control Descriptor (DEBIAN/control)
// ============================================================================

struct ControlField {
    std::string name;
    std::string value;   // Continuation lines kept verbatim, joined with '\n'
};

// One deb822 paragraph. Field names compare case-insensitively.
struct ControlDescriptor {
    std::vector<ControlField> fields;

    std::optional<std::string> get(const std::string& name) const;

    // Replace an existing field or append a new one
    void set(const std::string& name, const std::string& value);

    std::string render() const;
};

struct ControlParseResult {
    bool ok = false;
    std::string error;
    ControlDescriptor descriptor;
};

ControlParseResult parse_control(const std::string& content);

// Fields every binary package control file must carry
const std::vector<std::string>& required_control_fields();

// Replace ${name}, ${version} and ${architecture} with resolved metadata
std::string render_control_template(const std::string& content,
                                    const PackageMetadata& metadata);

// ============================================================================
// Control Generation
// ============================================================================

// Descriptive fields used when no static control file is configured
struct ControlFields {
    std::string maintainer;     // "Name <email>"
    std::string description;    // Synopsis, optionally followed by "\n" + long text
    std::string section;
    std::string priority = "optional";
    std::string homepage;
};

ControlDescriptor generate_control(const PackageMetadata& metadata,
                                   const ControlFields& fields,
                                   std::uint64_t installed_size_kib);

// Check required fields and that Package/Version/Architecture agree with the
// resolved metadata
StageResult validate_control(const ControlDescriptor& control,
                             const PackageMetadata& metadata);

// Where the control file comes from
struct ControlSource {
    std::string path;           // Static file; empty to generate from `fields`
    ControlFields fields;
};

struct ControlPrepareResult {
    bool ok = false;
    BuildError error_code = BuildError::None;
    std::string error;
    std::string content;        // Exact bytes to write to DEBIAN/control
    bool generated = false;
};

// Produce the final control file text. A static file without placeholders is
// returned byte-for-byte.
ControlPrepareResult prepare_control(const ControlSource& source,
                                     const PackageMetadata& metadata,
                                     std::uint64_t installed_size_kib);

} // namespace debpack
