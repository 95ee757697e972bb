#pragma once

#include "debpack/staging.hpp"
#include "debpack/types.hpp"

#include <string>
#include <vector>

namespace debpack {

// ============================================================================
// Permission Normalization
// ============================================================================

// Modes dpkg-deb accepts for a binary package tree
constexpr unsigned kDirectoryMode = 0755;
constexpr unsigned kExecutableMode = 0755;
constexpr unsigned kDataMode = 0644;

// Mode a staged path must carry. Directories and everything under the binary
// install directory are 0755, as are maintainer scripts; DEBIAN/control and
// all other payload files are 0644.
unsigned expected_mode(const StagingTree& tree, const std::string& path, bool is_dir);

// Walk the tree (root included) and chmod every entry to its expected mode.
// Fails with PermissionError on the first mode change the filesystem refuses
// or on any symlink, device, FIFO or socket in the tree.
StageResult normalize_permissions(const StagingTree& tree);

struct PermissionViolation {
    std::string path;
    unsigned expected = 0;
    unsigned actual = 0;
};

// Every path whose mode differs from expected_mode(); empty when the tree
// is ready for the archiver
std::vector<PermissionViolation> verify_permissions(const StagingTree& tree);

} // namespace debpack
