#pragma once

#include <string>

namespace debpack {

enum class PathError {
    None,
    Empty,
    ContainsNul,
    EscapesRoot,
};

struct PathResult {
    bool ok;
    std::string path;  // root-joined normalized path when ok
    PathError error;
};

const char* path_error_to_string(PathError e);

// Place a package-relative path (e.g. "usr/bin" or "/usr/bin") under a
// staging root without touching the filesystem.
// - Rejects empty paths and NUL bytes
// - Leading separators are stripped: "/usr/bin" lands at <root>/usr/bin
// - Collapses "." and ".." segments
// - Fails if the result would escape root
PathResult normalize_under_root(const std::string& root,
                                const std::string& relative_path);

} // namespace debpack
