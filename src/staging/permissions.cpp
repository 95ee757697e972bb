#include "debpack/permissions.hpp"
#include "debpack/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace debpack {

namespace {

bool is_under(const std::string& path, const std::string& dir) {
    if (dir.empty() || path.size() <= dir.size()) return false;
    return path.compare(0, dir.size(), dir) == 0 && path[dir.size()] == '/';
}

struct StagedEntry {
    std::string path;
    fs::file_type type;
};

// Root first, then every entry below it without following symlinks
bool collect_entries(const std::string& root, std::vector<StagedEntry>& out,
                     std::string& error) {
    std::error_code ec;
    out.push_back({root, fs::symlink_status(root, ec).type()});
    if (ec) {
        error = "cannot stat " + root + ": " + ec.message();
        return false;
    }

    fs::recursive_directory_iterator it(root, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
        std::error_code st_ec;
        auto type = it->symlink_status(st_ec).type();
        if (st_ec) {
            error = "cannot stat " + it->path().string() + ": " + st_ec.message();
            return false;
        }
        out.push_back({to_portable_path(it->path().string()), type});
    }
    if (ec) {
        error = "cannot walk " + root + ": " + ec.message();
        return false;
    }
    return true;
}

} // namespace

unsigned expected_mode(const StagingTree& tree, const std::string& path, bool is_dir) {
    if (is_dir) {
        return kDirectoryMode;
    }
    if (path == tree.installed_binary || is_under(path, tree.install_dir)) {
        return kExecutableMode;
    }
    if (std::find(tree.maintainer_scripts.begin(), tree.maintainer_scripts.end(), path) !=
        tree.maintainer_scripts.end()) {
        return kExecutableMode;
    }
    return kDataMode;
}

StageResult normalize_permissions(const StagingTree& tree) {
    std::vector<StagedEntry> entries;
    std::string error;
    if (!collect_entries(tree.root, entries, error)) {
        return StageResult::failure(BuildError::PermissionError, error);
    }

    for (const auto& entry : entries) {
        bool is_dir = entry.type == fs::file_type::directory;
        if (!is_dir && entry.type != fs::file_type::regular) {
            return StageResult::failure(BuildError::PermissionError,
                                        "unsupported file type in staging tree: " + entry.path);
        }

        unsigned mode = expected_mode(tree, entry.path, is_dir);
        std::error_code ec;
        fs::permissions(entry.path, static_cast<fs::perms>(mode), fs::perm_options::replace, ec);
        if (ec) {
            return StageResult::failure(BuildError::PermissionError,
                                        "chmod " + format_mode(mode) + " " + entry.path +
                                            ": " + ec.message());
        }
    }

    spdlog::debug("normalized modes of {} staged entries", entries.size());
    return StageResult::success();
}

std::vector<PermissionViolation> verify_permissions(const StagingTree& tree) {
    std::vector<PermissionViolation> violations;
    std::vector<StagedEntry> entries;
    std::string error;
    if (!collect_entries(tree.root, entries, error)) {
        violations.push_back({tree.root, kDirectoryMode, 0});
        return violations;
    }

    for (const auto& entry : entries) {
        bool is_dir = entry.type == fs::file_type::directory;
        unsigned expected = expected_mode(tree, entry.path, is_dir);
        auto actual = file_mode(entry.path);
        bool supported = is_dir || entry.type == fs::file_type::regular;
        if (!supported || !actual || *actual != expected) {
            violations.push_back({entry.path, expected, actual.value_or(0)});
        }
    }
    return violations;
}

} // namespace debpack
