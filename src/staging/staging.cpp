#include "debpack/staging.hpp"
#include "debpack/gzip.hpp"
#include "debpack/metadata.hpp"
#include "debpack/path_utils.hpp"
#include "debpack/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <filesystem>

namespace fs = std::filesystem;

namespace debpack {

namespace {

StagingResult fail(BuildError code, std::string message) {
    StagingResult result;
    result.error_code = code;
    result.error = std::move(message);
    return result;
}

// Resolves symlinks in the existing prefix so aliases of one directory compare equal
std::string resolved_path(const std::string& path) {
    std::error_code ec;
    auto p = fs::weakly_canonical(fs::absolute(path, ec), ec);
    if (ec) {
        return absolute_path(path);
    }
    std::string out = to_portable_path(p.lexically_normal().string());
    while (out.size() > 1 && out.back() == '/') {
        out.pop_back();
    }
    return out;
}

// True if `dir` is `path` or one of its ancestors
bool contains_path(const std::string& dir, const std::string& path) {
    if (dir == path || dir == "/") return true;
    return path.size() > dir.size() && path.compare(0, dir.size(), dir) == 0 &&
           path[dir.size()] == '/';
}

} // namespace

const std::vector<std::string>& maintainer_script_names() {
    static const std::vector<std::string> names = {"preinst", "postinst", "prerm", "postrm"};
    return names;
}

std::string default_staging_root(const std::string& output_dir,
                                 const PackageMetadata& metadata) {
    std::string dir_name = "." + metadata.name + "_" + strip_epoch(metadata.version) +
                           "_" + metadata.architecture + ".staging";
    return join_path(output_dir.empty() ? "." : output_dir, dir_name);
}

StageResult check_release_binary(const std::string& binary_path) {
    if (binary_path.empty()) {
        return StageResult::failure(BuildError::MissingArtifact,
                                    "no release binary configured");
    }
    if (!path_exists(binary_path)) {
        return StageResult::failure(BuildError::MissingArtifact,
                                    "missing build artifact: " + binary_path +
                                        " (run the release build first)");
    }
    if (!is_regular_file(binary_path)) {
        return StageResult::failure(BuildError::MissingArtifact,
                                    "build artifact is not a regular file: " + binary_path);
    }
    auto mode = file_mode(binary_path);
    if (mode && (*mode & 0100) == 0) {
        spdlog::warn("release binary {} is not executable ({}); staging will fix the mode",
                     binary_path, format_mode(*mode));
    }
    return StageResult::success();
}

StageResult check_staging_root(const std::string& staging_root,
                               const std::string& archive_path) {
    if (staging_root.empty()) {
        return StageResult::failure(BuildError::StagingError, "staging directory is empty");
    }

    const std::string root = resolved_path(staging_root);
    if (root == "/") {
        return StageResult::failure(BuildError::StagingError,
                                    "refusing to use the filesystem root as staging directory");
    }

    std::error_code ec;
    const std::string cwd = resolved_path(fs::current_path(ec).string());
    const std::string archive = resolved_path(archive_path);
    const struct {
        const char* what;
        std::string path;
    } protected_paths[] = {
        {"the working directory", ec ? std::string() : cwd},
        {"the output directory", get_parent_directory(archive)},
        {"the output archive", archive},
    };

    for (const auto& p : protected_paths) {
        if (!p.path.empty() && contains_path(root, p.path)) {
            return StageResult::failure(BuildError::StagingError,
                                        "staging directory " + staging_root + " contains " +
                                            p.what + " and would be deleted with it");
        }
    }
    return StageResult::success();
}

std::uint64_t installed_size_kib(const std::string& root) {
    std::uint64_t total = 0;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        if (entry.path().filename() == "DEBIAN" && it.depth() == 0) {
            it.disable_recursion_pending();
            continue;
        }
        std::error_code size_ec;
        if (entry.is_regular_file(size_ec)) {
            auto size = entry.file_size(size_ec);
            if (!size_ec) {
                total += (size + 1023) / 1024;
            }
        } else {
            // Directories and other inodes count as one block each
            total += 1;
        }
    }
    return total;
}

StagingResult build_staging_tree(const std::string& staging_root,
                                 const PackageMetadata& metadata,
                                 const StagingLayout& layout) {
    // Every tree path derives from one normalized absolute root
    const std::string root = absolute_path(staging_root);

    // Precondition checks touch nothing on disk
    auto binary = check_release_binary(layout.binary_path);
    if (!binary.ok) {
        return fail(binary.error_code, binary.error);
    }

    auto install_dir = normalize_under_root(root, layout.install_dir);
    if (!install_dir.ok) {
        return fail(BuildError::StagingError, "invalid install directory '" +
                                                  layout.install_dir + "': " +
                                                  path_error_to_string(install_dir.error));
    }

    std::string install_name = layout.install_name.empty() ? metadata.name : layout.install_name;
    if (install_name.find('/') != std::string::npos || install_name == "." ||
        install_name == "..") {
        return fail(BuildError::StagingError, "invalid install name: '" + install_name + "'");
    }

    for (const auto& [script, source] : layout.scripts) {
        const auto& names = maintainer_script_names();
        if (std::find(names.begin(), names.end(), script) == names.end()) {
            return fail(BuildError::StagingError, "unsupported maintainer script: " + script);
        }
        if (!is_regular_file(source)) {
            return fail(BuildError::StagingError,
                        "maintainer script " + script + " not found: " + source);
        }
    }

    StagingResult result;
    auto& tree = result.tree;
    tree.root = root;
    tree.install_dir = install_dir.path;
    tree.control_dir = join_path(root, "DEBIAN");
    tree.control_file = join_path(tree.control_dir, "control");
    tree.installed_binary = join_path(tree.install_dir, install_name);

    // Always start from an empty root
    if (path_exists(root)) {
        spdlog::debug("removing stale staging tree {}", root);
        if (!remove_directory(root)) {
            return fail(BuildError::StagingError, "cannot remove stale staging tree: " + root);
        }
    }

    if (!create_directories(tree.install_dir) || !create_directories(tree.control_dir)) {
        return fail(BuildError::StagingError, "cannot create staging directories under " + root);
    }

    spdlog::info("staging {} as {}", layout.binary_path, tree.installed_binary);
    if (!copy_file(layout.binary_path, tree.installed_binary)) {
        return fail(BuildError::StagingError, "cannot copy " + layout.binary_path + " to " +
                                                  tree.installed_binary);
    }

    for (const auto& [script, source] : layout.scripts) {
        std::string dest = join_path(tree.control_dir, script);
        if (!copy_file(source, dest)) {
            return fail(BuildError::StagingError, "cannot copy maintainer script " + source);
        }
        tree.maintainer_scripts.push_back(dest);
    }

    if (!layout.changelog.empty() || !layout.copyright.empty()) {
        std::string doc_dir = join_path(root, "usr/share/doc/" + metadata.name);
        if (!create_directories(doc_dir)) {
            return fail(BuildError::StagingError, "cannot create " + doc_dir);
        }

        if (!layout.copyright.empty()) {
            std::string dest = join_path(doc_dir, "copyright");
            if (!is_regular_file(layout.copyright) || !copy_file(layout.copyright, dest)) {
                return fail(BuildError::StagingError,
                            "cannot copy copyright file " + layout.copyright);
            }
            tree.doc_files.push_back(dest);
        }

        if (!layout.changelog.empty()) {
            auto text = read_file(layout.changelog);
            if (!text) {
                return fail(BuildError::StagingError,
                            "cannot read changelog " + layout.changelog);
            }
            auto compressed = gzip_compress(*text);
            std::string dest = join_path(doc_dir, "changelog.gz");
            if (compressed.empty() || !write_file(dest, compressed)) {
                return fail(BuildError::StagingError, "cannot write " + dest);
            }
            tree.doc_files.push_back(dest);
        }
    }

    auto control = prepare_control(layout.control, metadata, installed_size_kib(root));
    if (!control.ok) {
        return fail(control.error_code, control.error);
    }
    if (!write_file(tree.control_file, control.content)) {
        return fail(BuildError::StagingError, "cannot write " + tree.control_file);
    }
    result.control_generated = control.generated;

    result.ok = true;
    return result;
}

// ============================================================================
// StagingGuard
// ============================================================================

StagingGuard::StagingGuard(std::string root, CleanupCallback on_cleanup)
    : root_(std::move(root)), on_cleanup_(std::move(on_cleanup)) {}

StagingGuard::~StagingGuard() {
    try {
        cleanup();
    } catch (const std::exception& e) {
        // The cleanup callback allocates; nothing may escape a destructor
        spdlog::error("staging cleanup of {} failed: {}", root_, e.what());
    }
}

StageResult StagingGuard::cleanup() {
    if (done_) {
        return StageResult::success();
    }
    done_ = true;

    StageResult result = StageResult::success();
    if (keep_) {
        spdlog::info("keeping staging tree {}", root_);
    } else if (!remove_directory(root_)) {
        result = StageResult::failure(BuildError::CleanupFailure,
                                      "failed to remove staging tree " + root_);
    } else {
        spdlog::debug("removed staging tree {}", root_);
    }

    if (on_cleanup_) {
        on_cleanup_(result);
    }
    return result;
}

} // namespace debpack
