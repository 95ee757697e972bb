#include "debpack/archiver.hpp"
#include "debpack/metadata.hpp"
#include "debpack/platform.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <utility>

namespace fs = std::filesystem;

namespace debpack {

std::string archive_file_name(const PackageMetadata& metadata, const std::string& extension) {
    return metadata.name + "_" + strip_epoch(metadata.version) + "_" +
           metadata.architecture + "." + extension;
}

std::string archive_output_path(const std::string& output_dir,
                                const PackageMetadata& metadata) {
    return join_path(output_dir.empty() ? "." : output_dir, archive_file_name(metadata));
}

CommandTemplate default_archiver_command() {
    return CommandTemplate{"dpkg-deb", {"--root-owner-group", "--build", "{staging}", "{output}"}};
}

// ============================================================================
// CommandArchiver
// ============================================================================

CommandArchiver::CommandArchiver(CommandTemplate command)
    : command_(std::move(command)) {}

ArchiveResult CommandArchiver::build(const ArchiveRequest& request) {
    ArchiveResult result;
    result.error_code = BuildError::ArchiveBuildFailure;

    auto spec = command_.expand({
        {"staging", request.staging_root},
        {"output", request.output_path},
    });

    spdlog::info("running {}", format_command_line(spec.argv));
    auto exec = run_process(spec);
    if (!exec.ok) {
        result.error = command_.program + ": " + exec.error;
        return result;
    }

    result.exit_code = exec.exit_code;
    if (exec.exit_code == 127) {
        result.error = command_.program + " could not be executed (exit 127; is it installed?)";
        return result;
    }
    if (exec.exit_code != 0) {
        result.error = command_.program + " exited with status " +
                       std::to_string(exec.exit_code);
        return result;
    }

    result.archive_path = request.output_path;
    result.error_code = BuildError::None;
    result.ok = true;
    return result;
}

// ============================================================================
// Atomic Archive Build
// ============================================================================

ArchiveResult build_archive(Archiver& archiver,
                            const std::string& staging_root,
                            const std::string& output_path) {
    const std::string partial = output_path + ".partial";

    auto fail = [&partial](ArchiveResult r, const std::string& message) {
        if (!remove_file(partial)) {
            spdlog::warn("could not remove partial archive {}", partial);
        }
        r.ok = false;
        r.error_code = BuildError::ArchiveBuildFailure;
        if (!message.empty()) {
            r.error = message;
        }
        r.archive_path.clear();
        return r;
    };

    std::string parent = get_parent_directory(output_path);
    if (!parent.empty() && !create_directories(parent)) {
        return fail(ArchiveResult{}, "cannot create output directory " + parent);
    }

    // A leftover from an interrupted run must not be mistaken for output
    if (!remove_file(partial)) {
        return fail(ArchiveResult{}, "cannot remove stale " + partial);
    }

    auto result = archiver.build(ArchiveRequest{staging_root, partial});
    if (!result.ok) {
        return fail(result, result.error.empty() ? "archiver failed" : "");
    }

    if (!is_regular_file(partial)) {
        return fail(result, "archiver reported success but produced no archive at " + partial);
    }

    std::error_code ec;
    fs::rename(partial, output_path, ec);
    if (ec) {
        return fail(result, "cannot move archive into place: " + ec.message());
    }

    result.archive_path = output_path;
    spdlog::info("built {}", output_path);
    return result;
}

} // namespace debpack
