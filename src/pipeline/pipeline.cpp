#include "debpack/pipeline.hpp"
#include "debpack/permissions.hpp"
#include "debpack/platform.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <filesystem>

namespace debpack {

int PipelineReport::exit_code() const {
    if (ok) return 0;
    if (error_code == BuildError::InstallFailure && !archive_path.empty()) return 2;
    return 1;
}

namespace {

class PipelineRun {
public:
    PipelineRun(const PipelineOptions& options, Archiver& archiver, Installer* installer)
        : options_(options), archiver_(archiver), installer_(installer) {}

    PipelineReport run() {
        enter(PipelineState::Resolving);

        auto meta = resolve_metadata(options_.metadata);
        if (!meta.ok) {
            // Nothing exists on disk yet, so there is nothing to clean up
            return finish(StageResult::failure(meta.error_code, meta.error));
        }
        report_.metadata = meta.metadata;
        spdlog::info("packaging {} {} ({})", meta.metadata.name, meta.metadata.version,
                     meta.metadata.architecture);

        report_.staging_root = options_.staging_root.empty()
            ? default_staging_root(options_.output_dir, meta.metadata)
            : options_.staging_root;

        auto root_check = check_staging_root(
            report_.staging_root, archive_output_path(options_.output_dir, meta.metadata));
        if (!root_check.ok) {
            // Rejected before the guard owns it, so nothing is removed
            return finish(root_check);
        }

        StageResult outcome;
        try {
            outcome = build_with_cleanup();
        } catch (const std::filesystem::filesystem_error& e) {
            outcome = StageResult::failure(BuildError::StagingError, e.what());
        } catch (const std::exception& e) {
            outcome = StageResult::failure(BuildError::StagingError,
                                           std::string("unexpected error: ") + e.what());
        }
        return finish(outcome);
    }

private:
    void enter(PipelineState state) {
        spdlog::debug("pipeline: {}", pipeline_state_to_string(state));
        report_.transitions.push_back(state);
    }

    void warn(const std::string& message) {
        spdlog::warn("{}", message);
        report_.warnings.push_back(message);
    }

    // Stages that own the staging tree. The guard removes it when this
    // function returns or unwinds.
    StageResult build_with_cleanup() {
        StagingGuard guard(report_.staging_root, [this](const StageResult& cleanup) {
            enter(PipelineState::CleaningUp);
            if (!cleanup.ok) {
                warn(cleanup.error + " (remove it before the next run)");
            }
        });
        if (options_.keep_staging) {
            guard.keep();
        }

        enter(PipelineState::Staging);
        auto staged = build_staging_tree(report_.staging_root, report_.metadata, options_.layout);
        if (!staged.ok) {
            return StageResult::failure(staged.error_code, staged.error);
        }
        if (staged.control_generated) {
            spdlog::debug("generated control file {}", staged.tree.control_file);
        }

        enter(PipelineState::Normalizing);
        auto normalized = normalize_permissions(staged.tree);
        if (!normalized.ok) {
            return normalized;
        }
        auto violations = verify_permissions(staged.tree);
        if (!violations.empty()) {
            const auto& v = violations.front();
            return StageResult::failure(
                BuildError::PermissionError,
                v.path + " has mode " + format_mode(v.actual) + ", expected " +
                    format_mode(v.expected));
        }

        enter(PipelineState::Archiving);
        auto output = archive_output_path(options_.output_dir, report_.metadata);
        auto archived = build_archive(archiver_, staged.tree.root, output);
        if (!archived.ok) {
            return StageResult::failure(archived.error_code, archived.error);
        }
        report_.archive_path = archived.archive_path;

        if (installer_) {
            enter(PipelineState::Installing);
            report_.install_attempted = true;
            auto installed = installer_->install(report_.archive_path);
            if (!installed.ok) {
                return StageResult::failure(
                    BuildError::InstallFailure,
                    installed.error + "; the archive is still available at " +
                        report_.archive_path);
            }
            report_.installed = true;
        }

        return StageResult::success();
    }

    PipelineReport finish(const StageResult& outcome) {
        report_.ok = outcome.ok;
        report_.error_code = outcome.error_code;
        report_.error = outcome.error;
        if (outcome.ok) {
            enter(PipelineState::Done);
        } else {
            if (is_fatal(outcome.error_code)) {
                spdlog::error("{}: {}", build_error_to_string(outcome.error_code), outcome.error);
            } else {
                spdlog::warn("{}: {}", build_error_to_string(outcome.error_code), outcome.error);
            }
            enter(PipelineState::Failed);
        }
        return report_;
    }

    const PipelineOptions& options_;
    Archiver& archiver_;
    Installer* installer_;
    PipelineReport report_;
};

} // namespace

PipelineReport run_pipeline(const PipelineOptions& options,
                            Archiver& archiver,
                            Installer* installer) {
    PipelineRun run(options, archiver, installer);
    return run.run();
}

} // namespace debpack
