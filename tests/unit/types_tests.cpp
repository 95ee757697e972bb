#include <doctest/doctest.h>
#include <debpack/types.hpp>

using namespace debpack;

TEST_CASE("build_error_to_string and parse_build_error agree") {
    const BuildError all[] = {
        BuildError::None,           BuildError::MetadataError,   BuildError::MissingArtifact,
        BuildError::InvalidControl, BuildError::StagingError,    BuildError::PermissionError,
        BuildError::ArchiveBuildFailure, BuildError::InstallFailure, BuildError::CleanupFailure,
    };
    for (auto e : all) {
        auto parsed = parse_build_error(build_error_to_string(e));
        REQUIRE(parsed);
        CHECK(*parsed == e);
    }
    CHECK(std::string(build_error_to_string(BuildError::MissingArtifact)) == "MISSING_ARTIFACT");
    CHECK_FALSE(parse_build_error("missing_artifact"));
}

TEST_CASE("is_fatal") {
    CHECK(is_fatal(BuildError::MissingArtifact));
    CHECK(is_fatal(BuildError::ArchiveBuildFailure));
    CHECK_FALSE(is_fatal(BuildError::None));
    CHECK_FALSE(is_fatal(BuildError::InstallFailure));
    CHECK_FALSE(is_fatal(BuildError::CleanupFailure));
}

TEST_CASE("StageResult factories") {
    auto ok = StageResult::success();
    CHECK(ok.ok);
    CHECK(ok.error_code == BuildError::None);

    auto failed = StageResult::failure(BuildError::StagingError, "cannot copy");
    CHECK_FALSE(failed.ok);
    CHECK(failed.error_code == BuildError::StagingError);
    CHECK(failed.error == "cannot copy");
}

TEST_CASE("pipeline states") {
    CHECK(std::string(pipeline_state_to_string(PipelineState::CleaningUp)) == "cleaning_up");
    CHECK(is_terminal(PipelineState::Done));
    CHECK(is_terminal(PipelineState::Failed));
    CHECK_FALSE(is_terminal(PipelineState::Archiving));
}
