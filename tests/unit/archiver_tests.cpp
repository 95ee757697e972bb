#include <doctest/doctest.h>
#include <debpack/archiver.hpp>
#include <debpack/platform.hpp>

#include "test_support.hpp"

using namespace debpack;
using debpack::test::TempDir;
using debpack::test::write_text;

namespace {

// Writes a tar of the staging tree to the requested output
CommandTemplate tar_command() {
    return CommandTemplate{"sh", {"-c", "tar -cf \"$2\" -C \"$1\" .", "sh", "{staging}", "{output}"}};
}

// Writes half an archive, then fails
CommandTemplate failing_command() {
    return CommandTemplate{"sh", {"-c", "echo partial > \"$2\"; exit 3", "sh", "{staging}", "{output}"}};
}

} // namespace

TEST_CASE("archive_file_name") {
    CHECK(archive_file_name({"roextract", "1.0.4", "amd64"}) == "roextract_1.0.4_amd64.deb");
    CHECK(archive_file_name({"tool", "1:2.0~rc.1-1", "arm64"}) == "tool_2.0~rc.1-1_arm64.deb");
    CHECK(archive_file_name({"tool", "1.0", "all"}, "ddeb") == "tool_1.0_all.ddeb");
    CHECK(archive_output_path("dist", {"roextract", "1.0.4", "amd64"}) ==
          "dist/roextract_1.0.4_amd64.deb");
}

TEST_CASE("default_archiver_command") {
    auto cmd = default_archiver_command();
    CHECK(cmd.program == "dpkg-deb");
    auto spec = cmd.expand({{"staging", "/s"}, {"output", "/o.deb"}});
    CHECK(spec.argv == std::vector<std::string>{"dpkg-deb", "--root-owner-group", "--build",
                                                "/s", "/o.deb"});
}

TEST_CASE("build_archive moves the archive into place") {
    TempDir dir;
    write_text(dir.file("stage/usr/bin/tool"), "bin");
    std::string output = dir.file("dist/tool_1.0_amd64.deb");

    CommandArchiver archiver(tar_command());
    auto result = build_archive(archiver, dir.file("stage"), output);
    REQUIRE(result.ok);
    CHECK(result.archive_path == output);
    CHECK(result.exit_code == 0);
    CHECK(is_regular_file(output));
    CHECK_FALSE(path_exists(output + ".partial"));
}

TEST_CASE("build_archive failure leaves no partial file") {
    TempDir dir;
    write_text(dir.file("stage/file"), "x");
    std::string output = dir.file("tool_1.0_amd64.deb");
    write_text(output, "previous build");

    CommandArchiver archiver(failing_command());
    auto result = build_archive(archiver, dir.file("stage"), output);
    CHECK_FALSE(result.ok);
    CHECK(result.error_code == BuildError::ArchiveBuildFailure);
    CHECK(result.exit_code == 3);
    CHECK(result.error == "sh exited with status 3");
    CHECK(result.archive_path.empty());

    CHECK_FALSE(path_exists(output + ".partial"));
    CHECK(read_file(output) == std::optional<std::string>("previous build"));
}

TEST_CASE("build_archive removes a stale partial file") {
    TempDir dir;
    write_text(dir.file("stage/file"), "x");
    std::string output = dir.file("tool_1.0_amd64.deb");
    write_text(output + ".partial", "stale");

    CommandArchiver archiver(tar_command());
    REQUIRE(build_archive(archiver, dir.file("stage"), output).ok);
    CHECK(read_file(output) != std::optional<std::string>("stale"));
}

TEST_CASE("build_archive detects a tool that writes nothing") {
    TempDir dir;
    CommandArchiver archiver(CommandTemplate{"true", {}});
    auto result = build_archive(archiver, dir.path(), dir.file("x.deb"));
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("produced no archive") != std::string::npos);
}

TEST_CASE("CommandArchiver reports a missing tool") {
    TempDir dir;
    CommandArchiver archiver(CommandTemplate{"debpack-no-such-tool", {"{output}"}});
    auto result = build_archive(archiver, dir.path(), dir.file("x.deb"));
    CHECK_FALSE(result.ok);
    CHECK(result.exit_code == 127);
    CHECK(result.error.find("could not be executed") != std::string::npos);
}
