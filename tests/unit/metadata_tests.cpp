#include <doctest/doctest.h>
#include <debpack/metadata.hpp>

#include "test_support.hpp"

using namespace debpack;
using debpack::test::TempDir;
using debpack::test::write_text;

TEST_CASE("parse_cargo_manifest reads the package table") {
    auto result = parse_cargo_manifest(
        "# top comment\n"
        "[package]\n"
        "name = \"roextract\"   # binary name\n"
        "version = \"1.0.4\"\n"
        "edition = \"2021\"\n"
        "\n"
        "[dependencies]\n"
        "version = \"9.9.9\"\n");
    REQUIRE(result.ok);
    CHECK(result.manifest.name == "roextract");
    CHECK(result.manifest.version == "1.0.4");
}

TEST_CASE("parse_cargo_manifest accepts literal strings") {
    auto result = parse_cargo_manifest("[package]\nname = 'tool'\nversion = '0.3.0'\n");
    REQUIRE(result.ok);
    CHECK(result.manifest.name == "tool");
    CHECK(result.manifest.version == "0.3.0");
}

TEST_CASE("parse_cargo_manifest keeps '#' inside quoted values") {
    auto result = parse_cargo_manifest(
        "[package]\nname = \"tool\"\nversion = \"1.0.0\"\ndescription = \"a # b\"\n");
    REQUIRE(result.ok);
    CHECK(result.manifest.version == "1.0.0");
}

TEST_CASE("parse_cargo_manifest follows full TOML syntax") {
    SUBCASE("quoted keys") {
        auto result = parse_cargo_manifest("[package]\n\"name\" = \"tool\"\n\"version\" = \"1.0.4\"\n");
        REQUIRE(result.ok);
        CHECK(result.manifest.version == "1.0.4");
    }

    SUBCASE("dotted keys at the top level") {
        auto result = parse_cargo_manifest("package.name = \"tool\"\npackage.version = \"1.0.4\"\n");
        REQUIRE(result.ok);
        CHECK(result.manifest.name == "tool");
        CHECK(result.manifest.version == "1.0.4");
    }

    SUBCASE("escape sequences in basic strings") {
        auto result = parse_cargo_manifest("[package]\nname = \"tool\"\nversion = \"1.0.\\u0034\"\n");
        REQUIRE(result.ok);
        CHECK(result.manifest.version == "1.0.4");
    }

    SUBCASE("malformed document") {
        auto result = parse_cargo_manifest("[package\nname = \"tool\"\n");
        CHECK_FALSE(result.ok);
        CHECK(result.error.find("invalid TOML at line 1") == 0);
    }
}

TEST_CASE("parse_cargo_manifest errors") {
    SUBCASE("no package table") {
        auto result = parse_cargo_manifest("[dependencies]\nserde = \"1\"\n");
        CHECK_FALSE(result.ok);
        CHECK(result.error == "[package] table missing");
    }

    SUBCASE("missing version") {
        auto result = parse_cargo_manifest("[package]\nname = \"tool\"\n");
        CHECK_FALSE(result.ok);
        CHECK(result.error == "package.version missing");
    }

    SUBCASE("version inherited from the workspace") {
        auto result = parse_cargo_manifest(
            "[package]\nname = \"tool\"\nversion.workspace = true\n");
        CHECK_FALSE(result.ok);
        CHECK(result.error.find("workspace") != std::string::npos);

        auto inline_table = parse_cargo_manifest(
            "[package]\nname = \"tool\"\nversion = { workspace = true }\n");
        CHECK_FALSE(inline_table.ok);
    }

    SUBCASE("non-string version") {
        auto result = parse_cargo_manifest("[package]\nname = \"tool\"\nversion = 1\n");
        CHECK_FALSE(result.ok);
        CHECK(result.error == "package.version is not a string");
    }
}

TEST_CASE("parse_cargo_manifest reads workspace.package version") {
    auto result = parse_cargo_manifest(
        "[workspace]\nmembers = [\"cli\"]\n\n[workspace.package]\nversion = \"2.1.0\"\n");
    REQUIRE(result.ok);
    CHECK(result.manifest.version == "2.1.0");
    CHECK(result.manifest.name.empty());
}

TEST_CASE("parse_json_manifest") {
    SUBCASE("top-level fields") {
        auto result = parse_json_manifest(R"({"name": "tool", "version": "1.2.3"})");
        REQUIRE(result.ok);
        CHECK(result.manifest.name == "tool");
        CHECK(result.manifest.version == "1.2.3");
    }

    SUBCASE("nested package object") {
        auto result = parse_json_manifest(R"({"package": {"name": "tool", "version": "0.1.0"}})");
        REQUIRE(result.ok);
        CHECK(result.manifest.version == "0.1.0");
    }

    SUBCASE("invalid JSON") {
        auto result = parse_json_manifest("{not json");
        CHECK_FALSE(result.ok);
        CHECK(result.error.find("invalid JSON") == 0);
    }

    SUBCASE("missing version") {
        auto result = parse_json_manifest(R"({"name": "tool"})");
        CHECK_FALSE(result.ok);
        CHECK(result.error == "version missing");
    }
}

TEST_CASE("read_build_manifest picks the parser from the extension") {
    TempDir dir;
    auto json = write_text(dir.file("package.JSON"), R"({"name": "a1", "version": "3.0.0"})");
    auto cargo = write_text(dir.file("Cargo.toml"), "[package]\nname = \"b1\"\nversion = \"4.0.0\"\n");

    auto j = read_build_manifest(json);
    REQUIRE(j.ok);
    CHECK(j.manifest.version == "3.0.0");
    CHECK(j.manifest.source_path == json);

    auto c = read_build_manifest(cargo);
    REQUIRE(c.ok);
    CHECK(c.manifest.version == "4.0.0");

    auto missing = read_build_manifest(dir.file("nope.toml"));
    CHECK_FALSE(missing.ok);
    CHECK(missing.error.find("cannot read build manifest") == 0);
}

TEST_CASE("is_valid_package_name") {
    CHECK(is_valid_package_name("roextract"));
    CHECK(is_valid_package_name("lib2to3"));
    CHECK(is_valid_package_name("g++"));
    CHECK(is_valid_package_name("foo-bar.baz"));

    CHECK_FALSE(is_valid_package_name(""));
    CHECK_FALSE(is_valid_package_name("a"));
    CHECK_FALSE(is_valid_package_name("RoExtract"));
    CHECK_FALSE(is_valid_package_name("-tool"));
    CHECK_FALSE(is_valid_package_name("my_tool"));
    CHECK_FALSE(is_valid_package_name("my tool"));
}

TEST_CASE("is_valid_debian_version") {
    CHECK(is_valid_debian_version("1.0.4"));
    CHECK(is_valid_debian_version("1.0.0~rc.1"));
    CHECK(is_valid_debian_version("2:1.0-3"));
    CHECK(is_valid_debian_version("1.0+dfsg-1ubuntu2"));

    CHECK_FALSE(is_valid_debian_version(""));
    CHECK_FALSE(is_valid_debian_version("v1.0"));
    CHECK_FALSE(is_valid_debian_version("x:1.0"));
    CHECK_FALSE(is_valid_debian_version("1.0-"));
    CHECK_FALSE(is_valid_debian_version("1.0 beta"));
}

TEST_CASE("to_debian_version") {
    SUBCASE("release versions pass through") {
        CHECK(to_debian_version("1.0.4") == "1.0.4");
        CHECK(to_debian_version(" 2.3.0 ") == "2.3.0");
        CHECK(to_debian_version("1.0.0+build.7") == "1.0.0+build.7");
    }

    SUBCASE("pre-releases sort before the release") {
        CHECK(to_debian_version("1.0.0-rc.1") == "1.0.0~rc.1");
        CHECK(to_debian_version("1.0.0-beta.2+build.456") == "1.0.0~beta.2+build.456");
        CHECK(to_debian_version("2.0.0-alpha-1") == "2.0.0~alpha.1");
    }

    SUBCASE("non-semver strings are left alone") {
        CHECK(to_debian_version("1.2") == "1.2");
        CHECK(to_debian_version("2:1.0-3") == "2:1.0-3");
    }
}

TEST_CASE("strip_epoch") {
    CHECK(strip_epoch("1.0.4") == "1.0.4");
    CHECK(strip_epoch("2:1.0-3") == "1.0-3");
}

TEST_CASE("debian_architecture_for_machine") {
    CHECK(debian_architecture_for_machine("x86_64") == std::optional<std::string>("amd64"));
    CHECK(debian_architecture_for_machine("aarch64") == std::optional<std::string>("arm64"));
    CHECK(debian_architecture_for_machine("i686") == std::optional<std::string>("i386"));
    CHECK(debian_architecture_for_machine("armv7l") == std::optional<std::string>("armhf"));
    CHECK(debian_architecture_for_machine("armv6l") == std::optional<std::string>("armel"));
    CHECK(debian_architecture_for_machine("ppc64le") == std::optional<std::string>("ppc64el"));
    CHECK(debian_architecture_for_machine("riscv64") == std::optional<std::string>("riscv64"));
    CHECK_FALSE(debian_architecture_for_machine("vax"));
}

TEST_CASE("host_architecture is a valid architecture name") {
    CHECK(is_valid_package_name(host_architecture()));
}

TEST_CASE("resolve_metadata") {
    TempDir dir;
    auto manifest = debpack::test::write_cargo_manifest(dir, "RoExtract", "1.0.4");

    SUBCASE("name from manifest, lower-cased") {
        MetadataRequest request;
        request.manifest_path = manifest;
        request.architecture = "amd64";
        auto result = resolve_metadata(request);
        REQUIRE(result.ok);
        CHECK(result.metadata == PackageMetadata{"roextract", "1.0.4", "amd64"});
        CHECK(result.upstream_version == "1.0.4");
    }

    SUBCASE("explicit name wins") {
        MetadataRequest request{manifest, "roextract-cli", "arm64"};
        auto result = resolve_metadata(request);
        REQUIRE(result.ok);
        CHECK(result.metadata.name == "roextract-cli");
        CHECK(result.metadata.architecture == "arm64");
    }

    SUBCASE("architecture defaults to the host") {
        MetadataRequest request{manifest, "", ""};
        auto result = resolve_metadata(request);
        REQUIRE(result.ok);
        CHECK(result.metadata.architecture == host_architecture());
    }

    SUBCASE("pre-release version is mapped") {
        auto pre = debpack::test::write_cargo_manifest(dir, "tool", "1.1.0-rc.2");
        auto result = resolve_metadata({pre, "", "amd64"});
        REQUIRE(result.ok);
        CHECK(result.metadata.version == "1.1.0~rc.2");
        CHECK(result.upstream_version == "1.1.0-rc.2");
    }

    SUBCASE("missing manifest") {
        auto result = resolve_metadata({dir.file("missing/Cargo.toml"), "", "amd64"});
        CHECK_FALSE(result.ok);
        CHECK(result.error_code == BuildError::MetadataError);
    }

    SUBCASE("invalid name") {
        auto result = resolve_metadata({manifest, "Bad_Name", "amd64"});
        CHECK_FALSE(result.ok);
        CHECK(result.error_code == BuildError::MetadataError);
        CHECK(result.error.find("invalid package name") == 0);
    }

    SUBCASE("invalid version") {
        auto bad = debpack::test::write_cargo_manifest(dir, "tool", "latest");
        auto result = resolve_metadata({bad, "", "amd64"});
        CHECK_FALSE(result.ok);
        CHECK(result.error_code == BuildError::MetadataError);
    }

    SUBCASE("malformed Cargo.toml") {
        auto bad = write_text(dir.file("Cargo.toml"), "[package]\nversion = \"1.0\n");
        auto result = resolve_metadata({bad, "tool", "amd64"});
        CHECK_FALSE(result.ok);
        CHECK(result.error_code == BuildError::MetadataError);
        CHECK(result.error.find("invalid TOML") != std::string::npos);
    }

    SUBCASE("no manifest configured") {
        auto result = resolve_metadata({"", "tool", "amd64"});
        CHECK_FALSE(result.ok);
        CHECK(result.error == "no build manifest configured");
    }
}
