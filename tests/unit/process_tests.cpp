#include <doctest/doctest.h>
#include <debpack/process.hpp>
#include <debpack/platform.hpp>

#include "test_support.hpp"

using namespace debpack;
using debpack::test::TempDir;

TEST_CASE("expand_arguments substitutes known placeholders") {
    auto out = expand_arguments({"--build", "{staging}", "{output}.tmp", "{unknown}", "{"},
                                {{"staging", "/s"}, {"output", "/o"}});
    CHECK(out == std::vector<std::string>{"--build", "/s", "/o.tmp", "{unknown}", "{"});
}

TEST_CASE("format_command_line quotes arguments with spaces") {
    CHECK(format_command_line({"sudo", "apt-get", "install", "./a b.deb"}) ==
          "sudo apt-get install './a b.deb'");
    CHECK(format_command_line({"echo", ""}) == "echo ''");
}

TEST_CASE("run_process reports exit codes") {
    SUBCASE("success") {
        auto result = run_process({{"true"}, ""});
        REQUIRE(result.ok);
        CHECK(result.exit_code == 0);
    }

    SUBCASE("failure status") {
        auto result = run_process({{"sh", "-c", "exit 7"}, ""});
        REQUIRE(result.ok);
        CHECK(result.exit_code == 7);
    }

    SUBCASE("signal") {
        auto result = run_process({{"sh", "-c", "kill -TERM $$"}, ""});
        REQUIRE(result.ok);
        CHECK(result.exit_code == 128 + 15);
    }

    SUBCASE("missing program") {
        auto result = run_process({{"debpack-no-such-tool"}, ""});
        REQUIRE(result.ok);
        CHECK(result.exit_code == 127);
    }

    SUBCASE("empty argv") {
        auto result = run_process({{}, ""});
        CHECK_FALSE(result.ok);
        CHECK(result.error == "empty command");
    }
}

TEST_CASE("run_process honours cwd") {
    TempDir dir;
    auto result = run_process({{"sh", "-c", "echo here > marker"}, dir.path()});
    REQUIRE(result.ok);
    CHECK(result.exit_code == 0);
    CHECK(is_regular_file(dir.file("marker")));
}
