/**
 * debpack CLI - Entry Point
 *
 * Builds Debian binary packages from prebuilt release binaries.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace debpack::cli::commands {
    void setup_build(CLI::App* app, GlobalOptions& opts);
    void setup_install(CLI::App* app, GlobalOptions& opts);
    void setup_metadata(CLI::App* app, GlobalOptions& opts);
    void setup_init(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace debpack::cli;

    CLI::App app{"debpack - build Debian packages from prebuilt binaries"};
    app.set_version_flag("-V,--version", DEBPACK_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config, "Config file (default: $DEBPACK_CONFIG or ./debpack.json)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* build_cmd = app.add_subcommand("build", "Stage, archive and optionally install the package");
    commands::setup_build(build_cmd, opts);

    auto* install_cmd = app.add_subcommand("install", "Install a previously built archive");
    commands::setup_install(install_cmd, opts);

    auto* metadata_cmd = app.add_subcommand("metadata", "Print the resolved package identity");
    commands::setup_metadata(metadata_cmd, opts);

    auto* init_cmd = app.add_subcommand("init", "Scaffold debpack.json and DEBIAN/control");
    commands::setup_init(init_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
