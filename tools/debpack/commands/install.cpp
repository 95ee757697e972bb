/**
 * debpack CLI - install command
 *
 * Install an already built archive with the configured installer.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <debpack/installer.hpp>
#include <debpack/platform.hpp>

namespace debpack::cli::commands {

namespace {

struct InstallOptions {
    std::string archive;
};

int cmd_install(const GlobalOptions& opts, const InstallOptions& install_opts) {
    configure_logging(opts);
    init_warning_collector(opts.json, opts.quiet);

    auto config = load_effective_config(opts);
    if (!config) {
        return 1;
    }

    if (!is_regular_file(install_opts.archive)) {
        print_error("archive not found: " + install_opts.archive, opts.json,
                    build_error_to_string(BuildError::InstallFailure));
        return 1;
    }

    CommandInstaller installer(config->installer);
    auto result = installer.install(install_opts.archive);

    if (!result.ok) {
        print_error(result.error, opts.json, build_error_to_string(result.error_code));
        return 2;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["archive"] = install_opts.archive;
        output_json(j);
    } else {
        print_success("Installed " + install_opts.archive, false);
    }
    return 0;
}

} // anonymous namespace

void setup_install(CLI::App* app, GlobalOptions& opts) {
    static InstallOptions install_opts;

    app->add_option("archive", install_opts.archive, "Path to a .deb built earlier")->required();

    app->callback([&opts]() {
        std::exit(cmd_install(opts, install_opts));
    });
}

} // namespace debpack::cli::commands
