/**
 * debpack CLI - build command
 *
 * Stage the release binary, normalize modes, run the archiver and
 * optionally install the result.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <debpack/archiver.hpp>
#include <debpack/installer.hpp>

#include <memory>

namespace debpack::cli::commands {

namespace {

struct BuildOptions {
    std::string manifest;
    std::string binary;
    std::string name;
    std::string install_name;
    std::string arch;
    std::string control;
    std::string output_dir;
    std::string staging_dir;
    bool install = false;
    bool keep_staging = false;
};

void apply_flags(BuildConfig& config, const BuildOptions& build_opts) {
    if (!build_opts.manifest.empty()) config.manifest = build_opts.manifest;
    if (!build_opts.binary.empty()) config.binary.path = build_opts.binary;
    if (!build_opts.name.empty()) config.package.name = build_opts.name;
    if (!build_opts.install_name.empty()) config.binary.install_name = build_opts.install_name;
    if (!build_opts.arch.empty()) config.package.architecture = build_opts.arch;
    if (!build_opts.control.empty()) config.control = build_opts.control;
    if (!build_opts.output_dir.empty()) config.output_dir = build_opts.output_dir;
    if (!build_opts.staging_dir.empty()) config.staging_dir = build_opts.staging_dir;
    if (build_opts.install) config.install = true;
}

int cmd_build(const GlobalOptions& opts, const BuildOptions& build_opts) {
    configure_logging(opts);
    init_warning_collector(opts.json, opts.quiet);

    auto config = load_effective_config(opts);
    if (!config) {
        return 1;
    }
    apply_flags(*config, build_opts);

    auto options = to_pipeline_options(*config);
    options.keep_staging = build_opts.keep_staging;

    CommandArchiver archiver(config->archiver);
    std::unique_ptr<Installer> installer;
    if (config->install) {
        installer = std::make_unique<CommandInstaller>(config->installer);
    }

    auto report = run_pipeline(options, archiver, installer.get());

    if (opts.json) {
        // Text mode already saw these through the logger
        for (const auto& w : report.warnings) {
            print_warning(w);
        }

        nlohmann::json j;
        j["ok"] = report.ok;
        if (!report.ok) {
            j["error"] = report.error;
            j["error_code"] = build_error_to_string(report.error_code);
        }
        if (!report.metadata.name.empty()) {
            j["package"] = metadata_to_json(report.metadata);
        }
        j["archive"] = report.archive_path.empty() ? nlohmann::json(nullptr)
                                                   : nlohmann::json(report.archive_path);
        j["install_attempted"] = report.install_attempted;
        j["installed"] = report.installed;
        nlohmann::json states = nlohmann::json::array();
        for (auto s : report.transitions) {
            states.push_back(pipeline_state_to_string(s));
        }
        j["states"] = states;
        output_json(j);
        return report.exit_code();
    }

    if (!report.ok) {
        print_error(report.error, false);
        if (!report.archive_path.empty()) {
            std::cerr << "Archive kept at " << report.archive_path
                      << " for manual installation" << std::endl;
        }
        return report.exit_code();
    }

    print_success("Built " + report.archive_path, false);
    if (!opts.quiet) {
        std::cout << "  Package: " << report.metadata.name << std::endl;
        std::cout << "  Version: " << report.metadata.version << std::endl;
        std::cout << "  Architecture: " << report.metadata.architecture << std::endl;
        if (report.installed) {
            std::cout << "  Installed: yes" << std::endl;
        }
    }
    return 0;
}

} // anonymous namespace

void setup_build(CLI::App* app, GlobalOptions& opts) {
    static BuildOptions build_opts;

    app->add_option("--manifest", build_opts.manifest, "Build manifest holding the version (Cargo.toml or .json)");
    app->add_option("--binary", build_opts.binary, "Prebuilt release binary");
    app->add_option("--name", build_opts.name, "Package name (default: manifest name, lower-cased)");
    app->add_option("--install-name", build_opts.install_name, "Installed binary name (default: package name)");
    app->add_option("--arch", build_opts.arch, "Debian architecture (default: host)");
    app->add_option("--control", build_opts.control, "Static DEBIAN/control file or template");
    app->add_option("-o,--output-dir", build_opts.output_dir, "Directory for the .deb");
    app->add_option("--staging-dir", build_opts.staging_dir, "Staging directory (removed after the run)");
    app->add_flag("--install", build_opts.install, "Install the archive after building");
    app->add_flag("--keep-staging", build_opts.keep_staging, "Leave the staging tree on disk");

    app->callback([&opts]() {
        std::exit(cmd_build(opts, build_opts));
    });
}

} // namespace debpack::cli::commands
