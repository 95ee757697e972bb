/**
 * debpack CLI - metadata command
 *
 * Print the resolved package identity without touching the filesystem.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <debpack/archiver.hpp>
#include <debpack/metadata.hpp>

namespace debpack::cli::commands {

namespace {

struct MetadataOptions {
    std::string manifest;
    std::string name;
    std::string arch;
};

int cmd_metadata(const GlobalOptions& opts, const MetadataOptions& meta_opts) {
    configure_logging(opts);
    init_warning_collector(opts.json, opts.quiet);

    auto config = load_effective_config(opts);
    if (!config) {
        return 1;
    }
    if (!meta_opts.manifest.empty()) config->manifest = meta_opts.manifest;
    if (!meta_opts.name.empty()) config->package.name = meta_opts.name;
    if (!meta_opts.arch.empty()) config->package.architecture = meta_opts.arch;

    auto resolved = resolve_metadata(to_pipeline_options(*config).metadata);
    if (!resolved.ok) {
        print_error(resolved.error, opts.json, build_error_to_string(resolved.error_code));
        return 1;
    }

    std::string archive = archive_file_name(resolved.metadata);

    if (opts.json) {
        nlohmann::json j = metadata_to_json(resolved.metadata);
        j["ok"] = true;
        j["upstream_version"] = resolved.upstream_version;
        j["manifest"] = config->manifest;
        j["archive"] = archive;
        output_json(j);
    } else {
        std::cout << "Package: " << resolved.metadata.name << std::endl;
        std::cout << "Version: " << resolved.metadata.version << std::endl;
        if (resolved.upstream_version != resolved.metadata.version) {
            std::cout << "Upstream version: " << resolved.upstream_version << std::endl;
        }
        std::cout << "Architecture: " << resolved.metadata.architecture << std::endl;
        std::cout << "Archive: " << archive << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_metadata(CLI::App* app, GlobalOptions& opts) {
    static MetadataOptions meta_opts;

    app->add_option("--manifest", meta_opts.manifest, "Build manifest holding the version");
    app->add_option("--name", meta_opts.name, "Package name override");
    app->add_option("--arch", meta_opts.arch, "Debian architecture override");

    app->callback([&opts]() {
        std::exit(cmd_metadata(opts, meta_opts));
    });
}

} // namespace debpack::cli::commands
