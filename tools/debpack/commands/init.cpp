/**
 * debpack CLI - init command
 *
 * Scaffold debpack.json and a DEBIAN/control template next to a project.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <debpack/metadata.hpp>
#include <debpack/platform.hpp>

#include <algorithm>
#include <cctype>

namespace debpack::cli::commands {

namespace {

struct InitOptions {
    std::string dir = ".";
    std::string name;
    std::string maintainer;
    bool force = false;
};

// Package name: --name, else the manifest name, else the directory name
std::string derive_name(const InitOptions& init_opts) {
    if (!init_opts.name.empty()) {
        return init_opts.name;
    }

    std::string name;
    auto manifest = read_build_manifest(join_path(init_opts.dir, "Cargo.toml"));
    if (manifest.ok) {
        name = manifest.manifest.name;
    } else {
        name = get_filename(absolute_path(init_opts.dir));
    }
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(name.begin(), name.end(), '_', '-');
    return name;
}

int cmd_init(const GlobalOptions& opts, const InitOptions& init_opts) {
    configure_logging(opts);
    init_warning_collector(opts.json, opts.quiet);

    std::string name = derive_name(init_opts);
    if (!is_valid_package_name(name)) {
        print_error("cannot derive a valid package name ('" + name + "'); pass --name",
                    opts.json);
        return 1;
    }

    std::string config_path = join_path(init_opts.dir, kDefaultConfigFile);
    std::string control_path = join_path(init_opts.dir, "DEBIAN/control");

    if (!init_opts.force) {
        for (const auto& path : {config_path, control_path}) {
            if (path_exists(path)) {
                print_error(path + " already exists (use --force to overwrite)", opts.json);
                return 1;
            }
        }
    }

    std::string maintainer = init_opts.maintainer;
    if (maintainer.empty()) {
        maintainer = get_env("DEBEMAIL").value_or("Unknown <unknown@example.com>");
        print_warning("no --maintainer given; using '" + maintainer + "'");
    }

    if (!create_directories(get_parent_directory(control_path))) {
        print_error("cannot create " + get_parent_directory(control_path), opts.json);
        return 1;
    }
    if (!write_file(config_path, render_starter_config(name))) {
        print_error("cannot write " + config_path, opts.json);
        return 1;
    }
    if (!write_file(control_path, render_starter_control(maintainer))) {
        print_error("cannot write " + control_path, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["name"] = name;
        j["config"] = config_path;
        j["control"] = control_path;
        output_json(j);
    } else {
        print_success("Created " + config_path, false);
        print_success("Created " + control_path, false);
        if (!opts.quiet) {
            std::cout << std::endl;
            std::cout << "Next: build the release binary, then run 'debpack build'" << std::endl;
        }
    }
    return 0;
}

} // anonymous namespace

void setup_init(CLI::App* app, GlobalOptions& opts) {
    static InitOptions init_opts;

    app->add_option("dir", init_opts.dir, "Project directory")->capture_default_str();
    app->add_option("--name", init_opts.name, "Package name");
    app->add_option("--maintainer", init_opts.maintainer, "Maintainer, e.g. 'Jane Doe <jane@example.com>'");
    app->add_flag("-f,--force", init_opts.force, "Overwrite existing files");

    app->callback([&opts]() {
        std::exit(cmd_init(opts, init_opts));
    });
}

} // namespace debpack::cli::commands
