#include "debpack/build_config.hpp"
#include "debpack/archiver.hpp"
#include "debpack/installer.hpp"
#include "debpack/metadata.hpp"
#include "debpack/platform.hpp"

#include <nlohmann/json.hpp>

#include <set>

namespace debpack {

namespace {

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// Relative config paths are relative to the config file, not the caller's cwd
std::string resolve(const std::string& base_dir, const std::string& path) {
    if (path.empty() || base_dir.empty() || path[0] == '/') {
        return path;
    }
    return join_path(base_dir, path);
}

void warn_unknown_keys(const nlohmann::json& j, const std::string& section,
                       const std::set<std::string>& known,
                       std::vector<std::string>& warnings) {
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!known.count(it.key())) {
            std::string where = section.empty() ? it.key() : section + "." + it.key();
            warnings.push_back("unknown config key: " + where);
        }
    }
}

// { "program": "...", "args": [...] }
bool parse_command(const nlohmann::json& j, const std::string& section,
                   CommandTemplate& out, std::string& error) {
    if (!j.is_object()) {
        error = section + " must be an object";
        return false;
    }
    if (auto program = get_string(j, "program")) {
        if (program->empty()) {
            error = section + ".program is empty";
            return false;
        }
        out.program = *program;
    }
    if (j.contains("args")) {
        if (!j["args"].is_array()) {
            error = section + ".args must be an array of strings";
            return false;
        }
        out.args.clear();
        for (const auto& arg : j["args"]) {
            if (!arg.is_string()) {
                error = section + ".args must be an array of strings";
                return false;
            }
            out.args.push_back(arg.get<std::string>());
        }
    }
    return true;
}

} // namespace

BuildConfig::BuildConfig()
    : archiver(default_archiver_command()), installer(default_installer_command()) {}

ConfigLoadResult parse_build_config(const std::string& json_str,
                                    const std::string& base_dir,
                                    const std::string& source_path) {
    ConfigLoadResult result;
    auto& cfg = result.config;
    cfg.source_path = source_path;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        result.error = "invalid JSON: " + std::string(e.what());
        return result;
    }

    if (!j.is_object()) {
        result.error = "config must be a JSON object";
        return result;
    }

    warn_unknown_keys(j, "",
                      {"$schema", "manifest", "package", "binary", "control", "scripts",
                       "docs", "output_dir", "staging_dir", "archiver", "installer",
                       "install"},
                      result.warnings);

    if (auto manifest = get_string(j, "manifest")) {
        cfg.manifest = *manifest;
    }

    if (j.contains("package")) {
        const auto& p = j["package"];
        if (!p.is_object()) {
            result.error = "package must be an object";
            return result;
        }
        warn_unknown_keys(p, "package",
                          {"name", "architecture", "maintainer", "description", "section",
                           "priority", "homepage", "version"},
                          result.warnings);
        if (p.contains("version")) {
            // The build manifest is the only version source
            result.warnings.push_back(
                "package.version is ignored; the version is read from " + cfg.manifest);
        }
        if (auto v = get_string(p, "name")) cfg.package.name = *v;
        if (auto v = get_string(p, "architecture")) cfg.package.architecture = *v;
        if (auto v = get_string(p, "maintainer")) cfg.package.maintainer = *v;
        if (auto v = get_string(p, "description")) cfg.package.description = *v;
        if (auto v = get_string(p, "section")) cfg.package.section = *v;
        if (auto v = get_string(p, "priority")) cfg.package.priority = *v;
        if (auto v = get_string(p, "homepage")) cfg.package.homepage = *v;
    }

    if (j.contains("binary")) {
        const auto& b = j["binary"];
        if (b.is_string()) {
            cfg.binary.path = b.get<std::string>();
        } else if (b.is_object()) {
            warn_unknown_keys(b, "binary", {"path", "install_dir", "install_name"},
                              result.warnings);
            if (auto v = get_string(b, "path")) cfg.binary.path = *v;
            if (auto v = get_string(b, "install_dir")) cfg.binary.install_dir = *v;
            if (auto v = get_string(b, "install_name")) cfg.binary.install_name = *v;
        } else {
            result.error = "binary must be a string or an object";
            return result;
        }
    }

    if (auto control = get_string(j, "control")) {
        cfg.control = *control;
    }

    if (j.contains("scripts")) {
        const auto& s = j["scripts"];
        if (!s.is_object()) {
            result.error = "scripts must be an object";
            return result;
        }
        for (auto it = s.begin(); it != s.end(); ++it) {
            if (!it.value().is_string()) {
                result.error = "scripts." + it.key() + " must be a path string";
                return result;
            }
            cfg.scripts[it.key()] = it.value().get<std::string>();
        }
    }

    if (j.contains("docs")) {
        const auto& d = j["docs"];
        if (!d.is_object()) {
            result.error = "docs must be an object";
            return result;
        }
        warn_unknown_keys(d, "docs", {"changelog", "copyright"}, result.warnings);
        if (auto v = get_string(d, "changelog")) cfg.docs.changelog = *v;
        if (auto v = get_string(d, "copyright")) cfg.docs.copyright = *v;
    }

    if (auto v = get_string(j, "output_dir")) cfg.output_dir = *v;
    if (auto v = get_string(j, "staging_dir")) cfg.staging_dir = *v;

    if (j.contains("archiver") && !parse_command(j["archiver"], "archiver", cfg.archiver,
                                                 result.error)) {
        return result;
    }
    if (j.contains("installer") && !parse_command(j["installer"], "installer", cfg.installer,
                                                  result.error)) {
        return result;
    }

    if (j.contains("install")) {
        if (!j["install"].is_boolean()) {
            result.error = "install must be a boolean";
            return result;
        }
        cfg.install = j["install"].get<bool>();
    }

    // Resolve file references against the config's directory
    cfg.manifest = resolve(base_dir, cfg.manifest);
    cfg.binary.path = resolve(base_dir, cfg.binary.path);
    cfg.control = resolve(base_dir, cfg.control);
    for (auto& [name, path] : cfg.scripts) {
        path = resolve(base_dir, path);
    }
    cfg.docs.changelog = resolve(base_dir, cfg.docs.changelog);
    cfg.docs.copyright = resolve(base_dir, cfg.docs.copyright);
    cfg.output_dir = resolve(base_dir, cfg.output_dir);
    cfg.staging_dir = resolve(base_dir, cfg.staging_dir);

    result.ok = true;
    return result;
}

ConfigLoadResult load_build_config(const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        ConfigLoadResult result;
        result.error = "cannot read config file: " + path;
        return result;
    }
    auto result = parse_build_config(*content, get_parent_directory(path), path);
    if (!result.ok) {
        result.error = path + ": " + result.error;
    }
    return result;
}

std::optional<std::string> find_config_path(const std::optional<std::string>& override_path) {
    // 1. Explicit override
    if (override_path && !override_path->empty()) {
        return *override_path;
    }

    // 2. Environment variable
    if (auto env = get_env("DEBPACK_CONFIG")) {
        return *env;
    }

    // 3. debpack.json in the working directory
    if (is_regular_file(kDefaultConfigFile)) {
        return std::string(kDefaultConfigFile);
    }

    return std::nullopt;
}

void apply_environment(BuildConfig& config) {
    if (auto dir = get_env("DEBPACK_OUTPUT_DIR")) {
        config.output_dir = *dir;
    }
    if (auto arch = get_env("DEBPACK_ARCH")) {
        config.package.architecture = *arch;
    }
}

PipelineOptions to_pipeline_options(const BuildConfig& config) {
    PipelineOptions options;
    options.metadata.manifest_path = config.manifest;
    options.metadata.name = config.package.name;
    options.metadata.architecture = config.package.architecture;

    options.layout.binary_path = config.binary.path;
    options.layout.install_dir = config.binary.install_dir;
    options.layout.install_name = config.binary.install_name;
    options.layout.control.path = config.control;
    options.layout.control.fields.maintainer = config.package.maintainer;
    options.layout.control.fields.description = config.package.description;
    options.layout.control.fields.section = config.package.section;
    options.layout.control.fields.priority = config.package.priority;
    options.layout.control.fields.homepage = config.package.homepage;
    options.layout.scripts = config.scripts;
    options.layout.changelog = config.docs.changelog;
    options.layout.copyright = config.docs.copyright;

    options.output_dir = config.output_dir;
    options.staging_root = config.staging_dir;
    return options;
}

std::string render_starter_config(const std::string& name) {
    nlohmann::ordered_json j;
    j["manifest"] = "Cargo.toml";
    j["package"]["name"] = name;
    j["package"]["architecture"] = host_architecture();
    j["binary"]["path"] = "target/release/" + name;
    j["binary"]["install_dir"] = "usr/bin";
    j["binary"]["install_name"] = name;
    j["control"] = "DEBIAN/control";
    j["output_dir"] = ".";
    j["install"] = false;
    return j.dump(2) + "\n";
}

std::string render_starter_control(const std::string& maintainer) {
    return "Package: ${name}\n"
           "Version: ${version}\n"
           "Architecture: ${architecture}\n"
           "Maintainer: " + maintainer + "\n"
           "Section: utils\n"
           "Priority: optional\n"
           "Description: ${name}\n"
           " Packaged with debpack.\n";
}

} // namespace debpack
