#include "debpack/metadata.hpp"
#include "debpack/platform.hpp"

// cpp-semver requires <cstdint> but doesn't include it (GCC strictness)
#include <cstdint>
#include <semver/semver.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>

namespace debpack {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

bool is_version_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '+' || c == '~';
}

} // namespace

// ============================================================================
// Build Manifest
// ============================================================================

ManifestParseResult parse_cargo_manifest(const std::string& content,
                                         const std::string& source_path) {
    ManifestParseResult result;
    result.manifest.source_path = source_path;

    toml::table tbl;
    try {
        tbl = toml::parse(content, source_path);
    } catch (const toml::parse_error& e) {
        result.error = "invalid TOML at line " + std::to_string(e.source().begin.line) +
                       ": " + std::string(e.description());
        return result;
    }

    auto package = tbl["package"];
    if (!package) {
        // A virtual workspace manifest carries the version in [workspace.package]
        if (auto version = tbl["workspace"]["package"]["version"].value<std::string>()) {
            result.manifest.version = trim(*version);
        }
        if (result.manifest.version.empty()) {
            result.error = "[package] table missing";
            return result;
        }
        result.ok = true;
        return result;
    }
    if (!package.is_table()) {
        result.error = "package is not a table";
        return result;
    }

    auto name = package["name"];
    if (name && !name.is_string()) {
        result.error = "package.name is not a string";
        return result;
    }
    result.manifest.name = name.value_or(std::string());

    auto version = package["version"];
    if (version.is_table()) {
        result.error = "version is inherited from the workspace; "
                       "point the manifest path at the workspace Cargo.toml";
        return result;
    }
    if (version && !version.is_string()) {
        result.error = "package.version is not a string";
        return result;
    }

    result.manifest.version = trim(version.value_or(std::string()));
    if (result.manifest.version.empty()) {
        result.error = "package.version missing";
        return result;
    }

    result.ok = true;
    return result;
}

ManifestParseResult parse_json_manifest(const std::string& content,
                                        const std::string& source_path) {
    ManifestParseResult result;
    result.manifest.source_path = source_path;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        result.error = "invalid JSON: " + std::string(e.what());
        return result;
    }

    if (!j.is_object()) {
        result.error = "JSON must be an object";
        return result;
    }

    const nlohmann::json* scope = &j;
    if (!j.contains("version") && j.contains("package") && j["package"].is_object()) {
        scope = &j["package"];
    }

    if (auto name = get_string(*scope, "name")) {
        result.manifest.name = trim(*name);
    }

    if (auto version = get_string(*scope, "version")) {
        result.manifest.version = trim(*version);
    }

    if (result.manifest.version.empty()) {
        result.error = "version missing";
        return result;
    }

    result.ok = true;
    return result;
}

ManifestParseResult read_build_manifest(const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        ManifestParseResult result;
        result.manifest.source_path = path;
        result.error = "cannot read build manifest: " + path;
        return result;
    }

    if (ends_with(to_lower(path), ".json")) {
        return parse_json_manifest(*content, path);
    }
    return parse_cargo_manifest(*content, path);
}

// ============================================================================
// Debian Identity Rules
// ============================================================================

bool is_valid_package_name(const std::string& name) {
    if (name.size() < 2) return false;

    auto lower_alnum = [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
    };

    if (!lower_alnum(name[0])) return false;
    for (char c : name) {
        if (!lower_alnum(c) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

bool is_valid_debian_version(const std::string& version) {
    std::string rest = version;

    auto colon = rest.find(':');
    if (colon != std::string::npos) {
        std::string epoch = rest.substr(0, colon);
        if (epoch.empty() ||
            !std::all_of(epoch.begin(), epoch.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            return false;
        }
        rest = rest.substr(colon + 1);
    }

    std::string upstream = rest;
    std::string revision;
    auto dash = rest.rfind('-');
    if (dash != std::string::npos) {
        upstream = rest.substr(0, dash);
        revision = rest.substr(dash + 1);
        if (revision.empty() ||
            !std::all_of(revision.begin(), revision.end(), is_version_char)) {
            return false;
        }
    }

    if (upstream.empty() || !std::isdigit(static_cast<unsigned char>(upstream[0]))) {
        return false;
    }

    return std::all_of(upstream.begin(), upstream.end(),
                       [](char c) { return is_version_char(c) || c == '-'; });
}

std::string to_debian_version(const std::string& upstream) {
    std::string v = trim(upstream);
    try {
        auto parsed = semver::version::parse(v);
        if (!parsed.is_prerelease()) {
            return v;
        }
        std::string out = std::to_string(parsed.major()) + "." +
                          std::to_string(parsed.minor()) + "." +
                          std::to_string(parsed.patch()) + "~" +
                          std::string(parsed.prerelease());
        if (!std::string(parsed.build_meta()).empty()) {
            out += "+" + std::string(parsed.build_meta());
        }
        // Debian forbids '-' in upstream when there is no revision
        std::replace(out.begin(), out.end(), '-', '.');
        return out;
    } catch (const semver::semver_exception&) {
        return v;
    }
}

std::string strip_epoch(const std::string& version) {
    auto colon = version.find(':');
    if (colon == std::string::npos) return version;
    return version.substr(colon + 1);
}

std::optional<std::string> debian_architecture_for_machine(const std::string& machine) {
    if (machine == "x86_64" || machine == "amd64") return std::string("amd64");
    if (machine == "aarch64" || machine == "arm64") return std::string("arm64");
    if (machine == "i386" || machine == "i486" || machine == "i586" || machine == "i686") {
        return std::string("i386");
    }
    if (machine.rfind("armv7", 0) == 0 || machine == "armhf") return std::string("armhf");
    if (machine.rfind("armv6", 0) == 0 || machine == "armel") return std::string("armel");
    if (machine == "ppc64le") return std::string("ppc64el");
    if (machine == "riscv64") return std::string("riscv64");
    if (machine == "s390x") return std::string("s390x");
    return std::nullopt;
}

std::string host_architecture() {
    auto machine = get_host_machine();
    if (auto arch = debian_architecture_for_machine(machine)) {
        return *arch;
    }
    spdlog::warn("unknown host machine '{}', defaulting architecture to amd64", machine);
    return "amd64";
}

// ============================================================================
// Metadata Resolution
// ============================================================================

MetadataResult resolve_metadata(const MetadataRequest& request) {
    MetadataResult result;
    result.error_code = BuildError::MetadataError;

    if (request.manifest_path.empty()) {
        result.error = "no build manifest configured";
        return result;
    }

    auto parsed = read_build_manifest(request.manifest_path);
    if (!parsed.ok) {
        result.error = request.manifest_path + ": " + parsed.error;
        return result;
    }

    std::string name = trim(request.name);
    if (name.empty()) {
        name = to_lower(parsed.manifest.name);
    }
    if (name.empty()) {
        result.error = "package name not configured and not present in " +
                       request.manifest_path;
        return result;
    }
    if (!is_valid_package_name(name)) {
        result.error = "invalid package name: '" + name + "'";
        return result;
    }

    std::string version = to_debian_version(parsed.manifest.version);
    if (!is_valid_debian_version(version)) {
        result.error = "invalid version '" + parsed.manifest.version + "' in " +
                       request.manifest_path;
        return result;
    }

    std::string arch = trim(request.architecture);
    if (arch.empty()) {
        arch = host_architecture();
    }
    if (!is_valid_package_name(arch)) {
        result.error = "invalid architecture: '" + arch + "'";
        return result;
    }

    result.metadata.name = name;
    result.metadata.version = version;
    result.metadata.architecture = arch;
    result.upstream_version = parsed.manifest.version;
    result.error_code = BuildError::None;
    result.ok = true;

    spdlog::debug("resolved metadata {} {} {} from {}", name, version, arch,
                  request.manifest_path);
    return result;
}

} // namespace debpack
