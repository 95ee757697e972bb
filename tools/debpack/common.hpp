/**
 * debpack CLI - Common utilities and types
 */

#pragma once

#include <debpack/build_config.hpp>
#include <debpack/pipeline.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace debpack::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config;            // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Route spdlog to stderr so --json output on stdout stays parseable.
 */
inline void configure_logging(const GlobalOptions& opts) {
    auto logger = spdlog::get("debpack");
    if (!logger) {
        logger = spdlog::stderr_color_mt("debpack");
    }
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("%^%l%$: %v");

    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet || opts.json) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static WarningCollector collector;
    return collector;
}

inline void init_warning_collector(bool json_mode, bool quiet) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode,
                        const std::string& code = "") {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        if (!code.empty()) {
            j["error_code"] = code;
        }
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_warning(const std::string& msg) {
    get_warning_collector().add(msg);
}

inline void print_success(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

inline nlohmann::json metadata_to_json(const PackageMetadata& metadata) {
    nlohmann::json j;
    j["name"] = metadata.name;
    j["version"] = metadata.version;
    j["architecture"] = metadata.architecture;
    return j;
}

/**
 * Load the effective configuration.
 * Priority: CLI flags (applied by the caller) > environment > config file > defaults.
 */
inline std::optional<BuildConfig> load_effective_config(const GlobalOptions& opts) {
    BuildConfig config;

    auto path = find_config_path(opts.config.empty() ? std::nullopt
                                                     : std::make_optional(opts.config));
    if (path) {
        auto loaded = load_build_config(*path);
        if (!loaded.ok) {
            print_error(loaded.error, opts.json);
            return std::nullopt;
        }
        for (const auto& w : loaded.warnings) {
            print_warning(*path + ": " + w);
        }
        config = loaded.config;
        spdlog::debug("using config {}", *path);
    }

    apply_environment(config);
    return config;
}

} // namespace debpack::cli
