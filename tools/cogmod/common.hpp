/**
 * cogmod CLI - Common utilities and types
 */

#pragma once

#include <cogmod/config.hpp>
#include <cogmod/errors.hpp>
#include <cogmod/install_manifest.hpp>
#include <cogmod/installer.hpp>
#include <cogmod/registry.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#ifndef COGMOD_VERSION
#define COGMOD_VERSION "1.0.0"
#endif

namespace cogmod::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string root;              // --root
    std::string registry;          // --registry
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
    bool certified = false;        // --certified
};

/**
 * Warning collector. In JSON mode, warnings are collected and output at the
 * end. In text mode, warnings are printed immediately to stderr.
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

inline void init_command(const GlobalOptions& opts) {
    init_logging(opts.verbose, opts.quiet);
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = opts.json;
    collector.quiet = opts.quiet;
}

inline void print_warnings(const std::vector<std::string>& warnings) {
    for (const auto& w : warnings) get_warning_collector().add(w);
}

inline nlohmann::json error_to_json(const Error& error) {
    nlohmann::json j;
    j["kind"] = error_kind_name(error.kind);
    j["message"] = error.message;
    if (!error.path.empty()) j["path"] = error.path;
    if (!error.expected.empty()) j["expected"] = error.expected;
    if (!error.actual.empty()) j["actual"] = error.actual;
    return j;
}

/**
 * Output utilities.
 */
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

inline void print_error(const Error& error, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = error_to_json(error);
        output_json(j);
    } else {
        std::cerr << "Error: " << error.describe() << std::endl;
    }
}

inline ConfigOverrides config_overrides(const GlobalOptions& opts) {
    ConfigOverrides overrides;
    if (!opts.root.empty()) overrides.root = opts.root;
    if (!opts.registry.empty()) overrides.registry_url = opts.registry;
    if (opts.certified) overrides.profile = Profile::Certified;
    return overrides;
}

/**
 * Everything an install/update/remove command needs, loaded once.
 */
struct Session {
    Config config;
    InstallManifest manifest;
    std::unique_ptr<RegistryClient> registry;
    std::unique_ptr<Installer> installer;
};

inline std::unique_ptr<Session> open_session(const GlobalOptions& opts) {
    auto loaded = load_config(config_overrides(opts));
    if (!loaded.ok) {
        print_error(loaded.error, opts.json);
        return nullptr;
    }

    auto manifest = InstallManifest::load(loaded.config.manifest_path);
    if (!manifest.ok) {
        print_error(manifest.error, opts.json);
        return nullptr;
    }

    auto session = std::make_unique<Session>();
    session->config = loaded.config;
    session->manifest = std::move(manifest.manifest);
    session->registry = std::make_unique<RegistryClient>(registry_options(session->config));
    session->installer = std::make_unique<Installer>(installer_options(session->config),
                                                     session->manifest, *session->registry);
    return session;
}

inline std::string optional_or(const std::optional<std::string>& value, const char* fallback) {
    return value ? *value : fallback;
}

} // namespace cogmod::cli
