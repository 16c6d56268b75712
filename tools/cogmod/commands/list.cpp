/**
 * cogmod CLI - list command
 *
 * List installed modules from the install manifest.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace cogmod::cli::commands {

namespace {

int cmd_list(const GlobalOptions& opts) {
    init_command(opts);

    auto loaded = load_config(config_overrides(opts));
    if (!loaded.ok) {
        print_error(loaded.error, opts.json);
        return 1;
    }
    auto manifest = InstallManifest::load(loaded.config.manifest_path);
    if (!manifest.ok) {
        print_error(manifest.error, opts.json);
        return 1;
    }

    const auto& entries = manifest.manifest.entries();

    if (opts.json) {
        nlohmann::json modules = nlohmann::json::array();
        for (const auto& [name, entry] : entries) {
            nlohmann::json m;
            m["name"] = name;
            m["source"] = entry.source;
            m["location"] = entry.location;
            m["version"] = entry.resolved_version ? nlohmann::json(*entry.resolved_version)
                                                  : nlohmann::json(nullptr);
            m["installedAt"] = entry.installed_at;
            if (entry.registry_module) m["registryModule"] = *entry.registry_module;
            modules.push_back(m);
        }
        nlohmann::json j;
        j["ok"] = true;
        j["modules"] = modules;
        output_json(j);
        return 0;
    }

    if (entries.empty()) {
        std::cout << "No modules installed." << std::endl;
        return 0;
    }
    for (const auto& [name, entry] : entries) {
        std::cout << "  " << name << "@" << optional_or(entry.resolved_version, "?")
                  << "  (" << entry.source << ")" << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_list(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_list(opts));
    });
}

} // namespace cogmod::cli::commands
