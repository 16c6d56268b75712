/**
 * cogmod CLI - search and info commands
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace cogmod::cli::commands {

namespace {

std::unique_ptr<RegistryClient> open_registry(const GlobalOptions& opts) {
    auto loaded = load_config(config_overrides(opts));
    if (!loaded.ok) {
        print_error(loaded.error, opts.json);
        return nullptr;
    }
    return std::make_unique<RegistryClient>(registry_options(loaded.config));
}

nlohmann::json module_to_json(const ModuleInfo& info) {
    nlohmann::json j;
    j["name"] = info.name;
    j["version"] = info.version;
    j["description"] = info.description;
    j["author"] = info.author;
    j["source"] = info.source;
    j["keywords"] = info.keywords;
    if (info.tarball) j["tarball"] = *info.tarball;
    if (info.checksum) j["checksum"] = *info.checksum;
    if (info.size_bytes) j["sizeBytes"] = *info.size_bytes;
    if (!info.files.empty()) j["files"] = info.files;
    if (info.tier) j["tier"] = *info.tier;
    if (info.namespace_) j["namespace"] = *info.namespace_;
    if (info.spec_version) j["specVersion"] = *info.spec_version;
    if (info.verified) j["verified"] = *info.verified;
    if (info.conformance_level) j["conformanceLevel"] = *info.conformance_level;
    if (info.deprecated) j["deprecated"] = *info.deprecated;
    return j;
}

int cmd_search(const GlobalOptions& opts, const std::string& query) {
    init_command(opts);

    auto registry = open_registry(opts);
    if (!registry) return 1;

    Error error;
    auto hits = registry->search(query, &error);
    if (error) {
        print_error(error, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json results = nlohmann::json::array();
        for (const auto& hit : hits) {
            nlohmann::json h = module_to_json(hit.info);
            h["score"] = hit.score;
            results.push_back(h);
        }
        nlohmann::json j;
        j["ok"] = true;
        j["query"] = query;
        j["results"] = results;
        output_json(j);
        return 0;
    }

    if (hits.empty()) {
        std::cout << "No modules match '" << query << "'." << std::endl;
        return 0;
    }
    for (const auto& hit : hits) {
        std::cout << "  " << hit.name << "@" << hit.info.version;
        if (!hit.info.description.empty()) std::cout << "  " << hit.info.description;
        std::cout << std::endl;
    }
    return 0;
}

int cmd_info(const GlobalOptions& opts, const std::string& name) {
    init_command(opts);

    auto registry = open_registry(opts);
    if (!registry) return 1;

    auto found = registry->get_module(name);
    if (!found.ok) {
        print_error(found.error, opts.json);
        return 1;
    }

    nlohmann::json info = module_to_json(found.info);
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["module"] = info;
        output_json(j);
    } else {
        std::cout << info.dump(2) << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_search(CLI::App* app, GlobalOptions& opts) {
    static std::string query;

    app->add_option("query", query, "Search terms (empty lists everything)");

    app->callback([&opts]() {
        std::exit(cmd_search(opts, query));
    });
}

void setup_info(CLI::App* app, GlobalOptions& opts) {
    static std::string name;

    app->add_option("name", name, "Registry module name")->required();

    app->callback([&opts]() {
        std::exit(cmd_info(opts, name));
    });
}

} // namespace cogmod::cli::commands
