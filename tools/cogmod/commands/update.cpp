/**
 * cogmod CLI - update command
 *
 * Re-resolve an installed module from its manifest entry.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace cogmod::cli::commands {

namespace {

struct UpdateCommandOptions {
    std::string name;
    std::string tag;
};

int cmd_update(const GlobalOptions& opts, const UpdateCommandOptions& update_opts) {
    init_command(opts);

    auto session = open_session(opts);
    if (!session) return 1;

    UpdateOptions options;
    if (!update_opts.tag.empty()) {
        options.pinned_ref = update_opts.tag;
        options.ref_type = RefType::Tag;
    }

    auto result = session->installer->update(update_opts.name, options);
    print_warnings(result.warnings);
    if (!result.success) {
        print_error(result.error, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["moduleName"] = result.module_name;
        j["oldVersion"] = result.old_version ? nlohmann::json(*result.old_version)
                                             : nlohmann::json(nullptr);
        j["newVersion"] = result.new_version ? nlohmann::json(*result.new_version)
                                             : nlohmann::json(nullptr);
        output_json(j);
    } else if (result.changed()) {
        std::cout << "Updated " << result.module_name << ": "
                  << optional_or(result.old_version, "?") << " -> "
                  << optional_or(result.new_version, "?") << std::endl;
    } else {
        std::cout << result.module_name << " is up to date ("
                  << optional_or(result.new_version, "unversioned") << ")" << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_update(CLI::App* app, GlobalOptions& opts) {
    static UpdateCommandOptions update_opts;

    app->add_option("name", update_opts.name, "Installed module name")->required();
    app->add_option("--tag", update_opts.tag, "Tag (or registry version) to move to");

    app->callback([&opts]() {
        std::exit(cmd_update(opts, update_opts));
    });
}

} // namespace cogmod::cli::commands
