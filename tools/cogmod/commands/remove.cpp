/**
 * cogmod CLI - remove command
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace cogmod::cli::commands {

namespace {

int cmd_remove(const GlobalOptions& opts, const std::string& name) {
    init_command(opts);

    auto session = open_session(opts);
    if (!session) return 1;

    auto result = session->installer->remove(name);
    if (!result.success) {
        print_error(result.error, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["moduleName"] = result.module_name;
        j["location"] = result.location;
        output_json(j);
    } else {
        std::cout << "Removed " << result.module_name << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_remove(CLI::App* app, GlobalOptions& opts) {
    static std::string name;

    app->add_option("name", name, "Installed module name")->required();

    app->callback([&opts]() {
        std::exit(cmd_remove(opts, name));
    });
}

} // namespace cogmod::cli::commands
