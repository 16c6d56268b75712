/**
 * cogmod CLI - add command
 *
 * Install a module from the registry or a GitHub repository.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace cogmod::cli::commands {

namespace {

struct AddOptions {
    std::string reference;
    std::string name;
    std::string tag;
    std::string branch;
};

int cmd_add(const GlobalOptions& opts, const AddOptions& add_opts) {
    init_command(opts);

    if (!add_opts.tag.empty() && !add_opts.branch.empty()) {
        print_error(make_error(ErrorKind::InvalidReference, "--tag and --branch are exclusive"),
                    opts.json);
        return 1;
    }

    auto session = open_session(opts);
    if (!session) return 1;

    InstallOptions install_opts;
    if (!add_opts.name.empty()) install_opts.rename_to = add_opts.name;
    if (!add_opts.tag.empty()) {
        install_opts.pinned_ref = add_opts.tag;
        install_opts.ref_type = RefType::Tag;
    } else if (!add_opts.branch.empty()) {
        install_opts.pinned_ref = add_opts.branch;
        install_opts.ref_type = RefType::Branch;
    }

    auto result = session->installer->install(add_opts.reference, install_opts);
    print_warnings(result.warnings);
    if (!result.success) {
        print_error(result.error, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["moduleName"] = result.module_name;
        j["version"] = result.version ? nlohmann::json(*result.version) : nlohmann::json(nullptr);
        j["location"] = result.location;
        j["source"] = result.source;
        output_json(j);
    } else {
        std::cout << "Installed " << result.module_name;
        if (result.version) std::cout << "@" << *result.version;
        std::cout << " -> " << result.location << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_add(CLI::App* app, GlobalOptions& opts) {
    static AddOptions add_opts;

    app->add_option("reference", add_opts.reference,
                    "Registry name[@version], owner/repo[/path][@ref] or GitHub URL")->required();
    app->add_option("--name", add_opts.name, "Install under this name");
    app->add_option("--tag", add_opts.tag, "Tag (or registry version) to install");
    app->add_option("--branch", add_opts.branch, "Branch to install");

    app->callback([&opts]() {
        std::exit(cmd_add(opts, add_opts));
    });
}

} // namespace cogmod::cli::commands
