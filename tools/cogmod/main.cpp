/**
 * cogmod CLI - Entry Point
 *
 * Installs, updates and removes cognitive modules, and builds and verifies
 * registry assets.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace cogmod::cli::commands {
    void setup_add(CLI::App* app, GlobalOptions& opts);
    void setup_update(CLI::App* app, GlobalOptions& opts);
    void setup_remove(CLI::App* app, GlobalOptions& opts);
    void setup_list(CLI::App* app, GlobalOptions& opts);
    void setup_search(CLI::App* app, GlobalOptions& opts);
    void setup_info(CLI::App* app, GlobalOptions& opts);
    void setup_registry(CLI::App* app, GlobalOptions& opts);
    void setup_verify_integrity(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace cogmod::cli;

    CLI::App app{"cogmod - cognitive module installer"};
    app.set_version_flag("-V,--version", COGMOD_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--root", opts.root, "cogmod home directory");
    app.add_option("--registry", opts.registry, "Registry index URL");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");
    app.add_flag("--certified", opts.certified, "Registry tarballs only, provenance mandatory");

    // Commands
    auto* add_cmd = app.add_subcommand("add", "Install a module");
    commands::setup_add(add_cmd, opts);

    auto* update_cmd = app.add_subcommand("update", "Re-resolve an installed module");
    commands::setup_update(update_cmd, opts);

    auto* remove_cmd = app.add_subcommand("remove", "Remove an installed module");
    commands::setup_remove(remove_cmd, opts);

    auto* list_cmd = app.add_subcommand("list", "List installed modules");
    commands::setup_list(list_cmd, opts);

    auto* search_cmd = app.add_subcommand("search", "Search the registry");
    commands::setup_search(search_cmd, opts);

    auto* info_cmd = app.add_subcommand("info", "Show a registry entry");
    commands::setup_info(info_cmd, opts);

    auto* registry_cmd = app.add_subcommand("registry", "Browse the registry, build or verify its assets");
    commands::setup_registry(registry_cmd, opts);

    auto* verify_cmd = app.add_subcommand("verify-integrity",
                                          "Check installed files against provenance.json");
    commands::setup_verify_integrity(verify_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
