/**
 * cogmod CLI - verify-integrity command
 *
 * Recompute per-file digests of an installed module and compare them with
 * its provenance record.
 */

#include "../common.hpp"
#include <cogmod/path_utils.hpp>
#include <cogmod/platform.hpp>
#include <cogmod/provenance.hpp>
#include <CLI/CLI.hpp>

namespace cogmod::cli::commands {

namespace {

int cmd_verify_integrity(const GlobalOptions& opts, const std::string& name) {
    init_command(opts);

    if (!is_safe_module_name(name)) {
        print_error(make_error(ErrorKind::InvalidReference, "invalid module name: " + name),
                    opts.json);
        return 1;
    }

    auto loaded = load_config(config_overrides(opts));
    if (!loaded.ok) {
        print_error(loaded.error, opts.json);
        return 1;
    }

    std::string module_dir = join_path(loaded.config.modules_dir, name);
    if (!is_directory(module_dir)) {
        print_error(make_path_error(ErrorKind::ModuleNotFound, "module is not installed",
                                    module_dir), opts.json);
        return 1;
    }

    auto result = verify_module_integrity(module_dir);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = result.ok;
        j["moduleName"] = name;
        j["changed"] = result.changed;
        j["missing"] = result.missing;
        j["extra"] = result.extra;
        if (!result.ok) j["error"] = error_to_json(result.error);
        output_json(j);
        return result.ok ? 0 : 1;
    }

    if (result.ok) {
        std::cout << name << ": integrity ok" << std::endl;
        return 0;
    }
    for (const auto& p : result.changed) std::cout << "  changed " << p << std::endl;
    for (const auto& p : result.missing) std::cout << "  missing " << p << std::endl;
    for (const auto& p : result.extra) std::cout << "  extra   " << p << std::endl;
    std::cerr << "Error: " << result.error.describe() << std::endl;
    return 1;
}

} // anonymous namespace

void setup_verify_integrity(CLI::App* app, GlobalOptions& opts) {
    static std::string name;

    app->add_option("name", name, "Installed module name")->required();

    app->callback([&opts]() {
        std::exit(cmd_verify_integrity(opts, name));
    });
}

} // namespace cogmod::cli::commands
