/**
 * cogmod CLI - registry build / verify
 *
 * Browse the configured registry, package module directories into
 * reproducible tarballs plus a registry index, and re-verify published assets.
 */

#include "../common.hpp"
#include <cogmod/assets.hpp>
#include <CLI/CLI.hpp>

namespace cogmod::cli::commands {

namespace {

struct BuildCommandOptions {
    std::string modules_dir = "cognitive/modules";
    std::string out_dir = "dist/registry-assets";
    std::string registry_out = "cognitive-registry.v2.json";
    std::string tag;
    std::string tarball_base_url;
    std::string timestamp;
    std::string namespace_ = "official";
    std::string legacy_registry;
    std::vector<std::string> only;
};

struct VerifyCommandOptions {
    std::string index = "cognitive-registry.v2.json";
    std::string assets_dir;
    bool remote = false;
    size_t concurrency = 0;
};

std::unique_ptr<RegistryClient> open_registry(const GlobalOptions& opts) {
    auto loaded = load_config(config_overrides(opts));
    if (!loaded.ok) {
        print_error(loaded.error, opts.json);
        return nullptr;
    }
    return std::make_unique<RegistryClient>(registry_options(loaded.config));
}

int cmd_list(const GlobalOptions& opts) {
    init_command(opts);

    auto registry = open_registry(opts);
    if (!registry) return 1;

    Error error;
    auto modules = registry->list_modules(&error);
    if (error) {
        print_error(error, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json list = nlohmann::json::array();
        for (const auto& m : modules) {
            list.push_back({
                {"name", m.name},
                {"version", m.version},
                {"description", m.description},
            });
        }
        nlohmann::json j;
        j["ok"] = true;
        j["registry"] = registry->registry_url();
        j["modules"] = list;
        output_json(j);
        return 0;
    }

    for (const auto& m : modules) {
        std::cout << "  " << m.name << "@" << m.version;
        if (!m.description.empty()) std::cout << "  " << m.description;
        std::cout << std::endl;
    }
    std::cout << modules.size() << " modules in " << registry->registry_url() << std::endl;
    return 0;
}

int cmd_categories(const GlobalOptions& opts) {
    init_command(opts);

    auto registry = open_registry(opts);
    if (!registry) return 1;

    Error error;
    auto categories = registry->categories(&error);
    if (error) {
        print_error(error, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json list = nlohmann::json::array();
        for (const auto& [key, c] : categories) {
            list.push_back({
                {"key", key},
                {"name", c.name},
                {"description", c.description},
                {"modules", c.modules},
            });
        }
        nlohmann::json j;
        j["ok"] = true;
        j["categories"] = list;
        output_json(j);
        return 0;
    }

    if (categories.empty()) {
        std::cout << "No categories." << std::endl;
        return 0;
    }
    for (const auto& [key, c] : categories) {
        std::cout << "  " << key << " (" << c.modules.size() << ")";
        if (!c.description.empty()) std::cout << "  " << c.description;
        std::cout << std::endl;
    }
    return 0;
}

int cmd_build(const GlobalOptions& opts, const BuildCommandOptions& build_opts) {
    init_command(opts);

    BuildOptions options;
    options.modules_dir = build_opts.modules_dir;
    options.out_dir = build_opts.out_dir;
    options.registry_out = build_opts.registry_out;
    if (!build_opts.tag.empty()) options.tag = build_opts.tag;
    if (!build_opts.tarball_base_url.empty()) options.tarball_base_url = build_opts.tarball_base_url;
    options.timestamp = build_opts.timestamp;
    options.namespace_ = build_opts.namespace_;
    if (!build_opts.legacy_registry.empty()) options.legacy_registry_path = build_opts.legacy_registry;
    options.only = build_opts.only;

    auto result = build_registry_assets(options);
    if (!result.ok) {
        print_error(result.error, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json modules = nlohmann::json::array();
        for (const auto& t : result.tarballs) {
            modules.push_back({
                {"name", t.name},
                {"version", t.version},
                {"file", t.file},
                {"sha256", t.sha256},
                {"size_bytes", t.size_bytes},
            });
        }
        nlohmann::json j;
        j["ok"] = true;
        j["registryOut"] = options.registry_out;
        j["outDir"] = options.out_dir;
        j["updated"] = result.updated;
        j["modules"] = modules;
        output_json(j);
    } else {
        for (const auto& t : result.tarballs) {
            std::cout << "  " << t.file << "  " << t.size_bytes << " bytes  sha256:" << t.sha256
                      << std::endl;
        }
        std::cout << "Wrote " << options.registry_out << " (" << result.tarballs.size()
                  << " modules)" << std::endl;
    }
    return 0;
}

int cmd_verify(const GlobalOptions& opts, const VerifyCommandOptions& verify_opts) {
    init_command(opts);

    VerifyOptions options;
    options.index = verify_opts.index;
    if (!verify_opts.assets_dir.empty()) options.assets_dir = verify_opts.assets_dir;
    options.remote = verify_opts.remote;
    if (verify_opts.concurrency > 0) options.concurrency = verify_opts.concurrency;

    auto report = verify_registry_assets(options);
    if (report.error) {
        print_error(report.error, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json failures = nlohmann::json::array();
        for (const auto& f : report.failures) {
            failures.push_back({
                {"module", f.module},
                {"phase", verify_phase_name(f.phase)},
                {"kind", error_kind_name(f.kind)},
                {"tarball_ref", f.tarball_ref},
                {"tarball_resolved", f.tarball_resolved},
                {"message", f.message},
            });
        }
        nlohmann::json j;
        j["ok"] = report.ok;
        j["checked"] = report.checked;
        j["passed"] = report.passed;
        j["failed"] = report.failed;
        j["failures"] = failures;
        output_json(j);
    } else {
        for (const auto& f : report.failures) {
            std::cout << "  FAIL " << f.module << " [" << verify_phase_name(f.phase) << "] "
                      << f.message << std::endl;
        }
        std::cout << "Checked " << report.checked << ": " << report.passed << " passed, "
                  << report.failed << " failed" << std::endl;
    }
    return report.ok ? 0 : 1;
}

} // anonymous namespace

void setup_registry(CLI::App* app, GlobalOptions& opts) {
    static BuildCommandOptions build_opts;
    static VerifyCommandOptions verify_opts;

    app->require_subcommand(1);

    auto* list = app->add_subcommand("list", "List every module in the registry");
    list->callback([&opts]() {
        std::exit(cmd_list(opts));
    });

    auto* categories = app->add_subcommand("categories", "List registry categories");
    categories->callback([&opts]() {
        std::exit(cmd_categories(opts));
    });

    auto* build = app->add_subcommand("build", "Build tarballs and a registry index");
    build->add_option("--modules-dir", build_opts.modules_dir, "Directory of module directories");
    build->add_option("--out-dir", build_opts.out_dir, "Where tarballs are written");
    build->add_option("--registry-out", build_opts.registry_out, "Registry index to write");
    build->add_option("--tag", build_opts.tag, "Release tag for tarball URLs");
    build->add_option("--tarball-base-url", build_opts.tarball_base_url, "Base URL for tarballs");
    build->add_option("--timestamp", build_opts.timestamp, "Fixed 'updated' timestamp");
    build->add_option("--namespace", build_opts.namespace_, "identity.namespace");
    build->add_option("--legacy-registry", build_opts.legacy_registry,
                      "Legacy index supplying descriptions, tags and categories");
    build->add_option("--only", build_opts.only, "Only build these modules");
    build->callback([&opts]() {
        std::exit(cmd_build(opts, build_opts));
    });

    auto* verify = app->add_subcommand("verify", "Verify registry assets");
    verify->add_option("--index", verify_opts.index, "Registry index path or URL");
    verify->add_option("--assets-dir", verify_opts.assets_dir, "Directory holding the tarballs");
    verify->add_flag("--remote", verify_opts.remote, "Download tarballs from their URLs");
    verify->add_option("--concurrency", verify_opts.concurrency, "Parallel downloads (max 8)");
    verify->callback([&opts]() {
        std::exit(cmd_verify(opts, verify_opts));
    });
}

} // namespace cogmod::cli::commands
