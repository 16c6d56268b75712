#include <doctest/doctest.h>
#include <cogmod/assets.hpp>
#include <cogmod/config.hpp>
#include <cogmod/installer.hpp>
#include <cogmod/module_descriptor.hpp>
#include <cogmod/platform.hpp>
#include <cogmod/provenance.hpp>
#include <cogmod/registry.hpp>

#include "../support/test_helpers.hpp"

#include <nlohmann/json.hpp>

using namespace cogmod;
using cogmod::testing::TempDir;
using cogmod::testing::write_module;
using cogmod::testing::write_text;

namespace {

// Publisher workspace plus a consumer home, both under one temp directory
struct Workspace {
    TempDir tmp;

    std::string publish(const std::string& timestamp = "2026-01-01T00:00:00Z") {
        BuildOptions options;
        options.modules_dir = tmp.file("publisher/modules");
        options.out_dir = tmp.file("publisher/dist");
        options.registry_out = tmp.file("publisher/dist/cognitive-registry.v2.json");
        options.timestamp = timestamp;
        auto built = build_registry_assets(options);
        REQUIRE_MESSAGE(built.ok, built.error.describe());
        return tmp.url("publisher/dist/cognitive-registry.v2.json");
    }

    Config consumer_config(const std::string& registry_url) {
        nlohmann::json config;
        config["registry_url"] = registry_url;
        config["repository_archive_base"] = tmp.url("gh");
        write_text(tmp.file("home/config.json"), config.dump(2));

        ConfigOverrides overrides;
        overrides.root = tmp.file("home");
        auto loaded = load_config(overrides);
        REQUIRE_MESSAGE(loaded.ok, loaded.error.describe());

        // Keep the index fresh between steps of one test
        loaded.config.cache_dir.clear();
        return loaded.config;
    }
};

} // namespace

TEST_CASE("publish, verify, install, update and remove one module") {
    Workspace ws;
    write_module(ws.tmp.file("publisher/modules/demo"), "demo", "1.0.0");
    std::string index_url = ws.publish();

    VerifyOptions verify;
    verify.index = ws.tmp.file("publisher/dist/cognitive-registry.v2.json");
    verify.assets_dir = ws.tmp.file("publisher/dist");
    auto report = verify_registry_assets(verify);
    REQUIRE_FALSE(report.error);
    CHECK(report.ok);
    CHECK(report.passed == 1);
    CHECK(report.failed == 0);

    Config config = ws.consumer_config(index_url);
    auto loaded = InstallManifest::load(config.manifest_path);
    REQUIRE(loaded.ok);
    InstallManifest manifest = loaded.manifest;

    RegistryClient registry(registry_options(config));
    auto hits = registry.search("demo");
    REQUIRE(hits.size() == 1);
    CHECK(hits[0].score == 18);

    Installer installer(installer_options(config), manifest, registry);
    auto installed = installer.install("demo");
    REQUIRE_MESSAGE(installed.success, installed.error.describe());
    CHECK(installed.location == join_path(config.modules_dir, "demo"));
    CHECK(verify_module_integrity(installed.location).ok);

    // Nothing new published: update reinstalls the same version
    auto same = installer.update("demo");
    REQUIRE(same.success);
    CHECK_FALSE(same.changed());

    // Publish 1.1.0 and update through a fresh client
    write_module(ws.tmp.file("publisher/modules/demo"), "demo", "1.1.0", "# prompt v2\n");
    ws.publish("2026-02-01T00:00:00Z");
    RegistryClient refreshed(registry_options(config));
    Installer updater(installer_options(config), manifest, refreshed);
    auto updated = updater.update("demo");
    REQUIRE_MESSAGE(updated.success, updated.error.describe());
    CHECK(updated.old_version == std::optional<std::string>("1.0.0"));
    CHECK(updated.new_version == std::optional<std::string>("1.1.0"));
    CHECK(cogmod::testing::read_text(join_path(installed.location, "prompt.md")) == "# prompt v2\n");

    auto reloaded = InstallManifest::load(config.manifest_path);
    REQUIRE(reloaded.ok);
    REQUIRE(reloaded.manifest.find("demo") != nullptr);
    CHECK(reloaded.manifest.find("demo")->resolved_version == std::optional<std::string>("1.1.0"));

    auto removed = updater.remove("demo");
    REQUIRE(removed.success);
    CHECK_FALSE(path_exists(installed.location));
    auto after = InstallManifest::load(config.manifest_path);
    REQUIRE(after.ok);
    CHECK(after.manifest.entries().empty());
}

TEST_CASE("tampering after install is detected") {
    Workspace ws;
    write_module(ws.tmp.file("publisher/modules/demo"), "demo", "1.0.0");
    Config config = ws.consumer_config(ws.publish());

    InstallManifest manifest(config.manifest_path);
    RegistryClient registry(registry_options(config));
    Installer installer(installer_options(config), manifest, registry);
    auto installed = installer.install("demo");
    REQUIRE(installed.success);

    write_text(join_path(installed.location, "prompt.md"), "# injected\n");
    auto check = verify_module_integrity(installed.location);
    CHECK_FALSE(check.ok);
    CHECK(check.changed == std::vector<std::string>{"prompt.md"});
}

TEST_CASE("certified profile installs only checksummed registry tarballs") {
    Workspace ws;
    write_module(ws.tmp.file("publisher/modules/demo"), "demo", "1.0.0");
    Config config = ws.consumer_config(ws.publish());
    config.profile = Profile::Certified;

    InstallManifest manifest(config.manifest_path);
    RegistryClient registry(registry_options(config));
    Installer installer(installer_options(config), manifest, registry);

    auto installed = installer.install("demo");
    REQUIRE_MESSAGE(installed.success, installed.error.describe());
    CHECK(read_provenance(installed.location).ok);

    auto repo = installer.install("acme/modules/demo");
    CHECK_FALSE(repo.success);
    CHECK(repo.error.kind == ErrorKind::PolicyViolation);
}
