#include <doctest/doctest.h>
#include <cogmod/assets.hpp>
#include <cogmod/integrity.hpp>
#include <cogmod/platform.hpp>
#include <cogmod/registry.hpp>

#include "../support/test_helpers.hpp"

#include <nlohmann/json.hpp>

using namespace cogmod;
using cogmod::testing::TempDir;
using cogmod::testing::write_module;
using cogmod::testing::write_text;

namespace {

const char* FIXED_TIME = "2026-01-01T00:00:00Z";

struct AssetFixture {
    TempDir tmp;

    AssetFixture() {
        write_module(tmp.file("modules/alpha"), "alpha", "1.0.0");
        write_module(tmp.file("modules/beta"), "beta", "2.1.0");
        write_text(tmp.file("modules/beta/docs/usage.md"), "usage");
        write_text(tmp.file("modules/notes/README.md"), "not a module");
    }

    BuildOptions build_options() const {
        BuildOptions options;
        options.modules_dir = tmp.file("modules");
        options.out_dir = tmp.file("dist");
        options.registry_out = tmp.file("dist/index.json");
        options.timestamp = FIXED_TIME;
        return options;
    }

    VerifyOptions local_verify() const {
        VerifyOptions options;
        options.index = tmp.file("dist/index.json");
        options.assets_dir = tmp.file("dist");
        return options;
    }

    VerifyOptions remote_verify(size_t concurrency) const {
        VerifyOptions options;
        options.index = tmp.url("dist/index.json");
        options.concurrency = concurrency;
        return options;
    }

    void flip_byte(const std::string& file) {
        auto bytes = cogmod::testing::read_bytes(tmp.file("dist/" + file));
        REQUIRE(bytes.size() > 40);
        bytes[bytes.size() / 2] ^= 0xff;
        cogmod::testing::write_bytes(tmp.file("dist/" + file), bytes);
    }

    nlohmann::json read_index() const {
        return nlohmann::json::parse(cogmod::testing::read_text(tmp.file("dist/index.json")));
    }

    void write_index(const nlohmann::json& doc) {
        write_text(tmp.file("dist/index.json"), doc.dump(2));
    }
};

} // namespace

// ============================================================================
// Builder
// ============================================================================

TEST_CASE("build writes tarballs and a loadable registry index") {
    AssetFixture fx;
    auto built = build_registry_assets(fx.build_options());
    REQUIRE_MESSAGE(built.ok, built.error.describe());
    REQUIRE(built.tarballs.size() == 2);
    CHECK(built.tarballs[0].file == "alpha-1.0.0.tar.gz");
    CHECK(built.tarballs[1].file == "beta-2.1.0.tar.gz");
    CHECK(built.updated == FIXED_TIME);

    for (const auto& t : built.tarballs) {
        auto digest = compute_sha256_file(t.path);
        REQUIRE(digest.ok);
        CHECK(digest.hex_digest == t.sha256);
        CHECK(file_size(t.path) == std::optional<uint64_t>(t.size_bytes));
    }

    auto doc = fx.read_index();
    CHECK(doc["version"] == REGISTRY_DOCUMENT_VERSION);
    CHECK(doc["stats"]["total_modules"] == 2);
    CHECK(doc["featured"] == nlohmann::json::array({"alpha", "beta"}));

    const auto& beta = doc["modules"]["beta"];
    CHECK(beta["identity"]["namespace"] == "official");
    CHECK(beta["distribution"]["tarball"] == "beta-2.1.0.tar.gz");
    CHECK(beta["distribution"]["files"] ==
          nlohmann::json::array({"docs/usage.md", "module.yaml", "prompt.md"}));
    CHECK(beta["metadata"]["description"] == "Test module beta");
    CHECK(beta["metadata"]["author"] == "unknown");
    CHECK(beta["timestamps"]["created_at"] == FIXED_TIME);

    auto parsed = parse_registry_index(built.index_json, "dist/index.json");
    REQUIRE(parsed.ok);
    const auto& info = parsed.index.modules.at("beta");
    CHECK(info.version == "2.1.0");
    CHECK(info.tier == std::optional<std::string>("decision"));
    CHECK(info.checksum == std::optional<std::string>("sha256:" + built.tarballs[1].sha256));
}

TEST_CASE("build output is reproducible") {
    AssetFixture fx;
    auto first = build_registry_assets(fx.build_options());
    REQUIRE(first.ok);
    auto first_bytes = cogmod::testing::read_bytes(first.tarballs[0].path);

    auto second = build_registry_assets(fx.build_options());
    REQUIRE(second.ok);
    CHECK(first.index_json == second.index_json);
    CHECK(first_bytes == cogmod::testing::read_bytes(second.tarballs[0].path));
}

TEST_CASE("tarball URLs from a release tag or an explicit base") {
    AssetFixture fx;

    auto tagged_options = fx.build_options();
    tagged_options.tag = "v1.2.0";
    auto tagged = build_registry_assets(tagged_options);
    REQUIRE(tagged.ok);
    auto doc = nlohmann::json::parse(tagged.index_json);
    CHECK(doc["modules"]["alpha"]["distribution"]["tarball"] ==
          "https://github.com/Cognary/cognitive/releases/download/v1.2.0/alpha-1.0.0.tar.gz");

    auto based_options = fx.build_options();
    based_options.tag = "ignored";
    based_options.tarball_base_url = "https://cdn.example.com/assets/";
    auto based = build_registry_assets(based_options);
    REQUIRE(based.ok);
    doc = nlohmann::json::parse(based.index_json);
    CHECK(doc["modules"]["alpha"]["distribution"]["tarball"] ==
          "https://cdn.example.com/assets/alpha-1.0.0.tar.gz");
}

TEST_CASE("legacy registry metadata and the only filter") {
    AssetFixture fx;
    write_text(fx.tmp.file("legacy.json"), R"({
      "modules": {"alpha": {"description": "Alpha helper", "author": "acme",
                            "tags": ["first", 7, "helper"]}},
      "categories": {"tools": {"modules": ["alpha"]}}
    })");

    auto options = fx.build_options();
    options.legacy_registry_path = fx.tmp.file("legacy.json");
    options.only = {" alpha "};
    options.registry_out.clear();

    auto built = build_registry_assets(options);
    REQUIRE(built.ok);
    REQUIRE(built.tarballs.size() == 1);
    CHECK_FALSE(path_exists(fx.tmp.file("dist/index.json")));

    auto doc = nlohmann::json::parse(built.index_json);
    const auto& alpha = doc["modules"]["alpha"];
    CHECK(alpha["metadata"]["description"] == "Alpha helper");
    CHECK(alpha["metadata"]["author"] == "acme");
    CHECK(alpha["metadata"]["keywords"] == nlohmann::json::array({"first", "helper"}));
    CHECK(doc["categories"]["tools"]["modules"][0] == "alpha");
    CHECK_FALSE(doc["modules"].contains("beta"));
}

TEST_CASE("build stops on an invalid module") {
    AssetFixture fx;
    write_text(fx.tmp.file("modules/gamma/module.yaml"), "name: gamma\n");
    auto built = build_registry_assets(fx.build_options());
    CHECK_FALSE(built.ok);
    CHECK(built.error.kind == ErrorKind::InvalidModule);

    auto options = fx.build_options();
    options.modules_dir = fx.tmp.file("absent");
    CHECK(build_registry_assets(options).error.kind == ErrorKind::IoError);
}

TEST_CASE("a version that would escape the output directory is refused") {
    AssetFixture fx;
    write_text(fx.tmp.file("modules/gamma/module.yaml"),
               "name: gamma\nversion: 1/../../../escaped\ntier: decision\nresponsibility: x\n");
    auto built = build_registry_assets(fx.build_options());
    CHECK_FALSE(built.ok);
    CHECK(built.error.kind == ErrorKind::InvalidModule);
    CHECK(built.error.message.find("version") != std::string::npos);
    CHECK_FALSE(path_exists(fx.tmp.file("dist/index.json")));
}

// ============================================================================
// Verifier
// ============================================================================

TEST_CASE("freshly built assets verify locally and remotely") {
    AssetFixture fx;
    REQUIRE(build_registry_assets(fx.build_options()).ok);

    auto local = verify_registry_assets(fx.local_verify());
    REQUIRE_FALSE(local.error);
    CHECK(local.ok);
    CHECK(local.checked == 2);
    CHECK(local.passed == 2);
    CHECK(local.failed == 0);

    auto remote = verify_registry_assets(fx.remote_verify(4));
    REQUIRE_FALSE(remote.error);
    CHECK(remote.ok);
    CHECK(remote.passed == 2);
}

TEST_CASE("a flipped byte fails the checksum phase, repeatably") {
    AssetFixture fx;
    REQUIRE(build_registry_assets(fx.build_options()).ok);
    fx.flip_byte("beta-2.1.0.tar.gz");

    for (int run = 0; run < 2; ++run) {
        auto report = verify_registry_assets(fx.local_verify());
        CHECK_FALSE(report.ok);
        CHECK(report.passed == 1);
        REQUIRE(report.failures.size() == 1);
        CHECK(report.failures[0].module == "beta");
        CHECK(report.failures[0].phase == VerifyPhase::Checksum);
        CHECK(report.failures[0].kind == ErrorKind::ChecksumMismatch);
    }
}

TEST_CASE("remote verification gives the same verdicts at any concurrency") {
    AssetFixture fx;
    REQUIRE(build_registry_assets(fx.build_options()).ok);
    fx.flip_byte("alpha-1.0.0.tar.gz");

    auto serial = verify_registry_assets(fx.remote_verify(1));
    auto parallel = verify_registry_assets(fx.remote_verify(8));
    REQUIRE_FALSE(serial.error);
    REQUIRE_FALSE(parallel.error);

    CHECK(serial.passed == parallel.passed);
    REQUIRE(serial.failures.size() == 1);
    REQUIRE(parallel.failures.size() == 1);
    CHECK(serial.failures[0].module == "alpha");
    CHECK(parallel.failures[0].module == "alpha");
    CHECK(serial.failures[0].tarball_resolved == parallel.failures[0].tarball_resolved);
    CHECK(serial.failures[0].tarball_resolved == fx.tmp.url("dist/alpha-1.0.0.tar.gz"));
}

TEST_CASE("tarballs sharing a basename download to separate scratch paths") {
    AssetFixture fx;
    REQUIRE(build_registry_assets(fx.build_options()).ok);

    // Different bytes behind the same file name
    auto alpha = cogmod::testing::read_bytes(fx.tmp.file("dist/alpha-1.0.0.tar.gz"));
    auto beta = cogmod::testing::read_bytes(fx.tmp.file("dist/beta-2.1.0.tar.gz"));
    cogmod::testing::write_bytes(fx.tmp.file("dist/a/module.tar.gz"), alpha);
    cogmod::testing::write_bytes(fx.tmp.file("dist/b/module.tar.gz"), beta);

    auto doc = fx.read_index();
    doc["modules"]["alpha"]["distribution"]["tarball"] = "a/module.tar.gz";
    doc["modules"]["beta"]["distribution"]["tarball"] = "b/module.tar.gz";
    fx.write_index(doc);

    for (size_t concurrency : {size_t(2), size_t(8)}) {
        CAPTURE(concurrency);
        auto report = verify_registry_assets(fx.remote_verify(concurrency));
        REQUIRE_FALSE(report.error);
        CHECK(report.ok);
        CHECK(report.passed == 2);
        CHECK(report.failures.empty());
    }
}

TEST_CASE("remote verification leaves a caller-supplied scratch directory empty") {
    AssetFixture fx;
    REQUIRE(build_registry_assets(fx.build_options()).ok);
    fx.flip_byte("alpha-1.0.0.tar.gz");

    auto doc = fx.read_index();
    doc["modules"]["beta"]["distribution"]["files"].push_back("ghost.md");
    fx.write_index(doc);

    auto options = fx.remote_verify(4);
    options.scratch_dir = fx.tmp.file("scratch");
    auto report = verify_registry_assets(options);
    REQUIRE_FALSE(report.error);
    REQUIRE(report.failures.size() == 2);
    CHECK(report.failures[0].phase == VerifyPhase::Checksum);
    CHECK(report.failures[1].phase == VerifyPhase::Extract);

    CHECK(is_directory(fx.tmp.file("scratch")));
    CHECK(list_directory(fx.tmp.file("scratch")).empty());
}

TEST_CASE("failures are reported per phase in index order") {
    AssetFixture fx;
    REQUIRE(build_registry_assets(fx.build_options()).ok);

    auto doc = fx.read_index();
    doc["modules"]["beta"]["distribution"]["files"].push_back("ghost.md");
    fx.write_index(doc);
    remove_file(fx.tmp.file("dist/alpha-1.0.0.tar.gz"));

    auto report = verify_registry_assets(fx.local_verify());
    REQUIRE_FALSE(report.error);
    CHECK(report.checked == 2);
    CHECK(report.failed == 2);
    REQUIRE(report.failures.size() == 2);
    CHECK(report.failures[0].module == "alpha");
    CHECK(report.failures[0].phase == VerifyPhase::Download);
    CHECK(report.failures[1].module == "beta");
    CHECK(report.failures[1].phase == VerifyPhase::Extract);
    CHECK(report.failures[1].kind == ErrorKind::InvalidModule);
}

TEST_CASE("identity drift between index and module.yaml is a failure") {
    AssetFixture fx;
    REQUIRE(build_registry_assets(fx.build_options()).ok);

    auto doc = fx.read_index();
    doc["modules"]["alpha"]["identity"]["version"] = "9.9.9";
    fx.write_index(doc);

    auto report = verify_registry_assets(fx.local_verify());
    REQUIRE(report.failures.size() == 1);
    CHECK(report.failures[0].phase == VerifyPhase::Extract);
    CHECK(report.failures[0].kind == ErrorKind::InvalidModule);
}

TEST_CASE("verifier argument and index errors") {
    AssetFixture fx;

    VerifyOptions no_assets;
    no_assets.index = fx.tmp.file("dist/index.json");
    CHECK(verify_registry_assets(no_assets).error.kind == ErrorKind::InvalidReference);

    VerifyOptions remote_path;
    remote_path.index = fx.tmp.file("dist/index.json");
    remote_path.remote = true;
    CHECK(verify_registry_assets(remote_path).error.kind == ErrorKind::InvalidReference);

    write_text(fx.tmp.file("dist/index.json"), "{ broken");
    auto report = verify_registry_assets(fx.local_verify());
    CHECK_FALSE(report.ok);
    CHECK(report.error.kind == ErrorKind::MalformedIndex);
}
