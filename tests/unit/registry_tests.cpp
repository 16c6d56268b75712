#include <doctest/doctest.h>
#include <cogmod/platform.hpp>
#include <cogmod/registry.hpp>

#include "../support/test_helpers.hpp"

using namespace cogmod;
using cogmod::testing::TempDir;

namespace {

const char* LEGACY_INDEX = R"({
  "version": "1.0.0",
  "modules": {
    "code-reviewer": {
      "description": "Review code for defects",
      "version": "1.2.0",
      "source": "github:acme/modules/code-reviewer@v1.2.0",
      "tags": ["code", "review"],
      "author": "acme"
    }
  }
})";

const char* CURRENT_INDEX = R"({
  "version": "2.0.0",
  "updated": "2026-01-01T00:00:00Z",
  "modules": {
    "code-reviewer": {
      "identity": {"name": "code-reviewer", "namespace": "official", "version": "1.2.0",
                   "spec_version": "2.2"},
      "metadata": {"description": "Review code for defects", "author": "acme",
                   "tier": "decision", "keywords": ["code", "review"]},
      "quality": {"conformance_level": 3, "verified": true, "deprecated": false},
      "dependencies": {"runtime_min": "2.2.0", "modules": []},
      "distribution": {
        "tarball": "code-reviewer-1.2.0.tar.gz",
        "checksum": "sha256:0000000000000000000000000000000000000000000000000000000000000000",
        "size_bytes": 1234,
        "files": ["module.yaml", "prompt.md"]
      }
    }
  },
  "categories": {
    "development": {"name": "Development", "description": "Development tools",
                    "modules": ["code-reviewer"]},
    "broken": 42
  }
})";

} // namespace

TEST_CASE("legacy and current entries normalize to the same core fields") {
    auto legacy = parse_registry_index(LEGACY_INDEX, "legacy");
    auto current = parse_registry_index(CURRENT_INDEX, "current");
    REQUIRE(legacy.ok);
    REQUIRE(current.ok);

    const auto& a = legacy.index.modules.at("code-reviewer");
    const auto& b = current.index.modules.at("code-reviewer");
    CHECK(a.name == b.name);
    CHECK(a.version == b.version);
    CHECK(a.description == b.description);
    CHECK(a.author == b.author);
    CHECK(a.keywords == b.keywords);

    CHECK_FALSE(a.tarball.has_value());
    CHECK_FALSE(a.checksum.has_value());
    CHECK(a.source == "github:acme/modules/code-reviewer@v1.2.0");

    REQUIRE(b.tarball.has_value());
    CHECK(*b.tarball == "code-reviewer-1.2.0.tar.gz");
    CHECK(b.size_bytes == 1234u);
    CHECK(b.tier == "decision");
    CHECK(b.verified == true);
    CHECK(b.conformance_level == std::optional<int>(3));
    CHECK_FALSE(a.conformance_level.has_value());
    CHECK(b.deprecated == false);
    CHECK(b.files.size() == 2);
    CHECK(current.index.updated == "2026-01-01T00:00:00Z");
}

TEST_CASE("malformed index documents are rejected") {
    CHECK(parse_registry_index("not json", "x").error.kind == ErrorKind::MalformedIndex);
    CHECK(parse_registry_index("[]", "x").error.kind == ErrorKind::MalformedIndex);
    CHECK(parse_registry_index(R"({"version": "1"})", "x").error.kind ==
          ErrorKind::MalformedIndex);
    CHECK(parse_registry_index(R"({"modules": {"a": 3}})", "x").error.kind ==
          ErrorKind::MalformedIndex);
    CHECK(parse_registry_index(R"({"modules": {"a": {"tags": "x"}}})", "x").error.kind ==
          ErrorKind::MalformedIndex);
    CHECK(parse_registry_index(R"({"modules": {"a": {"identity": {"name": "a"}}}})", "x")
              .error.kind == ErrorKind::MalformedIndex);
    CHECK(parse_registry_index(
              R"({"modules": {"a": {"identity": {"name": "a", "version": "1"},
                                    "distribution": {"size_bytes": -4}}}})", "x")
              .error.kind == ErrorKind::MalformedIndex);
}

TEST_CASE("search scores names, descriptions and keywords") {
    RegistryIndex index;
    ModuleInfo reviewer;
    reviewer.name = "code-reviewer";
    reviewer.description = "Review code for defects";
    reviewer.keywords = {"code", "review"};
    index.modules[reviewer.name] = reviewer;

    ModuleInfo code;
    code.name = "code";
    code.description = "General helper";
    index.modules[code.name] = code;

    ModuleInfo writer;
    writer.name = "writer";
    writer.description = "Draft prose";
    writer.keywords = {"docs", ""};
    index.modules[writer.name] = writer;

    auto hits = search_modules(index, "code");
    REQUIRE(hits.size() == 2);
    // Both score 15 (exact name vs. name + description + keyword); ties go by name
    CHECK(hits[0].name == "code");
    CHECK(hits[0].score == 15);
    CHECK(hits[1].name == "code-reviewer");
    CHECK(hits[1].score == 15);

    auto reviewed = search_modules(index, "review defects");
    REQUIRE(reviewed.size() == 1);
    CHECK(reviewed[0].name == "code-reviewer");

    auto none = search_modules(index, "zzz");
    CHECK(none.empty());

    auto all = search_modules(index, "   ");
    REQUIRE(all.size() == 3);
    CHECK(all[0].name == "code");
    CHECK(all[0].score == 1);
    CHECK(all[2].name == "writer");
}

TEST_CASE("RegistryClient fetches once and writes its cache file") {
    TempDir tmp;
    cogmod::testing::write_text(tmp.file("index.json"), CURRENT_INDEX);

    RegistryClientOptions options;
    options.registry_url = tmp.url("index.json");
    options.cache_dir = tmp.file("cache");
    RegistryClient client(options);

    auto found = client.get_module("code-reviewer");
    REQUIRE(found.ok);
    CHECK(found.info.version == "1.2.0");
    CHECK(path_exists(client.cache_path()));

    auto missing = client.get_module("nope");
    CHECK_FALSE(missing.ok);
    CHECK(missing.error.kind == ErrorKind::ModuleNotFound);

    // A second client reads the fresh cache even after the source is gone
    remove_file(tmp.file("index.json"));
    RegistryClient cached(options);
    CHECK(cached.get_module("code-reviewer").ok);

    auto hits = cached.search("review");
    REQUIRE(hits.size() == 1);
    CHECK(hits[0].name == "code-reviewer");

    auto listed = cached.list_modules();
    REQUIRE(listed.size() == 1);
    CHECK(listed[0].name == "code-reviewer");

    auto categories = cached.categories();
    REQUIRE(categories.size() == 1);
    CHECK(categories.at("development").name == "Development");
    CHECK(categories.at("development").modules == std::vector<std::string>{"code-reviewer"});
}

TEST_CASE("RegistryClient surfaces fetch and size errors") {
    TempDir tmp;
    RegistryClientOptions options;
    options.registry_url = tmp.url("missing.json");
    RegistryClient client(options);

    Error error;
    auto hits = client.search("x", &error);
    CHECK(hits.empty());
    CHECK(error.kind == ErrorKind::DownloadFailed);

    cogmod::testing::write_text(tmp.file("big.json"), CURRENT_INDEX);
    RegistryClientOptions small;
    small.registry_url = tmp.url("big.json");
    small.limits.max_bytes = 16;
    RegistryClient limited(small);
    auto fetched = limited.fetch_index();
    CHECK_FALSE(fetched.ok);
    CHECK(fetched.error.kind == ErrorKind::PayloadTooLarge);
}
