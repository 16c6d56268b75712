#include <doctest/doctest.h>
#include <cogmod/module_ref.hpp>

using namespace cogmod;

TEST_CASE("registry names with and without a version") {
    auto plain = classify_reference("code-reviewer");
    REQUIRE(plain.ok);
    CHECK(plain.reference.kind == ReferenceKind::RegistryName);
    CHECK(plain.reference.name == "code-reviewer");
    CHECK(plain.reference.version.empty());

    auto pinned = classify_reference("  code-reviewer@1.2.0 ");
    REQUIRE(pinned.ok);
    CHECK(pinned.reference.name == "code-reviewer");
    CHECK(pinned.reference.version == "1.2.0");
}

TEST_CASE("repository shorthand forms") {
    auto bare = classify_reference("acme/modules");
    REQUIRE(bare.ok);
    CHECK(bare.reference.kind == ReferenceKind::RepositoryShorthand);
    CHECK(bare.reference.repository.owner == "acme");
    CHECK(bare.reference.repository.repo == "modules");
    CHECK(bare.reference.repository.subpath.empty());
    CHECK(bare.reference.repository.ref.empty());

    auto full = classify_reference("github:acme/modules.git/cognitive/modules/reviewer@v1.0.0");
    REQUIRE(full.ok);
    CHECK(full.reference.repository.repo == "modules");
    CHECK(full.reference.repository.subpath == "cognitive/modules/reviewer");
    CHECK(full.reference.repository.ref == "v1.0.0");
    CHECK(full.reference.repository.url() == "https://github.com/acme/modules");
}

TEST_CASE("repository URLs with tree paths") {
    auto url = classify_reference("https://github.com/acme/modules/tree/main/mods/reviewer?x=1");
    REQUIRE(url.ok);
    CHECK(url.reference.kind == ReferenceKind::RepositoryUrl);
    CHECK(url.reference.repository.ref == "main");
    CHECK(url.reference.repository.subpath == "mods/reviewer");

    auto root = classify_reference("github.com/acme/modules/");
    REQUIRE(root.ok);
    CHECK(root.reference.repository.ref.empty());

    CHECK_FALSE(classify_reference("https://gitlab.com/acme/modules").ok);
    CHECK_FALSE(classify_reference("https://github.com/acme").ok);
    CHECK_FALSE(classify_reference("https://github.com/acme/modules/issues/3").ok);
}

TEST_CASE("malformed references are InvalidReference") {
    const char* bad[] = {
        "",
        "   ",
        "a b",
        "acme/../etc",
        "acme/modules/../../x",
        "acme/modules@..",
        "name@",
        "name@1/2",
        "../name",
        "-/repo@-x",
        "acme/modules/a\\b",
    };
    for (const char* input : bad) {
        CAPTURE(input);
        auto parsed = classify_reference(input);
        CHECK_FALSE(parsed.ok);
        CHECK(parsed.error.kind == ErrorKind::InvalidReference);
    }
}

TEST_CASE("registry sources that point at repositories") {
    CHECK(is_repository_source("github:acme/modules/reviewer"));
    CHECK(is_repository_source("https://github.com/acme/modules"));
    CHECK_FALSE(is_repository_source(
        "https://github.com/acme/modules/releases/download/v1/reviewer-1.0.0.tar.gz"));
    CHECK_FALSE(is_repository_source("https://example.com/reviewer.tar.gz"));

    auto parsed = parse_repository_source("github:acme/modules/reviewer@v2");
    REQUIRE(parsed.ok);
    CHECK(parsed.reference.repository.subpath == "reviewer");
    CHECK(parsed.reference.repository.ref == "v2");

    CHECK_FALSE(parse_repository_source("reviewer").ok);
}
