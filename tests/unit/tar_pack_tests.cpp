#include <doctest/doctest.h>
#include <cogmod/archive.hpp>
#include <cogmod/platform.hpp>

#include "../support/test_helpers.hpp"

#include <filesystem>

namespace fs = std::filesystem;

using namespace cogmod;
using cogmod::testing::TempDir;

namespace {

TarEntry file_entry(const std::string& path, const std::string& content, bool executable = false) {
    TarEntry e;
    e.path = path;
    e.type = TarEntryType::RegularFile;
    e.data.assign(content.begin(), content.end());
    e.executable = executable;
    return e;
}

TarEntry dir_entry(const std::string& path) {
    TarEntry e;
    e.path = path;
    e.type = TarEntryType::Directory;
    return e;
}

} // namespace

TEST_CASE("create_deterministic_archive is byte-identical regardless of input order") {
    std::vector<TarEntry> a = {dir_entry("demo"), file_entry("demo/b.md", "b"),
                               file_entry("demo/a.md", "a")};
    std::vector<TarEntry> b = {file_entry("demo/a.md", "a"), file_entry("demo/b.md", "b"),
                               dir_entry("demo")};

    auto ra = create_deterministic_archive(a);
    auto rb = create_deterministic_archive(b);
    REQUIRE(ra.ok);
    REQUIRE(rb.ok);
    CHECK(ra.archive_data == rb.archive_data);
}

TEST_CASE("gzip header carries no timestamp and OS 255") {
    auto gz = gzip_compress({'x', 'y'});
    REQUIRE(gz.size() > 10);
    CHECK(gz[0] == 0x1f);
    CHECK(gz[1] == 0x8b);
    CHECK(gz[4] == 0);
    CHECK(gz[5] == 0);
    CHECK(gz[6] == 0);
    CHECK(gz[7] == 0);
    CHECK(gz[9] == 255);
}

TEST_CASE("packed archive extracts with directories first and executable bits") {
    TempDir tmp;
    std::vector<TarEntry> entries = {file_entry("demo/run.sh", "#!/bin/sh\n", true),
                                     dir_entry("demo"), file_entry("demo/module.yaml", "x")};
    auto packed = create_deterministic_archive(entries);
    REQUIRE(packed.ok);

    cogmod::testing::write_bytes(tmp.file("out.tar.gz"), packed.archive_data);
    auto result = extract_tar_gz_file(tmp.file("out.tar.gz"), tmp.file("out"), {});
    REQUIRE(result.ok);
    REQUIRE(result.entries.size() == 3);
    CHECK(result.entries[0] == "demo");
    CHECK(result.entries[1] == "demo/module.yaml");
    CHECK(result.entries[2] == "demo/run.sh");

#ifndef _WIN32
    auto perms = fs::status(tmp.file("out/demo/run.sh")).permissions();
    CHECK((perms & fs::perms::owner_exec) != fs::perms::none);
    auto plain = fs::status(tmp.file("out/demo/module.yaml")).permissions();
    CHECK((plain & fs::perms::owner_exec) == fs::perms::none);
#endif
}

TEST_CASE("long member names survive via prefix and PAX records") {
    TempDir tmp;
    std::string prefixed = "demo/" + std::string(80, 'p') + "/" + std::string(60, 'n') + ".md";
    std::string pax = "demo/" + std::string(200, 'q') + "/" + std::string(120, 'r') + ".md";
    auto packed = create_deterministic_archive({dir_entry("demo"), file_entry(prefixed, "one"),
                                                file_entry(pax, "two")});
    REQUIRE(packed.ok);

    cogmod::testing::write_bytes(tmp.file("out.tar.gz"), packed.archive_data);
    auto result = extract_tar_gz_file(tmp.file("out.tar.gz"), tmp.file("out"), {});
    REQUIRE(result.ok);
    CHECK(cogmod::testing::read_text(tmp.file("out/" + prefixed)) == "one");
    CHECK(cogmod::testing::read_text(tmp.file("out/" + pax)) == "two");
}

TEST_CASE("unsafe entry names cannot be packed") {
    auto packed = create_deterministic_archive({file_entry("../escape", "x")});
    CHECK_FALSE(packed.ok);

    auto absolute = create_deterministic_archive({file_entry("/abs", "x")});
    CHECK_FALSE(absolute.ok);
}

TEST_CASE("collect_directory_entries roots members under the module name") {
    TempDir tmp;
    cogmod::testing::write_module(tmp.file("src"), "demo", "1.0.0");
    cogmod::testing::write_text(tmp.file("src/docs/guide.md"), "guide");
    cogmod::testing::write_text(tmp.file("src/.DS_Store"), "junk");

    auto collected = collect_directory_entries(tmp.file("src"), "demo");
    REQUIRE(collected.ok);
    CHECK(collected.entries.front().path == "demo");
    for (const auto& e : collected.entries) {
        CHECK(e.path.rfind("demo", 0) == 0);
        CHECK(e.path.find(".DS_Store") == std::string::npos);
    }
    CHECK(collected.files ==
          std::vector<std::string>{"docs/guide.md", "module.yaml", "prompt.md"});
}

#ifndef _WIN32
TEST_CASE("symlinks inside a module directory are refused") {
    TempDir tmp;
    cogmod::testing::write_module(tmp.file("src"), "demo", "1.0.0");
    fs::create_symlink("/etc/passwd", tmp.file("src/passwd"));

    auto collected = collect_directory_entries(tmp.file("src"), "demo");
    CHECK_FALSE(collected.ok);
    CHECK(collected.error.kind == ErrorKind::UnsafeArchiveEntry);

    auto listed = list_module_files(tmp.file("src"));
    CHECK_FALSE(listed.ok);
}
#endif

TEST_CASE("packing the same directory twice yields the same digest") {
    TempDir tmp;
    cogmod::testing::write_module(tmp.file("src"), "demo", "1.0.0");
    auto first = cogmod::testing::pack_module(tmp.file("src"), "demo");
    auto second = cogmod::testing::pack_module(tmp.file("src"), "demo");
    REQUIRE_FALSE(first.empty());
    CHECK(first == second);
}
