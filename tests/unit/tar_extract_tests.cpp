#include <doctest/doctest.h>
#include <cogmod/archive.hpp>
#include <cogmod/platform.hpp>

#include "../support/test_helpers.hpp"

#include <algorithm>

using namespace cogmod;
using cogmod::testing::RawTar;
using cogmod::testing::TempDir;

namespace {

std::string pax_record(const std::string& key, const std::string& value) {
    std::string body = " " + key + "=" + value + "\n";
    size_t len = body.size() + 1;
    while (std::to_string(len).size() + body.size() != len) ++len;
    return std::to_string(len) + body;
}

ExtractResult extract_gz(const std::vector<uint8_t>& gz, const std::string& dest,
                         const ExtractLimits& limits = {}) {
    std::string archive = dest + ".tar.gz";
    cogmod::testing::write_bytes(archive, gz);
    return extract_tar_gz_file(archive, dest, limits);
}

} // namespace

TEST_CASE("extracts regular files and directories in archive order") {
    TempDir tmp;
    RawTar tar;
    tar.dir("demo/").file("demo/module.yaml", "name: demo\n").file("demo/docs/a.md", "A").end();

    auto result = extract_gz(tar.gz(), tmp.file("out"));
    REQUIRE(result.ok);
    REQUIRE(result.entries.size() == 3);
    CHECK(result.entries[0] == "demo");
    CHECK(result.entries[1] == "demo/module.yaml");
    CHECK(result.entries[2] == "demo/docs/a.md");
    CHECK(result.total_bytes == 12);
    CHECK(cogmod::testing::read_text(tmp.file("out/demo/docs/a.md")) == "A");
}

TEST_CASE("uncompressed tar bytes can be pushed in arbitrary chunks") {
    TempDir tmp;
    RawTar tar;
    tar.file("x/y.txt", "hello").end();
    const auto& raw = tar.bytes();

    TarExtractor extractor(tmp.file("out"), {});
    for (size_t pos = 0; pos < raw.size(); pos += 7) {
        REQUIRE(extractor.feed(raw.data() + pos, std::min<size_t>(7, raw.size() - pos)));
    }
    REQUIRE(extractor.finish());
    CHECK(extractor.entries() == std::vector<std::string>{"x/y.txt"});
    CHECK(cogmod::testing::read_text(tmp.file("out/x/y.txt")) == "hello");
}

TEST_CASE("traversal entry fails and removes entries extracted before it") {
    TempDir tmp;
    RawTar tar;
    tar.file("demo/safe.txt", "ok").file("demo/../../escape.txt", "bad").end();

    auto result = extract_gz(tar.gz(), tmp.file("out"));
    CHECK_FALSE(result.ok);
    CHECK(result.error.kind == ErrorKind::PathTraversal);
    CHECK(result.error.path == "demo/../../escape.txt");
    CHECK_FALSE(path_exists(tmp.file("out/demo/safe.txt")));
    CHECK_FALSE(path_exists(tmp.file("escape.txt")));
}

TEST_CASE("absolute entry names are rejected") {
    TempDir tmp;
    RawTar tar;
    tar.file("/etc/cogmod-test", "bad").end();

    auto result = extract_gz(tar.gz(), tmp.file("out"));
    CHECK_FALSE(result.ok);
    CHECK(result.error.kind == ErrorKind::PathTraversal);
}

TEST_CASE("symlink and hardlink entries fail regardless of target") {
    TempDir tmp;
    for (char type : {'1', '2'}) {
        RawTar tar;
        tar.file("demo/a.txt", "a").add("demo/link", type, "", "a.txt").end();

        auto result = extract_gz(tar.gz(), tmp.file("out"));
        CHECK_FALSE(result.ok);
        CHECK(result.error.kind == ErrorKind::UnsafeArchiveEntry);
        CHECK_FALSE(path_exists(tmp.file("out/demo/a.txt")));
    }
}

TEST_CASE("device and fifo entries are unsupported") {
    TempDir tmp;
    RawTar tar;
    tar.add("demo/dev", '3').end();

    auto result = extract_gz(tar.gz(), tmp.file("out"));
    CHECK_FALSE(result.ok);
    CHECK(result.error.kind == ErrorKind::UnsafeArchiveEntry);
}

TEST_CASE("file count quota counts every entry") {
    TempDir tmp;
    RawTar tar;
    tar.file("a", "1").file("b", "2").file("c", "3").end();

    ExtractLimits limits;
    limits.max_files = 2;
    auto result = extract_gz(tar.gz(), tmp.file("out"), limits);
    CHECK_FALSE(result.ok);
    CHECK(result.error.kind == ErrorKind::ArchiveQuotaExceeded);
    CHECK_FALSE(path_exists(tmp.file("out/a")));
}

TEST_CASE("single file and total size quotas") {
    TempDir tmp;
    RawTar tar;
    tar.file("a", std::string(600, 'a')).file("b", std::string(600, 'b')).end();

    ExtractLimits single;
    single.max_single_file_bytes = 500;
    auto r1 = extract_gz(tar.gz(), tmp.file("out1"), single);
    CHECK(r1.error.kind == ErrorKind::ArchiveQuotaExceeded);

    ExtractLimits total;
    total.max_total_bytes = 1000;
    auto r2 = extract_gz(tar.gz(), tmp.file("out2"), total);
    CHECK(r2.error.kind == ErrorKind::ArchiveQuotaExceeded);
    CHECK(r2.error.path == "b");
    CHECK_FALSE(path_exists(tmp.file("out2/a")));
}

TEST_CASE("decompression bomb is stopped by the stream ceiling") {
    TempDir tmp;
    RawTar tar;
    tar.file("bomb/zeros.bin", std::string(2 * 1024 * 1024, '\0')).end();
    auto gz = tar.gz();
    CHECK(gz.size() < 64 * 1024);

    ExtractLimits limits;
    limits.max_tar_bytes = 64 * 1024;
    auto result = extract_gz(gz, tmp.file("out"), limits);
    CHECK_FALSE(result.ok);
    CHECK(result.error.kind == ErrorKind::ArchiveQuotaExceeded);
    CHECK_FALSE(path_exists(tmp.file("out/bomb/zeros.bin")));
}

TEST_CASE("header checksum is recomputed") {
    TempDir tmp;
    RawTar tar;
    tar.file("demo/a.txt", "a").end();
    tar.bytes()[0] = 'X';  // name changes, stored checksum does not

    auto result = extract_gz(tar.gz(), tmp.file("out"));
    CHECK_FALSE(result.ok);
    CHECK(result.error.kind == ErrorKind::MalformedArchive);
}

TEST_CASE("non-ustar headers are rejected") {
    TempDir tmp;
    RawTar tar;
    tar.add("demo/a.txt", '0', "a", "", false).end();

    auto result = extract_gz(tar.gz(), tmp.file("out"));
    CHECK_FALSE(result.ok);
    CHECK(result.error.kind == ErrorKind::MalformedArchive);
}

TEST_CASE("stream ending inside an entry is malformed") {
    TempDir tmp;
    RawTar tar;
    tar.file("demo/a.txt", std::string(2000, 'a'));
    auto& bytes = tar.bytes();
    bytes.resize(512 + 1024);

    auto result = extract_gz(tar.gz(), tmp.file("out"));
    CHECK_FALSE(result.ok);
    CHECK(result.error.kind == ErrorKind::MalformedArchive);
    CHECK_FALSE(path_exists(tmp.file("out/demo/a.txt")));
}

TEST_CASE("corrupt gzip data is malformed") {
    TempDir tmp;
    std::vector<uint8_t> garbage(256, 0x5a);
    auto result = extract_gz(garbage, tmp.file("out"));
    CHECK_FALSE(result.ok);
    CHECK(result.error.kind == ErrorKind::MalformedArchive);
}

TEST_CASE("PAX path record overrides the next entry name") {
    TempDir tmp;
    std::string long_path = "demo/" + std::string(120, 'd') + "/" + std::string(110, 'f') + ".md";
    RawTar tar;
    tar.add("PaxHeaders/0", 'x', pax_record("path", long_path)).file("demo/stand-in", "long").end();

    auto result = extract_gz(tar.gz(), tmp.file("out"));
    REQUIRE(result.ok);
    REQUIRE(result.entries.size() == 1);
    CHECK(result.entries[0] == long_path);
    CHECK(cogmod::testing::read_text(tmp.file("out/" + long_path)) == "long");
    CHECK_FALSE(path_exists(tmp.file("out/demo/stand-in")));
}

TEST_CASE("PAX path override passes the same traversal checks") {
    TempDir tmp;
    RawTar tar;
    tar.add("PaxHeaders/0", 'x', pax_record("path", "../evil.txt")).file("demo/ok", "x").end();

    auto result = extract_gz(tar.gz(), tmp.file("out"));
    CHECK_FALSE(result.ok);
    CHECK(result.error.kind == ErrorKind::PathTraversal);
    CHECK_FALSE(path_exists(tmp.file("evil.txt")));
}

TEST_CASE("oversized metadata blocks are refused") {
    TempDir tmp;
    RawTar tar;
    tar.add("PaxHeaders/0", 'x', std::string(MAX_ARCHIVE_METADATA_BYTES + 1, 'p')).end();

    auto result = extract_gz(tar.gz(), tmp.file("out"));
    CHECK_FALSE(result.ok);
    CHECK(result.error.kind == ErrorKind::ArchiveQuotaExceeded);
}

TEST_CASE("scan validates without writing") {
    TempDir tmp;
    RawTar good;
    good.file("demo/a.txt", "a").end();
    cogmod::testing::write_bytes(tmp.file("good.tar.gz"), good.gz());

    auto scanned = scan_tar_gz_file(tmp.file("good.tar.gz"), {});
    REQUIRE(scanned.ok);
    CHECK(scanned.entries == std::vector<std::string>{"demo/a.txt"});

    RawTar bad;
    bad.add("demo/link", '2', "", "/etc/passwd").end();
    cogmod::testing::write_bytes(tmp.file("bad.tar.gz"), bad.gz());
    auto rejected = scan_tar_gz_file(tmp.file("bad.tar.gz"), {});
    CHECK(rejected.error.kind == ErrorKind::UnsafeArchiveEntry);
}

TEST_CASE("push parser accepts arbitrary chunking") {
    TempDir tmp;
    RawTar tar;
    tar.file("demo/a.txt", std::string(1500, 'q')).file("demo/b.txt", "b").end();
    const auto& bytes = tar.bytes();

    TarExtractor extractor(tmp.file("out"), {});
    for (size_t i = 0; i < bytes.size(); i += 7) {
        size_t n = std::min<size_t>(7, bytes.size() - i);
        REQUIRE(extractor.feed(bytes.data() + i, n));
    }
    REQUIRE(extractor.finish());
    CHECK(extractor.entries().size() == 2);
    CHECK(cogmod::testing::read_text(tmp.file("out/demo/a.txt")) == std::string(1500, 'q'));
}
