#include <doctest/doctest.h>
#include <cogmod/path_utils.hpp>
#include <cogmod/platform.hpp>

#include "../support/test_helpers.hpp"

using cogmod::PathError;
using cogmod::is_lexically_within;
using cogmod::is_safe_module_name;
using cogmod::normalize_member_name;
using cogmod::normalize_under_root;

TEST_CASE("normalize simple relative path under root") {
    auto r = normalize_under_root("/cog/modules/m", "prompts/main.md");
    REQUIRE(r.ok);
    CHECK(r.path == "/cog/modules/m/prompts/main.md");
}

TEST_CASE("collapse dot and dotdot segments") {
    auto r = normalize_under_root("/cog/modules/m", "./a/../b/./file");
    REQUIRE(r.ok);
    CHECK(r.path == "/cog/modules/m/b/file");
}

TEST_CASE("reject escape above root") {
    auto r = normalize_under_root("/cog/modules/m", "../../etc/passwd");
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::EscapesRoot);
}

TEST_CASE("reject absolute when not allowed") {
    auto r = normalize_under_root("/cog/modules/m", "/abs/path");
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::AbsoluteNotAllowed);
}

TEST_CASE("member names are normalized without resolving parents") {
    auto r = normalize_member_name("./demo//prompt.md");
    REQUIRE(r.ok);
    CHECK(r.path == "demo/prompt.md");

    auto parent = normalize_member_name("demo/../demo/prompt.md");
    CHECK_FALSE(parent.ok);
    CHECK(parent.error == PathError::ParentSegment);
}

TEST_CASE("member names reject absolute and drive-prefixed paths") {
    CHECK(normalize_member_name("/etc/passwd").error == PathError::AbsoluteNotAllowed);
    CHECK(normalize_member_name("\\windows\\system32").error == PathError::AbsoluteNotAllowed);
    CHECK(normalize_member_name("C:evil").error == PathError::AbsoluteNotAllowed);
}

TEST_CASE("member names reject empty and NUL") {
    CHECK(normalize_member_name("").error == PathError::Empty);
    CHECK(normalize_member_name("./").error == PathError::Empty);
    CHECK(normalize_member_name(std::string("a\0b", 3)).error == PathError::ContainsNul);
}

TEST_CASE("dots inside a name are not parent segments") {
    auto r = normalize_member_name("demo/v1..2/notes.md");
    REQUIRE(r.ok);
    CHECK(r.path == "demo/v1..2/notes.md");
}

TEST_CASE("lexical containment") {
    CHECK(is_lexically_within("/root/x", "/root/x/a/b"));
    CHECK(is_lexically_within("/root/x/", "/root/x/a"));
    CHECK_FALSE(is_lexically_within("/root/x", "/root/xy/a"));
    CHECK_FALSE(is_lexically_within("/root/x", "/root/x/../y"));
}

TEST_CASE("safe module names are single components") {
    CHECK(is_safe_module_name("code-reviewer"));
    CHECK(is_safe_module_name("my_module.v2"));
    CHECK_FALSE(is_safe_module_name(""));
    CHECK_FALSE(is_safe_module_name(".."));
    CHECK_FALSE(is_safe_module_name("a/b"));
    CHECK_FALSE(is_safe_module_name("a\\b"));
    CHECK_FALSE(is_safe_module_name("x..y"));
}

TEST_CASE("replacing a directory can hand the old tree to the caller") {
    cogmod::testing::TempDir tmp;
    cogmod::testing::write_text(tmp.file("mods/demo/v.txt"), "old");
    cogmod::testing::write_text(tmp.file("mods/.staging-1/v.txt"), "new");

    CHECK(cogmod::place_directory(tmp.file("mods/.staging-1"), tmp.file("mods/demo")).status ==
          cogmod::PlaceStatus::AlreadyExists);

    std::string aside;
    auto placed = cogmod::replace_directory(tmp.file("mods/.staging-1"), tmp.file("mods/demo"),
                                            &aside);
    REQUIRE(placed.status == cogmod::PlaceStatus::Placed);
    CHECK(cogmod::testing::read_text(tmp.file("mods/demo/v.txt")) == "new");
    REQUIRE_FALSE(aside.empty());
    CHECK(cogmod::get_filename(aside).rfind(cogmod::REPLACED_DIR_PREFIX, 0) == 0);
    CHECK(cogmod::testing::read_text(cogmod::join_path(aside, "v.txt")) == "old");

    cogmod::testing::write_text(tmp.file("mods/.staging-2/v.txt"), "newer");
    REQUIRE(cogmod::replace_directory(tmp.file("mods/.staging-2"), tmp.file("mods/demo")).status ==
            cogmod::PlaceStatus::Placed);
    CHECK(cogmod::list_directory(tmp.file("mods")) ==
          std::vector<std::string>{cogmod::get_filename(aside), "demo"});
}
