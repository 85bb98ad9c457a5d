#include <catch2/catch.hpp>
#include <kiln/glob.hpp>
#include "test_support.hpp"

#include <unistd.h>

using namespace kiln;
using namespace kiln_test;

TEST_CASE("Star matches within a segment", "[glob]") {
    CHECK(glob_match("*.rs", "main.rs"));
    CHECK_FALSE(glob_match("*.rs", "src/main.rs"));
    CHECK(glob_match("src/*.rs", "src/main.rs"));
    CHECK_FALSE(glob_match("src/*.rs", "src/bin/tool.rs"));
}

TEST_CASE("Double star spans segments", "[glob]") {
    CHECK(glob_match("**/*.d", "release/deps/app.d"));
    CHECK(glob_match("**/*.d", "app.d"));
    CHECK(glob_match("release/**", "release/deps/libfoo.rlib"));
    CHECK(glob_match("release/.fingerprint/app-*/**", "release/.fingerprint/app-1a2b/bin-app"));
}

TEST_CASE("Question mark and character classes", "[glob]") {
    CHECK(glob_match("lib?.a", "libx.a"));
    CHECK_FALSE(glob_match("lib?.a", "lib.a"));
    CHECK(glob_match("v[0-9]", "v7"));
    CHECK_FALSE(glob_match("v[!0-9]", "v7"));
    CHECK(glob_match("[abc]x", "bx"));
}

TEST_CASE("Paths are normalized before matching", "[glob]") {
    CHECK(glob_match("./src/main.rs", "src//main.rs"));
    CHECK(glob_match("src\\main.rs", "src/main.rs"));
}

TEST_CASE("GlobSet last matching rule wins", "[glob]") {
    GlobSet set({"**/*.log", "!keep/*.log"});
    CHECK(set.matches("a/b.log"));
    CHECK_FALSE(set.matches("keep/b.log"));
    CHECK_FALSE(set.matches("a/b.txt"));
}

TEST_CASE("Empty GlobSet matches nothing", "[glob]") {
    GlobSet set;
    CHECK(set.empty());
    CHECK_FALSE(set.matches("anything"));
}

TEST_CASE("glob_expand returns sorted matches", "[glob]") {
    auto dir = temp_dir("glob");
    write_file(dir / "release" / "app.d", "");
    write_file(dir / "release" / "deps" / "app-1.d", "");
    write_file(dir / "release" / "deps" / "libfoo.rlib", "");
    write_file(dir / "debug" / "x.d", "");

    auto r = glob_expand(GlobSet({"release/**/*.d"}), dir);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::vector<std::string>{"release/app.d", "release/deps/app-1.d"});
    fs::remove_all(dir);
}

TEST_CASE("glob_expand can report directories", "[glob]") {
    auto dir = temp_dir("glob_dirs");
    write_file(dir / "release" / ".fingerprint" / "app-1" / "bin-app", "");
    write_file(dir / "release" / ".fingerprint" / "serde-2" / "lib-serde", "");

    auto r = glob_expand(GlobSet({"release/.fingerprint/app-*"}), dir, true);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::vector<std::string>{"release/.fingerprint/app-1"});
    fs::remove_all(dir);
}

TEST_CASE("glob_expand on a missing root is an error", "[glob]") {
    REQUIRE(glob_expand(GlobSet({"*"}), "/nonexistent/kiln/root").is_err(KilnError::IO));
}

TEST_CASE("glob_expand fails when a subdirectory cannot be read", "[glob]") {
    // Mode bits do not stop root
    if (::geteuid() == 0) return;
    auto dir = temp_dir("glob_unreadable");
    write_file(dir / "release" / "app.d", "");
    write_file(dir / "sealed" / "inner" / "app.d", "");
    fs::permissions(dir / "sealed", fs::perms::none);

    auto r = glob_expand(GlobSet({"**/*.d"}), dir);
    fs::permissions(dir / "sealed", fs::perms::owner_all);
    REQUIRE(r.is_err(KilnError::IO));
    CHECK(r.error().message.find("error iterating") != std::string::npos);
    fs::remove_all(dir);
}
