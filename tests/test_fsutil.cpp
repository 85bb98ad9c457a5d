#include <catch2/catch.hpp>
#include <kiln/fsutil.hpp>
#include <kiln/sha256.hpp>
#include "test_support.hpp"

using namespace kiln;
using namespace kiln_test;

TEST_CASE("write_file_atomic creates parents and replaces content", "[fsutil]") {
    auto dir = temp_dir("fsutil_write");
    auto path = dir / "a" / "b" / "file.txt";
    REQUIRE(write_file_atomic(path, "one").is_ok());
    REQUIRE(kiln_test::read_file(path) == "one");
    REQUIRE(write_file_atomic(path, "two").is_ok());
    REQUIRE(kiln::read_file(path).value() == "two");

    // No temporaries left behind
    int count = 0;
    for (const auto& e : fs::directory_iterator(path.parent_path())) { (void)e; ++count; }
    REQUIRE(count == 1);
    fs::remove_all(dir);
}

TEST_CASE("read_file on a missing path is an IO error", "[fsutil]") {
    REQUIRE(kiln::read_file("/nonexistent/kiln/x").is_err(KilnError::IO));
}

TEST_CASE("copy_file_atomic copies bytes", "[fsutil]") {
    auto dir = temp_dir("fsutil_copy_file");
    write_file(dir / "src.bin", std::string("\0\1\2binary", 9));
    REQUIRE(copy_file_atomic(dir / "src.bin", dir / "out" / "dest.bin").is_ok());
    REQUIRE(kiln_test::read_file(dir / "out" / "dest.bin") == std::string("\0\1\2binary", 9));

    REQUIRE(copy_file_atomic(dir / "missing", dir / "x").is_err(KilnError::IO));
    fs::remove_all(dir);
}

TEST_CASE("copy_tree preserves content, mtimes and links", "[fsutil]") {
    auto dir = temp_dir("fsutil_copy_tree");
    auto src = dir / "src";
    write_file(src / "main.rs", "fn main() {}\n");
    write_file(src / "nested" / "mod.rs", "pub fn f() {}\n");
    age_file(src / "main.rs", 3600);
    fs::create_symlink("main.rs", src / "link.rs");

    auto r = copy_tree(src, dir / "dest");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().files == 2);
    REQUIRE(r.value().bytes == 13 + 14);

    REQUIRE(kiln_test::read_file(dir / "dest" / "nested" / "mod.rs") == "pub fn f() {}\n");
    REQUIRE(fs::last_write_time(dir / "dest" / "main.rs") == fs::last_write_time(src / "main.rs"));
    REQUIRE(fs::is_symlink(dir / "dest" / "link.rs"));
    REQUIRE(fs::read_symlink(dir / "dest" / "link.rs") == "main.rs");
    fs::remove_all(dir);
}

TEST_CASE("copy_tree honors exclusions and overwrites", "[fsutil]") {
    auto dir = temp_dir("fsutil_copy_exclude");
    auto src = dir / "src";
    write_file(src / "Cargo.toml", "new");
    write_file(src / "target" / "release" / "app", "bin");
    write_file(src / ".git" / "HEAD", "ref");
    write_file(dir / "dest" / "Cargo.toml", "old");

    auto r = copy_tree(src, dir / "dest", GlobSet({"target", ".git"}));
    REQUIRE(r.is_ok());
    REQUIRE(r.value().files == 1);
    REQUIRE(kiln_test::read_file(dir / "dest" / "Cargo.toml") == "new");
    REQUIRE_FALSE(fs::exists(dir / "dest" / "target"));
    REQUIRE_FALSE(fs::exists(dir / "dest" / ".git"));
    fs::remove_all(dir);
}

TEST_CASE("copy_tree from a missing directory fails", "[fsutil]") {
    auto dir = temp_dir("fsutil_copy_missing");
    REQUIRE(copy_tree(dir / "nope", dir / "dest").is_err(KilnError::IO));
    fs::remove_all(dir);
}

TEST_CASE("hash_tree is content-addressed", "[fsutil]") {
    auto a = temp_dir("fsutil_hash_a");
    auto b = temp_dir("fsutil_hash_b");
    write_file(a / "x" / "one", "1");
    write_file(a / "two", "22");
    write_file(b / "two", "22");
    write_file(b / "x" / "one", "1");
    age_file(b / "two", 1000);

    auto ha = hash_tree(a);
    auto hb = hash_tree(b);
    REQUIRE(ha.is_ok());
    REQUIRE(hb.is_ok());
    REQUIRE(ha.value().hex == hb.value().hex);
    REQUIRE(ha.value().files == 2);
    REQUIRE(ha.value().bytes == 3);

    write_file(b / "two", "23");
    REQUIRE(hash_tree(b).value().hex != ha.value().hex);

    // Renaming a file changes the digest even with identical bytes
    write_file(b / "two", "22");
    fs::rename(b / "x" / "one", b / "x" / "uno");
    REQUIRE(hash_tree(b).value().hex != ha.value().hex);

    fs::remove_all(a);
    fs::remove_all(b);
}

TEST_CASE("hash_tree exclusions leave files out", "[fsutil]") {
    auto dir = temp_dir("fsutil_hash_exclude");
    write_file(dir / "lib.rlib", "stable");
    auto base = hash_tree(dir).value().hex;

    write_file(dir / ".fingerprint" / "stamp", "123");
    REQUIRE(hash_tree(dir).value().hex != base);
    REQUIRE(hash_tree(dir, GlobSet({".fingerprint"})).value().hex == base);
    fs::remove_all(dir);
}

TEST_CASE("hash_tree on a missing directory is NotFound", "[fsutil]") {
    REQUIRE(hash_tree("/nonexistent/kiln/tree").is_err(KilnError::NotFound));
}

TEST_CASE("newest_mtime finds the newest entry", "[fsutil]") {
    auto dir = temp_dir("fsutil_mtime");
    write_file(dir / "old", "o");
    write_file(dir / "sub" / "new", "n");
    age_file(dir / "old", 7200);
    age_file(dir / "sub" / "new", 60);
    age_file(dir / "sub", 7200);
    age_file(dir, 7200);

    auto r = newest_mtime(dir);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == fs::last_write_time(dir / "sub" / "new"));

    auto single = newest_mtime(dir / "old");
    REQUIRE(single.value() == fs::last_write_time(dir / "old"));

    REQUIRE(newest_mtime(dir / "missing").is_err(KilnError::IO));
    fs::remove_all(dir);
}

TEST_CASE("remove_tree removes recursively and tolerates absence", "[fsutil]") {
    auto dir = temp_dir("fsutil_remove");
    write_file(dir / "a" / "b" / "c", "x");
    REQUIRE(remove_tree(dir / "a").is_ok());
    REQUIRE_FALSE(fs::exists(dir / "a"));
    REQUIRE(remove_tree(dir / "a").is_ok());
    fs::remove_all(dir);
}

TEST_CASE("unique_token values differ", "[fsutil]") {
    auto a = unique_token();
    auto b = unique_token();
    REQUIRE(a != b);
    REQUIRE(a.find(std::to_string(getpid()) + "-") == 0);
    REQUIRE(a.size() == std::to_string(getpid()).size() + 1 + 16);
}
