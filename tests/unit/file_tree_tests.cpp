#include <doctest/doctest.h>
#include <repro/file_tree.hpp>

#include "../support/fixtures.hpp"

#include <algorithm>
#include <filesystem>

using namespace repro;
using repro::test::TempDir;
using repro::test::write_file;

namespace fs = std::filesystem;

TEST_CASE("list_artifact_tree returns sorted relative regular files") {
    TempDir dir;
    write_file(dir.sub("lib/b.so"), "b");
    write_file(dir.sub("bin/app"), "app");
    write_file(dir.sub("lib/a.so"), "a");
    write_file(dir.sub("README"), "r");
    fs::create_directories(dir.sub("empty/dir"));

    auto result = list_artifact_tree("built", dir.path());
    REQUIRE(result.ok);
    CHECK(result.tree.name == "built");

    std::vector<std::string> expected = {"README", "bin/app", "lib/a.so", "lib/b.so"};
    CHECK(result.tree.paths == expected);
    CHECK(std::is_sorted(result.tree.paths.begin(), result.tree.paths.end()));
}

TEST_CASE("list_artifact_tree does not list symlinks") {
    TempDir dir;
    write_file(dir.sub("real.txt"), "x");
    std::error_code ec;
    fs::create_symlink(dir.sub("real.txt"), dir.sub("link.txt"), ec);
    REQUIRE_FALSE(ec);

    auto result = list_artifact_tree("official", dir.path());
    REQUIRE(result.ok);
    CHECK(result.tree.paths == std::vector<std::string>{"real.txt"});
}

TEST_CASE("list_artifact_tree of an empty directory") {
    TempDir dir;
    auto result = list_artifact_tree("built", dir.path());
    REQUIRE(result.ok);
    CHECK(result.tree.paths.empty());
}

TEST_CASE("list_artifact_tree rejects missing roots and files") {
    TempDir dir;
    write_file(dir.sub("file.txt"), "x");

    auto missing = list_artifact_tree("built", dir.sub("nope"));
    CHECK_FALSE(missing.ok);
    CHECK(missing.error.find("not found") != std::string::npos);

    auto not_dir = list_artifact_tree("built", dir.sub("file.txt"));
    CHECK_FALSE(not_dir.ok);
    CHECK(not_dir.error.find("not a directory") != std::string::npos);
}

TEST_CASE("FileEntry computes its digest lazily") {
    TempDir dir;
    write_file(dir.sub("a.txt"), "abc");

    auto listed = list_artifact_tree("built", dir.path());
    REQUIRE(listed.ok);

    auto entry = listed.tree.entry("a.txt");
    REQUIRE(entry.has_value());
    CHECK(entry->size() == 3);
    CHECK_FALSE(entry->has_digest());

    const auto& digest = entry->digest();
    CHECK(entry->has_digest());
    REQUIRE(digest.ok);
    CHECK(digest.hex_digest == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    CHECK_FALSE(listed.tree.entry("missing.txt").has_value());
}

TEST_CASE("compute_tree_digest depends on paths and content") {
    TempDir a;
    TempDir b;
    write_file(a.sub("x/one.txt"), "1");
    write_file(a.sub("two.txt"), "2");
    write_file(b.sub("x/one.txt"), "1");
    write_file(b.sub("two.txt"), "2");

    auto tree_a = list_artifact_tree("a", a.path());
    auto tree_b = list_artifact_tree("b", b.path());
    REQUIRE(tree_a.ok);
    REQUIRE(tree_b.ok);

    auto digest_a = compute_tree_digest(tree_a.tree);
    auto digest_b = compute_tree_digest(tree_b.tree, 4);
    REQUIRE(digest_a.ok);
    REQUIRE(digest_b.ok);
    CHECK(digest_a.hex_digest == digest_b.hex_digest);

    write_file(b.sub("two.txt"), "changed");
    auto digest_changed = compute_tree_digest(tree_b.tree);
    REQUIRE(digest_changed.ok);
    CHECK(digest_changed.hex_digest != digest_a.hex_digest);
}
