#include <doctest/doctest.h>
#include <repro/archive.hpp>
#include <repro/file_tree.hpp>

#include "../support/fixtures.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace repro;
using repro::test::TarFixtureEntry;
using repro::test::TempDir;
using repro::test::write_file;
using repro::test::write_tar_gz;

namespace fs = std::filesystem;

namespace {

std::string read_text(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

// ============================================================================
// TarGzExtractor
// ============================================================================

TEST_CASE("TarGzExtractor extracts files and directories") {
    TempDir dir;
    std::string archive = dir.sub("bundle.tar.gz");
    REQUIRE(write_tar_gz(archive, {
        {"Sparrow/", "", '5', ""},
        {"Sparrow/bin/Sparrow", "launcher", '0', ""},
        {"./Sparrow/lib/app/Sparrow.cfg", "[Application]\n", '0', ""},
        {"Sparrow/empty.txt", "", '0', ""},
    }));

    TarGzExtractor extractor;
    auto result = extractor.extract(archive, dir.sub("out"));
    REQUIRE(result.ok);
    CHECK(result.file_count == 3);
    CHECK(read_text(dir.sub("out/Sparrow/bin/Sparrow")) == "launcher");
    CHECK(read_text(dir.sub("out/Sparrow/lib/app/Sparrow.cfg")) == "[Application]\n");
    CHECK(fs::is_regular_file(dir.sub("out/Sparrow/empty.txt")));
}

TEST_CASE("TarGzExtractor handles payloads spanning several blocks") {
    TempDir dir;
    std::string big(5000, 'z');
    std::string archive = dir.sub("big.tar.gz");
    REQUIRE(write_tar_gz(archive, {{"big.bin", big, '0', ""}, {"after.txt", "after", '0', ""}}));

    TarGzExtractor extractor;
    auto result = extractor.extract(archive, dir.sub("out"));
    REQUIRE(result.ok);
    CHECK(read_text(dir.sub("out/big.bin")) == big);
    CHECK(read_text(dir.sub("out/after.txt")) == "after");
}

TEST_CASE("TarGzExtractor rejects unsafe paths") {
    TempDir dir;

    SUBCASE("traversal") {
        std::string archive = dir.sub("evil.tar.gz");
        REQUIRE(write_tar_gz(archive, {{"../escape.txt", "x", '0', ""}}));
        auto result = TarGzExtractor().extract(archive, dir.sub("out"));
        CHECK_FALSE(result.ok);
        CHECK(result.error.find("traversal") != std::string::npos);
        CHECK_FALSE(fs::exists(dir.sub("escape.txt")));
    }

    SUBCASE("absolute") {
        std::string archive = dir.sub("abs.tar.gz");
        REQUIRE(write_tar_gz(archive, {{"/tmp/abs.txt", "x", '0', ""}}));
        auto result = TarGzExtractor().extract(archive, dir.sub("out"));
        CHECK_FALSE(result.ok);
        CHECK(result.error.find("absolute") != std::string::npos);
    }
}

TEST_CASE("TarGzExtractor honors pax path records") {
    TempDir dir;
    std::string archive = dir.sub("pax.tar.gz");
    REQUIRE(repro::test::write_pax_tar_gz(archive, "java.base/java/lang/Object.class", "object"));

    auto result = TarGzExtractor().extract(archive, dir.sub("out"));
    REQUIRE(result.ok);
    CHECK(result.file_count == 1);
    CHECK(read_text(dir.sub("out/java.base/java/lang/Object.class")) == "object");
    CHECK_FALSE(fs::exists(dir.sub("out/placeholder")));
}

TEST_CASE("TarGzExtractor reports entry paths too long for the filesystem") {
    TempDir dir;
    std::string deep;
    for (int i = 0; i < 30; ++i) {
        deep += std::string(200, 'b') + "/";
    }
    deep += "x";
    std::string archive = dir.sub("deep.tar.gz");
    REQUIRE(repro::test::write_pax_tar_gz(archive, deep, "payload"));

    auto result = TarGzExtractor().extract(archive, dir.sub("out"));
    CHECK_FALSE(result.ok);
    CHECK_FALSE(result.error.empty());
}

TEST_CASE("TarGzExtractor skips links") {
    TempDir dir;
    std::string archive = dir.sub("links.tar.gz");
    REQUIRE(write_tar_gz(archive, {
        {"real.txt", "real", '0', ""},
        {"link.txt", "", '2', "real.txt"},
    }));

    auto result = TarGzExtractor().extract(archive, dir.sub("out"));
    REQUIRE(result.ok);
    CHECK(result.file_count == 1);
    CHECK(result.skipped == 1);
    CHECK_FALSE(fs::exists(fs::symlink_status(dir.sub("out/link.txt"))));
}

TEST_CASE("TarGzExtractor reports corrupt archives") {
    TempDir dir;

    SUBCASE("garbage") {
        write_file(dir.sub("corrupt.tar.gz"), std::string(2048, 'Q'));
        auto result = TarGzExtractor().extract(dir.sub("corrupt.tar.gz"), dir.sub("out"));
        CHECK_FALSE(result.ok);
        CHECK_FALSE(result.error.empty());
    }

    SUBCASE("empty file") {
        write_file(dir.sub("empty.tar.gz"), "");
        auto result = TarGzExtractor().extract(dir.sub("empty.tar.gz"), dir.sub("out"));
        CHECK_FALSE(result.ok);
    }

    SUBCASE("missing") {
        auto result = TarGzExtractor().extract(dir.sub("missing.tar.gz"), dir.sub("out"));
        CHECK_FALSE(result.ok);
        CHECK(result.error.find("not found") != std::string::npos);
    }
}

// ============================================================================
// CommandExtractor
// ============================================================================

TEST_CASE("CommandExtractor substitutes placeholders") {
    CommandExtractor extractor("jimage", {"jimage", "extract", "--dir", "{dir}", "{archive}"});
    auto argv = extractor.build_argv("/in/modules", "/out");
    std::vector<std::string> expected = {"jimage", "extract", "--dir", "/out", "/in/modules"};
    CHECK(argv == expected);

    CommandExtractor inline_args("custom", {"tool", "--out={dir}", "{archive}"});
    CHECK(inline_args.build_argv("a", "b")[1] == "--out=b");
}

TEST_CASE("CommandExtractor runs the tool") {
    TempDir dir;
    write_file(dir.sub("container.bin"), "payload");

    CommandExtractor copy("copy", {"cp", "{archive}", "{dir}/copied.bin"});
    auto result = copy.extract(dir.sub("container.bin"), dir.sub("out"));
    REQUIRE(result.ok);
    CHECK(read_text(dir.sub("out/copied.bin")) == "payload");
}

TEST_CASE("CommandExtractor failures") {
    TempDir dir;
    write_file(dir.sub("container.bin"), "payload");

    SUBCASE("non-zero exit") {
        CommandExtractor failing("false", {"false"});
        auto result = failing.extract(dir.sub("container.bin"), dir.sub("out"));
        CHECK_FALSE(result.ok);
        CHECK(result.error.find("exited with status 1") != std::string::npos);
    }

    SUBCASE("missing tool") {
        CommandExtractor missing("none", {"repro-no-such-extractor-tool", "{archive}"});
        auto result = missing.extract(dir.sub("container.bin"), dir.sub("out"));
        CHECK_FALSE(result.ok);
        CHECK(result.error.find("not available") != std::string::npos);
    }
}

// ============================================================================
// make_extractor
// ============================================================================

TEST_CASE("make_extractor resolves formats") {
    auto tar = make_extractor("tar.gz");
    REQUIRE(tar);
    CHECK(tar->name() == "tar.gz");

    auto jimage = make_extractor("jimage");
    REQUIRE(jimage);
    CHECK(jimage->name() == "jimage");

    CHECK_FALSE(make_extractor("rar"));
    CHECK_FALSE(is_known_format("rar"));

    ExtractorTable custom = {{"rar", {"unrar", "x", "{archive}", "{dir}"}}};
    auto rar = make_extractor("rar", custom);
    REQUIRE(rar);
    CHECK(is_known_format("rar", custom));
    auto* command = dynamic_cast<CommandExtractor*>(rar.get());
    REQUIRE(command != nullptr);
    CHECK(command->argv_template()[0] == "unrar");
}

TEST_CASE("is_tar_gz_path") {
    CHECK(is_tar_gz_path("Sparrow-2.0.0-x86_64.tar.gz"));
    CHECK(is_tar_gz_path("bundle.tgz"));
    CHECK_FALSE(is_tar_gz_path("bundle.zip"));
}
