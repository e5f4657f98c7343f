#include <doctest/doctest.h>

#include "../support/fixtures.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

#include <sys/wait.h>

#include <nlohmann/json.hpp>

using repro::test::TempDir;
using repro::test::write_file;

namespace {

struct CliRun {
    int exit_code = -1;
    std::string out;
};

// Run the repro binary, capturing stdout; logs on stderr are discarded
CliRun run_cli(const std::string& args) {
    CliRun run;
    std::string command = std::string(REPRO_CLI_PATH) + " " + args + " 2>/dev/null";
    FILE* pipe = popen(command.c_str(), "r");
    REQUIRE(pipe != nullptr);

    char buffer[4096];
    size_t n;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        run.out.append(buffer, n);
    }
    int status = pclose(pipe);
    if (WIFEXITED(status)) {
        run.exit_code = WEXITSTATUS(status);
    }
    return run;
}

void write_tree(const std::string& root, const std::string& launcher) {
    write_file(root + "/bin/Sparrow", launcher);
    write_file(root + "/lib/app/Sparrow.cfg", "[Application]\n");
}

std::string read_text(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST_CASE("repro compare exits 0 for matching trees") {
    TempDir dir;
    write_tree(dir.sub("built"), "launcher");
    write_tree(dir.sub("official"), "launcher");

    auto run = run_cli("compare --built " + dir.sub("built") + " --official " + dir.sub("official") +
                       " --critical bin/Sparrow --format json");
    CHECK(run.exit_code == 0);

    auto j = nlohmann::json::parse(run.out);
    CHECK(j["results"][0]["status"] == "reproducible");
    CHECK(j["results"][0]["tiers"][0]["name"] == "critical_binaries");
}

TEST_CASE("repro compare exits 1 for differing trees") {
    TempDir dir;
    write_tree(dir.sub("built"), "launcher a");
    write_tree(dir.sub("official"), "launcher b");

    auto run = run_cli("compare --built " + dir.sub("built") + " --official " + dir.sub("official") +
                       " --critical bin/Sparrow --format summary --app-id sparrow");
    CHECK(run.exit_code == 1);
    CHECK(run.out.find("===== Begin Results =====") != std::string::npos);
    CHECK(run.out.find("verdict:        not_reproducible") != std::string::npos);
    CHECK(run.out.find("BUILDS DO NOT MATCH BINARIES") != std::string::npos);
}

TEST_CASE("repro compare exits 2 for a missing root and still reports") {
    TempDir dir;
    write_tree(dir.sub("built"), "launcher");

    auto run = run_cli("compare --built " + dir.sub("built") + " --official " +
                       dir.sub("nowhere") + " -o " + dir.sub("out/report.yaml"));
    CHECK(run.exit_code == 2);
    CHECK(read_text(dir.sub("out/report.yaml")).find("input_error") != std::string::npos);
}

TEST_CASE("repro compare exits 2 for a malformed profile") {
    TempDir dir;
    write_tree(dir.sub("built"), "launcher");
    write_tree(dir.sub("official"), "launcher");
    write_file(dir.sub("bad.json"), R"({"critical_files": ["bin/Sparrow"]})");

    auto run = run_cli("compare --built " + dir.sub("built") + " --official " + dir.sub("official") +
                       " --profile " + dir.sub("bad.json") + " --format json");
    CHECK(run.exit_code == 2);
    auto j = nlohmann::json::parse(run.out);
    CHECK(j["results"][0]["error"]["kind"] == "input_error");
}

TEST_CASE("repro compare rejects bad arguments") {
    CHECK(run_cli("compare --official /tmp").exit_code == 2);
    CHECK(run_cli("compare --built a --official b --format xml").exit_code == 2);
}

TEST_CASE("repro compare applies profile exclusions") {
    TempDir dir;
    write_tree(dir.sub("built"), "launcher");
    write_tree(dir.sub("official"), "launcher");
    write_file(dir.sub("official/lib/runtime/legal/c.txt"), "notice");
    write_file(dir.sub("profile.json"), R"({
        "$schema": "repro.target.profile.v1",
        "target": {"id": "sparrow", "build_type": "tarball", "architecture": "x86_64"},
        "critical_files": ["bin/Sparrow"],
        "exclusions": ["lib/runtime/legal/"]
    })");

    auto run = run_cli("compare --built " + dir.sub("built") + " --official " + dir.sub("official") +
                       " --profile " + dir.sub("profile.json"));
    CHECK(run.exit_code == 0);
    CHECK(run.out.find("build_type: tarball") != std::string::npos);
    CHECK(run.out.find("excluded: 1") != std::string::npos);
}

TEST_CASE("repro profile check") {
    TempDir dir;
    write_file(dir.sub("good.json"),
               R"({"$schema": "repro.target.profile.v1", "critical_files": ["bin/Sparrow"]})");
    write_file(dir.sub("bad.json"), R"({"$schema": "repro.target.profile.v0"})");

    auto good = run_cli("--json profile check " + dir.sub("good.json"));
    CHECK(good.exit_code == 0);
    auto j = nlohmann::json::parse(good.out);
    CHECK(j["ok"] == true);
    CHECK(j["profile"]["critical_files"][0] == "bin/Sparrow");

    auto bad = run_cli("profile check " + dir.sub("bad.json"));
    CHECK(bad.exit_code == 2);
}
