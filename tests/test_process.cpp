#include <catch2/catch.hpp>
#include <kiln/process.hpp>
#include "test_support.hpp"

using namespace kiln;
using namespace kiln_test;

TEST_CASE("run_command captures stdout and exit code", "[process]") {
    auto r = run_command({"sh", "-c", "echo hello; exit 0"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().success());
    REQUIRE(r.value().stdout_str == "hello\n");
    REQUIRE(r.value().stderr_str.empty());
}

TEST_CASE("Non-zero exit is reported, not an error", "[process]") {
    auto r = run_command({"sh", "-c", "echo oops >&2; exit 3"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 3);
    REQUIRE_FALSE(r.value().success());
    REQUIRE(r.value().stderr_str == "oops\n");
}

TEST_CASE("combined_output puts stderr first", "[process]") {
    auto r = run_command({"sh", "-c", "printf out; printf err >&2"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().combined_output() == "err\nout");
}

TEST_CASE("Large output does not deadlock", "[process]") {
    auto r = run_command({"sh", "-c", "i=0; while [ $i -lt 20000 ]; do echo line$i; echo err$i >&2; i=$((i+1)); done"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().stdout_str.find("line19999\n") != std::string::npos);
    REQUIRE(r.value().stderr_str.find("err19999\n") != std::string::npos);
}

TEST_CASE("Working directory and environment are applied", "[process]") {
    auto dir = temp_dir("process");
    CommandOptions opts;
    opts.working_dir = dir.string();
    opts.env["KILN_PROBE"] = "42";

    auto r = run_command({"sh", "-c", "pwd; echo $KILN_PROBE"}, opts);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().stdout_str ==
            fs::canonical(dir).string() + "\n42\n");
    fs::remove_all(dir);
}

TEST_CASE("Missing executable is a Process error", "[process]") {
    auto r = run_command({"kiln-no-such-tool-xyz"});
    REQUIRE(r.is_err(KilnError::Process));
    REQUIRE_FALSE(r.error().hint.empty());
}

TEST_CASE("Timeout kills the command", "[process]") {
    CommandOptions opts;
    opts.timeout_seconds = 1;
    auto r = run_command({"sleep", "10"}, opts);
    REQUIRE(r.is_err(KilnError::Process));
    REQUIRE(r.error().message.find("timed out") != std::string::npos);
}

TEST_CASE("Empty command line is rejected", "[process]") {
    REQUIRE(run_command({}).is_err(KilnError::InvalidArg));
}
