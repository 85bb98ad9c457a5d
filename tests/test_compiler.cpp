#include <catch2/catch.hpp>
#include <kiln/compiler.hpp>
#include "test_support.hpp"

using namespace kiln;
using namespace kiln_test;

static const TemplateVars VARS = {{"package", "app"}, {"profile", "release"}};

// A shell "compiler" writing <cache>/release/app from the source tree
static CommandSpec shell_spec(const std::string& script) {
    CommandSpec spec;
    spec.argv = {"sh", "-c", script, "kiln-test", "{{ source }}", "{{ cache }}"};
    spec.output = "{{ cache }}/{{ profile }}/{{ package }}";
    return spec;
}

TEST_CASE("cargo_release defaults", "[compiler]") {
    auto spec = CommandSpec::cargo_release();
    CHECK(spec.argv == std::vector<std::string>{"cargo", "build", "--release", "--target-dir", "{{ cache }}"});
    CHECK(spec.output == "{{ cache }}/{{ profile }}/{{ package }}");
    CHECK(spec.timeout_seconds == 0);
}

TEST_CASE("CommandCompiler runs in the source root and finds the binary", "[compiler]") {
    auto dir = temp_dir("compiler_ok");
    write_file(dir / "src" / "main.rs", "fn main() {}\n");

    CommandCompiler compiler(shell_spec(
        "mkdir -p \"$2/release\" && cat src/main.rs > \"$2/release/app\" && echo compiled"), VARS);
    auto r = compiler.compile(dir / "src", dir / "target");
    REQUIRE(r.is_ok());
    CHECK(r.value().binary == dir / "target" / "release" / "app");
    CHECK(read_file(r.value().binary) == "fn main() {}\n");
    CHECK(r.value().log == "compiled\n");
    fs::remove_all(dir);
}

TEST_CASE("Relative output is resolved against the source root", "[compiler]") {
    auto dir = temp_dir("compiler_relative");
    fs::create_directories(dir / "src");
    auto spec = shell_spec("mkdir -p out && echo bin > out/app");
    spec.output = "out/{{ package }}";
    CommandCompiler compiler(spec, VARS);
    auto r = compiler.compile(dir / "src", dir / "target");
    REQUIRE(r.is_ok());
    CHECK(r.value().binary == dir / "src" / "out" / "app");
    fs::remove_all(dir);
}

TEST_CASE("Environment templates are expanded", "[compiler]") {
    auto dir = temp_dir("compiler_env");
    fs::create_directories(dir / "src");
    auto spec = shell_spec("mkdir -p \"$2/release\" && echo \"$KILN_OUT_DIR\" > \"$2/release/app\"");
    spec.env["KILN_OUT_DIR"] = "{{ cache }}/{{ profile }}";
    CommandCompiler compiler(spec, VARS);
    auto r = compiler.compile(dir / "src", dir / "target");
    REQUIRE(r.is_ok());
    CHECK(read_file(r.value().binary) == (dir / "target").string() + "/release\n");
    fs::remove_all(dir);
}

TEST_CASE("Failed compile carries the compiler output", "[compiler]") {
    auto dir = temp_dir("compiler_fail");
    fs::create_directories(dir / "src");
    CommandCompiler compiler(shell_spec("echo 'error[E0308]: mismatched types' >&2; exit 101"), VARS);
    auto r = compiler.compile(dir / "src", dir / "target");
    REQUIRE(r.is_err(KilnError::CompileFailed));
    CHECK(std::string(KilnError::code_name(r.error().code)) == "CompileFailed");
    CHECK(r.error().message.find("101") != std::string::npos);
    CHECK(r.error().diagnostic == "error[E0308]: mismatched types\n");
    fs::remove_all(dir);
}

TEST_CASE("Successful compile without a binary is an error", "[compiler]") {
    auto dir = temp_dir("compiler_nobin");
    fs::create_directories(dir / "src");
    CommandCompiler compiler(shell_spec("echo done"), VARS);
    auto r = compiler.compile(dir / "src", dir / "target");
    REQUIRE(r.is_err(KilnError::Process));
    CHECK_FALSE(r.error().hint.empty());
    fs::remove_all(dir);
}

TEST_CASE("Template and command errors", "[compiler]") {
    auto dir = temp_dir("compiler_bad");
    fs::create_directories(dir / "src");

    CommandSpec unknown;
    unknown.argv = {"cargo", "{{ target_triple }}"};
    CHECK(CommandCompiler(unknown, VARS).compile(dir / "src", dir / "target").is_err(KilnError::Config));

    CommandSpec empty;
    CHECK(CommandCompiler(empty, VARS).compile(dir / "src", dir / "target").is_err(KilnError::Config));

    CommandSpec missing;
    missing.argv = {"kiln-no-such-compiler"};
    CHECK(CommandCompiler(missing, VARS).compile(dir / "src", dir / "target").is_err(KilnError::Process));
    fs::remove_all(dir);
}

TEST_CASE("Identity reflects command, environment and profile", "[compiler]") {
    auto spec = CommandSpec::cargo_release();
    CommandCompiler base(spec, VARS);
    CHECK(base.identity() ==
          "command cargo build --release --target-dir {{ cache }}\nprofile release\n");

    auto with_env = spec;
    with_env.env["RUSTFLAGS"] = "-C target-cpu=native";
    CHECK(CommandCompiler(with_env, VARS).identity() != base.identity());

    CHECK(CommandCompiler(spec, {{"package", "app"}, {"profile", "dev"}}).identity() != base.identity());

    // The package name is not part of the toolchain identity
    CHECK(CommandCompiler(spec, {{"package", "other"}, {"profile", "release"}}).identity() ==
          base.identity());
}
