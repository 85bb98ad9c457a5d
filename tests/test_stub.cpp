#include <catch2/catch.hpp>
#include <kiln/stub.hpp>
#include "test_support.hpp"

using namespace kiln;
using namespace kiln_test;

static Manifest manifest_of(const std::string& toml) {
    auto m = Manifest::parse(toml, "version = 3\n[[package]]\nname = \"app\"\nversion = \"0.1.0\"\n",
                             "Cargo.toml", "Cargo.lock");
    REQUIRE(m.is_ok());
    return std::move(m).value();
}

static const char* BASIC = "[package]\nname = \"app\"\nversion = \"0.1.0\"\n";

TEST_CASE("Profile names round-trip", "[stub]") {
    for (auto p : {StubProfile::Rust, StubProfile::C, StubProfile::Cpp, StubProfile::Go}) {
        StubProfile parsed = StubProfile::Rust;
        REQUIRE(parse_stub_profile(stub_profile_name(p), parsed));
        CHECK(parsed == p);
    }
    StubProfile out = StubProfile::Rust;
    CHECK(parse_stub_profile("c++", out));
    CHECK(out == StubProfile::Cpp);
    CHECK_FALSE(parse_stub_profile("java", out));
}

TEST_CASE("Rust stub for the implicit binary", "[stub]") {
    auto stub = StubSynthesizer().synthesize(manifest_of(BASIC));
    REQUIRE(stub.is_ok());
    REQUIRE(stub.value().files.size() == 1);
    CHECK(stub.value().files[0].path == "src/main.rs");
    CHECK(stub.value().files[0].content == "fn main() {}\n");
}

TEST_CASE("Stub covers every target and the build script", "[stub]") {
    auto m = manifest_of(std::string(BASIC) +
        "build = \"build.rs\"\n[lib]\n[[bin]]\nname = \"app\"\n[[bin]]\nname = \"cli\"\npath = \"src/cli/main.rs\"\n");
    auto stub = StubSynthesizer().synthesize(m);
    REQUIRE(stub.is_ok());
    CHECK(stub.value().paths() ==
          std::vector<std::string>{"build.rs", "src/cli/main.rs", "src/lib.rs", "src/main.rs"});
    REQUIRE(stub.value().find("src/lib.rs"));
    CHECK(stub.value().find("src/lib.rs")->content.empty());
    CHECK(stub.value().find("build.rs")->content == "fn main() {}\n");
    CHECK(stub.value().find("src/missing.rs") == nullptr);
}

TEST_CASE("Stubs reference no application code", "[stub]") {
    auto m = manifest_of(std::string(BASIC) + "[lib]\n");
    for (auto p : {StubProfile::Rust, StubProfile::C, StubProfile::Cpp, StubProfile::Go}) {
        auto stub = StubSynthesizer(p).synthesize(m);
        REQUIRE(stub.is_ok());
        for (const auto& f : stub.value().files) {
            CHECK(f.content.find("mod ") == std::string::npos);
            CHECK(f.content.find("use ") == std::string::npos);
            CHECK(f.content.find("#include") == std::string::npos);
            CHECK(f.content.find("import") == std::string::npos);
        }
    }
}

TEST_CASE("Profiles produce language-appropriate entry points", "[stub]") {
    auto m = manifest_of("[package]\nname = \"my-app\"\nversion = \"0.1.0\"\n[lib]\n");

    auto c = StubSynthesizer(StubProfile::C).synthesize(m).value();
    CHECK(c.find("src/main.rs")->content == "int main(void) { return 0; }\n");
    CHECK_FALSE(c.find("src/lib.rs")->content.empty());

    auto cpp = StubSynthesizer(StubProfile::Cpp).synthesize(m).value();
    CHECK(cpp.find("src/main.rs")->content == "int main() { return 0; }\n");

    auto go = StubSynthesizer(StubProfile::Go).synthesize(m).value();
    CHECK(go.find("src/main.rs")->content == "package main\n\nfunc main() {}\n");
    CHECK(go.find("src/lib.rs")->content == "package my_app\n");
}

TEST_CASE("Stub is byte-identical for the same manifest", "[stub]") {
    auto m = manifest_of(std::string(BASIC) + "[lib]\n");
    auto a = StubSynthesizer().synthesize(m).value();
    auto b = StubSynthesizer().synthesize(m).value();
    CHECK(a.files == b.files);
    CHECK(a.digest() == b.digest());

    auto c = StubSynthesizer(StubProfile::C).synthesize(m).value();
    CHECK(a.digest() != c.digest());
}

TEST_CASE("Override files replace the profile", "[stub]") {
    StubSynthesizer synth(StubProfile::C);
    synth.set_override({{"./main.c", "int main(void) { return 0; }\n"}, {"include/app.h", ""}});
    auto stub = synth.synthesize(manifest_of(BASIC));
    REQUIRE(stub.is_ok());
    CHECK(stub.value().paths() == std::vector<std::string>{"include/app.h", "main.c"});
}

TEST_CASE("Invalid stub layouts are rejected", "[stub]") {
    SECTION("no targets") {
        auto m = manifest_of(std::string(BASIC) + "autobins = false\n");
        REQUIRE(StubSynthesizer().synthesize(m).is_err(KilnError::MalformedManifest));
    }
    SECTION("lib and bin share a file") {
        auto m = manifest_of(std::string(BASIC) + "[lib]\npath = \"src/main.rs\"\n");
        REQUIRE(StubSynthesizer().synthesize(m).is_err(KilnError::MalformedManifest));
    }
    SECTION("path escaping the source root") {
        auto m = manifest_of(std::string(BASIC) + "[[bin]]\nname = \"x\"\npath = \"../x.rs\"\n");
        REQUIRE(StubSynthesizer().synthesize(m).is_err(KilnError::InvalidArg));
    }
    SECTION("absolute override path") {
        StubSynthesizer synth;
        synth.set_override({{"/etc/main.rs", ""}});
        REQUIRE(synth.synthesize(manifest_of(BASIC)).is_err(KilnError::InvalidArg));
    }
}

TEST_CASE("Write and remove stub files", "[stub]") {
    auto dir = temp_dir("stub_write");
    write_file(dir / "Cargo.toml", BASIC);
    StubSynthesizer synth;
    auto stub = synth.synthesize(manifest_of(std::string(BASIC) + "[lib]\n")).value();

    auto written = synth.write(stub, dir);
    REQUIRE(written.is_ok());
    REQUIRE(written.value().size() == 2);
    CHECK(read_file(dir / "src" / "main.rs") == "fn main() {}\n");
    CHECK(fs::exists(dir / "src" / "lib.rs"));

    REQUIRE(synth.remove(stub, dir).is_ok());
    CHECK_FALSE(fs::exists(dir / "src" / "main.rs"));
    CHECK_FALSE(fs::exists(dir / "src" / "lib.rs"));
    CHECK(fs::exists(dir / "Cargo.toml"));

    // Removing again is harmless
    REQUIRE(synth.remove(stub, dir).is_ok());
    fs::remove_all(dir);
}
