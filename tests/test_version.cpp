#include <catch2/catch.hpp>
#include <kiln/version.hpp>

using namespace kiln;

static Version V(const std::string& s) {
    auto r = Version::parse(s);
    REQUIRE(r.is_ok());
    return r.value();
}

static bool req_matches(const std::string& req, const std::string& ver) {
    auto r = VersionReq::parse(req);
    REQUIRE(r.is_ok());
    return r.value().matches(V(ver));
}

TEST_CASE("Version parse full form", "[version]") {
    auto v = V("1.22.333-rc.1+build.7");
    REQUIRE(v.major == 1);
    REQUIRE(v.minor == 22);
    REQUIRE(v.micro == 333);
    REQUIRE(v.pre == "rc.1");
    REQUIRE(v.build == "build.7");
    REQUIRE(v.is_prerelease());
    REQUIRE(v.to_string() == "1.22.333-rc.1+build.7");
}

TEST_CASE("Version parse rejects malformed input", "[version]") {
    CHECK(Version::parse("").is_err(KilnError::Version));
    CHECK(Version::parse("1.2").is_err(KilnError::Version));
    CHECK(Version::parse("1.2.x").is_err(KilnError::Version));
    CHECK(Version::parse("a.b.c").is_err(KilnError::Version));
    CHECK(Version::parse("1.2.3-").is_err(KilnError::Version));
    CHECK(Version::parse("1.2.3.4").is_err(KilnError::Version));
}

TEST_CASE("Version ordering follows semver precedence", "[version]") {
    std::vector<std::string> ordered = {
        "1.0.0-alpha", "1.0.0-alpha.1", "1.0.0-alpha.beta", "1.0.0-beta",
        "1.0.0-beta.2", "1.0.0-beta.11", "1.0.0-rc.1", "1.0.0", "1.0.1", "1.1.0", "2.0.0",
    };
    for (size_t i = 0; i + 1 < ordered.size(); ++i) {
        INFO(ordered[i] << " < " << ordered[i + 1]);
        CHECK(V(ordered[i]) < V(ordered[i + 1]));
        CHECK(V(ordered[i + 1]) > V(ordered[i]));
    }
}

TEST_CASE("Build metadata is ignored by comparison", "[version]") {
    CHECK(V("1.2.3+a") == V("1.2.3+b"));
    CHECK(V("1.2.3") <= V("1.2.3+x"));
}

TEST_CASE("Caret requirements", "[version]") {
    CHECK(req_matches("1.2.3", "1.9.0"));
    CHECK(req_matches("^1.2.3", "1.2.3"));
    CHECK_FALSE(req_matches("^1.2.3", "1.2.2"));
    CHECK_FALSE(req_matches("^1.2.3", "2.0.0"));
    CHECK(req_matches("^0.2.3", "0.2.9"));
    CHECK_FALSE(req_matches("^0.2.3", "0.3.0"));
    CHECK(req_matches("^0.0.3", "0.0.3"));
    CHECK_FALSE(req_matches("^0.0.3", "0.0.4"));
}

TEST_CASE("Tilde, wildcard and exact requirements", "[version]") {
    CHECK(req_matches("~1.2.3", "1.2.9"));
    CHECK_FALSE(req_matches("~1.2.3", "1.3.0"));
    CHECK(req_matches("1.*", "1.5.0"));
    CHECK_FALSE(req_matches("1.*", "2.0.0"));
    CHECK(req_matches("*", "3.4.5"));
    CHECK(req_matches("=1.2.3", "1.2.3+build"));
    CHECK_FALSE(req_matches("=1.2.3", "1.2.4"));
    CHECK(req_matches("=1.2", "1.2.5"));
    CHECK_FALSE(req_matches("=1.2", "1.3.0"));
}

TEST_CASE("Comparison operators and conjunctions", "[version]") {
    CHECK(req_matches(">=1.0, <2.0", "1.5.0"));
    CHECK_FALSE(req_matches(">=1.0, <2.0", "2.0.0"));
    CHECK(req_matches(">1.2", "1.3.0"));
    CHECK_FALSE(req_matches(">1.2", "1.2.9"));
    CHECK(req_matches("<=1.2", "1.2.7"));
    CHECK_FALSE(req_matches("<=1.2.3", "1.2.4"));
}

TEST_CASE("Pre-releases need an explicit pre-release requirement", "[version]") {
    CHECK_FALSE(req_matches("*", "1.0.0-rc.1"));
    CHECK_FALSE(req_matches("^1.2.3", "1.3.0-alpha"));
    CHECK(req_matches("^1.2.3-alpha", "1.2.3-beta"));
    CHECK_FALSE(req_matches("^1.2.3-alpha", "1.2.4-beta"));
}

TEST_CASE("Requirement parse errors", "[version]") {
    CHECK(VersionReq::parse("").is_err(KilnError::Version));
    CHECK(VersionReq::parse(">=").is_err(KilnError::Version));
    CHECK(VersionReq::parse("1.x.3").is_err(KilnError::Version));
    CHECK(VersionReq::parse(">=1.*").is_err(KilnError::Version));
    CHECK(VersionReq::parse("1.0,").is_err(KilnError::Version));
}

TEST_CASE("Requirement to_string", "[version]") {
    auto r = VersionReq::parse(">=1.0, <2");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().to_string() == ">=1.0, <2");
    REQUIRE(VersionReq::parse("1.2").value().to_string() == "^1.2");
}
