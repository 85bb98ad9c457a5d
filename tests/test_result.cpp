#include <catch2/catch.hpp>
#include <kiln/result.hpp>
#include <string>

using namespace kiln;

static Result<int> try_double(Result<int> input) {
    KILN_TRY(input);
    return Result<int>::ok(input.value() * 2);
}

static Result<int> try_assign(Result<int> input) {
    KILN_TRY_ASSIGN(v, input);
    return Result<int>::ok(v + 1);
}

static Status try_status(bool fail) {
    auto r = fail ? Result<std::string>::err(KilnError{KilnError::IO, "disk"})
                  : Result<std::string>::ok("fine");
    KILN_TRY(r);
    return ok_status();
}

TEST_CASE("Create Ok result and access value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
    REQUIRE(static_cast<bool>(r));
}

TEST_CASE("Create Err result and access error", "[result]") {
    auto r = Result<int>::err(KilnError{KilnError::NotFound, "missing entry"});
    REQUIRE(r.is_err());
    REQUIRE(r.is_err(KilnError::NotFound));
    REQUIRE_FALSE(r.is_err(KilnError::IO));
    REQUIRE(r.error().message == "missing entry");
    REQUIRE_FALSE(static_cast<bool>(r));
}

TEST_CASE("value_or falls back on error", "[result]") {
    REQUIRE(Result<int>::ok(3).value_or(9) == 3);
    REQUIRE(Result<int>::err(KilnError{KilnError::IO, "x"}).value_or(9) == 9);
}

TEST_CASE("KILN_TRY propagates errors across result types", "[result]") {
    REQUIRE(try_double(Result<int>::ok(21)).value() == 42);
    auto failed = try_double(Result<int>::err(KilnError{KilnError::Parse, "bad"}));
    REQUIRE(failed.is_err(KilnError::Parse));

    REQUIRE(try_status(false).is_ok());
    REQUIRE(try_status(true).is_err(KilnError::IO));
}

TEST_CASE("KILN_TRY_ASSIGN unwraps the value", "[result]") {
    REQUIRE(try_assign(Result<int>::ok(1)).value() == 2);
    REQUIRE(try_assign(Result<int>::err(KilnError{KilnError::Version, "v"}))
                .is_err(KilnError::Version));
}

TEST_CASE("and_then chains on success only", "[result]") {
    auto r = Result<int>::ok(5).and_then([](int& v) { return Result<std::string>::ok(std::to_string(v)); });
    REQUIRE(r.value() == "5");

    auto e = Result<int>::err(KilnError{KilnError::Config, "nope"})
        .and_then([](int& v) { return Result<std::string>::ok(std::to_string(v)); });
    REQUIRE(e.is_err(KilnError::Config));
}

TEST_CASE("Error format includes build context", "[result]") {
    KilnError err{KilnError::DependencyCompile, "dependency build failed: boom", "check the lock"};
    err.with_phase("dependency-build")
       .with_fingerprint("abc123")
       .with_diagnostic("error: line one\nerror: line two");

    std::string text = err.format();
    REQUIRE(text.find("error[DependencyCompileError]: dependency build failed: boom") == 0);
    REQUIRE(text.find("phase: dependency-build") != std::string::npos);
    REQUIRE(text.find("fingerprint: abc123") != std::string::npos);
    REQUIRE(text.find("hint: check the lock") != std::string::npos);
    REQUIRE(text.find("    error: line one\n    error: line two") != std::string::npos);
    REQUIRE(text.back() != '\n');
}

TEST_CASE("Error format includes file location", "[result]") {
    KilnError err{KilnError::MalformedManifest, "bad", "", "Cargo.toml", 4};
    REQUIRE(err.format().find("--> Cargo.toml:4") != std::string::npos);
}

TEST_CASE("Fatal error codes", "[result]") {
    CHECK(KilnError{KilnError::MalformedManifest, ""}.is_fatal());
    CHECK(KilnError{KilnError::ReconciliationFailed, ""}.is_fatal());
    CHECK(KilnError{KilnError::FingerprintCollision, ""}.is_fatal());
    CHECK_FALSE(KilnError{KilnError::CacheStoreConflict, ""}.is_fatal());
    CHECK_FALSE(KilnError{KilnError::ApplicationCompile, ""}.is_fatal());
}
