#include <catch2/catch.hpp>
#include <wharf/result.hpp>
#include <memory>
#include <string>

using namespace wharf;

// Helper function that uses WHARF_TRY
static Result<int> try_double(Result<int> input) {
    WHARF_TRY(input);
    return Result<int>::ok(input.value() * 2);
}

static Status try_steps(bool fail_second, int& reached) {
    reached = 0;
    WHARF_TRY(ok_status());
    reached = 1;
    WHARF_TRY(fail_second
        ? Status::err(WharfError{WharfError::StashFailed, "stash failed"})
        : ok_status());
    reached = 2;
    return ok_status();
}

TEST_CASE("Create Ok result and access value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
}

TEST_CASE("Create Err result and access error", "[result]") {
    auto r = Result<int>::err(WharfError{WharfError::NotFound, "missing item"});
    REQUIRE(r.is_err());
    REQUIRE_FALSE(r.is_ok());
    REQUIRE(r.error().code == WharfError::NotFound);
    REQUIRE(r.error().message == "missing item");
}

TEST_CASE("Implicit conversion from WharfError", "[result]") {
    Result<std::string> r = WharfError{WharfError::Git, "fetch failed"};
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == WharfError::Git);
}

TEST_CASE("Bool conversion", "[result]") {
    auto ok = Result<int>::ok(1);
    auto err = Result<int>::err(WharfError{WharfError::IO, "fail"});
    REQUIRE(static_cast<bool>(ok) == true);
    REQUIRE(static_cast<bool>(err) == false);
}

TEST_CASE("Value access on Err throws bad_variant_access", "[result]") {
    auto r = Result<int>::err(WharfError{WharfError::IO, "fail"});
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("value_or() falls back on Err", "[result]") {
    auto ok = Result<std::string>::ok("path");
    auto err = Result<std::string>::err(WharfError{WharfError::NotFound, "none"});
    REQUIRE(ok.value_or("fallback") == "path");
    REQUIRE(err.value_or("fallback") == "fallback");
}

TEST_CASE("map() transforms Ok value", "[result]") {
    auto r = Result<int>::ok(5);
    auto mapped = r.map([](int x) { return x * 2; });
    REQUIRE(mapped.is_ok());
    REQUIRE(mapped.value() == 10);
}

TEST_CASE("map() passes through Err", "[result]") {
    auto r = Result<int>::err(WharfError{WharfError::Parse, "bad input"});
    bool called = false;
    auto mapped = r.map([&](int x) { called = true; return x * 2; });
    REQUIRE(mapped.is_err());
    REQUIRE_FALSE(called);
    REQUIRE(mapped.error().code == WharfError::Parse);
}

TEST_CASE("and_then() short-circuits on Err", "[result]") {
    auto r = Result<int>::err(WharfError{WharfError::Canceled, "superseded"});
    bool called = false;
    auto chained = r.and_then([&](int x) {
        called = true;
        return Result<int>::ok(x + 10);
    });
    REQUIRE(chained.is_err());
    REQUIRE_FALSE(called);
    REQUIRE(chained.error().code == WharfError::Canceled);
}

TEST_CASE("WHARF_TRY propagates errors", "[result]") {
    auto output = try_double(Result<int>::err(WharfError{WharfError::Parse, "syntax error"}));
    REQUIRE(output.is_err());
    REQUIRE(output.error().message == "syntax error");

    auto good = try_double(Result<int>::ok(7));
    REQUIRE(good.is_ok());
    REQUIRE(good.value() == 14);
}

TEST_CASE("WHARF_TRY stops at the first failing Status", "[result]") {
    int reached = 0;
    REQUIRE(try_steps(false, reached).is_ok());
    REQUIRE(reached == 2);

    auto s = try_steps(true, reached);
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == WharfError::StashFailed);
    REQUIRE(reached == 1);
}

TEST_CASE("WharfError format() output", "[error]") {
    WharfError e{WharfError::CloneFailed, "git clone failed", "try the ssh URL"};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[CloneFailed]") != std::string::npos);
    REQUIRE(formatted.find("git clone failed") != std::string::npos);
    REQUIRE(formatted.find("hint: try the ssh URL") != std::string::npos);
}

TEST_CASE("WharfError format() without hint", "[error]") {
    WharfError e{WharfError::Parse, "unexpected token"};
    auto formatted = e.format();
    REQUIRE(formatted == "error[Parse]: unexpected token");
}

TEST_CASE("WharfError with_context() prefixes the message", "[error]") {
    WharfError e{WharfError::Git, "exit 128", "hint stays"};
    auto ctx = e.with_context("resolving github.com/acme/widgets@main");
    REQUIRE(ctx.code == WharfError::Git);
    REQUIRE(ctx.message == "resolving github.com/acme/widgets@main: exit 128");
    REQUIRE(ctx.hint == "hint stays");
    REQUIRE(e.message == "exit 128");
}

TEST_CASE("WharfError code_name() for resolution codes", "[error]") {
    REQUIRE(std::string(WharfError::code_name(WharfError::NotARepository)) == "NotARepository");
    REQUIRE(std::string(WharfError::code_name(WharfError::RemoteRefNotFound)) == "RemoteRefNotFound");
    REQUIRE(std::string(WharfError::code_name(WharfError::NoSelection)) == "NoSelection");
    REQUIRE(std::string(WharfError::code_name(WharfError::StashFailed)) == "StashFailed");
    REQUIRE(std::string(WharfError::code_name(WharfError::CloneFailed)) == "CloneFailed");
    REQUIRE(std::string(WharfError::code_name(WharfError::NonFastForward)) == "NonFastForward");
    REQUIRE(std::string(WharfError::code_name(WharfError::Timeout)) == "Timeout");
}

TEST_CASE("Result with move-only type (unique_ptr)", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(99));
    REQUIRE(r.is_ok());
    REQUIRE(*r.value() == 99);

    auto moved = std::move(r).value();
    REQUIRE(*moved == 99);
}
