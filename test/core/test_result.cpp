#include <catch2/catch_test_macros.hpp>

#include <dashgraph/core/result.hpp>

#include <memory>
#include <sstream>
#include <string>
#include <utility>

using namespace dashgraph;

// ===========================================================================
// Basic Ok / Err
// ===========================================================================

TEST_CASE("Result: Ok result holds value", "[result]") {
    auto r = Result<int, std::string>::Ok(42);
    REQUIRE(r.IsOk());
    REQUIRE_FALSE(r.IsErr());
    CHECK(static_cast<bool>(r));
    CHECK(r.Value() == 42);
}

TEST_CASE("Result: Err result holds error", "[result]") {
    auto r = Result<int, std::string>::Err("failure");
    REQUIRE(r.IsErr());
    CHECK_FALSE(static_cast<bool>(r));
    CHECK(r.Error() == "failure");
}

TEST_CASE("Result: move-only value", "[result]") {
    auto r = Result<std::unique_ptr<int>, std::string>::Ok(std::make_unique<int>(7));
    REQUIRE(r.IsOk());
    auto p = std::move(r).Value();
    REQUIRE(p);
    CHECK(*p == 7);
}

TEST_CASE("Result: ValueOr", "[result]") {
    CHECK(Result<int, std::string>::Ok(42).ValueOr(0) == 42);
    CHECK(Result<int, std::string>::Err("fail").ValueOr(99) == 99);
}

TEST_CASE("Result: AndThen chains on Ok and short-circuits on Err", "[result]") {
    auto twice = [](int v) -> Result<std::string, std::string> {
        return Result<std::string, std::string>::Ok(std::to_string(v * 2));
    };
    auto ok = Result<int, std::string>::Ok(10).AndThen(twice);
    REQUIRE(ok.IsOk());
    CHECK(ok.Value() == "20");

    auto err = Result<int, std::string>::Err("bad").AndThen(twice);
    REQUIRE(err.IsErr());
    CHECK(err.Error() == "bad");
}

TEST_CASE("Result<void>: Ok and Err", "[result]") {
    auto ok = Result<void, Error>::Ok();
    CHECK(ok.IsOk());

    auto err = Result<void, Error>::Err(Error{"Op", "", "broken", std::nullopt,
                                              ErrorCategory::Internal});
    REQUIRE(err.IsErr());
    CHECK(err.Error().message == "broken");
}

// ===========================================================================
// Error
// ===========================================================================

TEST_CASE("Error: ToString without object or cause", "[result][error]") {
    Error e{"ResourceViewer", "", "no visitor configured", std::nullopt,
            ErrorCategory::Configuration};
    CHECK(e.ToString() == "ResourceViewer: no visitor configured");
}

TEST_CASE("Error: ToString with object", "[result][error]") {
    Error e{"Visit", "obj:apps/v1:Deployment:default:web", "boom", std::nullopt,
            ErrorCategory::Internal};
    CHECK(e.ToString() == "Visit [obj:apps/v1:Deployment:default:web]: boom");
}

TEST_CASE("Error: Wrap keeps the cause text", "[result][error]") {
    Error cause{"Children", "", "connection refused", std::nullopt,
                ErrorCategory::Internal};
    auto wrapped = Error::Wrap(ErrorCategory::ChildLookup, "Visit", "obj::Pod:ns:p",
                               "unable to fetch children", cause);

    CHECK(wrapped.Is(ErrorCategory::ChildLookup));
    REQUIRE(wrapped.cause.has_value());
    CHECK(*wrapped.cause == "Children: connection refused");
    CHECK(wrapped.ToString() ==
          "Visit [obj::Pod:ns:p]: unable to fetch children: Children: connection refused");
}

TEST_CASE("Error: category names", "[result][error]") {
    auto name = [](ErrorCategory c) {
        return Error{"", "", "", std::nullopt, c}.CategoryName();
    };
    CHECK(name(ErrorCategory::InvalidObject) == "invalid_object");
    CHECK(name(ErrorCategory::NoQueryerConfigured) == "no_queryer_configured");
    CHECK(name(ErrorCategory::ChildLookup) == "child_lookup");
    CHECK(name(ErrorCategory::Configuration) == "configuration");
    CHECK(name(ErrorCategory::ContextCancelled) == "context_cancelled");
    CHECK(name(ErrorCategory::PathResolution) == "path_resolution");
    CHECK(name(ErrorCategory::NotFound) == "not_found");
    CHECK(name(ErrorCategory::Internal) == "internal");
}

TEST_CASE("Error: equality and stream output", "[result][error]") {
    Error a{"Op", "x", "msg", std::nullopt, ErrorCategory::NotFound};
    Error b = a;
    CHECK(a == b);
    b.category = ErrorCategory::Internal;
    CHECK(a != b);

    std::ostringstream oss;
    oss << a;
    CHECK(oss.str() == "Op [x]: msg");
}
