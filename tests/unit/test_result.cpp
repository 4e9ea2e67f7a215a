#include <catch2/catch_test_macros.hpp>
#include "core/result.hpp"

#include <string>

using namespace docsync;

TEST_CASE("Result::ok creates a success result", "[result]") {
    auto result = Result<int>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.unwrap() == 42);
}

TEST_CASE("Result::err carries message, code and kind", "[result]") {
    auto result = Result<int>::err(Error(ErrorKind::Network, "connection reset", 104));

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().message == "connection reset");
    REQUIRE(result.unwrap_err().code == 104);
    REQUIRE(result.unwrap_err().kind == ErrorKind::Network);
}

TEST_CASE("Error factories set the kind", "[result]") {
    REQUIRE(Error::validation("bad").kind == ErrorKind::Validation);
    REQUIRE(Error::not_found("gone").kind == ErrorKind::NotFound);
    REQUIRE(Error::storage("disk", 11).kind == ErrorKind::Storage);
    REQUIRE(Error::storage("disk", 11).code == 11);
    REQUIRE(Error{"plain"}.kind == ErrorKind::Internal);
}

TEST_CASE("Result::unwrap throws on error", "[result]") {
    auto result = Result<int>::err(Error{"error"});

    REQUIRE_THROWS_AS(result.unwrap(), std::logic_error);
    REQUIRE_THROWS_AS(Result<int>::ok(1).unwrap_err(), std::logic_error);
}

TEST_CASE("Result::value_or returns default on error", "[result]") {
    auto ok_result = Result<int>::ok(42);
    auto err_result = Result<int>::err(Error{"error"});

    REQUIRE(ok_result.value_or(0) == 42);
    REQUIRE(err_result.value_or(0) == 0);
}

TEST_CASE("Result::map transforms success and propagates error", "[result]") {
    auto mapped = Result<int>::ok(21).map([](int x) { return x * 2; });
    REQUIRE(mapped.unwrap() == 42);

    auto failed = Result<int>::err(Error{"error"}).map([](int x) { return x * 2; });
    REQUIRE(failed.is_err());
    REQUIRE(failed.unwrap_err().message == "error");
}

TEST_CASE("Result::and_then chains and short-circuits", "[result]") {
    auto divide = [](int x) -> Result<int> {
        if (x == 0) return Result<int>::err(Error::validation("division by zero"));
        return Result<int>::ok(100 / x);
    };

    REQUIRE(Result<int>::ok(5).and_then(divide).unwrap() == 20);
    REQUIRE(Result<int>::ok(0).and_then(divide).unwrap_err().kind == ErrorKind::Validation);
    REQUIRE(Result<int>::err(Error{"initial"}).and_then(divide).unwrap_err().message == "initial");
}

TEST_CASE("Result<void> works correctly", "[result]") {
    auto ok_result = Result<void>::ok();
    auto err_result = Result<void>::err(Error{"error"});

    REQUIRE(ok_result.is_ok());
    REQUIRE(err_result.is_err());

    REQUIRE_NOTHROW(ok_result.unwrap());
    REQUIRE_THROWS(err_result.unwrap());
}

TEST_CASE("propagate forwards the error into another value type", "[result]") {
    const auto source = Result<int>::err(Error(ErrorKind::Auth, "expired", 401));
    const auto forwarded = propagate<std::string>(source);

    REQUIRE(forwarded.is_err());
    REQUIRE(forwarded.unwrap_err().kind == ErrorKind::Auth);
    REQUIRE(forwarded.unwrap_err().code == 401);
    REQUIRE(propagate<void>(source).unwrap_err().message == "expired");
}
