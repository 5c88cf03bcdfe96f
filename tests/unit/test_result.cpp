#include <catch2/catch_test_macros.hpp>
#include "core/errors.hpp"
#include "core/result.hpp"

#include <string>

using namespace lanlog;

TEST_CASE("Result::ok creates a success result", "[result]") {
    auto result = Result<uint16_t>::ok(47778);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.unwrap() == 47778);
}

TEST_CASE("Result::err keeps message and code", "[result]") {
    auto result = Result<uint16_t>::err(Error{"address in use", 98});

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().message == "address in use");
    REQUIRE(result.unwrap_err().code == 98);
}

TEST_CASE("Result::unwrap throws on error", "[result]") {
    auto result = Result<uint16_t>::err(Error{"error"});

    REQUIRE_THROWS_AS(result.unwrap(), std::runtime_error);
    REQUIRE_THROWS_AS(Result<uint16_t>::ok(1).unwrap_err(), std::runtime_error);
}

TEST_CASE("Result::value_or returns default on error", "[result]") {
    REQUIRE(Result<int>::ok(42).value_or(0) == 42);
    REQUIRE(Result<int>::err(Error{"error"}).value_or(-1) == -1);
}

TEST_CASE("Result::map and map_err", "[result]") {
    auto port = Result<int>::ok(8080).map([](int p) { return std::to_string(p); });
    REQUIRE(port.unwrap() == "8080");

    auto failed = Result<int>::err(Error{"refused", 1})
        .map([](int p) { return p + 1; })
        .map_err([](const Error& e) {
            return ConnectionError{ConnectionErrorKind::Unreachable,
                                   QString::fromStdString(e.message)};
        });
    REQUIRE(failed.is_err());
    REQUIRE(failed.unwrap_err().kind == ConnectionErrorKind::Unreachable);
    REQUIRE(failed.unwrap_err().message == QStringLiteral("refused"));
}

TEST_CASE("Result::and_then short-circuits on error", "[result]") {
    auto parse_port = [](int x) -> Result<uint16_t> {
        if (x <= 0 || x > 65535) return Result<uint16_t>::err(Error{"invalid port"});
        return Result<uint16_t>::ok(static_cast<uint16_t>(x));
    };

    REQUIRE(Result<int>::ok(80).and_then(parse_port).unwrap() == 80);
    REQUIRE(Result<int>::ok(70000).and_then(parse_port).unwrap_err().message == "invalid port");
    REQUIRE(Result<int>::err(Error{"first"}).and_then(parse_port).unwrap_err().message == "first");
}

TEST_CASE("Result with the same value and error type", "[result]") {
    auto ok = Result<std::string, std::string>::ok("value");
    auto err = Result<std::string, std::string>::err("problem");

    REQUIRE(ok.is_ok());
    REQUIRE(ok.unwrap() == "value");
    REQUIRE(err.is_err());
    REQUIRE(err.unwrap_err() == "problem");
}

TEST_CASE("Result<void> with a domain error", "[result]") {
    auto ok = Result<void, DiscoveryError>::ok();
    auto err = Result<void, DiscoveryError>::err(
        DiscoveryError{DiscoveryErrorKind::PermissionDenied, QStringLiteral("denied")});

    REQUIRE(ok.is_ok());
    REQUIRE_NOTHROW(ok.unwrap());
    REQUIRE(err.is_err());
    REQUIRE_THROWS(err.unwrap());
    REQUIRE(err.unwrap_err().kind == DiscoveryErrorKind::PermissionDenied);

    int calls = 0;
    auto chained = ok.and_then([&]() { ++calls; return Result<void, DiscoveryError>::ok(); });
    REQUIRE(chained.is_ok());
    REQUIRE(calls == 1);
}

TEST_CASE("Error descriptions", "[result][errors]") {
    const ConnectionError invalid{ConnectionErrorKind::InvalidPasscode, QString()};
    const ConnectionError timeout{ConnectionErrorKind::Timeout, QString()};

    REQUIRE(invalid.is_passcode_error());
    REQUIRE_FALSE(timeout.is_passcode_error());
    REQUIRE_FALSE(describe(invalid).isEmpty());
    REQUIRE(std::string(to_string(ConnectionErrorKind::PasscodeRequired)) == "passcode_required");
    REQUIRE(std::string(to_string(DiscoveryErrorKind::Unavailable)) == "unavailable");
}
