// network_rag Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <network_rag/core/error.hpp>
#include <string>
#include <vector>

using namespace network_rag;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err("Test error");
        REQUIRE(err.message() == "Test error");
        REQUIRE(err.code() == ErrorCode::Unknown);
    }

    SECTION("from code and message") {
        Error err(ErrorCode::InvalidArgument, "Bad argument");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.message() == "Bad argument");
    }

    SECTION("with context") {
        Error err = Error("Base error").with_context("key", "value");
        auto* ctx = err.get_context("key");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == "value");
        REQUIRE(err.get_context("missing") == nullptr);
    }
}

TEST_CASE("Error kinds map to codes", "[core][error]") {
    SECTION("VersionError::invalid_format") {
        Error err = VersionError::invalid_format("1.x.y", "bad component");
        REQUIRE(err.code() == ErrorCode::ParseError);
        REQUIRE(err.is<VersionError>());
        REQUIRE(err.as<VersionError>()->input == "1.x.y");
    }

    SECTION("VersionError::unsatisfied") {
        Error err = VersionError::unsatisfied(">=1.0.0", "0.0.1");
        REQUIRE(err.code() == ErrorCode::IncompatibleVersion);
        REQUIRE(err.message().find(">=1.0.0") != std::string::npos);
        REQUIRE(err.message().find("0.0.1") != std::string::npos);
    }

    SECTION("ExportError") {
        REQUIRE(Error(ExportError::unknown("graph")).code() == ErrorCode::NotFound);
        REQUIRE(Error(ExportError::duplicate("version")).code() == ErrorCode::AlreadyExists);
        REQUIRE(Error(ExportError::undefined("version")).code() == ErrorCode::ValidationError);
    }

    SECTION("ConfigError") {
        REQUIRE(Error(ConfigError::read_failed("a.json")).code() == ErrorCode::IOError);
        REQUIRE(Error(ConfigError::parse_failed("a.json", "eof")).code() == ErrorCode::ParseError);
        REQUIRE(Error(ConfigError::invalid_value("log.level", "nope")).code() == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("Error chain formatting", "[core][error]") {
    SECTION("plain message") {
        REQUIRE(build_error_chain(Error(ErrorCode::NotSupported, "later")) == "[NotSupported] later");
    }

    SECTION("version error details") {
        auto chain = build_error_chain(VersionError::unsatisfied("^1.0.0", "0.0.1"));
        REQUIRE(chain.starts_with("[IncompatibleVersion] [VersionError]"));
        REQUIRE(chain.find("(required: ^1.0.0, found: 0.0.1)") != std::string::npos);
    }

    SECTION("config error with context") {
        Error err = ConfigError::invalid_value("log.level", "unknown level 'loud'");
        err.with_context("source", "network_rag.json");
        auto chain = build_error_chain(err);
        REQUIRE(chain.find("[ConfigError]") != std::string::npos);
        REQUIRE(chain.find("(field: log.level)") != std::string::npos);
        REQUIRE(chain.find("source: network_rag.json") != std::string::npos);
    }
}

// =============================================================================
// Result<T> Tests
// =============================================================================

TEST_CASE("Result construction", "[core][result]") {
    SECTION("Ok with value") {
        Result<int> r = Ok(42);
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
        REQUIRE(r.value() == 42);
    }

    SECTION("Ok void") {
        Result<void> r = Ok();
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
    }

    SECTION("Err with Error object") {
        Error err(ErrorCode::NotFound, "Not found");
        Result<int> r = Err<int>(err);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::NotFound);
    }

    SECTION("Err void from kind") {
        Result<void> r = Err(ExportError::unknown("nxql"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().is<ExportError>());
    }
}

TEST_CASE("Result value access", "[core][result]") {
    SECTION("value_or on Err") {
        Result<std::string> r = Err<std::string>(Error("error"));
        REQUIRE(r.value_or("fallback") == "fallback");
    }

    SECTION("unwrap on Err throws") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE_THROWS_AS(r.unwrap(), std::runtime_error);

        Result<void> v = Err(Error("error"));
        REQUIRE_THROWS_AS(v.unwrap(), std::runtime_error);
    }

    SECTION("move value out") {
        Result<std::string> r = Ok(std::string("hello"));
        std::string s = std::move(r).value();
        REQUIRE(s == "hello");
    }
}

TEST_CASE("Result map operations", "[core][result]") {
    SECTION("map on Ok") {
        Result<int> r = Ok(21);
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == 42);
    }

    SECTION("map on Err keeps error") {
        Result<int> r = Err<int>(Error(ErrorCode::ParseError, "bad"));
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_err());
        REQUIRE(r2.error().code() == ErrorCode::ParseError);
    }

    SECTION("and_then on Ok") {
        Result<int> r = Ok(42);
        auto r2 = r.and_then([](int x) -> Result<std::string> {
            return Ok(std::to_string(x));
        });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == "42");
    }

    SECTION("or_else on Err") {
        Result<int> r = Err<int>(Error("error"));
        auto r2 = r.or_else([](const Error& /*e*/) -> Result<int> {
            return Ok(0);
        });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == 0);
    }

    SECTION("vector in result") {
        Result<std::vector<std::string>> r = Ok(std::vector<std::string>{"version"});
        REQUIRE(r.is_ok());
        REQUIRE(r->size() == 1);
    }
}
