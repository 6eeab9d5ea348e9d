#include <catch2/catch_test_macros.hpp>

#include <toolserve/core/result.hpp>

#include <memory>
#include <string>
#include <utility>

using namespace toolserve;

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
    REQUIRE_FALSE(r.IsOk());
    CHECK_FALSE(static_cast<bool>(r));
    CHECK(r.Error() == "failure");
}

TEST_CASE("Result: copies keep their state", "[result]") {
    auto ok = Result<std::string, int>::Ok("hello");
    auto ok_copy = ok;
    REQUIRE(ok_copy.IsOk());
    CHECK(ok_copy.Value() == "hello");

    auto err = Result<std::string, int>::Err(404);
    auto err_copy = err;
    REQUIRE(err_copy.IsErr());
    CHECK(err_copy.Error() == 404);
}

// ===========================================================================
// Move semantics
// ===========================================================================

TEST_CASE("Result: move Ok value out", "[result]") {
    auto r = Result<std::string, int>::Ok("moveable");
    auto val = std::move(r).Value();
    CHECK(val == "moveable");
}

TEST_CASE("Result: move-only type in Ok", "[result]") {
    auto r = Result<std::unique_ptr<int>, std::string>::Ok(std::make_unique<int>(42));
    REQUIRE(r.IsOk());
    auto ptr = std::move(r).Value();
    REQUIRE(ptr != nullptr);
    CHECK(*ptr == 42);
}

// ===========================================================================
// Result<void, E>
// ===========================================================================

TEST_CASE("Result<void>: Ok and Err", "[result]") {
    auto ok = Result<void, std::string>::Ok();
    CHECK(ok.IsOk());
    CHECK_FALSE(ok.IsErr());

    auto err = Result<void, std::string>::Err("boom");
    REQUIRE(err.IsErr());
    CHECK(err.Error() == "boom");
    CHECK(std::move(err).Error() == "boom");
}

// ===========================================================================
// Error
// ===========================================================================

TEST_CASE("Error::Config: category, operation and exit code", "[error]") {
    auto e = Error::Config("Invalid port: 0");
    CHECK(e.category == ErrorCategory::Config);
    CHECK(e.operation == "ConfigLoader");
    CHECK(e.message == "Invalid port: 0");
    CHECK_FALSE(e.detail.has_value());
    CHECK(e.ExitCode() == 2);
    CHECK(e.CategoryName() == "config");
}

TEST_CASE("Error::Bind: carries address and port as detail", "[error]") {
    auto e = Error::Bind("127.0.0.1", 8765, "Address already in use");
    CHECK(e.category == ErrorCategory::Bind);
    CHECK(e.operation == "HttpServer");
    REQUIRE(e.detail.has_value());
    CHECK(*e.detail == "127.0.0.1:8765");
    CHECK(e.ExitCode() == 3);
}

TEST_CASE("Error: ExitCode mapping", "[error]") {
    CHECK(Error{"", "", ErrorCategory::Config, std::nullopt}.ExitCode() == 2);
    CHECK(Error{"", "", ErrorCategory::Bind, std::nullopt}.ExitCode() == 3);
    CHECK(Error{"", "", ErrorCategory::Io, std::nullopt}.ExitCode() == 4);
    CHECK(Error{"", "", ErrorCategory::Internal, std::nullopt}.ExitCode() == 99);
}

TEST_CASE("Error: default category is Internal", "[error]") {
    Error e{"Op", "msg"};
    CHECK(e.category == ErrorCategory::Internal);
    CHECK(e.CategoryName() == "internal");
}

TEST_CASE("Error: ToString includes detail when present", "[error]") {
    auto with = Error::Bind("0.0.0.0", 80, "Permission denied").ToString();
    CHECK(with == "HttpServer [0.0.0.0:80]: Permission denied");

    auto without = Error::Config("bad").ToString();
    CHECK(without == "ConfigLoader: bad");
}

TEST_CASE("Error: ToJson contains required fields", "[error]") {
    auto json = Error::Bind("127.0.0.1", 9000, "in use").ToJson();
    CHECK(json.find("\"category\":\"bind\"") != std::string::npos);
    CHECK(json.find("\"operation\":\"HttpServer\"") != std::string::npos);
    CHECK(json.find("\"message\":\"in use\"") != std::string::npos);
    CHECK(json.find("\"exit_code\":3") != std::string::npos);
    CHECK(json.find("\"detail\":\"127.0.0.1:9000\"") != std::string::npos);
}

TEST_CASE("Error: ToJson omits absent detail and escapes text", "[error]") {
    auto json = Error::Config("line1\nline2 \"quoted\"").ToJson();
    CHECK(json.find("\"detail\"") == std::string::npos);
    CHECK(json.find("\\n") != std::string::npos);
    CHECK(json.find("\\\"quoted\\\"") != std::string::npos);
}

TEST_CASE("Error: equality includes category and detail", "[error]") {
    auto e1 = Error::Config("msg");
    auto e2 = Error::Config("msg");
    Error e3{"ConfigLoader", "msg", ErrorCategory::Io, std::nullopt};
    Error e4{"ConfigLoader", "msg", ErrorCategory::Config, std::string("x")};
    CHECK(e1 == e2);
    CHECK(e1 != e3);
    CHECK(e1 != e4);
}

TEST_CASE("Result with Error type", "[result][error]") {
    auto r = Result<std::string, Error>::Err(Error::Config("missing"));
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Config);
    CHECK(r.Error().message == "missing");
}
