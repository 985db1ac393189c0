#include <catch2/catch_test_macros.hpp>

#include "wslgate/core/error.hpp"

TEST_CASE("Error creation and accessors", "[error]") {
    SECTION("basic error") {
        wslgate::Error err(wslgate::ErrorCode::NotFound, "resource not found");
        CHECK(err.code() == wslgate::ErrorCode::NotFound);
        CHECK(err.message() == "resource not found");
        CHECK(err.detail() == "");
        CHECK(err.what() == "resource not found");
    }

    SECTION("error with detail") {
        wslgate::Error err(wslgate::ErrorCode::InvalidConfirmation,
                           "Invalid or expired confirmation ID", "abc123def456");
        CHECK(err.code() == wslgate::ErrorCode::InvalidConfirmation);
        CHECK(err.detail() == "abc123def456");
        CHECK(err.what() == "Invalid or expired confirmation ID: abc123def456");
    }
}

TEST_CASE("make_error helpers", "[error]") {
    auto err = wslgate::make_error(wslgate::ErrorCode::Timeout,
                                   "Command timed out after 50ms");
    CHECK(err.code() == wslgate::ErrorCode::Timeout);
    CHECK(err.what() == "Command timed out after 50ms");
}

TEST_CASE("Result type error case", "[error]") {
    wslgate::Result<int> result = std::unexpected(
        wslgate::make_error(wslgate::ErrorCode::ValidationFailed, "Invalid timeout value"));

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == wslgate::ErrorCode::ValidationFailed);
}

TEST_CASE("make_fail converts to any Result", "[error]") {
    wslgate::Result<std::string> result =
        wslgate::make_fail(wslgate::make_error(wslgate::ErrorCode::SpawnFailed, "no shell"));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == wslgate::ErrorCode::SpawnFailed);

    CHECK(wslgate::ok_result().has_value());
}

TEST_CASE("error_code_to_string covers all codes", "[error]") {
    using wslgate::ErrorCode;
    using wslgate::error_code_to_string;

    CHECK(error_code_to_string(ErrorCode::Unknown) == "UNKNOWN");
    CHECK(error_code_to_string(ErrorCode::InvalidConfig) == "INVALID_CONFIG");
    CHECK(error_code_to_string(ErrorCode::InvalidArgument) == "INVALID_ARGUMENT");
    CHECK(error_code_to_string(ErrorCode::ValidationFailed) == "VALIDATION_FAILED");
    CHECK(error_code_to_string(ErrorCode::InvalidConfirmation) == "INVALID_CONFIRMATION");
    CHECK(error_code_to_string(ErrorCode::NotFound) == "NOT_FOUND");
    CHECK(error_code_to_string(ErrorCode::Timeout) == "TIMEOUT");
    CHECK(error_code_to_string(ErrorCode::SpawnFailed) == "SPAWN_FAILED");
    CHECK(error_code_to_string(ErrorCode::IoError) == "IO_ERROR");
    CHECK(error_code_to_string(ErrorCode::ProtocolError) == "PROTOCOL_ERROR");
    CHECK(error_code_to_string(ErrorCode::SerializationError) == "SERIALIZATION_ERROR");
    CHECK(error_code_to_string(ErrorCode::InternalError) == "INTERNAL_ERROR");
}

TEST_CASE("error_code_to_jsonrpc maps to JSON-RPC codes", "[error]") {
    using wslgate::ErrorCode;
    using wslgate::error_code_to_jsonrpc;

    CHECK(error_code_to_jsonrpc(ErrorCode::SerializationError) == -32700);
    CHECK(error_code_to_jsonrpc(ErrorCode::ProtocolError) == -32600);
    CHECK(error_code_to_jsonrpc(ErrorCode::InvalidConfirmation) == -32600);
    CHECK(error_code_to_jsonrpc(ErrorCode::NotFound) == -32601);
    CHECK(error_code_to_jsonrpc(ErrorCode::InvalidArgument) == -32602);
    CHECK(error_code_to_jsonrpc(ErrorCode::ValidationFailed) == -32602);
    CHECK(error_code_to_jsonrpc(ErrorCode::Timeout) == -32603);
    CHECK(error_code_to_jsonrpc(ErrorCode::SpawnFailed) == -32603);
}
