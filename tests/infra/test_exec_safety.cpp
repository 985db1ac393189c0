#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>

#include "wslgate/core/config.hpp"
#include "wslgate/infra/exec_safety.hpp"

using namespace wslgate;
using namespace wslgate::infra;

// ---------------------------------------------------------------------------
// sanitize_command
// ---------------------------------------------------------------------------

TEST_CASE("Metacharacters are stripped", "[infra][exec_safety]") {
    auto r = sanitize_command("echo hi; rm -rf / && ls | grep x `id` $HOME &");
    REQUIRE(r.has_value());
    for (char c : kShellMetacharacters) {
        CHECK(r->str().find(c) == std::string::npos);
    }
    CHECK(r->str() == "echo hi rm -rf /  ls  grep x id HOME");
}

TEST_CASE("Semicolon chain keeps both halves", "[infra][exec_safety]") {
    auto r = sanitize_command("echo hi; rm -rf /");
    REQUIRE(r.has_value());
    CHECK(r->str() == "echo hi rm -rf /");
}

TEST_CASE("Backslashes become forward slashes", "[infra][exec_safety]") {
    auto r = sanitize_command("cat C:\\Users\\me\\notes.txt");
    REQUIRE(r.has_value());
    CHECK(r->str() == "cat C:/Users/me/notes.txt");
}

TEST_CASE("Parent and home references are removed", "[infra][exec_safety]") {
    SECTION("parent traversal") {
        auto r = sanitize_command("cat ../../etc/passwd");
        REQUIRE(r.has_value());
        CHECK(r->str() == "cat //etc/passwd");
    }

    SECTION("home expansion") {
        auto r = sanitize_command("ls ~/projects");
        REQUIRE(r.has_value());
        CHECK(r->str() == "ls /projects");
    }

    SECTION("dots inside names are removed too") {
        auto r = sanitize_command("cat release..notes");
        REQUIRE(r.has_value());
        CHECK(r->str() == "cat releasenotes");
    }
}

TEST_CASE("Surrounding whitespace is trimmed", "[infra][exec_safety]") {
    auto r = sanitize_command("   ls -la \t\n");
    REQUIRE(r.has_value());
    CHECK(r->str() == "ls -la");
}

TEST_CASE("Empty after sanitization is rejected", "[infra][exec_safety]") {
    for (const char* raw : {"", "   ", ";;&&||", "$`", " .. ~ "}) {
        auto r = sanitize_command(raw);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::ValidationFailed);
        CHECK(r.error().message() == "Invalid command: Empty after sanitization");
    }
}

// ---------------------------------------------------------------------------
// validate_working_dir
// ---------------------------------------------------------------------------

TEST_CASE("Working dir absent or empty means none", "[infra][exec_safety]") {
    auto none = validate_working_dir(std::nullopt);
    REQUIRE(none.has_value());
    CHECK_FALSE(none->has_value());

    auto empty = validate_working_dir(std::string{});
    REQUIRE(empty.has_value());
    CHECK_FALSE(empty->has_value());
}

TEST_CASE("Working dir keeps dots and tildes", "[infra][exec_safety]") {
    auto r = validate_working_dir(std::string("~/src/../build"));
    REQUIRE(r.has_value());
    REQUIRE(r->has_value());
    CHECK(**r == "~/src/../build");
}

TEST_CASE("Working dir strips metacharacters and backslashes", "[infra][exec_safety]") {
    auto r = validate_working_dir(std::string("C:\\work;rm"));
    REQUIRE(r.has_value());
    CHECK(r->value() == "C:/workrm");
}

TEST_CASE("Working dir of only metacharacters is invalid", "[infra][exec_safety]") {
    auto r = validate_working_dir(std::string(" ;|& "));
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code() == ErrorCode::ValidationFailed);
    CHECK(r.error().message() == "Invalid working directory");
}

// ---------------------------------------------------------------------------
// validate_timeout
// ---------------------------------------------------------------------------

TEST_CASE("Timeout absent or zero means none", "[infra][exec_safety]") {
    CHECK_FALSE(validate_timeout(std::nullopt)->has_value());
    CHECK_FALSE(validate_timeout(0.0)->has_value());
}

TEST_CASE("Timeout fractions round up", "[infra][exec_safety]") {
    auto r = validate_timeout(49.2);
    REQUIRE(r.has_value());
    CHECK(r->value() == 50);
}

TEST_CASE("Bad timeout values are rejected", "[infra][exec_safety]") {
    for (double bad : {-1.0, std::numeric_limits<double>::infinity(),
                       std::numeric_limits<double>::quiet_NaN()}) {
        auto r = validate_timeout(bad);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().message() == "Invalid timeout value");
    }
}

TEST_CASE("Timeouts beyond the ceiling are rejected", "[infra][exec_safety]") {
    for (double huge : {1e13, 1e19, static_cast<double>(kMaxTimeoutMs) + 1.0}) {
        auto r = validate_timeout(huge);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().message() == "Invalid timeout value");
    }

    auto top = validate_timeout(static_cast<double>(kMaxTimeoutMs));
    REQUIRE(top.has_value());
    CHECK(top->value() == kMaxTimeoutMs);
}

// ---------------------------------------------------------------------------
// validate_request
// ---------------------------------------------------------------------------

TEST_CASE("validate_request runs all validators", "[infra][exec_safety]") {
    SECTION("valid request") {
        auto r = validate_request(CommandRequest{
            .raw_command = "ls -la",
            .working_dir = "/home/user",
            .timeout_ms = 1000.0,
        });
        REQUIRE(r.has_value());
        CHECK(r->command.str() == "ls -la");
        CHECK(r->working_dir == std::optional<std::string>("/home/user"));
        CHECK(r->timeout_ms == std::optional<int64_t>(1000));
    }

    SECTION("first failure wins") {
        auto r = validate_request(CommandRequest{
            .raw_command = "ls",
            .working_dir = ";",
            .timeout_ms = -3.0,
        });
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().message() == "Invalid working directory");
    }
}

// ---------------------------------------------------------------------------
// sanitize_argument
// ---------------------------------------------------------------------------

TEST_CASE("Argument fragments cannot break out of quotes", "[infra][exec_safety]") {
    CHECK(sanitize_argument("PATH\"; rm -rf / #") == "PATH rm -rf / #");
    CHECK(sanitize_argument("  /mnt/c  ") == "/mnt/c");
    CHECK(sanitize_argument("../..").empty());
}
