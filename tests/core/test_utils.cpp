#include <catch2/catch_test_macros.hpp>

#include "wslgate/core/utils.hpp"

TEST_CASE("generate_id produces expected length", "[utils]") {
    SECTION("default length") {
        CHECK(wslgate::utils::generate_id().size() == 16);
    }

    SECTION("custom length") {
        CHECK(wslgate::utils::generate_id(12).size() == 12);
    }

    SECTION("contains only lowercase alphanumeric characters") {
        auto id = wslgate::utils::generate_id(100);
        for (char c : id) {
            bool valid = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
            CHECK(valid);
        }
    }

    SECTION("successive calls produce different IDs") {
        CHECK(wslgate::utils::generate_id(16) != wslgate::utils::generate_id(16));
    }
}

TEST_CASE("trim removes whitespace", "[utils]") {
    CHECK(wslgate::utils::trim("  hello  ") == "hello");
    CHECK(wslgate::utils::trim("\t\nhello\r\n") == "hello");
    CHECK(wslgate::utils::trim("   ").empty());
    CHECK(wslgate::utils::trim("") == "");
}

TEST_CASE("split and join", "[utils]") {
    auto parts = wslgate::utils::split("a b  c", ' ');
    REQUIRE(parts.size() == 4);
    CHECK(parts[0] == "a");
    CHECK(parts[2].empty());

    CHECK(wslgate::utils::join({"wsl.exe", "--exec"}, " ") == "wsl.exe --exec");
    CHECK(wslgate::utils::join({}, ",").empty());
}

TEST_CASE("replace_all and to_lower", "[utils]") {
    CHECK(wslgate::utils::replace_all("cd ../../etc", "..", "") == "cd //etc");
    CHECK(wslgate::utils::replace_all("abc", "", "x") == "abc");
    CHECK(wslgate::utils::to_lower("RM -RF") == "rm -rf");
}
