// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "util/string_parsing.hpp"

using namespace relaychain::util;

TEST_CASE("SafeParseInt", "[string_parsing]") {
    CHECK(SafeParseInt("42", 0, 100) == 42);
    CHECK(SafeParseInt("-5", -10, 10) == -5);
    CHECK_FALSE(SafeParseInt("999", 0, 100).has_value());
    CHECK_FALSE(SafeParseInt("42x", 0, 100).has_value());
    CHECK_FALSE(SafeParseInt(" 42", 0, 100).has_value());
    CHECK_FALSE(SafeParseInt("", 0, 100).has_value());
    CHECK_FALSE(SafeParseInt("99999999999999999999", 0, 100).has_value());
}

TEST_CASE("SafeParsePort", "[string_parsing]") {
    CHECK(SafeParsePort("6001") == 6001);
    CHECK(SafeParsePort("1") == 1);
    CHECK(SafeParsePort("65535") == 65535);
    CHECK_FALSE(SafeParsePort("0").has_value());
    CHECK_FALSE(SafeParsePort("65536").has_value());
    CHECK_FALSE(SafeParsePort("-1").has_value());
    CHECK_FALSE(SafeParsePort("http").has_value());
    CHECK_FALSE(SafeParsePort("3001 ").has_value());
}

TEST_CASE("ParsePeerAddress", "[string_parsing]") {
    SECTION("host:port") {
        auto addr = ParsePeerAddress("127.0.0.1:6001");
        REQUIRE(addr.has_value());
        CHECK(addr->host == "127.0.0.1");
        CHECK(addr->port == 6001);
        CHECK(addr->ToString() == "127.0.0.1:6001");
    }

    SECTION("hostname") {
        auto addr = ParsePeerAddress("localhost:6002");
        REQUIRE(addr.has_value());
        CHECK(addr->host == "localhost");
        CHECK(addr->port == 6002);
    }

    SECTION("bracketed IPv6") {
        auto addr = ParsePeerAddress("[::1]:6001");
        REQUIRE(addr.has_value());
        CHECK(addr->host == "::1");
        CHECK(addr->port == 6001);
        CHECK(addr->ToString() == "[::1]:6001");
    }

    SECTION("ws:// form") {
        auto addr = ParsePeerAddress("ws://localhost:6001");
        REQUIRE(addr.has_value());
        CHECK(addr->host == "localhost");
        CHECK(addr->port == 6001);

        auto slash = ParsePeerAddress("ws://10.0.0.2:6003/");
        REQUIRE(slash.has_value());
        CHECK(slash->host == "10.0.0.2");
        CHECK(slash->port == 6003);
    }

    SECTION("rejected forms") {
        CHECK_FALSE(ParsePeerAddress("").has_value());
        CHECK_FALSE(ParsePeerAddress("localhost").has_value());
        CHECK_FALSE(ParsePeerAddress(":6001").has_value());
        CHECK_FALSE(ParsePeerAddress("localhost:").has_value());
        CHECK_FALSE(ParsePeerAddress("localhost:0").has_value());
        CHECK_FALSE(ParsePeerAddress("localhost:70000").has_value());
        CHECK_FALSE(ParsePeerAddress("::1:6001").has_value());
        CHECK_FALSE(ParsePeerAddress("[::1]6001").has_value());
        CHECK_FALSE(ParsePeerAddress("[]:6001").has_value());
        CHECK_FALSE(ParsePeerAddress("bad host:6001").has_value());
        CHECK_FALSE(ParsePeerAddress("ws://").has_value());
        CHECK_FALSE(ParsePeerAddress("http://localhost:6001").has_value());
    }
}

TEST_CASE("SplitList", "[string_parsing]") {
    CHECK(SplitList("").empty());
    CHECK(SplitList(" , ,").empty());
    CHECK(SplitList("a") == std::vector<std::string>{"a"});
    CHECK(SplitList("a,b") == std::vector<std::string>{"a", "b"});
    CHECK(SplitList(" ws://a:1 , b:2,,") == std::vector<std::string>{"ws://a:1", "b:2"});
}

TEST_CASE("JSON bodies", "[string_parsing]") {
    CHECK(JsonError("Invalid parameter") == "{\"error\":\"Invalid parameter\"}\n");
    CHECK(JsonError("say \"hi\"\n") == "{\"error\":\"say \\\"hi\\\"\\n\"}\n");
    CHECK(JsonSuccess("connecting") == "{\"result\":\"connecting\"}\n");
    CHECK(EscapeJSONString(std::string("\x01", 1)) == "\\u0001");
}
