// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "chain/block.hpp"
#include <nlohmann/json.hpp>

using namespace relaychain;
using namespace relaychain::chain;
using json = nlohmann::json;

static const char* GENESIS_HASH =
    "df0dc66f3f6076119b08b371a5430b25cf9bc3db7408fcfe081bc72c3f59f281";

TEST_CASE("Genesis block is fixed", "[block][genesis]") {
    Block genesis = CreateGenesisBlock();

    CHECK(genesis.index == 0);
    CHECK(genesis.previous_hash == "0");
    CHECK(genesis.timestamp == 1465154705);
    CHECK(genesis.payload == "Genesis Block");
    CHECK(genesis.hash == GENESIS_HASH);
    CHECK(genesis.HasValidHash());

    // Identical on every call
    CHECK(CreateGenesisBlock() == genesis);
}

TEST_CASE("CalculateBlockHash - field concatenation", "[block][hash]") {
    SECTION("integral timestamp") {
        CHECK(CalculateBlockHash(1, GENESIS_HASH, 1700000000, "hello") ==
              "788e17c95990dc321b997bee95e3cce909fa82b577ef8d0fc7b0ab008f7d8429");
    }

    SECTION("fractional timestamp") {
        CHECK(CalculateBlockHash(1, GENESIS_HASH, 1700000000.25, "hello") ==
              "17f4d71d925c84aefcf6365d5ad3bb4bf67e7eb6683fc94fc001d80e49f2bbd4");
    }

    SECTION("every field is committed") {
        std::string base = CalculateBlockHash(1, GENESIS_HASH, 1700000000, "hello");
        CHECK(CalculateBlockHash(2, GENESIS_HASH, 1700000000, "hello") != base);
        CHECK(CalculateBlockHash(1, "0", 1700000000, "hello") != base);
        CHECK(CalculateBlockHash(1, GENESIS_HASH, 1700000001, "hello") != base);
        CHECK(CalculateBlockHash(1, GENESIS_HASH, 1700000000, "hellO") != base);
    }
}

TEST_CASE("FormatTimestamp", "[block]") {
    CHECK(FormatTimestamp(1465154705) == "1465154705");
    CHECK(FormatTimestamp(0) == "0");
    CHECK(FormatTimestamp(1465154705.5) == "1465154705.5");
    CHECK(FormatTimestamp(1700000000.25) == "1700000000.25");
}

TEST_CASE("Block - HasValidHash detects tampering", "[block]") {
    Block block;
    block.index = 1;
    block.previous_hash = GENESIS_HASH;
    block.timestamp = 1700000000;
    block.payload = "hello";
    block.hash = block.CalculateHash();
    REQUIRE(block.HasValidHash());

    SECTION("payload changed") {
        block.payload = "goodbye";
        CHECK_FALSE(block.HasValidHash());
    }

    SECTION("hash replaced") {
        block.hash = std::string(64, '0');
        CHECK_FALSE(block.HasValidHash());
    }
}

TEST_CASE("Block - ToString", "[block]") {
    SECTION("calendar time for ordinary timestamps") {
        std::string text = CreateGenesisBlock().ToString();
        CHECK(text.find("1465154705") != std::string::npos);
        CHECK(text.find("2016-06-05 19:25:05 UTC") != std::string::npos);
    }

    SECTION("timestamps beyond the calendar range from a peer") {
        for (double timestamp : {1e300, -1e300, 9.3e18}) {
            Block block;
            block.index = 1;
            block.previous_hash = GENESIS_HASH;
            block.timestamp = timestamp;
            block.payload = "x";
            block.hash = block.CalculateHash();

            // Arrives over the wire as JSON and links correctly
            nlohmann::json j = block;
            auto parsed = BlockFromJson(j);
            REQUIRE(parsed.has_value());
            REQUIRE(parsed->HasValidHash());

            std::string text = parsed->ToString();
            INFO(text);
            CHECK(text.find("out of range") != std::string::npos);
            CHECK(text.find(FormatTimestamp(timestamp)) != std::string::npos);
        }
    }
}

TEST_CASE("Block JSON form", "[block][json]") {
    Block genesis = CreateGenesisBlock();

    SECTION("field names") {
        json j = genesis;
        CHECK(j["index"] == 0);
        CHECK(j["previousHash"] == "0");
        CHECK(j["timestamp"] == 1465154705);
        CHECK(j["data"] == "Genesis Block");
        CHECK(j["hash"] == GENESIS_HASH);
    }

    SECTION("parse back") {
        json j = genesis;
        auto parsed = BlockFromJson(json::parse(j.dump()));
        REQUIRE(parsed.has_value());
        CHECK(*parsed == genesis);
    }

    SECTION("fractional timestamp survives") {
        json j = {{"index", 3}, {"previousHash", "ab"}, {"timestamp", 12.5},
                  {"data", "x"}, {"hash", "cd"}};
        auto parsed = BlockFromJson(j);
        REQUIRE(parsed.has_value());
        CHECK(parsed->timestamp == 12.5);
    }

    SECTION("hash is not verified by the parser") {
        json j = genesis;
        j["hash"] = "not-a-digest";
        auto parsed = BlockFromJson(j);
        REQUIRE(parsed.has_value());
        CHECK_FALSE(parsed->HasValidHash());
    }
}

TEST_CASE("BlockFromJson rejects malformed input", "[block][json]") {
    json good = CreateGenesisBlock();

    SECTION("not an object") {
        CHECK_FALSE(BlockFromJson(json::array()).has_value());
        CHECK_FALSE(BlockFromJson(json("block")).has_value());
    }

    SECTION("missing fields") {
        for (const char* field : {"index", "previousHash", "timestamp", "data", "hash"}) {
            json j = good;
            j.erase(field);
            CHECK_FALSE(BlockFromJson(j).has_value());
        }
    }

    SECTION("wrong types") {
        json j = good;
        j["index"] = "0";
        CHECK_FALSE(BlockFromJson(j).has_value());

        j = good;
        j["index"] = -1;
        CHECK_FALSE(BlockFromJson(j).has_value());

        j = good;
        j["timestamp"] = "1465154705";
        CHECK_FALSE(BlockFromJson(j).has_value());

        j = good;
        j["data"] = json::object();
        CHECK_FALSE(BlockFromJson(j).has_value());

        j = good;
        j["previousHash"] = nullptr;
        CHECK_FALSE(BlockFromJson(j).has_value());
    }
}
