#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "test_helpers.hpp"
#include <cstdio>
#include <fstream>

using namespace chainwatch::pipeline;

TEST_CASE("Memory block source") {
    MemoryBlockSource source;
    CHECK_FALSE(source.highest(1).has_value());
    CHECK_FALSE(source.fetchBlock(1, 1).value().has_value());

    source.put(1, makeBlock(99, 1, "0xa", "0x0", 1000));
    source.put(1, makeBlock(1, 2, "0xb", "0xa", 1012));

    auto first = source.fetchBlock(1, 1).value();
    REQUIRE(first.has_value());
    CHECK(first->chain_id == 1);
    CHECK(first->hash == "0xa");
    CHECK(source.highest(1) == std::optional<i64>(2));
    CHECK_FALSE(source.fetchBlock(137, 1).value().has_value());

    SUBCASE("Put replaces a height") {
        source.put(1, makeBlock(1, 2, "0xb2", "0xa", 1013));
        CHECK(source.fetchBlock(1, 2).value()->hash == "0xb2");
        CHECK(source.highest(1) == std::optional<i64>(2));
    }

    SUBCASE("Put all keeps each block's chain") {
        source.putAll({makeBlock(137, 5, "0xp5", "0xp4", 10), makeBlock(1, 3, "0xc", "0xb", 1024)});
        CHECK(source.highest(137) == std::optional<i64>(5));
        CHECK(source.highest(1) == std::optional<i64>(3));
    }
}

TEST_CASE("Block JSON") {
    SUBCASE("Full block") {
        auto parsed = parseBlockJson(R"({"chain_id": 1, "number": 19000000, "hash": "0xAA", "parent_hash": "0x99",
            "timestamp": 1700000000, "transfers": [
              {"tx_hash": "0xt1", "log_index": 3, "token_address": "0xusdc", "from": "0xa", "to": "0xb",
               "amount": "115792089237316195423570985008687907853269984665640564039457584007913129639935",
               "symbol": "USDC", "decimals": 6},
              {"tx_hash": "0xt2", "log_index": 4, "from": "0xb", "to": "0xc", "amount": 42}
            ]})");
        REQUIRE(parsed.is_ok());
        const auto &block = parsed.value();
        CHECK(block.chain_id == 1);
        CHECK(block.number == 19000000);
        CHECK(block.hash == "0xAA");
        CHECK(block.timestamp == 1700000000);
        REQUIRE(block.transfers.size() == 2);
        CHECK(block.transfers[0].log_index == 3);
        CHECK(block.transfers[0].decimals == 6);
        CHECK(block.transfers[0].amount.size() == 78);
        CHECK(block.transfers[1].amount == "42");
        CHECK(block.transfers[1].token_address.empty());
        CHECK(block.transfers[1].decimals == 0);
    }

    SUBCASE("Transfers are optional") {
        auto parsed = parseBlockJson(R"({"chain_id": 137, "number": 5, "hash": "0x5", "parent_hash": "0x4"})");
        REQUIRE(parsed.is_ok());
        CHECK(parsed.value().transfers.empty());
        CHECK(parsed.value().timestamp == 0);
    }

    SUBCASE("Malformed input") {
        CHECK(parseBlockJson("{not json").error().code == ERR_INVALID_BLOCK);
        CHECK(parseBlockJson(R"({"chain_id": 1, "number": 5})").error().code == ERR_INVALID_BLOCK);
        CHECK(parseBlockJson(R"({"chain_id": 1, "number": "five", "hash": "0x5", "parent_hash": "0x4"})").is_err());
    }
}

TEST_CASE("JSONL loading") {
    const std::string path = "test_blocks.jsonl";

    SUBCASE("Blank lines are skipped") {
        {
            std::ofstream out(path);
            out << R"({"chain_id": 1, "number": 1, "hash": "0x1", "parent_hash": "0x0"})" << "\n";
            out << "\n   \n";
            out << R"({"chain_id": 1, "number": 2, "hash": "0x2", "parent_hash": "0x1"})" << "\n";
        }
        auto blocks = loadBlocksJsonl(path);
        REQUIRE(blocks.is_ok());
        REQUIRE(blocks.value().size() == 2);
        CHECK(blocks.value()[1].number == 2);
    }

    SUBCASE("Errors name the line") {
        {
            std::ofstream out(path);
            out << R"({"chain_id": 1, "number": 1, "hash": "0x1", "parent_hash": "0x0"})" << "\n";
            out << "garbage\n";
        }
        auto blocks = loadBlocksJsonl(path);
        REQUIRE(blocks.is_err());
        CHECK(errorMessage(blocks.error()).find(path + ":2") != std::string::npos);
    }

    SUBCASE("Missing file") { CHECK(loadBlocksJsonl("does_not_exist.jsonl").is_err()); }

    std::remove(path.c_str());
}
