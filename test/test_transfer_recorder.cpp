#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "test_helpers.hpp"

using namespace chainwatch::ingest;

TEST_SUITE("Transfer recorder") {
    TEST_CASE("Idempotent recording") {
        TestDB test_db("test_recorder_idempotent");
        REQUIRE(test_db.ready);
        TransferRecorder recorder(test_db.store);

        auto t = makeTransfer(1, 10, "0xtx1", 0, "0xa", "0xb", "100", 1000);

        auto first = recorder.record(t);
        REQUIRE(first.is_ok());
        CHECK(first.value().inserted);
        CHECK(first.value().id > 0);

        auto second = recorder.record(t);
        REQUIRE(second.is_ok());
        CHECK_FALSE(second.value().inserted);
        CHECK(second.value().id == first.value().id);

        CHECK(recorder.count(1).value() == 1);
    }

    TEST_CASE("Identity key") {
        TestDB test_db("test_recorder_key");
        REQUIRE(test_db.ready);
        TransferRecorder recorder(test_db.store);

        auto base = makeTransfer(1, 10, "0xtx1", 0, "0xa", "0xb", "100", 1000);
        auto other_log = base;
        other_log.log_index = 1;
        auto other_chain = base;
        other_chain.chain_id = 137;

        auto a = recorder.record(base);
        auto b = recorder.record(other_log);
        auto c = recorder.record(other_chain);
        REQUIRE(a.is_ok());
        REQUIRE(b.is_ok());
        REQUIRE(c.is_ok());
        CHECK(b.value().inserted);
        CHECK(c.value().inserted);
        CHECK(a.value().id != b.value().id);
        CHECK(a.value().id != c.value().id);
    }

    TEST_CASE("Normalisation") {
        TestDB test_db("test_recorder_normalise");
        REQUIRE(test_db.ready);
        TransferRecorder recorder(test_db.store);

        auto upper = makeTransfer(1, 10, "0xABCDEF", 2, "0xAAAA", "0xBBBB", "000250", 1000);
        auto recorded = recorder.record(upper);
        REQUIRE(recorded.is_ok());

        auto stored = recorder.get(recorded.value().id);
        REQUIRE(stored.is_ok());
        REQUIRE(stored.value().has_value());
        CHECK(stored.value()->tx_hash == "0xabcdef");
        CHECK(stored.value()->from_address == "0xaaaa");
        CHECK(stored.value()->to_address == "0xbbbb");
        CHECK(stored.value()->amount == "250");

        // Same key in different case is the same transfer
        auto lower = makeTransfer(1, 10, "0xabcdef", 2, "0xaaaa", "0xbbbb", "250", 1000);
        auto again = recorder.record(lower);
        REQUIRE(again.is_ok());
        CHECK_FALSE(again.value().inserted);
        CHECK(again.value().id == recorded.value().id);
    }

    TEST_CASE("Rejects malformed transfers") {
        TestDB test_db("test_recorder_invalid");
        REQUIRE(test_db.ready);
        TransferRecorder recorder(test_db.store);

        auto bad_amount = makeTransfer(1, 10, "0xtx", 0, "0xa", "0xb", "12.5", 1000);
        auto res = recorder.record(bad_amount);
        REQUIRE(res.is_err());
        CHECK(res.error().code == ERR_INVALID_AMOUNT);

        auto no_from = makeTransfer(1, 10, "0xtx", 0, "", "0xb", "1", 1000);
        auto res2 = recorder.record(no_from);
        REQUIRE(res2.is_err());
        CHECK(res2.error().code == ERR_INVALID_BLOCK);

        CHECK(recorder.count(1).value() == 0);
    }

    TEST_CASE("Listing") {
        TestDB test_db("test_recorder_list");
        REQUIRE(test_db.ready);
        TransferRecorder recorder(test_db.store);

        REQUIRE(recorder.record(makeTransfer(1, 12, "0xt3", 0, "0xa", "0xb", "3", 1200)).is_ok());
        REQUIRE(recorder.record(makeTransfer(1, 10, "0xt1", 1, "0xa", "0xb", "2", 1000)).is_ok());
        REQUIRE(recorder.record(makeTransfer(1, 10, "0xt0", 0, "0xa", "0xb", "1", 1000)).is_ok());

        auto all = recorder.listForChain(1);
        REQUIRE(all.is_ok());
        REQUIRE(all.value().size() == 3);
        CHECK(all.value()[0].tx_hash == "0xt0");
        CHECK(all.value()[1].tx_hash == "0xt1");
        CHECK(all.value()[2].tx_hash == "0xt3");

        auto above = recorder.listAbove(1, 10);
        REQUIRE(above.is_ok());
        REQUIRE(above.value().size() == 1);
        CHECK(above.value()[0].block_number == 12);
    }

    TEST_CASE("Fetched transfer flattening") {
        auto block = makeBlock(1, 42, "0xblock", "0xparent", 4200, {makeFetched("0xtx", 3, "0xa", "0xb", "7", "USDT", 6)});
        Transfer t = chainwatch::ingest::makeTransfer(block, block.transfers[0]);
        CHECK(t.chain_id == 1);
        CHECK(t.block_number == 42);
        CHECK(t.block_hash == "0xblock");
        CHECK(t.block_timestamp == 4200);
        CHECK(t.log_index == 3);
        CHECK(t.token_symbol == "USDT");
        CHECK(t.token_decimals == 6);
    }
}
