#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "test_helpers.hpp"
#include <sqlite3.h>
#include <thread>

using namespace chainwatch::storage;

// ===========================================
// Utility function tests
// ===========================================

TEST_CASE("Utility functions") {
    SUBCASE("Timestamp") {
        i64 ts1 = currentTimestamp();
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        i64 ts2 = currentTimestamp();

        CHECK(ts2 >= ts1);
        CHECK(ts2 - ts1 <= 1);
    }

    SUBCASE("Result code classification") {
        CHECK(errorFromCode(SQLITE_BUSY, "x").code == ERR_TRANSIENT_STORE);
        CHECK(errorFromCode(SQLITE_LOCKED, "x").code == ERR_TRANSIENT_STORE);
        CHECK(errorFromCode(SQLITE_IOERR_WRITE, "x").code == ERR_TRANSIENT_STORE);
        CHECK(errorFromCode(SQLITE_CONSTRAINT, "x").code == ERR_STORE);
        CHECK(errorFromCode(SQLITE_ERROR, "x").code == ERR_STORE);
        CHECK(isTransient(errorFromCode(SQLITE_BUSY, "x")));
        CHECK(std::string(errorKindName(ERR_TRANSIENT_STORE)) == "TransientStoreError");
    }
}

// ===========================================
// Core database operations
// ===========================================

TEST_CASE("Database lifecycle") {
    TestDB test_db("test_lifecycle");
    REQUIRE(test_db.ready);

    SUBCASE("Close and reopen") {
        CHECK(test_db.store.isOpen());
        test_db.store.close();
        CHECK_FALSE(test_db.store.isOpen());

        OpenOptions opts;
        opts.busy_timeout_ms = 3000;
        opts.sync_mode = OpenOptions::Synchronous::FULL;
        CHECK(test_db.store.open(test_db.path, opts).is_ok());
        CHECK(test_db.store.isOpen());
        CHECK(test_db.store.path() == test_db.path);
    }

    SUBCASE("Schema is versioned and idempotent") {
        CHECK(test_db.store.schemaVersion() == 6);
        CHECK(test_db.store.initializeSchema().is_ok());
        CHECK(test_db.store.schemaVersion() == 6);
        CHECK(test_db.count("SELECT COUNT(*) FROM schema_migrations") == 6);
    }

    SUBCASE("Every table exists") {
        const char *tables[] = {"chain_checkpoints",  "block_hashes",       "transfers",
                                "processed_transfers", "wallet_first_seen",  "wallet_graph_edges",
                                "entity_labels",      "watchlist_entries",  "transfer_entity_flags",
                                "onramp_providers",   "provider_wallets",   "onramp_transfers",
                                "attribution_audit",  "anomalies",          "wallet_clusters",
                                "known_tokens",       "provider_fiat_currencies"};
        for (const char *table : tables) {
            std::string sql = std::string("SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name='") +
                              table + "'";
            CHECK_MESSAGE(test_db.count(sql) == 1, table);
        }
    }

    SUBCASE("Quick check") { CHECK(test_db.store.quickCheck()); }

    SUBCASE("Operations on a closed store fail") {
        test_db.store.close();
        CHECK(test_db.store.initializeSchema().is_err());
        CHECK(test_db.store.executeSql("SELECT 1").is_err());
        auto tx = test_db.store.beginTransaction();
        CHECK_FALSE(tx->active());
        CHECK(tx->beginError().code == ERR_STORE);
    }
}

// ===========================================
// Statements
// ===========================================

TEST_CASE("Prepared statements") {
    TestDB test_db("test_statements");
    REQUIRE(test_db.ready);

    SUBCASE("Bind and read back") {
        Statement insert(test_db.store, "INSERT INTO block_hashes (chain_id, block_number, block_hash, parent_hash) "
                                        "VALUES (?, ?, ?, ?)");
        REQUIRE(insert.ok());
        insert.bind(1, static_cast<i64>(1)).bind(2, 7).bind(3, std::string("0xabc")).bind(4, std::string("0xdef"));
        REQUIRE(insert.exec().is_ok());
        CHECK(insert.changes() == 1);

        Statement select(test_db.store, "SELECT block_number, block_hash FROM block_hashes WHERE chain_id = ?");
        select.bind(1, 1);
        REQUIRE(select.next());
        CHECK(select.columnInt64(0) == 7);
        CHECK(select.columnText(1) == "0xabc");
        CHECK_FALSE(select.next());
        CHECK(select.ok());
    }

    SUBCASE("Optional binds NULL") {
        Statement insert(test_db.store, "INSERT INTO entity_labels (address, chain_id, entity_name, entity_type, "
                                        "label_source, created_at, updated_at) VALUES ('0x1', ?, 'n', 't', 's', 0, 0)");
        insert.bind(1, std::optional<i64>());
        REQUIRE(insert.exec().is_ok());

        Statement select(test_db.store, "SELECT chain_id FROM entity_labels");
        REQUIRE(select.next());
        CHECK(select.columnIsNull(0));
    }

    SUBCASE("Invalid SQL reports an error") {
        Statement bad(test_db.store, "SELEKT nothing");
        CHECK_FALSE(bad.ok());
        CHECK(bad.error().code == ERR_STORE);
        CHECK(bad.exec().is_err());
    }

    SUBCASE("Foreign keys are enforced") {
        Statement orphan(test_db.store,
                         "INSERT INTO processed_transfers (transfer_id, chain_id, processed_at) VALUES (999, 1, 0)");
        auto res = orphan.exec();
        REQUIRE(res.is_err());
        CHECK(res.error().code == ERR_STORE);
    }
}

// ===========================================
// Transactions
// ===========================================

TEST_CASE("Transaction guard") {
    TestDB test_db("test_txguard");
    REQUIRE(test_db.ready);

    SUBCASE("Commit persists") {
        {
            auto tx = test_db.store.beginTransaction();
            REQUIRE(tx->active());
            REQUIRE(test_db.store.executeSql("INSERT INTO chain_checkpoints VALUES (1, 10, '0xa', 0)").is_ok());
            CHECK(tx->commit().is_ok());
        }
        CHECK(test_db.count("SELECT COUNT(*) FROM chain_checkpoints") == 1);
    }

    SUBCASE("Destruction rolls back") {
        {
            auto tx = test_db.store.beginTransaction();
            REQUIRE(tx->active());
            REQUIRE(test_db.store.executeSql("INSERT INTO chain_checkpoints VALUES (1, 10, '0xa', 0)").is_ok());
        }
        CHECK(test_db.count("SELECT COUNT(*) FROM chain_checkpoints") == 0);
    }

    SUBCASE("Explicit rollback") {
        auto tx = test_db.store.beginTransaction();
        REQUIRE(test_db.store.executeSql("INSERT INTO chain_checkpoints VALUES (1, 10, '0xa', 0)").is_ok());
        tx->rollback();
        CHECK(test_db.count("SELECT COUNT(*) FROM chain_checkpoints") == 0);
        CHECK(tx->commit().is_err());
    }

    SUBCASE("Contention surfaces as a transient error") {
        OpenOptions impatient;
        impatient.busy_timeout_ms = 0;
        SqliteStore other;
        REQUIRE(other.open(test_db.path, impatient).is_ok());

        auto held = test_db.store.beginTransaction();
        REQUIRE(held->active());

        auto blocked = other.beginTransaction();
        CHECK_FALSE(blocked->active());
        CHECK(isTransient(blocked->beginError()));

        held->rollback();
        auto retried = other.beginTransaction();
        CHECK(retried->active());
    }
}
