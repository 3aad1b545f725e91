#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "test_helpers.hpp"
#include <chrono>
#include <functional>
#include <thread>

using namespace chainwatch::pipeline;

namespace {

    config::IndexerConfig serviceConfig(const std::string &path) {
        config::IndexerConfig c;
        c.database.path = path;
        c.chains = {makeChain(1, "ethereum"), makeChain(137, "polygon", 100)};
        c.anomaly_detection = quietAnomalies();
        c.retry.initial_backoff_ms = 5;
        c.retry.max_backoff_ms = 20;
        return c;
    }

    void publishLinear(MemoryBlockSource &source, i64 chain_id, i64 first, i64 count) {
        std::string parent = "0x0";
        for (i64 n = first; n < first + count; ++n) {
            std::string hash = "0x" + std::to_string(chain_id) + "h" + std::to_string(n);
            source.put(chain_id, makeBlock(chain_id, n, hash, parent, 1000 + n,
                                           {makeFetched("0xt" + std::to_string(n), 0, "0xa", "0xb", "1")}));
            parent = hash;
        }
    }

    bool waitUntil(const std::function<bool()> &predicate, int timeout_ms = 5000) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            if (predicate())
                return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return predicate();
    }

    /// Fails the first `failures` fetches with a transient error
    class FlakySource : public BlockSource {
      public:
        FlakySource(MemoryBlockSource &inner, int failures) : inner_(inner), failures_(failures) {}

        Result<std::optional<FetchedBlock>, Error> fetchBlock(i64 chain_id, i64 height) override {
            if (failures_ > 0) {
                --failures_;
                return Result<std::optional<FetchedBlock>, Error>::err(transient_store("rpc timeout"));
            }
            return inner_.fetchBlock(chain_id, height);
        }

      private:
        MemoryBlockSource &inner_;
        int failures_;
    };

} // namespace

TEST_SUITE("Indexer service") {
    TEST_CASE("Configured tokens are seeded on open") {
        TestDB test_db("test_service_tokens");
        REQUIRE(test_db.ready);
        MemoryBlockSource source;

        auto cfg = serviceConfig(test_db.path);
        KnownToken usdc;
        usdc.chain_id = 1;
        usdc.token_address = "0xtoken";
        usdc.symbol = "USDC";
        usdc.decimals = 6;
        cfg.chains[0].tokens = {usdc};

        {
            IndexerService service(cfg, source);
            REQUIRE(service.open().is_ok());
        }
        IndexerService reopened(cfg, source);
        REQUIRE(reopened.open().is_ok());

        CHECK(test_db.count("SELECT COUNT(*) FROM known_tokens") == 1);
        auto found = reopened.indexer(1)->tokens().lookup(1, "0xtoken");
        REQUIRE(found.is_ok());
        REQUIRE(found.value().has_value());
        CHECK(found.value()->decimals == 6);
        CHECK(reopened.indexer(137)->tokens().listForChain(137).value().empty());
    }

    TEST_CASE("Pump drives each chain independently") {
        TestDB test_db("test_service_pump");
        REQUIRE(test_db.ready);
        MemoryBlockSource source;
        publishLinear(source, 1, 1, 5);
        publishLinear(source, 137, 100, 3);

        IndexerService service(serviceConfig(test_db.path), source);
        REQUIRE(service.open().is_ok());
        REQUIRE(service.open().is_ok());

        auto eth = service.pump(1, 100);
        REQUIRE(eth.is_ok());
        CHECK(eth.value().blocks_applied == 5);
        CHECK(eth.value().idle);
        CHECK_FALSE(eth.value().halted);

        auto partial = service.pump(137, 2);
        REQUIRE(partial.is_ok());
        CHECK(partial.value().blocks_applied == 2);
        CHECK_FALSE(partial.value().idle);

        CHECK(service.pump(137, 10).value().blocks_applied == 1);
        CHECK(service.indexer(1)->nextHeight().value() == 6);
        CHECK(service.indexer(137)->nextHeight().value() == 103);
        CHECK(service.indexer(42) == nullptr);
        CHECK(service.pump(42, 1).is_err());

        // Both chains share one database but never each other's rows
        CHECK(test_db.count("SELECT COUNT(*) FROM transfers WHERE chain_id = 1") == 5);
        CHECK(test_db.count("SELECT COUNT(*) FROM transfers WHERE chain_id = 137") == 3);
        CHECK(service.indexer(1)->graph().edge("0xa", "0xb", 1).value()->transfer_count == 5);
        CHECK(service.indexer(137)->graph().edge("0xa", "0xb", 137).value()->transfer_count == 3);
    }

    TEST_CASE("A halted chain does not stop the others") {
        TestDB test_db("test_service_isolation");
        REQUIRE(test_db.ready);
        MemoryBlockSource source;
        publishLinear(source, 1, 1, 3);
        publishLinear(source, 137, 100, 3);

        auto cfg = serviceConfig(test_db.path);
        cfg.chains[0].max_reorg_depth = 1;
        IndexerService service(cfg, source);
        REQUIRE(service.open().is_ok());
        REQUIRE(service.pump(1, 10).is_ok());

        // Rewrite ethereum from block 1 on; the fork is deeper than allowed
        std::string parent = "0xother";
        for (i64 n = 1; n <= 4; ++n) {
            std::string hash = "0xf" + std::to_string(n);
            source.put(1, makeBlock(1, n, hash, parent, 2000 + n));
            parent = hash;
        }

        auto halted = service.pump(1, 10);
        REQUIRE(halted.is_ok());
        CHECK(halted.value().halted);
        CHECK(service.indexer(1)->requiresResume());

        auto polygon = service.pump(137, 10);
        REQUIRE(polygon.is_ok());
        CHECK(polygon.value().blocks_applied == 3);

        auto health = service.health();
        REQUIRE(health.size() == 2);
        CHECK(health[0].chain_id == 1);
        CHECK(health[0].status == ChainStatus::Halted);
        CHECK(health[0].last_error_kind == "DeepReorgError");
        CHECK(std::string(chainStatusName(health[0].status)) == "halted");
        CHECK(health[1].chain_id == 137);
        CHECK(health[1].status == ChainStatus::Healthy);
        CHECK(health[1].last_height == std::optional<i64>(102));

        // Still halted on the next pump
        CHECK(service.pump(1, 10).value().halted);
        CHECK(service.indexer(1)->nextHeight().value() == 4);
    }

    TEST_CASE("A reorg is followed by re-ingestion of the new branch") {
        TestDB test_db("test_service_reorg");
        REQUIRE(test_db.ready);
        MemoryBlockSource source;
        publishLinear(source, 1, 1, 3);

        IndexerService service(serviceConfig(test_db.path), source);
        REQUIRE(service.open().is_ok());
        REQUIRE(service.pump(1, 10).is_ok());

        source.put(1, makeBlock(1, 3, "0xnew3", "0x1h2", 1103, {makeFetched("0xn3", 0, "0xb", "0xa", "2")}));
        source.put(1, makeBlock(1, 4, "0xnew4", "0xnew3", 1104));

        auto pumped = service.pump(1, 10);
        REQUIRE(pumped.is_ok());
        CHECK(pumped.value().rollbacks == 1);
        CHECK(pumped.value().blocks_applied == 2);
        CHECK(pumped.value().idle);
        CHECK_FALSE(pumped.value().halted);

        auto cp = service.indexer(1)->checkpoints().get(1).value();
        CHECK(cp->last_indexed_block == 4);
        CHECK(cp->last_block_hash == "0xnew4");
        CHECK(service.indexer(1)->graph().edge("0xa", "0xb", 1).value()->transfer_count == 2);
        CHECK(service.indexer(1)->graph().edge("0xb", "0xa", 1).value()->transfer_count == 1);
    }

    TEST_CASE("Threads ingest until stopped") {
        TestDB test_db("test_service_threads");
        REQUIRE(test_db.ready);
        MemoryBlockSource source;
        publishLinear(source, 1, 1, 10);
        publishLinear(source, 137, 100, 10);

        IndexerService service(serviceConfig(test_db.path), source);
        REQUIRE(service.start().is_ok());
        CHECK(service.running());

        CHECK(waitUntil([&]() { return service.indexer(1)->nextHeight().value() == 11; }));
        CHECK(waitUntil([&]() { return service.indexer(137)->nextHeight().value() == 110; }));

        // Blocks published later are picked up by the polling loop
        source.put(1, makeBlock(1, 11, "0xlate", "0x1h10", 2000));
        CHECK(waitUntil([&]() { return service.indexer(1)->nextHeight().value() == 12; }));

        service.stop();
        CHECK_FALSE(service.running());
        CHECK(test_db.count("SELECT COUNT(*) FROM transfers") == 20);
    }

    TEST_CASE("Fetch failures are retried without moving the checkpoint") {
        TestDB test_db("test_service_flaky");
        REQUIRE(test_db.ready);
        MemoryBlockSource blocks;
        publishLinear(blocks, 1, 1, 2);
        FlakySource source(blocks, 2);

        auto cfg = serviceConfig(test_db.path);
        cfg.chains.pop_back();
        IndexerService service(cfg, source);
        REQUIRE(service.open().is_ok());

        auto first = service.pump(1, 10);
        REQUIRE(first.is_err());
        CHECK(isTransient(first.error()));
        CHECK(service.health()[0].status == ChainStatus::Retrying);
        CHECK(service.health()[0].last_error_kind == "TransientStoreError");
        CHECK(service.indexer(1)->nextHeight().value() == 1);

        CHECK(service.pump(1, 10).is_err());

        auto recovered = service.pump(1, 10);
        REQUIRE(recovered.is_ok());
        CHECK(recovered.value().blocks_applied == 2);
        CHECK(service.health()[0].status == ChainStatus::Healthy);
    }
}
