#pragma once

#include <atomic>
#include <condition_variable>
#include <datapod/datapod.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "chainwatch/config/config.hpp"
#include "chainwatch/pipeline/block_source.hpp"
#include "chainwatch/pipeline/chain_indexer.hpp"
#include "chainwatch/storage/sqlite_store.hpp"

namespace chainwatch::pipeline {

    using namespace datapod;

    struct PumpResult {
        i64 blocks_applied = 0; // extensions and duplicates
        i64 rollbacks = 0;
        bool idle = false;   // source has no block at the next height
        bool halted = false; // chain stopped on a halting error
    };

    /// Runs one sequential ingestion task per configured chain. Each chain has its own
    /// connection and indexer; a failure on one chain never touches another.
    class IndexerService {
      public:
        IndexerService(config::IndexerConfig config, BlockSource &source);
        ~IndexerService();

        IndexerService(const IndexerService &) = delete;
        IndexerService &operator=(const IndexerService &) = delete;

        /// Open per-chain stores and apply the schema. Idempotent.
        Result<void, Error> open();

        /// open(), then spawn one thread per chain
        Result<void, Error> start();

        /// Signal every chain loop and join
        void stop();

        bool running() const { return running_.load(); }

        /// Drive one chain synchronously for up to max_blocks steps. Transient failures come
        /// back as errors with the checkpoint unchanged; halting failures set `halted`.
        Result<PumpResult, Error> pump(i64 chain_id, i64 max_blocks);

        std::vector<ChainHealth> health() const;

        /// nullptr when the chain is not configured or not opened
        ChainIndexer *indexer(i64 chain_id);

        const config::IndexerConfig &config() const { return config_; }

      private:
        struct ChainTask {
            config::ChainConfig chain;
            std::unique_ptr<storage::SqliteStore> store;
            std::unique_ptr<ChainIndexer> indexer;
            std::thread thread;
        };

        config::IndexerConfig config_;
        BlockSource &source_;
        std::map<i64, std::unique_ptr<ChainTask>> chains_;
        bool opened_ = false;

        std::atomic<bool> running_{false};
        std::atomic<bool> stop_requested_{false};
        std::mutex wait_mutex_;
        std::condition_variable wake_;

        void run(ChainTask &task);

        /// Sleep unless stop() is called first; returns false when stopping
        bool waitFor(i64 millis);
    };

} // namespace chainwatch::pipeline
