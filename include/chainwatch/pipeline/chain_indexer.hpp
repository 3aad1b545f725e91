#pragma once

#include <datapod/datapod.hpp>
#include <mutex>
#include <optional>
#include <string>

#include "chainwatch/anomaly/anomaly_scorer.hpp"
#include "chainwatch/common/types.hpp"
#include "chainwatch/config/config.hpp"
#include "chainwatch/entity/entity_attributor.hpp"
#include "chainwatch/entity/label_registry.hpp"
#include "chainwatch/graph/graph_aggregator.hpp"
#include "chainwatch/ingest/checkpoint_store.hpp"
#include "chainwatch/ingest/reorg_detector.hpp"
#include "chainwatch/ingest/token_registry.hpp"
#include "chainwatch/ingest/transfer_recorder.hpp"
#include "chainwatch/pipeline/block_source.hpp"
#include "chainwatch/storage/sqlite_store.hpp"

namespace chainwatch::pipeline {

    using namespace datapod;

    enum class AdvanceKind { Extended, Duplicate, RolledBack };

    struct AdvanceOutcome {
        AdvanceKind kind = AdvanceKind::Extended;
        i64 height = 0;              // block height, or the ancestor after a rollback
        std::optional<i64> ancestor; // set when rolled back
        i64 transfers_recorded = 0;
        i64 duplicates_ignored = 0;
        i64 transfers_deleted = 0;
        i64 anomalies_written = 0;
        i64 flags_written = 0;
        i64 wallets_clustered = 0; // set when clusters were rebuilt
    };

    enum class ChainStatus { Healthy, Retrying, Halted };

    const char *chainStatusName(ChainStatus status);

    struct ChainHealth {
        i64 chain_id = 0;
        std::string name;
        std::optional<i64> last_height;
        ChainStatus status = ChainStatus::Healthy;
        std::string last_error_kind;
        std::string last_error_message;
    };

    /// Sole owner of one chain's checkpoint. Blocks are applied strictly in height order;
    /// every accepted block and every rollback commits as one transaction.
    class ChainIndexer {
      public:
        ChainIndexer(const config::ChainConfig &chain, storage::SqliteStore &store, BlockSource &source,
                     const anomaly::AnomalyConfig &anomaly_config);

        ChainIndexer(const ChainIndexer &) = delete;
        ChainIndexer &operator=(const ChainIndexer &) = delete;

        /// Apply one fetched block: extend, skip a duplicate, or roll back to the common ancestor.
        /// After a rollback the block itself is not ingested; feed again from ancestor + 1.
        Result<AdvanceOutcome, Error> advance(const FetchedBlock &block);

        /// Height the next advance expects
        Result<i64, Error> nextHeight();

        /// Record a failure of the block source for health reporting
        void reportFetchError(const Error &error);

        /// Clear a halt caused by a deep reorg or a store failure
        void resume();

        bool isHalted() const;

        /// Halted by an error that advance() refuses to retry until resume()
        bool requiresResume() const;
        ChainHealth health() const;

        i64 chainId() const { return chain_.chain_id; }
        const std::string &name() const { return chain_.name; }

        // ===========================================
        // Component access (queries and tests)
        // ===========================================

        ingest::CheckpointStore &checkpoints() { return checkpoints_; }
        ingest::TransferRecorder &recorder() { return recorder_; }
        ingest::TokenRegistry &tokens() { return tokens_; }
        graph::GraphAggregator &graph() { return graph_; }
        entity::LabelRegistry &registry() { return registry_; }
        entity::EntityAttributor &attributor() { return attributor_; }
        anomaly::AnomalyScorer &scorer() { return scorer_; }

      private:
        config::ChainConfig chain_;
        storage::SqliteStore &store_;
        BlockSource &source_;

        ingest::CheckpointStore checkpoints_;
        ingest::ReorgDetector detector_;
        ingest::TransferRecorder recorder_;
        ingest::TokenRegistry tokens_;
        graph::GraphAggregator graph_;
        entity::LabelRegistry registry_;
        entity::EntityAttributor attributor_;
        anomaly::AnomalyScorer scorer_;

        mutable std::mutex mutex_;
        ChainStatus status_ = ChainStatus::Healthy;
        bool requires_resume_ = false;
        std::optional<i64> last_height_;
        std::string last_error_kind_;
        std::string last_error_message_;

        Result<AdvanceOutcome, Error> extend(const FetchedBlock &block);
        Result<AdvanceOutcome, Error> rollback(const FetchedBlock &block, const Checkpoint &checkpoint);
        Result<i64, Error> deleteAbove(const char *sql, i64 ancestor);

        Error fail(const Error &error);
        void succeed();
        std::string tag() const;
    };

} // namespace chainwatch::pipeline
