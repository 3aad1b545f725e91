#pragma once

#include <datapod/datapod.hpp>
#include <utility>
#include <vector>

#include "chainwatch/anomaly/rules.hpp"
#include "chainwatch/common/types.hpp"
#include "chainwatch/entity/label_registry.hpp"
#include "chainwatch/graph/graph_aggregator.hpp"
#include "chainwatch/storage/sqlite_store.hpp"

namespace chainwatch::anomaly {

    using namespace datapod;

    /// Runs the rule set against a transfer and upserts one row per (transfer, anomaly type).
    /// Expects the transfer to be recorded and absorbed already; `resolved` is never written.
    class AnomalyScorer {
      public:
        AnomalyScorer(storage::SqliteStore &store, graph::GraphAggregator &graph, entity::LabelRegistry &registry,
                      AnomalyConfig config)
            : store_(store), graph_(graph), registry_(registry), config_(std::move(config)) {}

        /// Read the wallet context the rules need from current state
        Result<WalletContext, Error> buildContext(const Transfer &transfer);

        /// Evaluate and upsert; returns the number of anomaly rows written
        Result<i64, Error> evaluate(const Transfer &transfer);

        Result<void, Error> upsert(const Transfer &transfer, const Detection &detection);

        Result<std::vector<AnomalyRow>, Error> anomaliesFor(i64 transfer_id);
        Result<std::vector<AnomalyRow>, Error> anomaliesForChain(i64 chain_id);

        const AnomalyConfig &config() const { return config_; }

      private:
        storage::SqliteStore &store_;
        graph::GraphAggregator &graph_;
        entity::LabelRegistry &registry_;
        AnomalyConfig config_;

        Result<std::vector<AnomalyRow>, Error> query(const char *where, i64 key);
    };

} // namespace chainwatch::anomaly
