#pragma once

#include <datapod/datapod.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "chainwatch/common/types.hpp"
#include "chainwatch/storage/sqlite_store.hpp"

namespace chainwatch::graph {

    using namespace datapod;

    /// (source_address, dest_address) on one chain
    using AddressPair = std::pair<std::string, std::string>;

    /// Incremental wallet graph: pair edges, first-seen sightings and derived wallet clusters.
    ///
    /// absorb() is not idempotent on its own; the pipeline absorbs each transfer id
    /// at most once through the processed_transfers marker.
    class GraphAggregator {
      public:
        explicit GraphAggregator(storage::SqliteStore &store) : store_(store) {}

        /// Fold one transfer into first-seen rows (from='out', to='in') and its pair edge
        Result<void, Error> absorb(const Transfer &transfer);

        /// Rebuild the given edges from the transfer rows that remain; edges with no rows are removed
        Result<void, Error> recomputeEdges(i64 chain_id, const std::vector<AddressPair> &pairs);

        /// Rebuild first-seen rows for the given addresses from the earliest remaining transfer
        Result<void, Error> recomputeFirstSeen(i64 chain_id, const std::vector<std::string> &addresses);

        /// Replace the chain's wallet clusters. Wallets joined by edges in both directions share a
        /// cluster (union-find); self-transfers do not count. Ids are 1.. in order of each cluster's
        /// lowest address. Returns the number of wallets assigned.
        Result<i64, Error> recluster(i64 chain_id);

        // ===========================================
        // Read side
        // ===========================================

        Result<std::optional<GraphEdge>, Error> edge(const std::string &source, const std::string &dest, i64 chain_id);
        Result<std::optional<WalletFirstSeen>, Error> firstSeen(const std::string &address, i64 chain_id);
        Result<std::vector<GraphEdge>, Error> outgoing(const std::string &address, i64 chain_id);
        Result<std::vector<GraphEdge>, Error> incoming(const std::string &address, i64 chain_id);
        Result<std::vector<GraphEdge>, Error> edgesForChain(i64 chain_id);

        Result<std::optional<i64>, Error> clusterOf(const std::string &address, i64 chain_id);
        Result<std::vector<std::string>, Error> clusterMembers(i64 cluster_id, i64 chain_id);
        Result<i64, Error> clusterCount(i64 chain_id);

      private:
        storage::SqliteStore &store_;

        Result<void, Error> markFirstSeen(const std::string &address, const Transfer &transfer, const char *direction);
        Result<void, Error> upsertEdge(const Transfer &transfer);
        Result<std::vector<GraphEdge>, Error> queryEdges(const char *where, const std::string &address, i64 chain_id);
    };

} // namespace chainwatch::graph
