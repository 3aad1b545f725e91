#include <algorithm>
#include <chainwatch/common/amount.hpp>
#include <chainwatch/graph/graph_aggregator.hpp>
#include <map>

namespace chainwatch::graph {

    using storage::Statement;

    namespace {

        constexpr const char *EDGE_COLUMNS =
            "source_address, dest_address, chain_id, transfer_count, total_amount, first_seen, last_seen";

        GraphEdge readEdge(const Statement &stmt) {
            GraphEdge e;
            e.source_address = stmt.columnText(0);
            e.dest_address = stmt.columnText(1);
            e.chain_id = stmt.columnInt64(2);
            e.transfer_count = stmt.columnInt64(3);
            e.total_amount = stmt.columnText(4);
            e.first_seen = stmt.columnInt64(5);
            e.last_seen = stmt.columnInt64(6);
            return e;
        }

        Result<Amount, Error> addAmounts(const std::string &a, const std::string &b) {
            auto lhs = Amount::parse(a);
            if (!lhs.is_ok())
                return lhs;
            auto rhs = Amount::parse(b);
            if (!rhs.is_ok())
                return rhs;
            return Result<Amount, Error>::ok(lhs.value() + rhs.value());
        }

        /// Disjoint address sets with path compression; the larger set absorbs the smaller
        class AddressForest {
          public:
            std::string find(const std::string &address) {
                auto it = parent_.find(address);
                if (it == parent_.end()) {
                    parent_[address] = address;
                    size_[address] = 1;
                    return address;
                }
                if (it->second == address)
                    return address;
                std::string root = find(it->second);
                parent_[address] = root;
                return root;
            }

            void unite(const std::string &a, const std::string &b) {
                std::string root_a = find(a);
                std::string root_b = find(b);
                if (root_a == root_b)
                    return;
                if (size_[root_a] < size_[root_b])
                    std::swap(root_a, root_b);
                parent_[root_b] = root_a;
                size_[root_a] += size_[root_b];
            }

            /// Every address seen, in sorted order
            std::vector<std::string> addresses() const {
                std::vector<std::string> all;
                all.reserve(parent_.size());
                for (const auto &[address, parent] : parent_)
                    all.push_back(address);
                return all;
            }

          private:
            std::map<std::string, std::string> parent_;
            std::map<std::string, i64> size_;
        };

    } // namespace

    Result<void, Error> GraphAggregator::absorb(const Transfer &transfer) {
        auto from = markFirstSeen(transfer.from_address, transfer, "out");
        if (!from.is_ok())
            return from;

        auto to = markFirstSeen(transfer.to_address, transfer, "in");
        if (!to.is_ok())
            return to;

        return upsertEdge(transfer);
    }

    Result<void, Error> GraphAggregator::markFirstSeen(const std::string &address, const Transfer &transfer,
                                                       const char *direction) {
        // First write wins
        Statement stmt(store_, "INSERT OR IGNORE INTO wallet_first_seen (address, chain_id, first_seen_at, first_block, "
                               "first_tx_hash, first_direction) VALUES (?, ?, ?, ?, ?, ?)");
        stmt.bind(1, address)
            .bind(2, transfer.chain_id)
            .bind(3, transfer.block_timestamp)
            .bind(4, transfer.block_number)
            .bind(5, transfer.tx_hash)
            .bind(6, std::string(direction));
        return stmt.exec();
    }

    Result<void, Error> GraphAggregator::upsertEdge(const Transfer &transfer) {
        auto existing = edge(transfer.from_address, transfer.to_address, transfer.chain_id);
        if (!existing.is_ok())
            return Result<void, Error>::err(existing.error());

        if (!existing.value().has_value()) {
            auto amount = Amount::parse(transfer.amount);
            if (!amount.is_ok())
                return Result<void, Error>::err(amount.error());

            Statement insert(store_, "INSERT INTO wallet_graph_edges (source_address, dest_address, chain_id, "
                                     "transfer_count, total_amount, first_seen, last_seen) VALUES (?, ?, ?, 1, ?, ?, ?)");
            insert.bind(1, transfer.from_address)
                .bind(2, transfer.to_address)
                .bind(3, transfer.chain_id)
                .bind(4, amount.value().toString())
                .bind(5, transfer.block_timestamp)
                .bind(6, transfer.block_timestamp);
            return insert.exec();
        }

        const GraphEdge &current = *existing.value();
        auto total = addAmounts(current.total_amount, transfer.amount);
        if (!total.is_ok())
            return Result<void, Error>::err(total.error());

        Statement update(store_, "UPDATE wallet_graph_edges SET transfer_count = transfer_count + 1, total_amount = ?, "
                                 "first_seen = MIN(first_seen, ?), last_seen = MAX(last_seen, ?) "
                                 "WHERE source_address = ? AND dest_address = ? AND chain_id = ?");
        update.bind(1, total.value().toString())
            .bind(2, transfer.block_timestamp)
            .bind(3, transfer.block_timestamp)
            .bind(4, transfer.from_address)
            .bind(5, transfer.to_address)
            .bind(6, transfer.chain_id);
        return update.exec();
    }

    Result<void, Error> GraphAggregator::recomputeEdges(i64 chain_id, const std::vector<AddressPair> &pairs) {
        for (const auto &[source, dest] : pairs) {
            Statement rows(store_, "SELECT amount, block_timestamp FROM transfers "
                                   "WHERE chain_id = ? AND from_address = ? AND to_address = ?");
            rows.bind(1, chain_id).bind(2, source).bind(3, dest);

            i64 count = 0;
            Amount total;
            i64 first_seen = 0;
            i64 last_seen = 0;
            while (rows.next()) {
                auto amount = Amount::parse(rows.columnText(0));
                if (!amount.is_ok())
                    return Result<void, Error>::err(amount.error());
                i64 ts = rows.columnInt64(1);
                total += amount.value();
                first_seen = count == 0 ? ts : std::min(first_seen, ts);
                last_seen = count == 0 ? ts : std::max(last_seen, ts);
                ++count;
            }
            if (!rows.ok())
                return Result<void, Error>::err(rows.error());

            if (count == 0) {
                Statement remove(store_, "DELETE FROM wallet_graph_edges "
                                         "WHERE source_address = ? AND dest_address = ? AND chain_id = ?");
                remove.bind(1, source).bind(2, dest).bind(3, chain_id);
                auto res = remove.exec();
                if (!res.is_ok())
                    return res;
                continue;
            }

            Statement replace(store_, "INSERT OR REPLACE INTO wallet_graph_edges (source_address, dest_address, "
                                      "chain_id, transfer_count, total_amount, first_seen, last_seen) "
                                      "VALUES (?, ?, ?, ?, ?, ?, ?)");
            replace.bind(1, source)
                .bind(2, dest)
                .bind(3, chain_id)
                .bind(4, count)
                .bind(5, total.toString())
                .bind(6, first_seen)
                .bind(7, last_seen);
            auto res = replace.exec();
            if (!res.is_ok())
                return res;
        }
        return Result<void, Error>::ok();
    }

    Result<void, Error> GraphAggregator::recomputeFirstSeen(i64 chain_id, const std::vector<std::string> &addresses) {
        for (const auto &address : addresses) {
            Statement remove(store_, "DELETE FROM wallet_first_seen WHERE address = ? AND chain_id = ?");
            remove.bind(1, address).bind(2, chain_id);
            auto removed = remove.exec();
            if (!removed.is_ok())
                return removed;

            // Same order the pipeline absorbs in
            Statement earliest(store_, "SELECT block_timestamp, block_number, tx_hash, from_address FROM transfers "
                                       "WHERE chain_id = ? AND (from_address = ? OR to_address = ?) "
                                       "ORDER BY block_number, log_index, id LIMIT 1");
            earliest.bind(1, chain_id).bind(2, address).bind(3, address);
            if (!earliest.next()) {
                if (!earliest.ok())
                    return Result<void, Error>::err(earliest.error());
                continue;
            }

            Statement insert(store_, "INSERT INTO wallet_first_seen (address, chain_id, first_seen_at, first_block, "
                                     "first_tx_hash, first_direction) VALUES (?, ?, ?, ?, ?, ?)");
            insert.bind(1, address)
                .bind(2, chain_id)
                .bind(3, earliest.columnInt64(0))
                .bind(4, earliest.columnInt64(1))
                .bind(5, earliest.columnText(2))
                .bind(6, std::string(earliest.columnText(3) == address ? "out" : "in"));
            auto res = insert.exec();
            if (!res.is_ok())
                return res;
        }
        return Result<void, Error>::ok();
    }

    // ===========================================
    // Clusters
    // ===========================================

    Result<i64, Error> GraphAggregator::recluster(i64 chain_id) {
        Statement pairs(store_, "SELECT e1.source_address, e1.dest_address FROM wallet_graph_edges e1 "
                                "JOIN wallet_graph_edges e2 ON e1.source_address = e2.dest_address "
                                "AND e1.dest_address = e2.source_address AND e1.chain_id = e2.chain_id "
                                "WHERE e1.chain_id = ? AND e1.source_address != e1.dest_address");
        pairs.bind(1, chain_id);

        AddressForest forest;
        while (pairs.next()) {
            forest.unite(pairs.columnText(0), pairs.columnText(1));
        }
        if (!pairs.ok())
            return Result<i64, Error>::err(pairs.error());

        Statement clear(store_, "DELETE FROM wallet_clusters WHERE chain_id = ?");
        clear.bind(1, chain_id);
        auto cleared = clear.exec();
        if (!cleared.is_ok())
            return Result<i64, Error>::err(cleared.error());

        const i64 now = storage::currentTimestamp();
        std::map<std::string, i64> cluster_ids;
        i64 assigned = 0;
        for (const auto &address : forest.addresses()) {
            const std::string root = forest.find(address);
            const i64 id = cluster_ids.emplace(root, static_cast<i64>(cluster_ids.size()) + 1).first->second;

            Statement insert(store_, "INSERT INTO wallet_clusters (address, chain_id, cluster_id, assigned_at) "
                                     "VALUES (?, ?, ?, ?)");
            insert.bind(1, address).bind(2, chain_id).bind(3, id).bind(4, now);
            auto res = insert.exec();
            if (!res.is_ok())
                return Result<i64, Error>::err(res.error());
            ++assigned;
        }
        return Result<i64, Error>::ok(assigned);
    }

    Result<std::optional<i64>, Error> GraphAggregator::clusterOf(const std::string &address, i64 chain_id) {
        Statement stmt(store_, "SELECT cluster_id FROM wallet_clusters WHERE address = ? AND chain_id = ?");
        stmt.bind(1, normalizeHex(address)).bind(2, chain_id);
        if (stmt.next())
            return Result<std::optional<i64>, Error>::ok(stmt.columnInt64(0));
        if (!stmt.ok())
            return Result<std::optional<i64>, Error>::err(stmt.error());
        return Result<std::optional<i64>, Error>::ok(std::nullopt);
    }

    Result<std::vector<std::string>, Error> GraphAggregator::clusterMembers(i64 cluster_id, i64 chain_id) {
        Statement stmt(store_, "SELECT address FROM wallet_clusters WHERE cluster_id = ? AND chain_id = ? "
                               "ORDER BY address");
        stmt.bind(1, cluster_id).bind(2, chain_id);

        std::vector<std::string> members;
        while (stmt.next()) {
            members.push_back(stmt.columnText(0));
        }
        if (!stmt.ok())
            return Result<std::vector<std::string>, Error>::err(stmt.error());
        return Result<std::vector<std::string>, Error>::ok(std::move(members));
    }

    Result<i64, Error> GraphAggregator::clusterCount(i64 chain_id) {
        Statement stmt(store_, "SELECT COUNT(DISTINCT cluster_id) FROM wallet_clusters WHERE chain_id = ?");
        stmt.bind(1, chain_id);
        if (stmt.next())
            return Result<i64, Error>::ok(stmt.columnInt64(0));
        return Result<i64, Error>::err(stmt.error());
    }

    Result<std::optional<GraphEdge>, Error> GraphAggregator::edge(const std::string &source, const std::string &dest,
                                                                  i64 chain_id) {
        std::string sql = std::string("SELECT ") + EDGE_COLUMNS +
                          " FROM wallet_graph_edges WHERE source_address = ? AND dest_address = ? AND chain_id = ?";
        Statement stmt(store_, sql.c_str());
        stmt.bind(1, source).bind(2, dest).bind(3, chain_id);
        if (stmt.next())
            return Result<std::optional<GraphEdge>, Error>::ok(readEdge(stmt));
        if (!stmt.ok())
            return Result<std::optional<GraphEdge>, Error>::err(stmt.error());
        return Result<std::optional<GraphEdge>, Error>::ok(std::nullopt);
    }

    Result<std::optional<WalletFirstSeen>, Error> GraphAggregator::firstSeen(const std::string &address,
                                                                             i64 chain_id) {
        Statement stmt(store_, "SELECT first_seen_at, first_block, first_tx_hash, first_direction "
                               "FROM wallet_first_seen WHERE address = ? AND chain_id = ?");
        stmt.bind(1, address).bind(2, chain_id);
        if (stmt.next()) {
            WalletFirstSeen row;
            row.address = address;
            row.chain_id = chain_id;
            row.first_seen_at = stmt.columnInt64(0);
            row.first_block = stmt.columnInt64(1);
            row.first_tx_hash = stmt.columnText(2);
            row.first_direction = stmt.columnText(3);
            return Result<std::optional<WalletFirstSeen>, Error>::ok(row);
        }
        if (!stmt.ok())
            return Result<std::optional<WalletFirstSeen>, Error>::err(stmt.error());
        return Result<std::optional<WalletFirstSeen>, Error>::ok(std::nullopt);
    }

    Result<std::vector<GraphEdge>, Error> GraphAggregator::queryEdges(const char *where, const std::string &address,
                                                                      i64 chain_id) {
        std::string sql = std::string("SELECT ") + EDGE_COLUMNS + " FROM wallet_graph_edges WHERE " + where +
                          " ORDER BY source_address, dest_address";
        Statement stmt(store_, sql.c_str());
        int index = 1;
        if (!address.empty())
            stmt.bind(index++, address);
        stmt.bind(index, chain_id);

        std::vector<GraphEdge> edges;
        while (stmt.next()) {
            edges.push_back(readEdge(stmt));
        }
        if (!stmt.ok())
            return Result<std::vector<GraphEdge>, Error>::err(stmt.error());
        return Result<std::vector<GraphEdge>, Error>::ok(std::move(edges));
    }

    Result<std::vector<GraphEdge>, Error> GraphAggregator::outgoing(const std::string &address, i64 chain_id) {
        return queryEdges("source_address = ? AND chain_id = ?", address, chain_id);
    }

    Result<std::vector<GraphEdge>, Error> GraphAggregator::incoming(const std::string &address, i64 chain_id) {
        return queryEdges("dest_address = ? AND chain_id = ?", address, chain_id);
    }

    Result<std::vector<GraphEdge>, Error> GraphAggregator::edgesForChain(i64 chain_id) {
        return queryEdges("chain_id = ?", std::string(), chain_id);
    }

} // namespace chainwatch::graph
