#include <algorithm>
#include <chainwatch/pipeline/chain_indexer.hpp>
#include <iostream>
#include <set>

namespace chainwatch::pipeline {

    using storage::Statement;

    const char *chainStatusName(ChainStatus status) {
        switch (status) {
        case ChainStatus::Healthy:
            return "healthy";
        case ChainStatus::Retrying:
            return "retrying";
        case ChainStatus::Halted:
            return "halted";
        }
        return "unknown";
    }

    ChainIndexer::ChainIndexer(const config::ChainConfig &chain, storage::SqliteStore &store, BlockSource &source,
                               const anomaly::AnomalyConfig &anomaly_config)
        : chain_(chain), store_(store), source_(source), checkpoints_(store),
          detector_(checkpoints_, chain.start_block, chain.max_reorg_depth), recorder_(store), tokens_(store),
          graph_(store),
          registry_(store), attributor_(store, registry_), scorer_(store, graph_, registry_, anomaly_config) {}

    std::string ChainIndexer::tag() const { return "[chain " + chain_.name + "] "; }

    // ===========================================
    // Health
    // ===========================================

    Error ChainIndexer::fail(const Error &error) {
        last_error_kind_ = errorKindName(error.code);
        last_error_message_ = errorMessage(error);

        if (isTransient(error)) {
            status_ = ChainStatus::Retrying;
            return error;
        }

        status_ = ChainStatus::Halted;
        // Gaps and malformed input clear on the next good block; everything else needs an operator
        requires_resume_ =
            !(error.code == ERR_GAP || error.code == ERR_INVALID_BLOCK || error.code == ERR_INVALID_AMOUNT);

        std::cout << tag() << "Halted: " << last_error_kind_ << ": " << last_error_message_ << std::endl;
        return error;
    }

    void ChainIndexer::succeed() {
        status_ = ChainStatus::Healthy;
        requires_resume_ = false;
    }

    void ChainIndexer::reportFetchError(const Error &error) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ == ChainStatus::Halted)
            return;
        status_ = ChainStatus::Retrying;
        last_error_kind_ = errorKindName(error.code);
        last_error_message_ = errorMessage(error);
    }

    void ChainIndexer::resume() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ == ChainStatus::Halted) {
            std::cout << tag() << "Resumed by operator" << std::endl;
            status_ = ChainStatus::Healthy;
        }
        requires_resume_ = false;
    }

    bool ChainIndexer::isHalted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return status_ == ChainStatus::Halted;
    }

    bool ChainIndexer::requiresResume() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return status_ == ChainStatus::Halted && requires_resume_;
    }

    ChainHealth ChainIndexer::health() const {
        std::lock_guard<std::mutex> lock(mutex_);
        ChainHealth h;
        h.chain_id = chain_.chain_id;
        h.name = chain_.name;
        h.last_height = last_height_;
        h.status = status_;
        h.last_error_kind = last_error_kind_;
        h.last_error_message = last_error_message_;
        return h;
    }

    Result<i64, Error> ChainIndexer::nextHeight() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto cp = checkpoints_.get(chain_.chain_id);
        if (!cp.is_ok())
            return Result<i64, Error>::err(cp.error());
        if (!cp.value().has_value())
            return Result<i64, Error>::ok(chain_.start_block);
        last_height_ = cp.value()->last_indexed_block;
        return Result<i64, Error>::ok(cp.value()->last_indexed_block + 1);
    }

    // ===========================================
    // Advance
    // ===========================================

    Result<AdvanceOutcome, Error> ChainIndexer::advance(const FetchedBlock &fetched) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (status_ == ChainStatus::Halted && requires_resume_) {
            return Result<AdvanceOutcome, Error>::err(
                chain_halted(chain_.name + " is halted after " + last_error_kind_ + "; resume() required"));
        }

        if (fetched.chain_id != chain_.chain_id) {
            return Result<AdvanceOutcome, Error>::err(fail(invalid_block(
                "Block for chain " + std::to_string(fetched.chain_id) + " fed to " + chain_.name)));
        }
        if (fetched.hash.empty()) {
            return Result<AdvanceOutcome, Error>::err(
                fail(invalid_block("Block " + std::to_string(fetched.number) + " has no hash")));
        }

        FetchedBlock block = fetched;
        block.hash = normalizeHex(block.hash);
        block.parent_hash = normalizeHex(block.parent_hash);

        auto cp = checkpoints_.get(chain_.chain_id);
        if (!cp.is_ok())
            return Result<AdvanceOutcome, Error>::err(fail(cp.error()));

        auto decision = detector_.classify(block, cp.value());
        if (!decision.is_ok())
            return Result<AdvanceOutcome, Error>::err(fail(decision.error()));

        switch (decision.value()) {
        case ingest::Continuation::Duplicate: {
            std::cout << tag() << "Block " << block.number << " already indexed, skipping" << std::endl;
            succeed();
            AdvanceOutcome outcome;
            outcome.kind = AdvanceKind::Duplicate;
            outcome.height = block.number;
            return Result<AdvanceOutcome, Error>::ok(outcome);
        }
        case ingest::Continuation::Reorg: {
            auto rolled = rollback(block, *cp.value());
            if (!rolled.is_ok())
                return Result<AdvanceOutcome, Error>::err(fail(rolled.error()));
            succeed();
            return rolled;
        }
        case ingest::Continuation::Extend:
            break;
        }

        auto extended = extend(block);
        if (!extended.is_ok())
            return Result<AdvanceOutcome, Error>::err(fail(extended.error()));
        succeed();
        return extended;
    }

    Result<AdvanceOutcome, Error> ChainIndexer::extend(const FetchedBlock &block) {
        AdvanceOutcome outcome;
        outcome.kind = AdvanceKind::Extended;
        outcome.height = block.number;

        auto tx = store_.beginTransaction();
        if (!tx->active())
            return Result<AdvanceOutcome, Error>::err(tx->beginError());

        BlockHashRecord hash_row{chain_.chain_id, block.number, block.hash, block.parent_hash};
        auto hashed = checkpoints_.putBlockHash(hash_row);
        if (!hashed.is_ok())
            return Result<AdvanceOutcome, Error>::err(hashed.error());

        std::vector<FetchedTransfer> transfers = block.transfers;
        std::stable_sort(transfers.begin(), transfers.end(),
                         [](const FetchedTransfer &a, const FetchedTransfer &b) { return a.log_index < b.log_index; });

        for (const auto &fetched : transfers) {
            Transfer incoming = ingest::makeTransfer(block, fetched);
            auto filled = tokens_.fillMissing(incoming);
            if (!filled.is_ok())
                return Result<AdvanceOutcome, Error>::err(filled.error());

            auto recorded = recorder_.record(incoming);
            if (!recorded.is_ok())
                return Result<AdvanceOutcome, Error>::err(recorded.error());
            if (recorded.value().inserted)
                ++outcome.transfers_recorded;
            else
                ++outcome.duplicates_ignored;

            auto stored = recorder_.get(recorded.value().id);
            if (!stored.is_ok())
                return Result<AdvanceOutcome, Error>::err(stored.error());
            if (!stored.value().has_value())
                return Result<AdvanceOutcome, Error>::err(store_failed("Recorded transfer vanished"));
            const Transfer &transfer = *stored.value();

            // The marker makes absorption exactly-once per transfer id
            Statement marker(store_, "INSERT OR IGNORE INTO processed_transfers (transfer_id, chain_id, processed_at) "
                                     "VALUES (?, ?, ?)");
            marker.bind(1, transfer.id).bind(2, transfer.chain_id).bind(3, storage::currentTimestamp());
            auto marked = marker.exec();
            if (!marked.is_ok())
                return Result<AdvanceOutcome, Error>::err(marked.error());
            if (marker.changes() > 0) {
                auto absorbed = graph_.absorb(transfer);
                if (!absorbed.is_ok())
                    return Result<AdvanceOutcome, Error>::err(absorbed.error());
            }

            auto attributed = attributor_.attribute(transfer);
            if (!attributed.is_ok())
                return Result<AdvanceOutcome, Error>::err(attributed.error());
            outcome.flags_written += attributed.value().flags_written;

            auto scored = scorer_.evaluate(transfer);
            if (!scored.is_ok())
                return Result<AdvanceOutcome, Error>::err(scored.error());
            outcome.anomalies_written += scored.value();
        }

        const i64 interval = chain_.recluster_interval_blocks;
        if (interval > 0 && block.number % interval == 0) {
            auto clustered = graph_.recluster(chain_.chain_id);
            if (!clustered.is_ok())
                return Result<AdvanceOutcome, Error>::err(clustered.error());
            outcome.wallets_clustered = clustered.value();
        }

        auto moved = checkpoints_.put(chain_.chain_id, block.number, block.hash);
        if (!moved.is_ok())
            return Result<AdvanceOutcome, Error>::err(moved.error());

        auto committed = tx->commit();
        if (!committed.is_ok())
            return Result<AdvanceOutcome, Error>::err(committed.error());

        last_height_ = block.number;
        std::cout << tag() << "Block " << block.number << ": " << outcome.transfers_recorded << " transfers";
        if (outcome.duplicates_ignored > 0)
            std::cout << " (" << outcome.duplicates_ignored << " duplicates)";
        if (outcome.anomalies_written > 0)
            std::cout << ", " << outcome.anomalies_written << " anomalies";
        if (outcome.wallets_clustered > 0)
            std::cout << ", reclustered " << outcome.wallets_clustered << " wallets";
        std::cout << std::endl;

        return Result<AdvanceOutcome, Error>::ok(outcome);
    }

    // ===========================================
    // Rollback
    // ===========================================

    Result<i64, Error> ChainIndexer::deleteAbove(const char *sql, i64 ancestor) {
        Statement stmt(store_, sql);
        stmt.bind(1, chain_.chain_id).bind(2, ancestor);
        auto res = stmt.exec();
        if (!res.is_ok())
            return Result<i64, Error>::err(res.error());
        return Result<i64, Error>::ok(stmt.changes());
    }

    Result<AdvanceOutcome, Error> ChainIndexer::rollback(const FetchedBlock &block, const Checkpoint &checkpoint) {
        std::cout << tag() << "Reorg detected at block " << block.number << " (stored tip "
                  << checkpoint.last_indexed_block << ")" << std::endl;

        ingest::HeaderLookup lookup = [this](i64 height) -> Result<std::optional<FetchedBlock>, Error> {
            auto header = source_.fetchBlock(chain_.chain_id, height);
            if (!header.is_ok() || !header.value().has_value())
                return header;
            FetchedBlock normalized = *header.value();
            normalized.hash = normalizeHex(normalized.hash);
            normalized.parent_hash = normalizeHex(normalized.parent_hash);
            return Result<std::optional<FetchedBlock>, Error>::ok(std::move(normalized));
        };

        auto found = detector_.findCommonAncestor(block, checkpoint, lookup);
        if (!found.is_ok())
            return Result<AdvanceOutcome, Error>::err(found.error());
        const i64 ancestor = found.value();

        auto tx = store_.beginTransaction();
        if (!tx->active())
            return Result<AdvanceOutcome, Error>::err(tx->beginError());

        auto doomed = recorder_.listAbove(chain_.chain_id, ancestor);
        if (!doomed.is_ok())
            return Result<AdvanceOutcome, Error>::err(doomed.error());

        std::set<graph::AddressPair> pairs;
        std::set<std::string> addresses;
        for (const auto &t : doomed.value()) {
            pairs.emplace(t.from_address, t.to_address);
            addresses.insert(t.from_address);
            addresses.insert(t.to_address);
        }

        // Dependents first, then transfers, then the hash ledger
        static const char *const deletions[] = {
            "DELETE FROM anomalies WHERE transfer_id IN "
            "(SELECT id FROM transfers WHERE chain_id = ? AND block_number > ?)",
            "DELETE FROM transfer_entity_flags WHERE transfer_id IN "
            "(SELECT id FROM transfers WHERE chain_id = ? AND block_number > ?)",
            "DELETE FROM onramp_transfers WHERE transfer_id IN "
            "(SELECT id FROM transfers WHERE chain_id = ? AND block_number > ?)",
            "DELETE FROM attribution_audit WHERE transfer_id IN "
            "(SELECT id FROM transfers WHERE chain_id = ? AND block_number > ?)",
            "DELETE FROM processed_transfers WHERE transfer_id IN "
            "(SELECT id FROM transfers WHERE chain_id = ? AND block_number > ?)",
        };
        for (const char *sql : deletions) {
            auto res = deleteAbove(sql, ancestor);
            if (!res.is_ok())
                return Result<AdvanceOutcome, Error>::err(res.error());
        }

        auto deleted = deleteAbove("DELETE FROM transfers WHERE chain_id = ? AND block_number > ?", ancestor);
        if (!deleted.is_ok())
            return Result<AdvanceOutcome, Error>::err(deleted.error());

        auto hashes = checkpoints_.deleteBlockHashesAbove(chain_.chain_id, ancestor);
        if (!hashes.is_ok())
            return Result<AdvanceOutcome, Error>::err(hashes.error());

        auto edges = graph_.recomputeEdges(chain_.chain_id, std::vector<graph::AddressPair>(pairs.begin(), pairs.end()));
        if (!edges.is_ok())
            return Result<AdvanceOutcome, Error>::err(edges.error());
        auto seen = graph_.recomputeFirstSeen(chain_.chain_id, std::vector<std::string>(addresses.begin(), addresses.end()));
        if (!seen.is_ok())
            return Result<AdvanceOutcome, Error>::err(seen.error());

        // Clusters derive from the edges just rebuilt; only chains that were clustered are redone
        auto clusters = graph_.clusterCount(chain_.chain_id);
        if (!clusters.is_ok())
            return Result<AdvanceOutcome, Error>::err(clusters.error());
        i64 reclustered = 0;
        if (clusters.value() > 0) {
            auto clustered = graph_.recluster(chain_.chain_id);
            if (!clustered.is_ok())
                return Result<AdvanceOutcome, Error>::err(clustered.error());
            reclustered = clustered.value();
        }

        // Below the start block there is no hash; the next block's parent is then unchecked
        std::string ancestor_hash;
        if (ancestor >= chain_.start_block) {
            auto row = checkpoints_.blockHash(chain_.chain_id, ancestor);
            if (!row.is_ok())
                return Result<AdvanceOutcome, Error>::err(row.error());
            if (row.value().has_value())
                ancestor_hash = row.value()->block_hash;
        }
        auto reset = checkpoints_.put(chain_.chain_id, ancestor, ancestor_hash);
        if (!reset.is_ok())
            return Result<AdvanceOutcome, Error>::err(reset.error());

        auto committed = tx->commit();
        if (!committed.is_ok())
            return Result<AdvanceOutcome, Error>::err(committed.error());

        last_height_ = ancestor;
        std::cout << tag() << "Rolled back to block " << ancestor << ", removed " << deleted.value() << " transfers"
                  << std::endl;

        AdvanceOutcome outcome;
        outcome.kind = AdvanceKind::RolledBack;
        outcome.height = ancestor;
        outcome.ancestor = ancestor;
        outcome.transfers_deleted = deleted.value();
        outcome.wallets_clustered = reclustered;
        return Result<AdvanceOutcome, Error>::ok(outcome);
    }

} // namespace chainwatch::pipeline
