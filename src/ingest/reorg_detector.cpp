#include <chainwatch/ingest/reorg_detector.hpp>

namespace chainwatch::ingest {

    Result<Continuation, Error> ReorgDetector::classify(const FetchedBlock &block,
                                                        const std::optional<Checkpoint> &checkpoint) {
        if (!checkpoint.has_value()) {
            if (block.number < start_block_)
                return Result<Continuation, Error>::ok(Continuation::Duplicate);
            if (block.number > start_block_)
                return Result<Continuation, Error>::err(gap("Expected block " + std::to_string(start_block_) +
                                                            ", got " + std::to_string(block.number)));
            return Result<Continuation, Error>::ok(Continuation::Extend);
        }

        const i64 tip = checkpoint->last_indexed_block;

        if (block.number == tip + 1) {
            // Empty tip hash: rolled back to just before the start block
            if (checkpoint->last_block_hash.empty() || block.parent_hash == checkpoint->last_block_hash)
                return Result<Continuation, Error>::ok(Continuation::Extend);
            return Result<Continuation, Error>::ok(Continuation::Reorg);
        }

        if (block.number > tip + 1) {
            return Result<Continuation, Error>::err(
                gap("Expected block " + std::to_string(tip + 1) + ", got " + std::to_string(block.number)));
        }

        auto stored = checkpoints_.blockHash(block.chain_id, block.number);
        if (!stored.is_ok())
            return Result<Continuation, Error>::err(stored.error());

        // Below the indexing start there is nothing to compare against
        if (!stored.value().has_value() || stored.value()->block_hash == block.hash)
            return Result<Continuation, Error>::ok(Continuation::Duplicate);

        return Result<Continuation, Error>::ok(Continuation::Reorg);
    }

    Result<i64, Error> ReorgDetector::findCommonAncestor(const FetchedBlock &block, const Checkpoint &checkpoint,
                                                         const HeaderLookup &lookup) {
        const i64 floor = start_block_ - 1;
        i64 height = block.number - 1;
        std::string claimed = block.parent_hash;

        while (true) {
            if (checkpoint.last_indexed_block - height > max_reorg_depth_) {
                return Result<i64, Error>::err(
                    deep_reorg("No common ancestor within " + std::to_string(max_reorg_depth_) + " blocks of " +
                               std::to_string(checkpoint.last_indexed_block)));
            }
            if (height <= floor)
                return Result<i64, Error>::ok(floor);

            auto stored = checkpoints_.blockHash(block.chain_id, height);
            if (!stored.is_ok())
                return Result<i64, Error>::err(stored.error());
            if (!stored.value().has_value()) {
                return Result<i64, Error>::err(
                    store_failed("Block hash ledger has no row at indexed height " + std::to_string(height)));
            }
            if (stored.value()->block_hash == claimed)
                return Result<i64, Error>::ok(height);

            auto header = lookup(height);
            if (!header.is_ok())
                return Result<i64, Error>::err(header.error());
            if (!header.value().has_value()) {
                return Result<i64, Error>::err(
                    ancestry_unavailable("No header for competing block at height " + std::to_string(height)));
            }
            const FetchedBlock &ancestor = *header.value();
            if (ancestor.hash != claimed) {
                return Result<i64, Error>::err(invalid_block("Competing header at height " + std::to_string(height) +
                                                             " does not match the claimed parent hash"));
            }

            claimed = ancestor.parent_hash;
            --height;
        }
    }

} // namespace chainwatch::ingest
