#pragma once

#include <datapod/datapod.hpp>
#include <functional>
#include <optional>

#include "chainwatch/common/types.hpp"
#include "chainwatch/ingest/checkpoint_store.hpp"

namespace chainwatch::ingest {

    using namespace datapod;

    enum class Continuation {
        Extend,    // next height, parent links to the stored tip
        Duplicate, // already indexed, identical hash
        Reorg      // stored history diverges from the fetched block
    };

    /// Fetch the header the competing chain has at a height; nullopt when unknown
    using HeaderLookup = std::function<Result<std::optional<FetchedBlock>, Error>(i64 height)>;

    class ReorgDetector {
      public:
        ReorgDetector(CheckpointStore &checkpoints, i64 start_block, i64 max_reorg_depth)
            : checkpoints_(checkpoints), start_block_(start_block), max_reorg_depth_(max_reorg_depth) {}

        /// Decide how a fetched block relates to what is stored. Fails with ERR_GAP for skipped heights.
        Result<Continuation, Error> classify(const FetchedBlock &block, const std::optional<Checkpoint> &checkpoint);

        /// Walk down from the height below `block` until the stored hash matches the hash the
        /// competing chain claims. Returns the common ancestor height, which is start_block - 1
        /// when the whole indexed range is replaced.
        Result<i64, Error> findCommonAncestor(const FetchedBlock &block, const Checkpoint &checkpoint,
                                              const HeaderLookup &lookup);

        i64 startBlock() const { return start_block_; }
        i64 maxReorgDepth() const { return max_reorg_depth_; }

      private:
        CheckpointStore &checkpoints_;
        i64 start_block_;
        i64 max_reorg_depth_;
    };

} // namespace chainwatch::ingest
