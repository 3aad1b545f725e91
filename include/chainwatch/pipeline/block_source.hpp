#pragma once

#include <datapod/datapod.hpp>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "chainwatch/common/types.hpp"

namespace chainwatch::pipeline {

    using namespace datapod;

    /// Producer of fetched blocks for the ingestion loop (RPC and decoding live behind it)
    class BlockSource {
      public:
        virtual ~BlockSource() = default;

        /// The block currently at `height` on the source's canonical chain; nullopt when not yet available
        virtual Result<std::optional<FetchedBlock>, Error> fetchBlock(i64 chain_id, i64 height) = 0;
    };

    /// In-memory source shared between threads. put() over an existing height replaces the block,
    /// which is how a competing chain segment shows up.
    class MemoryBlockSource : public BlockSource {
      public:
        void put(i64 chain_id, FetchedBlock block);
        void putAll(const std::vector<FetchedBlock> &blocks);

        Result<std::optional<FetchedBlock>, Error> fetchBlock(i64 chain_id, i64 height) override;

        /// Highest height held for a chain, nullopt when empty
        std::optional<i64> highest(i64 chain_id) const;

      private:
        mutable std::mutex mutex_;
        std::map<i64, std::map<i64, FetchedBlock>> blocks_;
    };

    /// Parse one JSON block object
    Result<FetchedBlock, Error> parseBlockJson(const std::string &text);

    /// Read newline-delimited JSON blocks; blank lines are skipped
    Result<std::vector<FetchedBlock>, Error> loadBlocksJsonl(const std::string &path);

} // namespace chainwatch::pipeline
