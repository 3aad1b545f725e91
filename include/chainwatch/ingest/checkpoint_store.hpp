#pragma once

#include <datapod/datapod.hpp>
#include <optional>
#include <string>

#include "chainwatch/common/types.hpp"
#include "chainwatch/storage/sqlite_store.hpp"

namespace chainwatch::ingest {

    using namespace datapod;

    /// Durable per-chain cursor plus the block hash ledger used for reorg comparison.
    /// Does not open transactions; callers wrap writes in a TxGuard.
    class CheckpointStore {
      public:
        explicit CheckpointStore(storage::SqliteStore &store) : store_(store) {}

        Result<std::optional<Checkpoint>, Error> get(i64 chain_id);

        /// Insert or move the cursor for a chain
        Result<void, Error> put(i64 chain_id, i64 height, const std::string &hash);

        Result<std::optional<BlockHashRecord>, Error> blockHash(i64 chain_id, i64 height);

        /// Insert or replace; a row from a competing chain overwrites the superseded one
        Result<void, Error> putBlockHash(const BlockHashRecord &row);

        /// Returns the number of rows removed
        Result<i64, Error> deleteBlockHashesAbove(i64 chain_id, i64 height);

      private:
        storage::SqliteStore &store_;
    };

} // namespace chainwatch::ingest
