#pragma once

#include <datapod/datapod.hpp>
#include <optional>
#include <vector>

#include "chainwatch/common/types.hpp"
#include "chainwatch/storage/sqlite_store.hpp"

namespace chainwatch::ingest {

    using namespace datapod;

    struct RecordOutcome {
        i64 id = 0;
        bool inserted = false; // false: duplicate key, existing row returned
    };

    /// Idempotent writer of transfer rows keyed by (chain_id, tx_hash, log_index)
    class TransferRecorder {
      public:
        explicit TransferRecorder(storage::SqliteStore &store) : store_(store) {}

        /// Insert or find the transfer. Hex fields are lower-cased and the amount canonicalised first.
        Result<RecordOutcome, Error> record(const Transfer &transfer);

        Result<std::optional<Transfer>, Error> get(i64 id);

        /// Transfers of one chain above a height, in (block_number, log_index) order
        Result<std::vector<Transfer>, Error> listAbove(i64 chain_id, i64 height);

        /// All transfers of one chain in (block_number, log_index) order
        Result<std::vector<Transfer>, Error> listForChain(i64 chain_id);

        Result<i64, Error> count(i64 chain_id);

      private:
        storage::SqliteStore &store_;

        Result<std::vector<Transfer>, Error> query(const char *sql, i64 chain_id, std::optional<i64> height);
    };

    /// Flatten a fetched transfer into the row it is recorded as
    Transfer makeTransfer(const FetchedBlock &block, const FetchedTransfer &fetched);

} // namespace chainwatch::ingest
