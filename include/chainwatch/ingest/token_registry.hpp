#pragma once

#include <datapod/datapod.hpp>
#include <optional>
#include <string>
#include <vector>

#include "chainwatch/common/types.hpp"
#include "chainwatch/storage/sqlite_store.hpp"

namespace chainwatch::ingest {

    using namespace datapod;

    /// Symbol and decimals of known token contracts, keyed by (chain_id, token_address).
    /// Token addresses are lower-cased on both sides.
    class TokenRegistry {
      public:
        explicit TokenRegistry(storage::SqliteStore &store) : store_(store) {}

        /// Insert or refresh symbol and decimals
        Result<void, Error> upsert(const KnownToken &token);

        Result<std::optional<KnownToken>, Error> lookup(i64 chain_id, const std::string &token_address);

        /// Tokens of one chain ordered by address
        Result<std::vector<KnownToken>, Error> listForChain(i64 chain_id);

        /// Fill an empty symbol, and then the decimals, from the registry. Returns true when filled.
        Result<bool, Error> fillMissing(Transfer &transfer);

      private:
        storage::SqliteStore &store_;
    };

} // namespace chainwatch::ingest
