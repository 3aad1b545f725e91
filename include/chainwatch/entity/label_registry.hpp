#pragma once

#include <datapod/datapod.hpp>
#include <optional>
#include <string>
#include <vector>

#include "chainwatch/common/types.hpp"
#include "chainwatch/storage/sqlite_store.hpp"

namespace chainwatch::entity {

    using namespace datapod;

    /// Entity labels, watchlists and provider wallet registries.
    ///
    /// Labels scoped to a chain shadow global (NULL chain) labels for the same address:
    /// when any chain-scoped label exists only those apply, otherwise the global ones do.
    /// Addresses are lower-cased on both the write and the read side.
    class LabelRegistry {
      public:
        explicit LabelRegistry(storage::SqliteStore &store) : store_(store) {}

        // ===========================================
        // Read side
        // ===========================================

        /// Labels applicable to an address on a chain, ordered by id
        Result<std::vector<EntityLabel>, Error> labelsFor(const std::string &address, i64 chain_id);

        Result<std::vector<WatchlistEntry>, Error> watchlistHits(const std::string &address);

        /// On a watchlist, or labelled sanctioned / ofac_sdn
        Result<bool, Error> isSanctioned(const std::string &address, i64 chain_id);

        Result<std::optional<ProviderWallet>, Error> providerWalletFor(i64 chain_id, const std::string &address);

        /// ISO currency codes a provider settles in, sorted
        Result<std::vector<std::string>, Error> providerCurrencies(i64 provider_id);

        // ===========================================
        // Write side (watchlist loader)
        // ===========================================

        /// Insert or refresh on (address, chain, source, name); returns the label id
        Result<i64, Error> upsertLabel(const EntityLabel &label);

        /// Insert or refresh on (list_name, address); returns the entry id
        Result<i64, Error> addWatchlistEntry(const WatchlistEntry &entry);

        /// Insert or refresh on name; returns the provider id
        Result<i64, Error> upsertProvider(const OnrampProvider &provider);

        /// Insert or reassign on (chain, address); returns the wallet id
        Result<i64, Error> addProviderWallet(const ProviderWallet &wallet);

        /// Upper-cases the code; adding it twice is a no-op
        Result<void, Error> addProviderCurrency(i64 provider_id, const std::string &currency_code);

      private:
        storage::SqliteStore &store_;

        Result<i64, Error> selectId(storage::Statement &stmt, const std::string &what);
    };

} // namespace chainwatch::entity
