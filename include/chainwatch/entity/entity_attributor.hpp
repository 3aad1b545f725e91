#pragma once

#include <datapod/datapod.hpp>
#include <optional>
#include <string>
#include <vector>

#include "chainwatch/common/types.hpp"
#include "chainwatch/entity/label_registry.hpp"
#include "chainwatch/storage/sqlite_store.hpp"

namespace chainwatch::entity {

    using namespace datapod;

    struct AttributionOutcome {
        i64 flags_written = 0;                       // new flag rows only
        std::optional<std::string> onramp_direction; // "deposit" or "withdrawal"
        bool ambiguous = false;                      // both sides are provider wallets
    };

    /// Joins a transfer's addresses against the registries and records flags and on-ramp rows.
    /// Re-running on the same transfer writes nothing new.
    class EntityAttributor {
      public:
        EntityAttributor(storage::SqliteStore &store, LabelRegistry &registry) : store_(store), registry_(registry) {}

        Result<AttributionOutcome, Error> attribute(const Transfer &transfer);

        Result<std::vector<TransferEntityFlag>, Error> flagsFor(i64 transfer_id);
        Result<std::optional<OnrampTransfer>, Error> onrampFor(i64 transfer_id);

      private:
        storage::SqliteStore &store_;
        LabelRegistry &registry_;

        Result<i64, Error> flagSide(const Transfer &transfer, const std::string &address, const char *side);
        Result<bool, Error> insertFlag(i64 transfer_id, const char *kind, i64 label_id, const char *side);
        Result<void, Error> recordAmbiguity(const Transfer &transfer, const ProviderWallet &from,
                                            const ProviderWallet &to);
    };

} // namespace chainwatch::entity
