#include <chainwatch/entity/entity_attributor.hpp>
#include <iostream>
#include <nlohmann/json.hpp>

namespace chainwatch::entity {

    using storage::Statement;

    Result<AttributionOutcome, Error> EntityAttributor::attribute(const Transfer &transfer) {
        AttributionOutcome outcome;

        auto from_flags = flagSide(transfer, transfer.from_address, "from");
        if (!from_flags.is_ok())
            return Result<AttributionOutcome, Error>::err(from_flags.error());
        auto to_flags = flagSide(transfer, transfer.to_address, "to");
        if (!to_flags.is_ok())
            return Result<AttributionOutcome, Error>::err(to_flags.error());
        outcome.flags_written = from_flags.value() + to_flags.value();

        auto from_wallet = registry_.providerWalletFor(transfer.chain_id, transfer.from_address);
        if (!from_wallet.is_ok())
            return Result<AttributionOutcome, Error>::err(from_wallet.error());
        auto to_wallet = registry_.providerWalletFor(transfer.chain_id, transfer.to_address);
        if (!to_wallet.is_ok())
            return Result<AttributionOutcome, Error>::err(to_wallet.error());

        const auto &from = from_wallet.value();
        const auto &to = to_wallet.value();

        if (from.has_value() && to.has_value()) {
            outcome.ambiguous = true;
            auto audited = recordAmbiguity(transfer, *from, *to);
            if (!audited.is_ok())
                return Result<AttributionOutcome, Error>::err(audited.error());
            return Result<AttributionOutcome, Error>::ok(outcome);
        }
        if (!from.has_value() && !to.has_value())
            return Result<AttributionOutcome, Error>::ok(outcome);

        // Funds arriving at a provider wallet are a deposit into it
        const ProviderWallet &wallet = to.has_value() ? *to : *from;
        const std::string direction = to.has_value() ? "deposit" : "withdrawal";

        Statement stmt(store_, "INSERT INTO onramp_transfers (transfer_id, provider_id, direction) VALUES (?, ?, ?) "
                               "ON CONFLICT(transfer_id) DO UPDATE SET provider_id = excluded.provider_id, "
                               "direction = excluded.direction");
        stmt.bind(1, transfer.id).bind(2, wallet.provider_id).bind(3, direction);
        auto res = stmt.exec();
        if (!res.is_ok())
            return Result<AttributionOutcome, Error>::err(res.error());

        outcome.onramp_direction = direction;
        return Result<AttributionOutcome, Error>::ok(outcome);
    }

    Result<i64, Error> EntityAttributor::flagSide(const Transfer &transfer, const std::string &address,
                                                  const char *side) {
        i64 written = 0;

        auto hits = registry_.watchlistHits(address);
        if (!hits.is_ok())
            return Result<i64, Error>::err(hits.error());
        for (const auto &hit : hits.value()) {
            auto inserted = insertFlag(transfer.id, "watchlist", hit.id, side);
            if (!inserted.is_ok())
                return Result<i64, Error>::err(inserted.error());
            written += inserted.value() ? 1 : 0;
        }

        auto labels = registry_.labelsFor(address, transfer.chain_id);
        if (!labels.is_ok())
            return Result<i64, Error>::err(labels.error());
        for (const auto &label : labels.value()) {
            auto inserted = insertFlag(transfer.id, "label", label.id, side);
            if (!inserted.is_ok())
                return Result<i64, Error>::err(inserted.error());
            written += inserted.value() ? 1 : 0;
        }

        return Result<i64, Error>::ok(written);
    }

    Result<bool, Error> EntityAttributor::insertFlag(i64 transfer_id, const char *kind, i64 label_id,
                                                     const char *side) {
        Statement stmt(store_, "INSERT OR IGNORE INTO transfer_entity_flags (transfer_id, label_kind, label_id, side) "
                               "VALUES (?, ?, ?, ?)");
        stmt.bind(1, transfer_id).bind(2, std::string(kind)).bind(3, label_id).bind(4, std::string(side));
        auto res = stmt.exec();
        if (!res.is_ok())
            return Result<bool, Error>::err(res.error());
        return Result<bool, Error>::ok(stmt.changes() > 0);
    }

    Result<void, Error> EntityAttributor::recordAmbiguity(const Transfer &transfer, const ProviderWallet &from,
                                                          const ProviderWallet &to) {
        nlohmann::json details = {{"from_provider_id", from.provider_id},
                                  {"to_provider_id", to.provider_id},
                                  {"from_address", transfer.from_address},
                                  {"to_address", transfer.to_address}};

        Statement stmt(store_, "INSERT OR IGNORE INTO attribution_audit (transfer_id, chain_id, reason, details, "
                               "recorded_at) VALUES (?, ?, 'both_sides_provider', ?, ?)");
        stmt.bind(1, transfer.id)
            .bind(2, transfer.chain_id)
            .bind(3, details.dump())
            .bind(4, storage::currentTimestamp());
        auto res = stmt.exec();
        if (!res.is_ok())
            return res;

        if (stmt.changes() > 0) {
            std::cout << "[attribution] Transfer " << transfer.id << " (" << transfer.tx_hash
                      << ") matches provider wallets on both sides, skipping on-ramp attribution" << std::endl;
        }
        return Result<void, Error>::ok();
    }

    Result<std::vector<TransferEntityFlag>, Error> EntityAttributor::flagsFor(i64 transfer_id) {
        Statement stmt(store_, "SELECT transfer_id, label_kind, label_id, side FROM transfer_entity_flags "
                               "WHERE transfer_id = ? ORDER BY id");
        stmt.bind(1, transfer_id);

        std::vector<TransferEntityFlag> flags;
        while (stmt.next()) {
            TransferEntityFlag flag;
            flag.transfer_id = stmt.columnInt64(0);
            flag.label_kind = stmt.columnText(1);
            flag.label_id = stmt.columnInt64(2);
            flag.side = stmt.columnText(3);
            flags.push_back(std::move(flag));
        }
        if (!stmt.ok())
            return Result<std::vector<TransferEntityFlag>, Error>::err(stmt.error());
        return Result<std::vector<TransferEntityFlag>, Error>::ok(std::move(flags));
    }

    Result<std::optional<OnrampTransfer>, Error> EntityAttributor::onrampFor(i64 transfer_id) {
        Statement stmt(store_, "SELECT transfer_id, provider_id, direction FROM onramp_transfers WHERE transfer_id = ?");
        stmt.bind(1, transfer_id);
        if (stmt.next()) {
            OnrampTransfer row;
            row.transfer_id = stmt.columnInt64(0);
            row.provider_id = stmt.columnInt64(1);
            row.direction = stmt.columnText(2);
            return Result<std::optional<OnrampTransfer>, Error>::ok(row);
        }
        if (!stmt.ok())
            return Result<std::optional<OnrampTransfer>, Error>::err(stmt.error());
        return Result<std::optional<OnrampTransfer>, Error>::ok(std::nullopt);
    }

} // namespace chainwatch::entity
