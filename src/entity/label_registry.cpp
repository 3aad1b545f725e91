#include <algorithm>
#include <cctype>
#include <chainwatch/entity/label_registry.hpp>

namespace chainwatch::entity {

    using storage::Statement;

    Result<std::vector<EntityLabel>, Error> LabelRegistry::labelsFor(const std::string &address, i64 chain_id) {
        // Chain-scoped rows sort first; the first row decides which scope applies
        Statement stmt(store_, "SELECT id, address, chain_id, entity_name, entity_type, label_source, confidence "
                               "FROM entity_labels WHERE address = ? AND (chain_id = ? OR chain_id IS NULL) "
                               "ORDER BY (chain_id IS NULL), id");
        stmt.bind(1, normalizeHex(address)).bind(2, chain_id);

        std::vector<EntityLabel> labels;
        while (stmt.next()) {
            EntityLabel label;
            label.id = stmt.columnInt64(0);
            label.address = stmt.columnText(1);
            if (!stmt.columnIsNull(2))
                label.chain_id = stmt.columnInt64(2);
            label.entity_name = stmt.columnText(3);
            label.entity_type = stmt.columnText(4);
            label.label_source = stmt.columnText(5);
            label.confidence = stmt.columnDouble(6);

            if (!labels.empty() && labels.front().chain_id.has_value() && !label.chain_id.has_value())
                break;
            labels.push_back(std::move(label));
        }
        if (!stmt.ok())
            return Result<std::vector<EntityLabel>, Error>::err(stmt.error());
        return Result<std::vector<EntityLabel>, Error>::ok(std::move(labels));
    }

    Result<std::vector<WatchlistEntry>, Error> LabelRegistry::watchlistHits(const std::string &address) {
        Statement stmt(store_, "SELECT id, list_name, address, entity_name, sdn_id, program "
                               "FROM watchlist_entries WHERE address = ? ORDER BY id");
        stmt.bind(1, normalizeHex(address));

        std::vector<WatchlistEntry> hits;
        while (stmt.next()) {
            WatchlistEntry entry;
            entry.id = stmt.columnInt64(0);
            entry.list_name = stmt.columnText(1);
            entry.address = stmt.columnText(2);
            entry.entity_name = stmt.columnText(3);
            entry.sdn_id = stmt.columnText(4);
            entry.program = stmt.columnText(5);
            hits.push_back(std::move(entry));
        }
        if (!stmt.ok())
            return Result<std::vector<WatchlistEntry>, Error>::err(stmt.error());
        return Result<std::vector<WatchlistEntry>, Error>::ok(std::move(hits));
    }

    Result<bool, Error> LabelRegistry::isSanctioned(const std::string &address, i64 chain_id) {
        auto hits = watchlistHits(address);
        if (!hits.is_ok())
            return Result<bool, Error>::err(hits.error());
        if (!hits.value().empty())
            return Result<bool, Error>::ok(true);

        auto labels = labelsFor(address, chain_id);
        if (!labels.is_ok())
            return Result<bool, Error>::err(labels.error());
        for (const auto &label : labels.value()) {
            if (label.entity_type == "sanctioned" || label.label_source == "ofac_sdn")
                return Result<bool, Error>::ok(true);
        }
        return Result<bool, Error>::ok(false);
    }

    Result<std::optional<ProviderWallet>, Error> LabelRegistry::providerWalletFor(i64 chain_id,
                                                                                  const std::string &address) {
        Statement stmt(store_, "SELECT id, provider_id, chain_id, address, label FROM provider_wallets "
                               "WHERE chain_id = ? AND address = ?");
        stmt.bind(1, chain_id).bind(2, normalizeHex(address));
        if (stmt.next()) {
            ProviderWallet wallet;
            wallet.id = stmt.columnInt64(0);
            wallet.provider_id = stmt.columnInt64(1);
            wallet.chain_id = stmt.columnInt64(2);
            wallet.address = stmt.columnText(3);
            wallet.label = stmt.columnText(4);
            return Result<std::optional<ProviderWallet>, Error>::ok(wallet);
        }
        if (!stmt.ok())
            return Result<std::optional<ProviderWallet>, Error>::err(stmt.error());
        return Result<std::optional<ProviderWallet>, Error>::ok(std::nullopt);
    }

    Result<std::vector<std::string>, Error> LabelRegistry::providerCurrencies(i64 provider_id) {
        Statement stmt(store_, "SELECT currency_code FROM provider_fiat_currencies WHERE provider_id = ? "
                               "ORDER BY currency_code");
        stmt.bind(1, provider_id);

        std::vector<std::string> codes;
        while (stmt.next()) {
            codes.push_back(stmt.columnText(0));
        }
        if (!stmt.ok())
            return Result<std::vector<std::string>, Error>::err(stmt.error());
        return Result<std::vector<std::string>, Error>::ok(std::move(codes));
    }

    Result<i64, Error> LabelRegistry::selectId(Statement &stmt, const std::string &what) {
        if (stmt.next())
            return Result<i64, Error>::ok(stmt.columnInt64(0));
        if (!stmt.ok())
            return Result<i64, Error>::err(stmt.error());
        return Result<i64, Error>::err(store_failed(what + " not found after write"));
    }

    Result<i64, Error> LabelRegistry::upsertLabel(const EntityLabel &label) {
        const std::string address = normalizeHex(label.address);
        const i64 now = storage::currentTimestamp();

        Statement existing(store_, "SELECT id FROM entity_labels WHERE address = ? AND IFNULL(chain_id, -1) = ? "
                                   "AND label_source = ? AND entity_name = ?");
        existing.bind(1, address)
            .bind(2, label.chain_id.value_or(-1))
            .bind(3, label.label_source)
            .bind(4, label.entity_name);
        if (existing.next()) {
            i64 id = existing.columnInt64(0);
            Statement update(store_, "UPDATE entity_labels SET entity_type = ?, confidence = ?, updated_at = ? "
                                     "WHERE id = ?");
            update.bind(1, label.entity_type).bind(2, label.confidence).bind(3, now).bind(4, id);
            auto res = update.exec();
            if (!res.is_ok())
                return Result<i64, Error>::err(res.error());
            return Result<i64, Error>::ok(id);
        }
        if (!existing.ok())
            return Result<i64, Error>::err(existing.error());

        Statement insert(store_, "INSERT INTO entity_labels (address, chain_id, entity_name, entity_type, label_source, "
                                 "confidence, created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
        insert.bind(1, address)
            .bind(2, label.chain_id)
            .bind(3, label.entity_name)
            .bind(4, label.entity_type)
            .bind(5, label.label_source)
            .bind(6, label.confidence)
            .bind(7, now)
            .bind(8, now);
        auto res = insert.exec();
        if (!res.is_ok())
            return Result<i64, Error>::err(res.error());

        Statement id(store_, "SELECT last_insert_rowid()");
        return selectId(id, "entity label");
    }

    Result<i64, Error> LabelRegistry::addWatchlistEntry(const WatchlistEntry &entry) {
        const std::string address = normalizeHex(entry.address);

        Statement upsert(store_, "INSERT INTO watchlist_entries (list_name, address, entity_name, sdn_id, program, "
                                 "added_at) VALUES (?, ?, ?, ?, ?, ?) "
                                 "ON CONFLICT(list_name, address) DO UPDATE SET entity_name = excluded.entity_name, "
                                 "sdn_id = excluded.sdn_id, program = excluded.program");
        upsert.bind(1, entry.list_name)
            .bind(2, address)
            .bind(3, entry.entity_name)
            .bind(4, entry.sdn_id)
            .bind(5, entry.program)
            .bind(6, storage::currentTimestamp());
        auto res = upsert.exec();
        if (!res.is_ok())
            return Result<i64, Error>::err(res.error());

        Statement id(store_, "SELECT id FROM watchlist_entries WHERE list_name = ? AND address = ?");
        id.bind(1, entry.list_name).bind(2, address);
        return selectId(id, "watchlist entry");
    }

    Result<i64, Error> LabelRegistry::upsertProvider(const OnrampProvider &provider) {
        Statement upsert(store_, "INSERT INTO onramp_providers (name, provider_type, website, kyc_required, created_at) "
                                 "VALUES (?, ?, ?, ?, ?) "
                                 "ON CONFLICT(name) DO UPDATE SET provider_type = excluded.provider_type, "
                                 "website = excluded.website, kyc_required = excluded.kyc_required");
        upsert.bind(1, provider.name)
            .bind(2, provider.provider_type)
            .bind(3, provider.website)
            .bind(4, provider.kyc_required ? 1 : 0)
            .bind(5, storage::currentTimestamp());
        auto res = upsert.exec();
        if (!res.is_ok())
            return Result<i64, Error>::err(res.error());

        Statement id(store_, "SELECT id FROM onramp_providers WHERE name = ?");
        id.bind(1, provider.name);
        return selectId(id, "provider");
    }

    Result<i64, Error> LabelRegistry::addProviderWallet(const ProviderWallet &wallet) {
        const std::string address = normalizeHex(wallet.address);

        Statement upsert(store_, "INSERT INTO provider_wallets (provider_id, chain_id, address, label, created_at) "
                                 "VALUES (?, ?, ?, ?, ?) "
                                 "ON CONFLICT(chain_id, address) DO UPDATE SET provider_id = excluded.provider_id, "
                                 "label = excluded.label");
        upsert.bind(1, wallet.provider_id)
            .bind(2, wallet.chain_id)
            .bind(3, address)
            .bind(4, wallet.label)
            .bind(5, storage::currentTimestamp());
        auto res = upsert.exec();
        if (!res.is_ok())
            return Result<i64, Error>::err(res.error());

        Statement id(store_, "SELECT id FROM provider_wallets WHERE chain_id = ? AND address = ?");
        id.bind(1, wallet.chain_id).bind(2, address);
        return selectId(id, "provider wallet");
    }

    Result<void, Error> LabelRegistry::addProviderCurrency(i64 provider_id, const std::string &currency_code) {
        std::string code = currency_code;
        std::transform(code.begin(), code.end(), code.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        if (code.empty())
            return Result<void, Error>::err(config_error("Empty currency code"));

        Statement insert(store_, "INSERT OR IGNORE INTO provider_fiat_currencies (provider_id, currency_code) "
                                 "VALUES (?, ?)");
        insert.bind(1, provider_id).bind(2, code);
        return insert.exec();
    }

} // namespace chainwatch::entity
