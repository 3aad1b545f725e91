#include <chainwatch/ingest/token_registry.hpp>

namespace chainwatch::ingest {

    using storage::Statement;

    Result<void, Error> TokenRegistry::upsert(const KnownToken &token) {
        if (token.token_address.empty() || token.symbol.empty())
            return Result<void, Error>::err(config_error("Known token needs an address and a symbol"));
        if (token.decimals < 0)
            return Result<void, Error>::err(config_error("Negative decimals for token " + token.symbol));

        Statement upsert(store_, "INSERT INTO known_tokens (chain_id, token_address, symbol, decimals) "
                                 "VALUES (?, ?, ?, ?) "
                                 "ON CONFLICT(chain_id, token_address) DO UPDATE SET symbol = excluded.symbol, "
                                 "decimals = excluded.decimals");
        upsert.bind(1, token.chain_id)
            .bind(2, normalizeHex(token.token_address))
            .bind(3, token.symbol)
            .bind(4, static_cast<i64>(token.decimals));
        return upsert.exec();
    }

    Result<std::optional<KnownToken>, Error> TokenRegistry::lookup(i64 chain_id, const std::string &token_address) {
        Statement stmt(store_, "SELECT token_address, symbol, decimals FROM known_tokens "
                               "WHERE chain_id = ? AND token_address = ?");
        stmt.bind(1, chain_id).bind(2, normalizeHex(token_address));
        if (stmt.next()) {
            KnownToken token;
            token.chain_id = chain_id;
            token.token_address = stmt.columnText(0);
            token.symbol = stmt.columnText(1);
            token.decimals = static_cast<i16>(stmt.columnInt64(2));
            return Result<std::optional<KnownToken>, Error>::ok(token);
        }
        if (!stmt.ok())
            return Result<std::optional<KnownToken>, Error>::err(stmt.error());
        return Result<std::optional<KnownToken>, Error>::ok(std::nullopt);
    }

    Result<std::vector<KnownToken>, Error> TokenRegistry::listForChain(i64 chain_id) {
        Statement stmt(store_, "SELECT token_address, symbol, decimals FROM known_tokens WHERE chain_id = ? "
                               "ORDER BY token_address");
        stmt.bind(1, chain_id);

        std::vector<KnownToken> tokens;
        while (stmt.next()) {
            KnownToken token;
            token.chain_id = chain_id;
            token.token_address = stmt.columnText(0);
            token.symbol = stmt.columnText(1);
            token.decimals = static_cast<i16>(stmt.columnInt64(2));
            tokens.push_back(std::move(token));
        }
        if (!stmt.ok())
            return Result<std::vector<KnownToken>, Error>::err(stmt.error());
        return Result<std::vector<KnownToken>, Error>::ok(std::move(tokens));
    }

    Result<bool, Error> TokenRegistry::fillMissing(Transfer &transfer) {
        // A symbol from the source wins together with its decimals
        if (!transfer.token_symbol.empty() || transfer.token_address.empty())
            return Result<bool, Error>::ok(false);

        auto known = lookup(transfer.chain_id, transfer.token_address);
        if (!known.is_ok())
            return Result<bool, Error>::err(known.error());
        if (!known.value().has_value())
            return Result<bool, Error>::ok(false);

        transfer.token_symbol = known.value()->symbol;
        transfer.token_decimals = known.value()->decimals;
        return Result<bool, Error>::ok(true);
    }

} // namespace chainwatch::ingest
