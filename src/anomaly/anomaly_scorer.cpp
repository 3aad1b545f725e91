#include <chainwatch/anomaly/anomaly_scorer.hpp>

namespace chainwatch::anomaly {

    using storage::Statement;

    Result<WalletContext, Error> AnomalyScorer::buildContext(const Transfer &transfer) {
        WalletContext context;

        auto from_sanctioned = registry_.isSanctioned(transfer.from_address, transfer.chain_id);
        if (!from_sanctioned.is_ok())
            return Result<WalletContext, Error>::err(from_sanctioned.error());
        context.from_sanctioned = from_sanctioned.value();

        auto to_sanctioned = registry_.isSanctioned(transfer.to_address, transfer.chain_id);
        if (!to_sanctioned.is_ok())
            return Result<WalletContext, Error>::err(to_sanctioned.error());
        context.to_sanctioned = to_sanctioned.value();

        auto first_seen = graph_.firstSeen(transfer.to_address, transfer.chain_id);
        if (!first_seen.is_ok())
            return Result<WalletContext, Error>::err(first_seen.error());
        context.to_first_seen = first_seen.value();

        Statement velocity(store_, "SELECT COUNT(*) FROM transfers WHERE chain_id = ? AND from_address = ? "
                                   "AND block_timestamp > ? AND block_timestamp <= ?");
        velocity.bind(1, transfer.chain_id)
            .bind(2, transfer.from_address)
            .bind(3, transfer.block_timestamp - config_.velocity_window_secs)
            .bind(4, transfer.block_timestamp);
        if (!velocity.next())
            return Result<WalletContext, Error>::err(velocity.error());
        context.sender_transfers_in_window = velocity.columnInt64(0);

        auto reverse = graph_.edge(transfer.to_address, transfer.from_address, transfer.chain_id);
        if (!reverse.is_ok())
            return Result<WalletContext, Error>::err(reverse.error());
        context.reverse_edge = reverse.value();

        return Result<WalletContext, Error>::ok(std::move(context));
    }

    Result<i64, Error> AnomalyScorer::evaluate(const Transfer &transfer) {
        if (!config_.enabled)
            return Result<i64, Error>::ok(0);

        auto context = buildContext(transfer);
        if (!context.is_ok())
            return Result<i64, Error>::err(context.error());

        i64 written = 0;
        for (const auto &detection : evaluateRules(transfer, context.value(), config_)) {
            auto res = upsert(transfer, detection);
            if (!res.is_ok())
                return Result<i64, Error>::err(res.error());
            ++written;
        }
        return Result<i64, Error>::ok(written);
    }

    Result<void, Error> AnomalyScorer::upsert(const Transfer &transfer, const Detection &detection) {
        Statement stmt(store_, "INSERT INTO anomalies (transfer_id, chain_id, anomaly_type, risk_score, flags, details, "
                               "address, detected_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?) "
                               "ON CONFLICT(transfer_id, anomaly_type) DO UPDATE SET risk_score = excluded.risk_score, "
                               "flags = excluded.flags, details = excluded.details, address = excluded.address");
        stmt.bind(1, transfer.id)
            .bind(2, transfer.chain_id)
            .bind(3, detection.anomaly_type)
            .bind(4, detection.risk_score)
            .bind(5, nlohmann::json(detection.flags).dump())
            .bind(6, detection.details.dump())
            .bind(8, storage::currentTimestamp());
        if (detection.address.has_value())
            stmt.bind(7, *detection.address);
        else
            stmt.bindNull(7);
        return stmt.exec();
    }

    Result<std::vector<AnomalyRow>, Error> AnomalyScorer::query(const char *where, i64 key) {
        std::string sql = std::string("SELECT id, transfer_id, chain_id, anomaly_type, risk_score, flags, details, "
                                      "address, resolved FROM anomalies WHERE ") +
                          where + " ORDER BY id";
        Statement stmt(store_, sql.c_str());
        stmt.bind(1, key);

        std::vector<AnomalyRow> rows;
        while (stmt.next()) {
            AnomalyRow row;
            row.id = stmt.columnInt64(0);
            row.transfer_id = stmt.columnInt64(1);
            row.chain_id = stmt.columnInt64(2);
            row.anomaly_type = stmt.columnText(3);
            row.risk_score = stmt.columnDouble(4);
            auto flags = nlohmann::json::parse(stmt.columnText(5), nullptr, false);
            if (flags.is_array()) {
                for (const auto &flag : flags) {
                    if (flag.is_string())
                        row.flags.push_back(flag.get<std::string>());
                }
            }
            row.details = stmt.columnText(6);
            row.address = stmt.columnText(7);
            row.resolved = stmt.columnInt64(8) != 0;
            rows.push_back(std::move(row));
        }
        if (!stmt.ok())
            return Result<std::vector<AnomalyRow>, Error>::err(stmt.error());
        return Result<std::vector<AnomalyRow>, Error>::ok(std::move(rows));
    }

    Result<std::vector<AnomalyRow>, Error> AnomalyScorer::anomaliesFor(i64 transfer_id) {
        return query("transfer_id = ?", transfer_id);
    }

    Result<std::vector<AnomalyRow>, Error> AnomalyScorer::anomaliesForChain(i64 chain_id) {
        return query("chain_id = ?", chain_id);
    }

} // namespace chainwatch::anomaly
