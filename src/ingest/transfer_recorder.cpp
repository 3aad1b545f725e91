#include <chainwatch/common/amount.hpp>
#include <chainwatch/ingest/transfer_recorder.hpp>

namespace chainwatch::ingest {

    using storage::Statement;

    namespace {

        constexpr const char *TRANSFER_COLUMNS =
            "id, chain_id, block_number, block_hash, tx_hash, log_index, token_address, from_address, "
            "to_address, amount, token_symbol, token_decimals, block_timestamp";

        Transfer readTransfer(const Statement &stmt) {
            Transfer t;
            t.id = stmt.columnInt64(0);
            t.chain_id = stmt.columnInt64(1);
            t.block_number = stmt.columnInt64(2);
            t.block_hash = stmt.columnText(3);
            t.tx_hash = stmt.columnText(4);
            t.log_index = static_cast<i32>(stmt.columnInt64(5));
            t.token_address = stmt.columnText(6);
            t.from_address = stmt.columnText(7);
            t.to_address = stmt.columnText(8);
            t.amount = stmt.columnText(9);
            t.token_symbol = stmt.columnText(10);
            t.token_decimals = static_cast<i16>(stmt.columnInt64(11));
            t.block_timestamp = stmt.columnInt64(12);
            return t;
        }

    } // namespace

    Transfer makeTransfer(const FetchedBlock &block, const FetchedTransfer &fetched) {
        Transfer t;
        t.chain_id = block.chain_id;
        t.block_number = block.number;
        t.block_hash = block.hash;
        t.tx_hash = fetched.tx_hash;
        t.log_index = fetched.log_index;
        t.token_address = fetched.token_address;
        t.from_address = fetched.from;
        t.to_address = fetched.to;
        t.amount = fetched.amount;
        t.token_symbol = fetched.symbol;
        t.token_decimals = fetched.decimals;
        t.block_timestamp = block.timestamp;
        return t;
    }

    Result<RecordOutcome, Error> TransferRecorder::record(const Transfer &transfer) {
        if (transfer.tx_hash.empty() || transfer.from_address.empty() || transfer.to_address.empty()) {
            return Result<RecordOutcome, Error>::err(
                invalid_block("Transfer is missing tx hash or addresses at block " +
                              std::to_string(transfer.block_number)));
        }
        if (transfer.log_index < 0) {
            return Result<RecordOutcome, Error>::err(invalid_block("Negative log index in " + transfer.tx_hash));
        }

        auto amount = Amount::parse(transfer.amount);
        if (!amount.is_ok())
            return Result<RecordOutcome, Error>::err(amount.error());

        const std::string tx_hash = normalizeHex(transfer.tx_hash);

        Statement insert(store_, "INSERT OR IGNORE INTO transfers (chain_id, block_number, block_hash, tx_hash, "
                                 "log_index, token_address, from_address, to_address, amount, token_symbol, "
                                 "token_decimals, block_timestamp) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
        insert.bind(1, transfer.chain_id)
            .bind(2, transfer.block_number)
            .bind(3, normalizeHex(transfer.block_hash))
            .bind(4, tx_hash)
            .bind(5, transfer.log_index)
            .bind(6, normalizeHex(transfer.token_address))
            .bind(7, normalizeHex(transfer.from_address))
            .bind(8, normalizeHex(transfer.to_address))
            .bind(9, amount.value().toString())
            .bind(10, transfer.token_symbol)
            .bind(11, static_cast<int>(transfer.token_decimals))
            .bind(12, transfer.block_timestamp);

        auto inserted = insert.exec();
        if (!inserted.is_ok())
            return Result<RecordOutcome, Error>::err(inserted.error());

        RecordOutcome outcome;
        outcome.inserted = insert.changes() > 0;

        Statement lookup(store_, "SELECT id FROM transfers WHERE chain_id = ? AND tx_hash = ? AND log_index = ?");
        lookup.bind(1, transfer.chain_id).bind(2, tx_hash).bind(3, transfer.log_index);
        if (!lookup.next()) {
            if (!lookup.ok())
                return Result<RecordOutcome, Error>::err(lookup.error());
            return Result<RecordOutcome, Error>::err(store_failed("Recorded transfer not found: " + tx_hash));
        }
        outcome.id = lookup.columnInt64(0);

        return Result<RecordOutcome, Error>::ok(outcome);
    }

    Result<std::optional<Transfer>, Error> TransferRecorder::get(i64 id) {
        std::string sql = std::string("SELECT ") + TRANSFER_COLUMNS + " FROM transfers WHERE id = ?";
        Statement stmt(store_, sql.c_str());
        stmt.bind(1, id);
        if (stmt.next())
            return Result<std::optional<Transfer>, Error>::ok(readTransfer(stmt));
        if (!stmt.ok())
            return Result<std::optional<Transfer>, Error>::err(stmt.error());
        return Result<std::optional<Transfer>, Error>::ok(std::nullopt);
    }

    Result<std::vector<Transfer>, Error> TransferRecorder::query(const char *where, i64 chain_id,
                                                                 std::optional<i64> height) {
        std::string sql = std::string("SELECT ") + TRANSFER_COLUMNS + " FROM transfers WHERE " + where +
                          " ORDER BY block_number, log_index";
        Statement stmt(store_, sql.c_str());
        stmt.bind(1, chain_id);
        if (height.has_value())
            stmt.bind(2, *height);

        std::vector<Transfer> rows;
        while (stmt.next()) {
            rows.push_back(readTransfer(stmt));
        }
        if (!stmt.ok())
            return Result<std::vector<Transfer>, Error>::err(stmt.error());
        return Result<std::vector<Transfer>, Error>::ok(std::move(rows));
    }

    Result<std::vector<Transfer>, Error> TransferRecorder::listAbove(i64 chain_id, i64 height) {
        return query("chain_id = ? AND block_number > ?", chain_id, height);
    }

    Result<std::vector<Transfer>, Error> TransferRecorder::listForChain(i64 chain_id) {
        return query("chain_id = ?", chain_id, std::nullopt);
    }

    Result<i64, Error> TransferRecorder::count(i64 chain_id) {
        Statement stmt(store_, "SELECT COUNT(*) FROM transfers WHERE chain_id = ?");
        stmt.bind(1, chain_id);
        if (!stmt.next())
            return Result<i64, Error>::err(stmt.error());
        return Result<i64, Error>::ok(stmt.columnInt64(0));
    }

} // namespace chainwatch::ingest
