#include <chainwatch/ingest/checkpoint_store.hpp>

namespace chainwatch::ingest {

    using storage::Statement;

    Result<std::optional<Checkpoint>, Error> CheckpointStore::get(i64 chain_id) {
        Statement stmt(store_, "SELECT chain_id, last_indexed_block, last_block_hash, updated_at "
                               "FROM chain_checkpoints WHERE chain_id = ?");
        stmt.bind(1, chain_id);

        if (stmt.next()) {
            Checkpoint cp;
            cp.chain_id = stmt.columnInt64(0);
            cp.last_indexed_block = stmt.columnInt64(1);
            cp.last_block_hash = stmt.columnText(2);
            cp.updated_at = stmt.columnInt64(3);
            return Result<std::optional<Checkpoint>, Error>::ok(cp);
        }
        if (!stmt.ok())
            return Result<std::optional<Checkpoint>, Error>::err(stmt.error());
        return Result<std::optional<Checkpoint>, Error>::ok(std::nullopt);
    }

    Result<void, Error> CheckpointStore::put(i64 chain_id, i64 height, const std::string &hash) {
        Statement stmt(store_, "INSERT INTO chain_checkpoints (chain_id, last_indexed_block, last_block_hash, updated_at) "
                               "VALUES (?, ?, ?, ?) "
                               "ON CONFLICT(chain_id) DO UPDATE SET last_indexed_block = excluded.last_indexed_block, "
                               "last_block_hash = excluded.last_block_hash, updated_at = excluded.updated_at");
        stmt.bind(1, chain_id).bind(2, height).bind(3, hash).bind(4, storage::currentTimestamp());
        return stmt.exec();
    }

    Result<std::optional<BlockHashRecord>, Error> CheckpointStore::blockHash(i64 chain_id, i64 height) {
        Statement stmt(store_, "SELECT block_hash, parent_hash FROM block_hashes WHERE chain_id = ? AND block_number = ?");
        stmt.bind(1, chain_id).bind(2, height);

        if (stmt.next()) {
            BlockHashRecord row;
            row.chain_id = chain_id;
            row.block_number = height;
            row.block_hash = stmt.columnText(0);
            row.parent_hash = stmt.columnText(1);
            return Result<std::optional<BlockHashRecord>, Error>::ok(row);
        }
        if (!stmt.ok())
            return Result<std::optional<BlockHashRecord>, Error>::err(stmt.error());
        return Result<std::optional<BlockHashRecord>, Error>::ok(std::nullopt);
    }

    Result<void, Error> CheckpointStore::putBlockHash(const BlockHashRecord &row) {
        Statement stmt(store_, "INSERT OR REPLACE INTO block_hashes (chain_id, block_number, block_hash, parent_hash) "
                               "VALUES (?, ?, ?, ?)");
        stmt.bind(1, row.chain_id).bind(2, row.block_number).bind(3, row.block_hash).bind(4, row.parent_hash);
        return stmt.exec();
    }

    Result<i64, Error> CheckpointStore::deleteBlockHashesAbove(i64 chain_id, i64 height) {
        Statement stmt(store_, "DELETE FROM block_hashes WHERE chain_id = ? AND block_number > ?");
        stmt.bind(1, chain_id).bind(2, height);
        auto res = stmt.exec();
        if (!res.is_ok())
            return Result<i64, Error>::err(res.error());
        return Result<i64, Error>::ok(stmt.changes());
    }

} // namespace chainwatch::ingest
