#pragma once

#include <utility>
#include <vector>

namespace chainwatch::storage::schema {

    // Core schema SQL definitions (inline, no separate files)

    static constexpr const char *SCHEMA_MIGRATIONS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version INTEGER PRIMARY KEY,
            applied_at INTEGER NOT NULL
        )
    )";

    // ===========================================
    // v1: ingestion
    // ===========================================

    static constexpr const char *CHAIN_CHECKPOINTS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS chain_checkpoints (
            chain_id INTEGER PRIMARY KEY,
            last_indexed_block INTEGER NOT NULL,
            last_block_hash TEXT NOT NULL DEFAULT '',
            updated_at INTEGER NOT NULL
        )
    )";

    static constexpr const char *BLOCK_HASHES_TABLE = R"(
        CREATE TABLE IF NOT EXISTS block_hashes (
            chain_id INTEGER NOT NULL,
            block_number INTEGER NOT NULL,
            block_hash TEXT NOT NULL,
            parent_hash TEXT NOT NULL,
            PRIMARY KEY (chain_id, block_number)
        )
    )";

    static constexpr const char *TRANSFERS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS transfers (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            chain_id INTEGER NOT NULL,
            block_number INTEGER NOT NULL,
            block_hash TEXT NOT NULL,
            tx_hash TEXT NOT NULL,
            log_index INTEGER NOT NULL,
            token_address TEXT NOT NULL,
            from_address TEXT NOT NULL,
            to_address TEXT NOT NULL,
            amount TEXT NOT NULL,
            token_symbol TEXT NOT NULL,
            token_decimals INTEGER NOT NULL,
            block_timestamp INTEGER NOT NULL,
            UNIQUE (chain_id, tx_hash, log_index)
        )
    )";

    static constexpr const char *PROCESSED_TRANSFERS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS processed_transfers (
            transfer_id INTEGER PRIMARY KEY REFERENCES transfers(id),
            chain_id INTEGER NOT NULL,
            processed_at INTEGER NOT NULL
        )
    )";

    static constexpr const char *IDX_TRANSFERS_CHAIN_BLOCK =
        "CREATE INDEX IF NOT EXISTS idx_transfers_chain_block ON transfers(chain_id, block_number)";
    static constexpr const char *IDX_TRANSFERS_FROM =
        "CREATE INDEX IF NOT EXISTS idx_transfers_from ON transfers(chain_id, from_address, block_timestamp)";
    static constexpr const char *IDX_TRANSFERS_TO =
        "CREATE INDEX IF NOT EXISTS idx_transfers_to ON transfers(chain_id, to_address)";
    static constexpr const char *IDX_TRANSFERS_TX_HASH =
        "CREATE INDEX IF NOT EXISTS idx_transfers_tx_hash ON transfers(tx_hash)";

    // ===========================================
    // v2: wallet graph
    // ===========================================

    static constexpr const char *WALLET_FIRST_SEEN_TABLE = R"(
        CREATE TABLE IF NOT EXISTS wallet_first_seen (
            address TEXT NOT NULL,
            chain_id INTEGER NOT NULL,
            first_seen_at INTEGER NOT NULL,
            first_block INTEGER NOT NULL,
            first_tx_hash TEXT NOT NULL,
            first_direction TEXT NOT NULL,
            PRIMARY KEY (address, chain_id)
        )
    )";

    static constexpr const char *WALLET_GRAPH_EDGES_TABLE = R"(
        CREATE TABLE IF NOT EXISTS wallet_graph_edges (
            source_address TEXT NOT NULL,
            dest_address TEXT NOT NULL,
            chain_id INTEGER NOT NULL,
            transfer_count INTEGER NOT NULL DEFAULT 1,
            total_amount TEXT NOT NULL DEFAULT '0',
            first_seen INTEGER NOT NULL,
            last_seen INTEGER NOT NULL,
            PRIMARY KEY (source_address, dest_address, chain_id)
        )
    )";

    static constexpr const char *IDX_FIRST_SEEN_CHAIN =
        "CREATE INDEX IF NOT EXISTS idx_wallet_first_seen_chain ON wallet_first_seen(chain_id, first_seen_at)";
    static constexpr const char *IDX_EDGES_DEST =
        "CREATE INDEX IF NOT EXISTS idx_graph_edges_dest ON wallet_graph_edges(dest_address, chain_id)";

    // ===========================================
    // v3: attribution
    // ===========================================

    static constexpr const char *ENTITY_LABELS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS entity_labels (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            address TEXT NOT NULL,
            chain_id INTEGER,
            entity_name TEXT NOT NULL,
            entity_type TEXT NOT NULL,
            label_source TEXT NOT NULL,
            confidence REAL NOT NULL DEFAULT 1.0,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        )
    )";

    // NULL chain_id means global; fold it so the key stays unique
    static constexpr const char *IDX_ENTITY_LABELS_UNIQUE =
        "CREATE UNIQUE INDEX IF NOT EXISTS idx_entity_labels_unique ON entity_labels"
        "(address, IFNULL(chain_id, -1), label_source, entity_name)";
    static constexpr const char *IDX_ENTITY_LABELS_ADDRESS =
        "CREATE INDEX IF NOT EXISTS idx_entity_labels_address ON entity_labels(address)";

    static constexpr const char *WATCHLIST_ENTRIES_TABLE = R"(
        CREATE TABLE IF NOT EXISTS watchlist_entries (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            list_name TEXT NOT NULL,
            address TEXT NOT NULL,
            entity_name TEXT NOT NULL DEFAULT '',
            sdn_id TEXT NOT NULL DEFAULT '',
            program TEXT NOT NULL DEFAULT '',
            added_at INTEGER NOT NULL,
            UNIQUE (list_name, address)
        )
    )";

    static constexpr const char *IDX_WATCHLIST_ADDRESS =
        "CREATE INDEX IF NOT EXISTS idx_watchlist_address ON watchlist_entries(address)";

    static constexpr const char *TRANSFER_ENTITY_FLAGS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS transfer_entity_flags (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            transfer_id INTEGER NOT NULL REFERENCES transfers(id),
            label_kind TEXT NOT NULL,
            label_id INTEGER NOT NULL,
            side TEXT NOT NULL,
            UNIQUE (transfer_id, label_kind, label_id, side)
        )
    )";

    static constexpr const char *ONRAMP_PROVIDERS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS onramp_providers (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT NOT NULL UNIQUE,
            provider_type TEXT NOT NULL,
            website TEXT NOT NULL DEFAULT '',
            kyc_required INTEGER NOT NULL DEFAULT 1,
            created_at INTEGER NOT NULL
        )
    )";

    static constexpr const char *PROVIDER_WALLETS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS provider_wallets (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            provider_id INTEGER NOT NULL REFERENCES onramp_providers(id),
            chain_id INTEGER NOT NULL,
            address TEXT NOT NULL,
            label TEXT NOT NULL DEFAULT '',
            created_at INTEGER NOT NULL,
            UNIQUE (chain_id, address)
        )
    )";

    static constexpr const char *ONRAMP_TRANSFERS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS onramp_transfers (
            transfer_id INTEGER PRIMARY KEY REFERENCES transfers(id),
            provider_id INTEGER NOT NULL REFERENCES onramp_providers(id),
            direction TEXT NOT NULL
        )
    )";

    static constexpr const char *ATTRIBUTION_AUDIT_TABLE = R"(
        CREATE TABLE IF NOT EXISTS attribution_audit (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            transfer_id INTEGER NOT NULL REFERENCES transfers(id),
            chain_id INTEGER NOT NULL,
            reason TEXT NOT NULL,
            details TEXT NOT NULL DEFAULT '',
            recorded_at INTEGER NOT NULL,
            UNIQUE (transfer_id, reason)
        )
    )";

    static constexpr const char *IDX_FLAGS_TRANSFER =
        "CREATE INDEX IF NOT EXISTS idx_transfer_entity_flags_transfer ON transfer_entity_flags(transfer_id)";
    static constexpr const char *IDX_PROVIDER_WALLETS_ADDRESS =
        "CREATE INDEX IF NOT EXISTS idx_provider_wallets_address ON provider_wallets(address)";

    // ===========================================
    // v4: anomalies
    // ===========================================

    static constexpr const char *ANOMALIES_TABLE = R"(
        CREATE TABLE IF NOT EXISTS anomalies (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            transfer_id INTEGER NOT NULL REFERENCES transfers(id),
            chain_id INTEGER NOT NULL,
            anomaly_type TEXT NOT NULL,
            risk_score REAL NOT NULL,
            flags TEXT NOT NULL DEFAULT '[]',
            details TEXT NOT NULL DEFAULT '{}',
            address TEXT,
            detected_at INTEGER NOT NULL,
            resolved INTEGER NOT NULL DEFAULT 0,
            UNIQUE (transfer_id, anomaly_type)
        )
    )";

    static constexpr const char *IDX_ANOMALIES_CHAIN =
        "CREATE INDEX IF NOT EXISTS idx_anomalies_chain ON anomalies(chain_id, detected_at)";
    static constexpr const char *IDX_ANOMALIES_UNRESOLVED =
        "CREATE INDEX IF NOT EXISTS idx_anomalies_unresolved ON anomalies(resolved) WHERE resolved = 0";

    // ===========================================
    // v5: wallet clusters
    // ===========================================

    static constexpr const char *WALLET_CLUSTERS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS wallet_clusters (
            address TEXT NOT NULL,
            chain_id INTEGER NOT NULL,
            cluster_id INTEGER NOT NULL,
            assigned_at INTEGER NOT NULL,
            PRIMARY KEY (address, chain_id)
        )
    )";

    static constexpr const char *IDX_CLUSTERS_CHAIN =
        "CREATE INDEX IF NOT EXISTS idx_wallet_clusters_chain ON wallet_clusters(chain_id, cluster_id)";

    // ===========================================
    // v6: token and provider registries
    // ===========================================

    static constexpr const char *KNOWN_TOKENS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS known_tokens (
            chain_id INTEGER NOT NULL,
            token_address TEXT NOT NULL,
            symbol TEXT NOT NULL,
            decimals INTEGER NOT NULL,
            PRIMARY KEY (chain_id, token_address)
        )
    )";

    static constexpr const char *PROVIDER_FIAT_CURRENCIES_TABLE = R"(
        CREATE TABLE IF NOT EXISTS provider_fiat_currencies (
            provider_id INTEGER NOT NULL REFERENCES onramp_providers(id),
            currency_code TEXT NOT NULL,
            PRIMARY KEY (provider_id, currency_code)
        )
    )";

    /// Ordered migrations: version -> statements
    inline std::vector<std::pair<int, std::vector<const char *>>> migrations() {
        return {
            {1,
             {CHAIN_CHECKPOINTS_TABLE, BLOCK_HASHES_TABLE, TRANSFERS_TABLE, PROCESSED_TRANSFERS_TABLE,
              IDX_TRANSFERS_CHAIN_BLOCK, IDX_TRANSFERS_FROM, IDX_TRANSFERS_TO, IDX_TRANSFERS_TX_HASH}},
            {2, {WALLET_FIRST_SEEN_TABLE, WALLET_GRAPH_EDGES_TABLE, IDX_FIRST_SEEN_CHAIN, IDX_EDGES_DEST}},
            {3,
             {ENTITY_LABELS_TABLE, IDX_ENTITY_LABELS_UNIQUE, IDX_ENTITY_LABELS_ADDRESS, WATCHLIST_ENTRIES_TABLE,
              IDX_WATCHLIST_ADDRESS, TRANSFER_ENTITY_FLAGS_TABLE, ONRAMP_PROVIDERS_TABLE, PROVIDER_WALLETS_TABLE,
              ONRAMP_TRANSFERS_TABLE, ATTRIBUTION_AUDIT_TABLE, IDX_FLAGS_TRANSFER, IDX_PROVIDER_WALLETS_ADDRESS}},
            {4, {ANOMALIES_TABLE, IDX_ANOMALIES_CHAIN, IDX_ANOMALIES_UNRESOLVED}},
            {5, {WALLET_CLUSTERS_TABLE, IDX_CLUSTERS_CHAIN}},
            {6, {KNOWN_TOKENS_TABLE, PROVIDER_FIAT_CURRENCIES_TABLE}},
        };
    }

} // namespace chainwatch::storage::schema
