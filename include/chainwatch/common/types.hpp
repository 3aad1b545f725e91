#pragma once

#include <algorithm>
#include <cctype>
#include <datapod/datapod.hpp>
#include <optional>
#include <string>
#include <vector>

namespace chainwatch {

    using namespace datapod;

    // ===========================================
    // Fetched input (produced by the external fetch/decode layer)
    // ===========================================

    /// One decoded Transfer log inside a fetched block
    struct FetchedTransfer {
        std::string tx_hash;
        i32 log_index = 0;
        std::string token_address;
        std::string from;
        std::string to;
        std::string amount; // raw base-10 integer
        std::string symbol;
        i16 decimals = 0;
    };

    /// A block header with the transfers decoded from it
    struct FetchedBlock {
        i64 chain_id = 0;
        i64 number = 0;
        std::string hash;
        std::string parent_hash;
        i64 timestamp = 0;
        std::vector<FetchedTransfer> transfers;
    };

    // ===========================================
    // Persisted rows
    // ===========================================

    struct Checkpoint {
        i64 chain_id = 0;
        i64 last_indexed_block = 0;
        std::string last_block_hash;
        i64 updated_at = 0;
    };

    struct BlockHashRecord {
        i64 chain_id = 0;
        i64 block_number = 0;
        std::string block_hash;
        std::string parent_hash;
    };

    struct Transfer {
        i64 id = 0;
        i64 chain_id = 0;
        i64 block_number = 0;
        std::string block_hash;
        std::string tx_hash;
        i32 log_index = 0;
        std::string token_address;
        std::string from_address;
        std::string to_address;
        std::string amount;
        std::string token_symbol;
        i16 token_decimals = 0;
        i64 block_timestamp = 0;
    };

    struct WalletFirstSeen {
        std::string address;
        i64 chain_id = 0;
        i64 first_seen_at = 0;
        i64 first_block = 0;
        std::string first_tx_hash;
        std::string first_direction; // "out" or "in"
    };

    struct GraphEdge {
        std::string source_address;
        std::string dest_address;
        i64 chain_id = 0;
        i64 transfer_count = 0;
        std::string total_amount;
        i64 first_seen = 0;
        i64 last_seen = 0;
    };

    struct WalletCluster {
        std::string address;
        i64 chain_id = 0;
        i64 cluster_id = 0;
    };

    struct KnownToken {
        i64 chain_id = 0;
        std::string token_address;
        std::string symbol;
        i16 decimals = 0;
    };

    struct AnomalyRow {
        i64 id = 0;
        i64 transfer_id = 0;
        i64 chain_id = 0;
        std::string anomaly_type;
        double risk_score = 0.0;
        std::vector<std::string> flags;
        std::string details; // JSON object text
        std::string address;
        bool resolved = false;
    };

    struct EntityLabel {
        i64 id = 0;
        std::string address;
        std::optional<i64> chain_id; // nullopt = global
        std::string entity_name;
        std::string entity_type;  // exchange, sanctioned, mixer, ...
        std::string label_source; // ofac_sdn, config, heuristic, ...
        double confidence = 1.0;
    };

    struct WatchlistEntry {
        i64 id = 0;
        std::string list_name;
        std::string address;
        std::string entity_name;
        std::string sdn_id;
        std::string program;
    };

    struct OnrampProvider {
        i64 id = 0;
        std::string name;
        std::string provider_type; // exchange, onramp, p2p
        std::string website;
        bool kyc_required = true;
    };

    struct ProviderWallet {
        i64 id = 0;
        i64 provider_id = 0;
        i64 chain_id = 0;
        std::string address;
        std::string label;
    };

    struct TransferEntityFlag {
        i64 transfer_id = 0;
        std::string label_kind; // "label" or "watchlist"
        i64 label_id = 0;
        std::string side; // "from" or "to"
    };

    struct OnrampTransfer {
        i64 transfer_id = 0;
        i64 provider_id = 0;
        std::string direction; // "deposit" or "withdrawal"
    };

    // ===========================================
    // Helpers
    // ===========================================

    inline std::string normalizeHex(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

} // namespace chainwatch
