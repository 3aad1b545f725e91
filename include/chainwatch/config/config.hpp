#pragma once

#include <datapod/datapod.hpp>
#include <string>
#include <vector>

#include "chainwatch/anomaly/rules.hpp"
#include "chainwatch/common/types.hpp"
#include "chainwatch/storage/sqlite_store.hpp"

namespace chainwatch::config {

    using namespace datapod;

    struct DatabaseConfig {
        std::string path;
        storage::OpenOptions options;
    };

    struct ChainConfig {
        std::string name;
        i64 chain_id = 0;
        i64 start_block = 0;
        i64 max_reorg_depth = 64;
        i64 poll_interval_ms = 2000;
        i64 recluster_interval_blocks = 0; // 0: clusters are rebuilt only on demand and after rollbacks
        std::vector<KnownToken> tokens;    // seeded into known_tokens when the service opens
    };

    struct RetryConfig {
        i64 initial_backoff_ms = 500;
        i64 max_backoff_ms = 30000;
    };

    struct IndexerConfig {
        DatabaseConfig database;
        std::vector<ChainConfig> chains;
        anomaly::AnomalyConfig anomaly_detection;
        RetryConfig retry;
    };

    /// Parse JSON configuration text; missing optional keys take their defaults
    Result<IndexerConfig, Error> parseConfig(const std::string &json_text);

    /// Read and parse a JSON configuration file
    Result<IndexerConfig, Error> loadConfig(const std::string &path);

    Result<void, Error> validate(const IndexerConfig &config);

} // namespace chainwatch::config
