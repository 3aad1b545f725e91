#include <chainwatch/config/config.hpp>
#include <fstream>
#include <nlohmann/json.hpp>
#include <set>
#include <sstream>

namespace chainwatch::config {

    using nlohmann::json;

    namespace {

        Result<storage::OpenOptions::Synchronous, Error> parseSyncMode(const std::string &mode) {
            if (mode == "off")
                return Result<storage::OpenOptions::Synchronous, Error>::ok(storage::OpenOptions::Synchronous::OFF);
            if (mode == "normal")
                return Result<storage::OpenOptions::Synchronous, Error>::ok(storage::OpenOptions::Synchronous::NORMAL);
            if (mode == "full")
                return Result<storage::OpenOptions::Synchronous, Error>::ok(storage::OpenOptions::Synchronous::FULL);
            return Result<storage::OpenOptions::Synchronous, Error>::err(
                config_error("database.sync_mode must be off, normal or full, got '" + mode + "'"));
        }

        Result<IndexerConfig, Error> fromJson(const json &root) {
            IndexerConfig config;

            if (!root.is_object())
                return Result<IndexerConfig, Error>::err(config_error("Configuration root must be an object"));

            // database
            if (!root.contains("database") || !root["database"].is_object())
                return Result<IndexerConfig, Error>::err(config_error("Missing 'database' section"));
            const json &db = root["database"];
            if (!db.contains("path"))
                return Result<IndexerConfig, Error>::err(config_error("Missing 'database.path'"));
            config.database.path = db["path"].get<std::string>();
            config.database.options.enable_wal = db.value("enable_wal", true);
            config.database.options.busy_timeout_ms = db.value("busy_timeout_ms", 5000);
            config.database.options.cache_size_kb = db.value("cache_size_kb", 20000);
            auto sync = parseSyncMode(db.value("sync_mode", std::string("normal")));
            if (!sync.is_ok())
                return Result<IndexerConfig, Error>::err(sync.error());
            config.database.options.sync_mode = sync.value();

            // chains
            if (!root.contains("chains") || !root["chains"].is_array())
                return Result<IndexerConfig, Error>::err(config_error("Missing 'chains' array"));
            for (const auto &entry : root["chains"]) {
                ChainConfig chain;
                chain.name = entry.value("name", std::string());
                if (!entry.contains("chain_id"))
                    return Result<IndexerConfig, Error>::err(config_error("Chain '" + chain.name + "' has no chain_id"));
                chain.chain_id = entry["chain_id"].get<i64>();
                chain.start_block = entry.value("start_block", static_cast<i64>(0));
                chain.max_reorg_depth = entry.value("max_reorg_depth", static_cast<i64>(64));
                chain.poll_interval_ms = entry.value("poll_interval_ms", static_cast<i64>(2000));
                chain.recluster_interval_blocks = entry.value("recluster_interval_blocks", static_cast<i64>(0));
                if (entry.contains("tokens")) {
                    for (const auto &t : entry["tokens"]) {
                        KnownToken token;
                        token.chain_id = chain.chain_id;
                        token.token_address = normalizeHex(t.value("address", std::string()));
                        token.symbol = t.value("symbol", std::string());
                        token.decimals = t.value("decimals", static_cast<i16>(0));
                        chain.tokens.push_back(std::move(token));
                    }
                }
                config.chains.push_back(std::move(chain));
            }

            // anomaly_detection
            if (root.contains("anomaly_detection")) {
                const json &ad = root["anomaly_detection"];
                auto &anomaly = config.anomaly_detection;
                anomaly.enabled = ad.value("enabled", true);
                if (ad.contains("large_transfer_thresholds")) {
                    anomaly.large_transfer_thresholds.clear();
                    for (const auto &[symbol, threshold] : ad["large_transfer_thresholds"].items()) {
                        anomaly.large_transfer_thresholds[symbol] = threshold.get<double>();
                    }
                }
                if (ad.contains("velocity")) {
                    anomaly.velocity_window_secs = ad["velocity"].value("window_secs", anomaly.velocity_window_secs);
                    anomaly.velocity_max_transfers =
                        ad["velocity"].value("max_transfers", anomaly.velocity_max_transfers);
                }
                if (ad.contains("round_number")) {
                    anomaly.round_number_tolerance =
                        ad["round_number"].value("tolerance", anomaly.round_number_tolerance);
                }
                if (ad.contains("new_wallet")) {
                    anomaly.new_wallet_threshold = ad["new_wallet"].value("threshold", anomaly.new_wallet_threshold);
                }
                if (ad.contains("round_trip")) {
                    anomaly.round_trip_window_secs =
                        ad["round_trip"].value("window_secs", anomaly.round_trip_window_secs);
                }
            }

            // retry
            if (root.contains("retry")) {
                const json &retry = root["retry"];
                config.retry.initial_backoff_ms = retry.value("initial_backoff_ms", config.retry.initial_backoff_ms);
                config.retry.max_backoff_ms = retry.value("max_backoff_ms", config.retry.max_backoff_ms);
            }

            return Result<IndexerConfig, Error>::ok(std::move(config));
        }

    } // namespace

    Result<IndexerConfig, Error> parseConfig(const std::string &json_text) {
        try {
            auto parsed = fromJson(json::parse(json_text));
            if (!parsed.is_ok())
                return parsed;

            auto valid = validate(parsed.value());
            if (!valid.is_ok())
                return Result<IndexerConfig, Error>::err(valid.error());
            return parsed;
        } catch (const json::exception &e) {
            return Result<IndexerConfig, Error>::err(config_error(std::string("Invalid configuration JSON: ") + e.what()));
        }
    }

    Result<IndexerConfig, Error> loadConfig(const std::string &path) {
        std::ifstream file(path);
        if (!file.is_open())
            return Result<IndexerConfig, Error>::err(config_error("Cannot open configuration file " + path));

        std::stringstream buffer;
        buffer << file.rdbuf();
        return parseConfig(buffer.str());
    }

    Result<void, Error> validate(const IndexerConfig &config) {
        if (config.database.path.empty())
            return Result<void, Error>::err(config_error("database.path must not be empty"));
        if (config.chains.empty())
            return Result<void, Error>::err(config_error("At least one chain must be configured"));

        std::set<i64> ids;
        for (const auto &chain : config.chains) {
            if (chain.name.empty())
                return Result<void, Error>::err(
                    config_error("Chain " + std::to_string(chain.chain_id) + " has an empty name"));
            if (!ids.insert(chain.chain_id).second)
                return Result<void, Error>::err(config_error("Duplicate chain_id " + std::to_string(chain.chain_id)));
            if (chain.max_reorg_depth <= 0)
                return Result<void, Error>::err(config_error("Chain '" + chain.name + "' needs max_reorg_depth > 0"));
            if (chain.start_block < 0)
                return Result<void, Error>::err(config_error("Chain '" + chain.name + "' has a negative start_block"));
            if (chain.recluster_interval_blocks < 0)
                return Result<void, Error>::err(
                    config_error("Chain '" + chain.name + "' has a negative recluster_interval_blocks"));
            for (const auto &token : chain.tokens) {
                if (token.token_address.empty() || token.symbol.empty())
                    return Result<void, Error>::err(
                        config_error("Chain '" + chain.name + "' lists a token without address or symbol"));
                if (token.decimals < 0)
                    return Result<void, Error>::err(
                        config_error("Token " + token.symbol + " on '" + chain.name + "' has negative decimals"));
            }
        }

        const double tolerance = config.anomaly_detection.round_number_tolerance;
        if (tolerance < 0.0 || tolerance >= 0.5)
            return Result<void, Error>::err(config_error("round_number.tolerance must be in [0, 0.5)"));
        if (config.retry.initial_backoff_ms <= 0 || config.retry.max_backoff_ms < config.retry.initial_backoff_ms)
            return Result<void, Error>::err(config_error("retry backoff must be positive and max >= initial"));

        return Result<void, Error>::ok();
    }

} // namespace chainwatch::config
