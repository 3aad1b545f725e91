#pragma once

#include <datapod/datapod.hpp>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "chainwatch/common/types.hpp"

namespace chainwatch::anomaly {

    using namespace datapod;

    namespace types {
        inline constexpr const char *LARGE_TRANSFER = "large_transfer";
        inline constexpr const char *SANCTIONED_COUNTERPARTY = "sanctioned_counterparty";
        inline constexpr const char *ROUND_NUMBER = "round_number";
        inline constexpr const char *NEW_WALLET_LARGE_RECEIVE = "new_wallet_large_receive";
        inline constexpr const char *VELOCITY = "velocity";
        inline constexpr const char *ROUND_TRIP = "round_trip";
    } // namespace types

    /// Rule thresholds; amounts are human units (raw / 10^decimals)
    struct AnomalyConfig {
        bool enabled = true;
        std::map<std::string, double> large_transfer_thresholds = {{"default", 100000.0}};
        i64 velocity_window_secs = 3600;
        i64 velocity_max_transfers = 50;
        double round_number_tolerance = 0.001;
        double new_wallet_threshold = 10000.0;
        i64 round_trip_window_secs = 86400;

        /// Per-symbol threshold, else "default", else 100000. An empty map disables large_transfer.
        double thresholdFor(const std::string &symbol) const;
    };

    /// State around a transfer that rules read; gathered by the scorer from the store
    struct WalletContext {
        bool from_sanctioned = false;
        bool to_sanctioned = false;
        std::optional<WalletFirstSeen> to_first_seen;
        i64 sender_transfers_in_window = 0; // includes the transfer itself
        std::optional<GraphEdge> reverse_edge;
    };

    struct Detection {
        std::string anomaly_type;
        double risk_score = 0.0; // [0, 1]
        std::vector<std::string> flags;
        nlohmann::json details = nlohmann::json::object();
        std::optional<std::string> address;
    };

    double humanAmount(const Transfer &transfer);

    std::optional<Detection> checkLargeTransfer(const Transfer &transfer, const AnomalyConfig &config);
    std::optional<Detection> checkSanctionedCounterparty(const Transfer &transfer, const WalletContext &context);
    std::optional<Detection> checkRoundNumber(const Transfer &transfer, const AnomalyConfig &config);
    std::optional<Detection> checkNewWalletLargeReceive(const Transfer &transfer, const WalletContext &context,
                                                        const AnomalyConfig &config);
    std::optional<Detection> checkVelocity(const Transfer &transfer, const WalletContext &context,
                                           const AnomalyConfig &config);
    std::optional<Detection> checkRoundTrip(const Transfer &transfer, const WalletContext &context,
                                            const AnomalyConfig &config);

    /// All rules in order; empty when detection is disabled
    std::vector<Detection> evaluateRules(const Transfer &transfer, const WalletContext &context,
                                         const AnomalyConfig &config);

} // namespace chainwatch::anomaly
