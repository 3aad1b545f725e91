#include <chainwatch/anomaly/rules.hpp>
#include <chainwatch/common/amount.hpp>
#include <cmath>
#include <cstdio>

namespace chainwatch::anomaly {

    namespace {

        std::string wholeNumber(double value) {
            char buf[64];
            std::snprintf(buf, sizeof(buf), "%.0f", value);
            return buf;
        }

    } // namespace

    double AnomalyConfig::thresholdFor(const std::string &symbol) const {
        auto it = large_transfer_thresholds.find(symbol);
        if (it != large_transfer_thresholds.end())
            return it->second;
        it = large_transfer_thresholds.find("default");
        if (it != large_transfer_thresholds.end())
            return it->second;
        return 100000.0;
    }

    double humanAmount(const Transfer &transfer) {
        auto amount = Amount::parse(transfer.amount);
        if (!amount.is_ok())
            return 0.0;
        return amount.value().toHuman(transfer.token_decimals);
    }

    std::optional<Detection> checkLargeTransfer(const Transfer &transfer, const AnomalyConfig &config) {
        // An empty threshold map switches the rule off
        if (config.large_transfer_thresholds.empty())
            return std::nullopt;

        const double threshold = config.thresholdFor(transfer.token_symbol);
        const double human = humanAmount(transfer);
        if (human < threshold)
            return std::nullopt;

        Detection d;
        d.anomaly_type = types::LARGE_TRANSFER;
        if (human >= threshold * 10.0)
            d.risk_score = 0.8;
        else if (human >= threshold * 5.0)
            d.risk_score = 0.6;
        else
            d.risk_score = 0.4;
        d.flags.push_back("transfer_amount_" + wholeNumber(human) + "_" + transfer.token_symbol + "_exceeds_" +
                          wholeNumber(threshold));
        d.details = {{"amount", human}, {"token", transfer.token_symbol}, {"threshold", threshold}};
        return d;
    }

    std::optional<Detection> checkSanctionedCounterparty(const Transfer &transfer, const WalletContext &context) {
        if (!context.from_sanctioned && !context.to_sanctioned)
            return std::nullopt;

        const std::string side = context.from_sanctioned ? "from" : "to";
        const std::string &address = context.from_sanctioned ? transfer.from_address : transfer.to_address;

        Detection d;
        d.anomaly_type = types::SANCTIONED_COUNTERPARTY;
        d.risk_score = 0.95;
        d.flags.push_back("sanctioned_" + side + "_address");
        d.details = {{"side", side}, {"sanctioned_address", address}};
        d.address = address;
        return d;
    }

    std::optional<Detection> checkRoundNumber(const Transfer &transfer, const AnomalyConfig &config) {
        const double human = humanAmount(transfer);
        if (human < 1000.0)
            return std::nullopt;

        static const double units[] = {100000.0, 50000.0, 25000.0, 10000.0, 5000.0, 1000.0};
        const double tolerance = config.round_number_tolerance;

        for (double unit : units) {
            if (human < unit)
                continue;
            const double fraction = std::fmod(human, unit) / unit;
            if (fraction >= tolerance && fraction <= 1.0 - tolerance)
                continue;

            Detection d;
            d.anomaly_type = types::ROUND_NUMBER;
            if (unit >= 100000.0)
                d.risk_score = 0.4;
            else if (unit >= 10000.0)
                d.risk_score = 0.3;
            else
                d.risk_score = 0.2;
            d.flags.push_back("round_amount_" + wholeNumber(human));
            d.details = {{"amount", human}, {"nearest_round", unit}, {"token", transfer.token_symbol}};
            return d;
        }
        return std::nullopt;
    }

    std::optional<Detection> checkNewWalletLargeReceive(const Transfer &transfer, const WalletContext &context,
                                                        const AnomalyConfig &config) {
        const double human = humanAmount(transfer);
        if (human < config.new_wallet_threshold)
            return std::nullopt;

        // New means this very transfer created the receiver's first-seen row
        const auto &seen = context.to_first_seen;
        if (!seen.has_value() || seen->first_direction != "in" || seen->first_tx_hash != transfer.tx_hash ||
            seen->first_block != transfer.block_number)
            return std::nullopt;

        Detection d;
        d.anomaly_type = types::NEW_WALLET_LARGE_RECEIVE;
        d.risk_score = human >= config.new_wallet_threshold * 10.0 ? 0.8 : 0.6;
        d.flags.push_back("new_wallet_received_" + wholeNumber(human) + "_" + transfer.token_symbol);
        d.details = {{"amount", human}, {"token", transfer.token_symbol}, {"new_wallet", transfer.to_address}};
        d.address = transfer.to_address;
        return d;
    }

    std::optional<Detection> checkVelocity(const Transfer &transfer, const WalletContext &context,
                                           const AnomalyConfig &config) {
        const i64 count = context.sender_transfers_in_window;
        if (count <= config.velocity_max_transfers)
            return std::nullopt;

        Detection d;
        d.anomaly_type = types::VELOCITY;
        d.risk_score = count > config.velocity_max_transfers * 5 ? 0.7 : 0.5;
        d.flags.push_back("velocity_" + std::to_string(count) + "_transfers_in_" +
                          std::to_string(config.velocity_window_secs) + "s");
        d.details = {{"transfer_count", count},
                     {"window_secs", config.velocity_window_secs},
                     {"max_transfers", config.velocity_max_transfers}};
        d.address = transfer.from_address;
        return d;
    }

    std::optional<Detection> checkRoundTrip(const Transfer &transfer, const WalletContext &context,
                                            const AnomalyConfig &config) {
        if (!context.reverse_edge.has_value() || transfer.from_address == transfer.to_address)
            return std::nullopt;

        const GraphEdge &reverse = *context.reverse_edge;
        const i64 gap = transfer.block_timestamp - reverse.last_seen;
        if (gap < -config.round_trip_window_secs || gap > config.round_trip_window_secs)
            return std::nullopt;

        bool covered = false;
        auto reverse_total = Amount::parse(reverse.total_amount);
        auto amount = Amount::parse(transfer.amount);
        if (reverse_total.is_ok() && amount.is_ok())
            covered = reverse_total.value().compare(amount.value()) >= 0;

        Detection d;
        d.anomaly_type = types::ROUND_TRIP;
        d.risk_score = covered ? 0.7 : 0.5;
        d.flags.push_back("round_trip_within_" + std::to_string(config.round_trip_window_secs) + "s");
        d.details = {{"reverse_transfer_count", reverse.transfer_count},
                     {"reverse_total_amount", reverse.total_amount},
                     {"seconds_since_reverse", gap},
                     {"counterparty", transfer.to_address}};
        d.address = transfer.from_address;
        return d;
    }

    std::vector<Detection> evaluateRules(const Transfer &transfer, const WalletContext &context,
                                         const AnomalyConfig &config) {
        std::vector<Detection> detections;
        if (!config.enabled)
            return detections;

        auto add = [&detections](std::optional<Detection> d) {
            if (d.has_value())
                detections.push_back(std::move(*d));
        };
        add(checkLargeTransfer(transfer, config));
        add(checkSanctionedCounterparty(transfer, context));
        add(checkRoundNumber(transfer, config));
        add(checkNewWalletLargeReceive(transfer, context, config));
        add(checkVelocity(transfer, context, config));
        add(checkRoundTrip(transfer, context, config));
        return detections;
    }

} // namespace chainwatch::anomaly
