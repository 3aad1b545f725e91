#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "test_helpers.hpp"

using namespace chainwatch::anomaly;

TEST_SUITE("Anomaly rules") {
    TEST_CASE("Large transfer") {
        AnomalyConfig config;
        config.large_transfer_thresholds = {{"USDC", 1000.0}, {"default", 5000.0}};

        SUBCASE("Below threshold") {
            auto t = makeTransfer(1, 1, "0xt", 0, "0xa", "0xb", "999000000", 0, "USDC", 6);
            CHECK_FALSE(checkLargeTransfer(t, config).has_value());
        }

        SUBCASE("Risk tiers") {
            auto at = makeTransfer(1, 1, "0xt", 0, "0xa", "0xb", "1000000000", 0, "USDC", 6);
            auto five = makeTransfer(1, 1, "0xt", 0, "0xa", "0xb", "5000000000", 0, "USDC", 6);
            auto ten = makeTransfer(1, 1, "0xt", 0, "0xa", "0xb", "10000000000", 0, "USDC", 6);

            REQUIRE(checkLargeTransfer(at, config).has_value());
            CHECK(checkLargeTransfer(at, config)->risk_score == doctest::Approx(0.4));
            CHECK(checkLargeTransfer(five, config)->risk_score == doctest::Approx(0.6));
            CHECK(checkLargeTransfer(ten, config)->risk_score == doctest::Approx(0.8));
        }

        SUBCASE("Default threshold for unknown symbols") {
            auto dai = makeTransfer(1, 1, "0xt", 0, "0xa", "0xb", "4000", 0, "DAI", 0);
            CHECK_FALSE(checkLargeTransfer(dai, config).has_value());
            dai.amount = "5000";
            auto d = checkLargeTransfer(dai, config);
            REQUIRE(d.has_value());
            CHECK(d->anomaly_type == types::LARGE_TRANSFER);
            CHECK(d->details["threshold"].get<double>() == doctest::Approx(5000.0));
            CHECK(d->flags.size() == 1);
        }

        SUBCASE("Empty threshold map disables the rule") {
            AnomalyConfig off;
            off.large_transfer_thresholds.clear();
            auto huge = makeTransfer(1, 1, "0xt", 0, "0xa", "0xb", "900000000000000", 0, "USDC", 6);
            CHECK_FALSE(checkLargeTransfer(huge, off).has_value());
            CHECK(off.thresholdFor("USDC") == doctest::Approx(100000.0));
        }
    }

    TEST_CASE("Sanctioned counterparty") {
        auto t = makeTransfer(1, 1, "0xt", 0, "0xa", "0xb", "1", 0);
        WalletContext context;
        CHECK_FALSE(checkSanctionedCounterparty(t, context).has_value());

        context.to_sanctioned = true;
        auto to = checkSanctionedCounterparty(t, context);
        REQUIRE(to.has_value());
        CHECK(to->risk_score == doctest::Approx(0.95));
        CHECK(to->address == std::optional<std::string>("0xb"));
        CHECK(to->flags[0] == "sanctioned_to_address");

        context.from_sanctioned = true;
        CHECK(checkSanctionedCounterparty(t, context)->address == std::optional<std::string>("0xa"));
    }

    TEST_CASE("Round number") {
        AnomalyConfig config;

        SUBCASE("Small amounts are ignored") {
            CHECK_FALSE(checkRoundNumber(makeTransfer(1, 1, "0xt", 0, "0xa", "0xb", "500", 0), config).has_value());
        }

        SUBCASE("Largest unit decides the risk") {
            auto hundred_k = checkRoundNumber(makeTransfer(1, 1, "0xt", 0, "0xa", "0xb", "200000", 0), config);
            REQUIRE(hundred_k.has_value());
            CHECK(hundred_k->risk_score == doctest::Approx(0.4));
            CHECK(hundred_k->details["nearest_round"].get<double>() == doctest::Approx(100000.0));

            auto fifty_k = checkRoundNumber(makeTransfer(1, 1, "0xt", 0, "0xa", "0xb", "150000", 0), config);
            REQUIRE(fifty_k.has_value());
            CHECK(fifty_k->risk_score == doctest::Approx(0.3));

            auto two_k = checkRoundNumber(makeTransfer(1, 1, "0xt", 0, "0xa", "0xb", "2000", 0), config);
            REQUIRE(two_k.has_value());
            CHECK(two_k->risk_score == doctest::Approx(0.2));
        }

        SUBCASE("Tolerance") {
            // 10000.5 is within 0.1% of 10000
            auto near = makeTransfer(1, 1, "0xt", 0, "0xa", "0xb", "100005", 0, "USDC", 1);
            CHECK(checkRoundNumber(near, config).has_value());

            auto odd = makeTransfer(1, 1, "0xt", 0, "0xa", "0xb", "1234", 0);
            CHECK_FALSE(checkRoundNumber(odd, config).has_value());
        }
    }

    TEST_CASE("New wallet large receive") {
        AnomalyConfig config;
        config.new_wallet_threshold = 1000.0;
        auto t = makeTransfer(1, 7, "0xtx", 0, "0xa", "0xnew", "5000", 0);

        WalletFirstSeen seen;
        seen.address = "0xnew";
        seen.chain_id = 1;
        seen.first_block = 7;
        seen.first_tx_hash = "0xtx";
        seen.first_direction = "in";

        WalletContext context;
        context.to_first_seen = seen;

        auto d = checkNewWalletLargeReceive(t, context, config);
        REQUIRE(d.has_value());
        CHECK(d->risk_score == doctest::Approx(0.6));
        CHECK(d->address == std::optional<std::string>("0xnew"));

        t.amount = "10000";
        CHECK(checkNewWalletLargeReceive(t, context, config)->risk_score == doctest::Approx(0.8));

        SUBCASE("Seen earlier by another transfer") {
            context.to_first_seen->first_tx_hash = "0xolder";
            CHECK_FALSE(checkNewWalletLargeReceive(t, context, config).has_value());
        }

        SUBCASE("First seen as a sender") {
            context.to_first_seen->first_direction = "out";
            CHECK_FALSE(checkNewWalletLargeReceive(t, context, config).has_value());
        }

        SUBCASE("Below threshold") {
            t.amount = "999";
            CHECK_FALSE(checkNewWalletLargeReceive(t, context, config).has_value());
        }
    }

    TEST_CASE("Velocity") {
        AnomalyConfig config;
        config.velocity_max_transfers = 3;
        auto t = makeTransfer(1, 1, "0xt", 0, "0xa", "0xb", "1", 0);

        WalletContext context;
        context.sender_transfers_in_window = 3;
        CHECK_FALSE(checkVelocity(t, context, config).has_value());

        context.sender_transfers_in_window = 4;
        auto d = checkVelocity(t, context, config);
        REQUIRE(d.has_value());
        CHECK(d->risk_score == doctest::Approx(0.5));
        CHECK(d->address == std::optional<std::string>("0xa"));

        context.sender_transfers_in_window = 16;
        CHECK(checkVelocity(t, context, config)->risk_score == doctest::Approx(0.7));
    }

    TEST_CASE("Round trip") {
        AnomalyConfig config;
        config.round_trip_window_secs = 3600;
        auto t = makeTransfer(1, 5, "0xt", 0, "0xa", "0xb", "100", 10000);

        GraphEdge reverse;
        reverse.source_address = "0xb";
        reverse.dest_address = "0xa";
        reverse.chain_id = 1;
        reverse.transfer_count = 1;
        reverse.total_amount = "40";
        reverse.last_seen = 9000;

        WalletContext context;
        CHECK_FALSE(checkRoundTrip(t, context, config).has_value());

        context.reverse_edge = reverse;
        auto partial = checkRoundTrip(t, context, config);
        REQUIRE(partial.has_value());
        CHECK(partial->risk_score == doctest::Approx(0.5));

        context.reverse_edge->total_amount = "100";
        CHECK(checkRoundTrip(t, context, config)->risk_score == doctest::Approx(0.7));

        context.reverse_edge->last_seen = 1000;
        CHECK_FALSE(checkRoundTrip(t, context, config).has_value());
    }

    TEST_CASE("Ordered evaluation") {
        AnomalyConfig config;
        config.large_transfer_thresholds = {{"default", 1000.0}};
        auto t = makeTransfer(1, 1, "0xt", 0, "0xa", "0xb", "100000", 0);

        WalletContext context;
        context.from_sanctioned = true;

        auto all = evaluateRules(t, context, config);
        REQUIRE(all.size() == 3);
        CHECK(all[0].anomaly_type == types::LARGE_TRANSFER);
        CHECK(all[1].anomaly_type == types::SANCTIONED_COUNTERPARTY);
        CHECK(all[2].anomaly_type == types::ROUND_NUMBER);
        for (const auto &d : all) {
            CHECK(d.risk_score >= 0.0);
            CHECK(d.risk_score <= 1.0);
        }

        config.enabled = false;
        CHECK(evaluateRules(t, context, config).empty());
    }
}
