#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <chainwatch/common/amount.hpp>

using namespace chainwatch;

TEST_SUITE("Amount") {
    TEST_CASE("Parsing") {
        SUBCASE("Canonical digits") {
            auto a = Amount::parse("000123");
            REQUIRE(a.is_ok());
            CHECK(a.value().toString() == "123");
        }

        SUBCASE("Zero") {
            auto a = Amount::parse("0000");
            REQUIRE(a.is_ok());
            CHECK(a.value().isZero());
            CHECK(a.value().toString() == "0");
        }

        SUBCASE("Rejects non-digits") {
            CHECK(Amount::parse("").is_err());
            CHECK(Amount::parse("12a").is_err());
            CHECK(Amount::parse("-5").is_err());
            CHECK(Amount::parse("1.5").is_err());
            CHECK(Amount::parse("12a").error().code == ERR_INVALID_AMOUNT);
        }
    }

    TEST_CASE("Addition") {
        SUBCASE("Carry") {
            auto sum = Amount::parse("999").value() + Amount::parse("1").value();
            CHECK(sum.toString() == "1000");
        }

        SUBCASE("Beyond 64 bits") {
            auto max = Amount::parse("115792089237316195423570985008687907853269984665640564039457584007913129639935");
            REQUIRE(max.is_ok());
            auto sum = max.value() + Amount::parse("1").value();
            CHECK(sum.toString() == "115792089237316195423570985008687907853269984665640564039457584007913129639936");
        }

        SUBCASE("Accumulate") {
            Amount total;
            total += Amount::parse("100").value();
            total += Amount::parse("50").value();
            CHECK(total.toString() == "150");
        }
    }

    TEST_CASE("Comparison") {
        auto small = Amount::parse("99").value();
        auto large = Amount::parse("100").value();
        CHECK(small < large);
        CHECK(large.compare(small) == 1);
        CHECK(small.compare(Amount::parse("099").value()) == 0);
        CHECK(small != large);
    }

    TEST_CASE("Human units") {
        CHECK(Amount::parse("1500000").value().toHuman(6) == doctest::Approx(1.5));
        CHECK(Amount::parse("42").value().toHuman(0) == doctest::Approx(42.0));
        CHECK(Amount::parse("100000000000000000000000").value().toHuman(18) == doctest::Approx(100000.0));
    }
}
