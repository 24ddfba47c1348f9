#include <gtest/gtest.h>
#include "core/clock.hpp"
#include "index/index_composer.hpp"

using namespace sentindex;

class IndexComposerTest : public ::testing::Test {
protected:
    FixedClock clock{WallTime{std::chrono::seconds{1759218000}}};
    IndexComposer composer{clock};
    IndexConfig config = default_index_config();

    static PriceSet market_prices() {
        return {
            {"GOLD", 1900.12},
            {"SILVER", 24.31},
            {"OIL", 78.45},
            {"BTC", 27450.0},
            {"ETH", 1850.0}
        };
    }

    static ComputeOptions return_based(double prior_value, PriceSet prior_prices) {
        ComputeOptions options;
        options.method = Method::ReturnBased;
        options.prior = PriorPeriod{prior_value, std::move(prior_prices)};
        return options;
    }
};

// Level-normalized

TEST_F(IndexComposerTest, BasePricesGiveBaseLevel) {
    auto result = composer.compute(config, config.base_prices);

    ASSERT_TRUE(result.is_ok());
    EXPECT_DOUBLE_EQ(result.value().value, 1000.0);
    EXPECT_DOUBLE_EQ(result.value().coverage_ratio, 1.0);
}

TEST_F(IndexComposerTest, FullMarketScenario) {
    auto result = composer.compute(config, market_prices());

    ASSERT_TRUE(result.is_ok());
    const auto& r = result.value();
    EXPECT_EQ(r.index_name, "gold_silver_oil_crypto");
    EXPECT_DOUBLE_EQ(r.value, 1220.72);
    EXPECT_EQ(r.method, Method::LevelNormalized);
    EXPECT_DOUBLE_EQ(r.coverage_ratio, 1.0);
    EXPECT_TRUE(r.provenance.symbols_missing.empty());
    EXPECT_EQ(r.provenance.symbols_used.size(), 5u);
}

TEST_F(IndexComposerTest, ComputeIsIdempotent) {
    auto first = composer.compute(config, market_prices());
    auto second = composer.compute(config, market_prices());

    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(first.value().value, second.value().value);
    EXPECT_EQ(first.value().coverage_ratio, second.value().coverage_ratio);
    EXPECT_EQ(first.value().provenance.symbols_used, second.value().provenance.symbols_used);
}

TEST_F(IndexComposerTest, MissingSymbolReducesCoverage) {
    auto prices = market_prices();
    prices.erase("ETH");

    auto result = composer.compute(config, prices);

    ASSERT_TRUE(result.is_ok());
    const auto& r = result.value();
    EXPECT_NEAR(r.coverage_ratio, 0.85, 1e-12);
    EXPECT_DOUBLE_EQ(r.value, 943.22);
    ASSERT_EQ(r.provenance.symbols_missing.size(), 1u);
    EXPECT_EQ(r.provenance.symbols_missing[0], "ETH");
    EXPECT_EQ(r.provenance.prices.count("ETH"), 0u);
}

TEST_F(IndexComposerTest, CoverageIsMonotoneInAvailableSymbols) {
    auto prices = market_prices();
    double previous = 1.0;

    for (const char* symbol : {"SILVER", "ETH"}) {
        prices.erase(symbol);
        auto core = IndexComposer::compose(config, prices);
        ASSERT_TRUE(core.is_ok());
        EXPECT_LT(core.value().coverage_ratio, previous);
        previous = core.value().coverage_ratio;
    }
}

TEST_F(IndexComposerTest, ExtraSymbolsIgnored) {
    auto prices = market_prices();
    prices["DOGE"] = 0.07;

    auto result = composer.compute(config, prices);

    ASSERT_TRUE(result.is_ok());
    EXPECT_DOUBLE_EQ(result.value().value, 1220.72);
    EXPECT_DOUBLE_EQ(result.value().coverage_ratio, 1.0);
    EXPECT_EQ(result.value().provenance.prices.count("DOGE"), 0u);
}

TEST_F(IndexComposerTest, InsufficientCoverageFails) {
    PriceSet prices{{"GOLD", 1900.12}};

    auto result = composer.compute(config, prices);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().reason, ComputationError::Reason::InsufficientCoverage);
    ASSERT_TRUE(result.error().coverage_ratio.has_value());
    EXPECT_DOUBLE_EQ(*result.error().coverage_ratio, 0.25);
}

TEST_F(IndexComposerTest, MinCoverageIsConfigurable) {
    PriceSet prices{{"GOLD", 1900.12}};
    ComputeOptions options;
    options.min_coverage = 0.2;

    auto result = composer.compute(config, prices, options);

    ASSERT_TRUE(result.is_ok());
    EXPECT_DOUBLE_EQ(result.value().coverage_ratio, 0.25);
}

TEST_F(IndexComposerTest, EmptyPricesFail) {
    auto result = composer.compute(config, PriceSet{});

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().reason, ComputationError::Reason::InsufficientCoverage);
    EXPECT_DOUBLE_EQ(*result.error().coverage_ratio, 0.0);
}

TEST_F(IndexComposerTest, InvalidConfigFails) {
    config.weights["GOLD"] = 0.5;

    auto result = composer.compute(config, market_prices());

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().reason, ComputationError::Reason::InvalidConfig);
}

TEST_F(IndexComposerTest, ZeroSumWeightsFail) {
    for (auto& [symbol, weight] : config.weights) {
        weight = 0.0;
    }

    auto result = composer.compute(config, market_prices());

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().reason, ComputationError::Reason::ZeroSumWeights);
}

// Return-based

TEST_F(IndexComposerTest, ReturnBasedWithoutPriorFails) {
    ComputeOptions options;
    options.method = Method::ReturnBased;

    auto result = composer.compute(config, market_prices(), options);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().reason, ComputationError::Reason::NoPriorPeriod);
}

TEST_F(IndexComposerTest, ReturnBasedWithNonPositivePriorFails) {
    auto result = composer.compute(config, market_prices(), return_based(0.0, market_prices()));

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().reason, ComputationError::Reason::NoPriorPeriod);
}

TEST_F(IndexComposerTest, ReturnBasedFlatPeriodKeepsValue) {
    auto result = composer.compute(config, market_prices(), return_based(1220.72, market_prices()));

    ASSERT_TRUE(result.is_ok());
    EXPECT_DOUBLE_EQ(result.value().value, 1220.72);
    EXPECT_EQ(result.value().method, Method::ReturnBased);
}

TEST_F(IndexComposerTest, ReturnBasedWeightsPeriodReturns) {
    auto now = market_prices();
    now["GOLD"] = 2090.132;  // +10% on a 25% weight

    auto result = composer.compute(config, now, return_based(1220.72, market_prices()));

    ASSERT_TRUE(result.is_ok());
    EXPECT_DOUBLE_EQ(result.value().value, 1251.24);
}

TEST_F(IndexComposerTest, ReturnBasedNegativeReturn) {
    auto now = market_prices();
    now["BTC"] = 24705.0;  // -10% on a 15% weight

    auto result = composer.compute(config, now, return_based(1220.72, market_prices()));

    ASSERT_TRUE(result.is_ok());
    EXPECT_DOUBLE_EQ(result.value().value, 1202.41);
}

TEST_F(IndexComposerTest, ReturnBasedNeedsSymbolInBothPeriods) {
    auto prior = market_prices();
    prior.erase("OIL");

    auto result = composer.compute(config, market_prices(), return_based(1220.72, prior));

    ASSERT_TRUE(result.is_ok());
    EXPECT_NEAR(result.value().coverage_ratio, 0.8, 1e-12);
    ASSERT_EQ(result.value().provenance.symbols_missing.size(), 1u);
    EXPECT_EQ(result.value().provenance.symbols_missing[0], "OIL");
}

TEST_F(IndexComposerTest, ReturnBasedRecordsPrior) {
    auto result = composer.compute(config, market_prices(), return_based(1220.72, market_prices()));

    ASSERT_TRUE(result.is_ok());
    const auto& prior = result.value().provenance.prior;
    ASSERT_TRUE(prior.has_value());
    EXPECT_DOUBLE_EQ(prior->value, 1220.72);
    EXPECT_EQ(prior->prices.size(), 5u);
}

// Rounding and deltas

TEST(RoundingTest, HalfToEven) {
    EXPECT_DOUBLE_EQ(convert::round_half_even(0.125, 2), 0.12);
    EXPECT_DOUBLE_EQ(convert::round_half_even(0.375, 2), 0.38);
    EXPECT_DOUBLE_EQ(convert::round_half_even(2.5, 0), 2.0);
    EXPECT_DOUBLE_EQ(convert::round_half_even(3.5, 0), 4.0);
    EXPECT_DOUBLE_EQ(convert::round_half_even(1000.125, 2), 1000.12);
}

TEST(PercentChangeTest, ComputesRoundedChange) {
    auto change = IndexComposer::percent_change(1220.72, 1000.0);

    ASSERT_TRUE(change.has_value());
    EXPECT_DOUBLE_EQ(*change, 22.07);
}

TEST(PercentChangeTest, NegativeChange) {
    auto change = IndexComposer::percent_change(900.0, 1000.0);

    ASSERT_TRUE(change.has_value());
    EXPECT_DOUBLE_EQ(*change, -10.0);
}

TEST(PercentChangeTest, NonPositivePreviousHasNoChange) {
    EXPECT_FALSE(IndexComposer::percent_change(1000.0, 0.0).has_value());
    EXPECT_FALSE(IndexComposer::percent_change(1000.0, -5.0).has_value());
}
