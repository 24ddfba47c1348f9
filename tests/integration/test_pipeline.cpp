#include <gtest/gtest.h>

#include "core/clock.hpp"
#include "core/config.hpp"
#include "engine/index_service.hpp"
#include "output/json_formatter.hpp"
#include "storage/index_store.hpp"
#include "support/fake_reasoning_client.hpp"

#include <chrono>
#include <memory>
#include <variant>

using namespace sentindex;
using sentindex::test_support::FakeReasoningClient;
using sentindex::test_support::healthy_completion;

namespace {

nlohmann::json market_prices() {
    return {
        {"GOLD", 1900.12},
        {"SILVER", 24.31},
        {"OIL", 78.45},
        {"BTC", 27450.0},
        {"ETH", 1850.0}
    };
}

nlohmann::json base_prices() {
    return {
        {"GOLD", 1800},
        {"SILVER", 23},
        {"OIL", 75},
        {"BTC", 20000},
        {"ETH", 1000}
    };
}

ComputeRequest make_request(nlohmann::json prices, std::string method = {}) {
    return ComputeRequest{
        .index_name = kDefaultIndexName,
        .prices = std::move(prices),
        .method = std::move(method),
        .min_coverage = std::nullopt
    };
}

const ComputationError& computation_error(const PipelineError& error) {
    return std::get<ComputationError>(error);
}

}  // namespace

// ============================================================================
// Pipeline Integration Tests
// ============================================================================

class PipelineIntegrationTest : public ::testing::Test {
protected:
    FixedClock clock{WallTime{std::chrono::seconds{1759218000}}};
    Config config = Config::defaults();
    std::shared_ptr<storage::InMemoryIndexStore> store = std::make_shared<storage::InMemoryIndexStore>();

    std::unique_ptr<IndexService> make_service(std::shared_ptr<ReasoningClient> client = nullptr) {
        return std::make_unique<IndexService>(config, build_registry(config), store, std::move(client), clock);
    }
};

TEST_F(PipelineIntegrationTest, ComputesAndPersistsScenario) {
    auto service = make_service();

    auto result = service->compute(make_request(market_prices()));

    ASSERT_TRUE(result.is_ok());
    EXPECT_DOUBLE_EQ(result.value().value, 1220.72);
    EXPECT_DOUBLE_EQ(result.value().coverage_ratio, 1.0);
    EXPECT_EQ(result.value().timestamp, clock.now());

    auto latest = store->latest(kDefaultIndexName);
    ASSERT_TRUE(latest.has_value());
    EXPECT_DOUBLE_EQ(latest->value, 1220.72);
}

TEST_F(PipelineIntegrationTest, ResponsePayloadMatchesWireShape) {
    auto service = make_service();

    auto result = service->compute(make_request(market_prices(), "level_normalized"));
    ASSERT_TRUE(result.is_ok());

    auto j = output::JsonFormatter::format_compute(result.value());
    EXPECT_EQ(j["index_name"], "gold_silver_oil_crypto");
    EXPECT_DOUBLE_EQ(j["index_value"].get<double>(), 1220.72);
    EXPECT_EQ(j["method"], "level_normalized");
    EXPECT_EQ(j["timestamp"], "2025-09-30T07:40:00.000Z");
}

TEST_F(PipelineIntegrationTest, LowerCaseSymbolsAccepted) {
    auto service = make_service();
    nlohmann::json prices = {
        {"gold", 1900.12}, {"silver", 24.31}, {"oil", 78.45}, {"btc", 27450.0}, {"eth", 1850.0}
    };

    auto result = service->compute(make_request(prices));

    ASSERT_TRUE(result.is_ok());
    EXPECT_DOUBLE_EQ(result.value().value, 1220.72);
}

TEST_F(PipelineIntegrationTest, UnknownIndexIsMissingConfig) {
    auto service = make_service();
    auto request = make_request(market_prices());
    request.index_name = "platinum_only";

    auto result = service->compute(request);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(computation_error(result.error()).reason, ComputationError::Reason::MissingConfig);
}

TEST_F(PipelineIntegrationTest, UnsupportedMethodRejected) {
    auto service = make_service();

    auto result = service->compute(make_request(market_prices(), "geometric"));

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(error_kind(result.error()), "computation_error");
    EXPECT_EQ(computation_error(result.error()).reason, ComputationError::Reason::UnsupportedMethod);
}

TEST_F(PipelineIntegrationTest, InvalidPriceRejectedAndNothingStored) {
    auto service = make_service();
    auto prices = market_prices();
    prices["OIL"] = 0;

    auto result = service->compute(make_request(prices));

    ASSERT_TRUE(result.is_err());
    ASSERT_TRUE(std::holds_alternative<ValidationError>(result.error()));
    const auto& error = std::get<ValidationError>(result.error());
    EXPECT_EQ(error.reason, ValidationError::Reason::NonPositivePrice);
    EXPECT_EQ(error.symbol, "OIL");
    EXPECT_FALSE(store->latest(kDefaultIndexName).has_value());
}

TEST_F(PipelineIntegrationTest, InsufficientCoverageReported) {
    auto service = make_service();

    auto result = service->compute(make_request({{"GOLD", 1900.12}, {"ETH", 1850.0}}));

    ASSERT_TRUE(result.is_err());
    const auto& error = computation_error(result.error());
    EXPECT_EQ(error.reason, ComputationError::Reason::InsufficientCoverage);
    EXPECT_NEAR(*error.coverage_ratio, 0.4, 1e-12);
}

TEST_F(PipelineIntegrationTest, RequestMinCoverageOverridesConfig) {
    auto service = make_service();
    auto request = make_request({{"GOLD", 1900.12}, {"ETH", 1850.0}});
    request.min_coverage = 0.4;

    auto result = service->compute(request);

    ASSERT_TRUE(result.is_ok());
    EXPECT_NEAR(result.value().coverage_ratio, 0.4, 1e-12);
}

TEST_F(PipelineIntegrationTest, ReturnBasedNeedsStoredPeriod) {
    auto service = make_service();

    auto result = service->compute(make_request(market_prices(), "return_based"));

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(computation_error(result.error()).reason, ComputationError::Reason::NoPriorPeriod);
}

TEST_F(PipelineIntegrationTest, ReturnBasedChainsFromStoredValue) {
    auto service = make_service();
    ASSERT_TRUE(service->compute(make_request(market_prices())).is_ok());

    clock.advance(std::chrono::hours{1});
    auto prices = market_prices();
    prices["GOLD"] = 2090.132;

    auto result = service->compute(make_request(prices, "return_based"));

    ASSERT_TRUE(result.is_ok());
    EXPECT_DOUBLE_EQ(result.value().value, 1251.24);
    EXPECT_EQ(result.value().method, Method::ReturnBased);
    ASSERT_TRUE(result.value().provenance.prior.has_value());
    EXPECT_DOUBLE_EQ(result.value().provenance.prior->value, 1220.72);
    EXPECT_EQ(store->history(kDefaultIndexName).size(), 2u);
}

TEST_F(PipelineIntegrationTest, ReturnBasedUsesSuppliedPriorPeriod) {
    auto service = make_service();
    auto prices = market_prices();
    prices["GOLD"] = 2090.132;

    auto request = make_request(prices, "return_based");
    request.prior_value = 1220.72;
    request.prior_prices = market_prices();
    auto result = service->compute(request);

    ASSERT_TRUE(result.is_ok());
    EXPECT_DOUBLE_EQ(result.value().value, 1251.24);
    ASSERT_TRUE(result.value().provenance.prior.has_value());
    EXPECT_DOUBLE_EQ(result.value().provenance.prior->prices.at("GOLD"), 1900.12);
}

TEST_F(PipelineIntegrationTest, SuppliedPriorTakesPrecedenceOverStore) {
    auto service = make_service();
    ASSERT_TRUE(service->compute(make_request(market_prices())).is_ok());

    auto request = make_request(market_prices(), "return_based");
    request.prior_value = 500.0;
    request.prior_prices = market_prices();
    auto result = service->compute(request);

    ASSERT_TRUE(result.is_ok());
    EXPECT_DOUBLE_EQ(result.value().value, 500.0);
}

TEST_F(PipelineIntegrationTest, InvalidSuppliedPriorPricesRejected) {
    auto service = make_service();

    auto request = make_request(market_prices(), "return_based");
    request.prior_value = 1220.72;
    request.prior_prices = {{"GOLD", -1.0}};
    auto result = service->compute(request);

    ASSERT_TRUE(result.is_err());
    ASSERT_TRUE(std::holds_alternative<ValidationError>(result.error()));
    EXPECT_EQ(std::get<ValidationError>(result.error()).symbol, "GOLD");
}

TEST_F(PipelineIntegrationTest, NonPositiveSuppliedPriorValueRejected) {
    auto service = make_service();

    auto request = make_request(market_prices(), "return_based");
    request.prior_value = 0.0;
    request.prior_prices = market_prices();
    auto result = service->compute(request);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(computation_error(result.error()).reason, ComputationError::Reason::NoPriorPeriod);
}

TEST_F(PipelineIntegrationTest, ConfiguredIndexIsComputable) {
    IndexConfig metals;
    metals.name = "metals";
    metals.base_level = 100.0;
    metals.base_date = "2024-06-01";
    metals.weights = {{"GOLD", 0.5}, {"SILVER", 0.5}};
    metals.base_prices = {{"GOLD", 2000.0}, {"SILVER", 25.0}};
    config.indices.push_back(metals);
    auto service = make_service();

    auto request = make_request({{"GOLD", 2200.0}, {"SILVER", 27.5}, {"BTC", 27450.0}});
    request.index_name = "metals";
    auto result = service->compute(request);

    ASSERT_TRUE(result.is_ok());
    EXPECT_DOUBLE_EQ(result.value().value, 110.0);
    EXPECT_EQ(result.value().provenance.prices.count("BTC"), 0u);
}

TEST_F(PipelineIntegrationTest, LowerCaseConfiguredSymbolsMatchPrices) {
    auto metals = IndexConfig::from_json(nlohmann::json{
        {"name", "metals"},
        {"base_level", 100.0},
        {"weights", {{"gold", 0.5}, {"silver", 0.5}}},
        {"base_prices", {{"gold", 1800.0}, {"silver", 23.0}}}
    });
    ASSERT_TRUE(metals.is_ok());
    config.indices.push_back(metals.value());
    auto service = make_service();

    auto request = make_request({{"gold", 1800}, {"silver", 23}});
    request.index_name = "metals";
    auto result = service->compute(request);

    ASSERT_TRUE(result.is_ok());
    EXPECT_DOUBLE_EQ(result.value().value, 100.0);
    EXPECT_DOUBLE_EQ(result.value().coverage_ratio, 1.0);
}

TEST_F(PipelineIntegrationTest, ProgrammaticLowerCaseIndexIsComputable) {
    IndexConfig metals;
    metals.name = "metals";
    metals.base_level = 100.0;
    metals.weights = {{"gold", 0.5}, {"silver", 0.5}};
    metals.base_prices = {{"gold", 1800.0}, {"silver", 23.0}};
    config.indices.push_back(metals);
    auto service = make_service();

    auto request = make_request({{"GOLD", 1800}, {"SILVER", 23}});
    request.index_name = "metals";
    auto result = service->compute(request);

    ASSERT_TRUE(result.is_ok());
    EXPECT_DOUBLE_EQ(result.value().value, 100.0);
}

TEST_F(PipelineIntegrationTest, InvalidConfiguredIndexSkipped) {
    IndexConfig broken;
    broken.name = "broken";
    broken.weights = {{"GOLD", 0.7}};
    broken.base_prices = {{"GOLD", 2000.0}};
    config.indices.push_back(broken);

    auto registry = build_registry(config);

    EXPECT_TRUE(registry.contains(kDefaultIndexName));
    EXPECT_FALSE(registry.contains("broken"));
}

// ============================================================================
// Insights
// ============================================================================

TEST_F(PipelineIntegrationTest, InsightsWithoutValueFallBack) {
    auto client = FakeReasoningClient::answering(healthy_completion());
    auto service = make_service(client);

    auto insight = service->insights(kDefaultIndexName);

    EXPECT_EQ(insight.source, InsightSource::Fallback);
    EXPECT_EQ(insight.sentiment, Sentiment::Unknown);
    EXPECT_EQ(client->calls.load(), 0);
}

TEST_F(PipelineIntegrationTest, InsightsForLatestValue) {
    auto client = FakeReasoningClient::answering(healthy_completion());
    auto service = make_service(client);
    ASSERT_TRUE(service->compute(make_request(market_prices())).is_ok());

    auto insight = service->insights(kDefaultIndexName);

    EXPECT_EQ(insight.source, InsightSource::Ai);
    EXPECT_EQ(insight.sentiment, Sentiment::Positive);
    EXPECT_EQ(client->last_deadline, config.reasoning.timeout);
    EXPECT_NE(client->last_prompt.find("Current index value: 1220.72"), std::string::npos);
    EXPECT_NE(client->last_prompt.find("- ETH: 1850.00 (weight 15%)"), std::string::npos);
    EXPECT_EQ(client->last_prompt.find("24h change"), std::string::npos);
}

TEST_F(PipelineIntegrationTest, InsightsDeadlineOverride) {
    auto client = FakeReasoningClient::answering(healthy_completion());
    auto service = make_service(client);
    ASSERT_TRUE(service->compute(make_request(market_prices())).is_ok());

    (void)service->insights(kDefaultIndexName, std::chrono::milliseconds{750});

    EXPECT_EQ(client->last_deadline, std::chrono::milliseconds{750});
}

TEST_F(PipelineIntegrationTest, InsightsDegradeOnServiceFailure) {
    auto client = FakeReasoningClient::failing("HTTP 503: Service Unavailable");
    auto service = make_service(client);
    ASSERT_TRUE(service->compute(make_request(market_prices())).is_ok());

    auto insight = service->insights(kDefaultIndexName);

    EXPECT_EQ(insight.source, InsightSource::Fallback);
    EXPECT_EQ(insight.summary, "insight unavailable");
    EXPECT_EQ(insight.generated_at, clock.now());
}

TEST_F(PipelineIntegrationTest, InsightsWithoutReasoningServiceFallBack) {
    auto service = make_service();
    ASSERT_TRUE(service->compute(make_request(market_prices())).is_ok());

    auto insight = service->insights(kDefaultIndexName);

    EXPECT_EQ(insight.source, InsightSource::Fallback);
}

TEST_F(PipelineIntegrationTest, DeltaAcrossTwentyFourHours) {
    auto client = FakeReasoningClient::answering(healthy_completion());
    auto service = make_service(client);
    ASSERT_TRUE(service->compute(make_request(base_prices())).is_ok());

    clock.advance(std::chrono::hours{24});
    ASSERT_TRUE(service->compute(make_request(market_prices())).is_ok());

    auto delta = service->delta_24h(kDefaultIndexName);
    ASSERT_TRUE(delta.has_value());
    EXPECT_DOUBLE_EQ(*delta, 22.07);

    (void)service->insights(kDefaultIndexName);
    EXPECT_NE(client->last_prompt.find("24h change: 22.07%"), std::string::npos);
}

TEST_F(PipelineIntegrationTest, NoDeltaWithinTwentyFourHours) {
    auto service = make_service();
    ASSERT_TRUE(service->compute(make_request(base_prices())).is_ok());

    clock.advance(std::chrono::hours{23});
    ASSERT_TRUE(service->compute(make_request(market_prices())).is_ok());

    EXPECT_FALSE(service->delta_24h(kDefaultIndexName).has_value());
}

// ============================================================================
// Metrics
// ============================================================================

TEST_F(PipelineIntegrationTest, CalculationsCountedByIndexAndMethod) {
    auto service = make_service();
    ASSERT_TRUE(service->compute(make_request(market_prices())).is_ok());
    ASSERT_TRUE(service->compute(make_request(market_prices(), "return_based")).is_ok());
    ASSERT_TRUE(service->compute(make_request({{"GOLD", 1900.12}})).is_err());

    const auto& metrics = service->metrics();
    EXPECT_EQ(metrics.index_calculations(kDefaultIndexName, "level_normalized"), 1u);
    EXPECT_EQ(metrics.index_calculations(kDefaultIndexName, "return_based"), 1u);
    EXPECT_EQ(metrics.calculation_failures(kDefaultIndexName), 1u);
    EXPECT_EQ(metrics.total_calculations(), 3u);
    EXPECT_EQ(metrics.calculation_duration(kDefaultIndexName, "level_normalized").count, 1u);

    auto j = metrics.to_json();
    EXPECT_DOUBLE_EQ(j["indices"][kDefaultIndexName]["value"].get<double>(), 1220.72);
}

TEST_F(PipelineIntegrationTest, InsightRequestsCountedByStatus) {
    auto metrics = std::make_shared<telemetry::Metrics>();
    auto client = FakeReasoningClient::answering(healthy_completion());
    IndexService service{config, build_registry(config), store, client, clock, metrics};
    ASSERT_TRUE(service.compute(make_request(market_prices())).is_ok());

    (void)service.insights(kDefaultIndexName);
    client->responder = [](const auto&, auto, const auto&) {
        return Result<std::string, std::string>::Ok("not json");
    };
    (void)service.insights(kDefaultIndexName);
    client->responder = [](const auto&, auto, const auto&) {
        return Result<std::string, std::string>::Err("timeout");
    };
    (void)service.insights(kDefaultIndexName);

    const std::string model = config.reasoning.model;
    EXPECT_EQ(metrics->llm_requests(model, telemetry::LlmStatus::Success), 1u);
    EXPECT_EQ(metrics->llm_requests(model, telemetry::LlmStatus::ValidationError), 1u);
    EXPECT_EQ(metrics->llm_requests(model, telemetry::LlmStatus::ApiError), 1u);
    EXPECT_EQ(metrics->llm_latency(model).count, 3u);
}

TEST_F(PipelineIntegrationTest, DeltaGaugeSetAfterTwentyFourHours) {
    auto service = make_service();
    ASSERT_TRUE(service->compute(make_request(base_prices())).is_ok());
    clock.advance(std::chrono::hours{24});
    ASSERT_TRUE(service->compute(make_request(market_prices())).is_ok());

    auto text = service->metrics().to_prometheus();

    EXPECT_NE(text.find("sentindex_index_delta_24h_percent{index_name=\"gold_silver_oil_crypto\"} 22.07"),
              std::string::npos);
}
