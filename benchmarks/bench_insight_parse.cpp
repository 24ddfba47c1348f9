#include <benchmark/benchmark.h>
#include "insight/insight_requester.hpp"
#include <string>

using namespace sentindex;

// Strict verification of a well-formed completion
static void BM_ParsePayload(benchmark::State& state) {
    const std::string text = R"({"sentiment": "positive",
        "summary": "Gold and crypto lead the index higher.",
        "notable_events": ["BTC above 27k", "Gold near record"],
        "risk_factors": ["Oil supply shock"]})";

    for (auto _ : state) {
        benchmark::DoNotOptimize(InsightRequester::parse_payload(text));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ParsePayload);

// Rejection path for prose answers
static void BM_ParsePayloadRejected(benchmark::State& state) {
    const std::string text = "The index looks bullish, driven by gold and bitcoin.";

    for (auto _ : state) {
        benchmark::DoNotOptimize(InsightRequester::parse_payload(text));
    }
}
BENCHMARK(BM_ParsePayloadRejected);

static void BM_BuildPrompt(benchmark::State& state) {
    InsightRequest req;
    req.index_name = "gold_silver_oil_crypto";
    req.value = 1220.72;
    req.prices = {{"GOLD", 1900.12}, {"SILVER", 24.31}, {"OIL", 78.45}, {"BTC", 27450.0}, {"ETH", 1850.0}};
    req.weights = {{"GOLD", 0.25}, {"SILVER", 0.25}, {"OIL", 0.20}, {"BTC", 0.15}, {"ETH", 0.15}};
    req.base_level = 1000.0;
    req.base_date = "2025-01-01";
    req.delta_24h_pct = 1.25;

    for (auto _ : state) {
        benchmark::DoNotOptimize(InsightRequester::build_prompt(req));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_BuildPrompt);

BENCHMARK_MAIN();
