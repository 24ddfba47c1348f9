#include <benchmark/benchmark.h>
#include "core/clock.hpp"
#include "index/index_composer.hpp"
#include "index/price_normalizer.hpp"
#include <string>

using namespace sentindex;

namespace {

PriceSet market_prices() {
    return {
        {"GOLD", 1900.12},
        {"SILVER", 24.31},
        {"OIL", 78.45},
        {"BTC", 27450.0},
        {"ETH", 1850.0}
    };
}

// Equal-weight index over n synthetic symbols
IndexConfig wide_config(std::size_t n) {
    IndexConfig config;
    config.name = "wide";
    for (std::size_t i = 0; i < n; ++i) {
        std::string symbol = "SYM" + std::to_string(i);
        config.weights[symbol] = 1.0 / static_cast<double>(n);
        config.base_prices[symbol] = 100.0 + static_cast<double>(i);
    }
    return config;
}

}  // namespace

// Pure composition of the built-in index
static void BM_ComposeLevelNormalized(benchmark::State& state) {
    auto config = default_index_config();
    auto prices = market_prices();

    for (auto _ : state) {
        benchmark::DoNotOptimize(IndexComposer::compose(config, prices));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ComposeLevelNormalized);

static void BM_ComposeReturnBased(benchmark::State& state) {
    auto config = default_index_config();
    auto prices = market_prices();
    ComputeOptions options;
    options.method = Method::ReturnBased;
    options.prior = PriorPeriod{1220.72, market_prices()};

    for (auto _ : state) {
        benchmark::DoNotOptimize(IndexComposer::compose(config, prices, options));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ComposeReturnBased);

// Full compute including provenance assembly
static void BM_ComputeWithProvenance(benchmark::State& state) {
    FixedClock clock{WallTime{}};
    IndexComposer composer{clock};
    auto config = default_index_config();
    auto prices = market_prices();

    for (auto _ : state) {
        benchmark::DoNotOptimize(composer.compute(config, prices));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ComputeWithProvenance);

// Scaling with index width
static void BM_ComposeWideIndex(benchmark::State& state) {
    auto n = static_cast<std::size_t>(state.range(0));
    auto config = wide_config(n);
    PriceSet prices;
    for (const auto& [symbol, base] : config.base_prices) {
        prices[symbol] = base * 1.05;
    }
    ComputeOptions options;
    options.weight_tolerance = 1e-9;

    for (auto _ : state) {
        benchmark::DoNotOptimize(IndexComposer::compose(config, prices, options));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ComposeWideIndex)->Range(8, 512);

// Wire prices to a validated PriceSet
static void BM_NormalizeText(benchmark::State& state) {
    const std::string text =
        R"({"gold": 1900.12, "silver": 24.31, "oil": 78.45, "btc": 27450.0, "eth": 1850.0})";

    for (auto _ : state) {
        benchmark::DoNotOptimize(PriceNormalizer::normalize_text(text));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_NormalizeText);

BENCHMARK_MAIN();
