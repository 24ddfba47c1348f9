#include "engine/index_service.hpp"
#include "index/price_normalizer.hpp"
#include <spdlog/spdlog.h>

namespace sentindex {

namespace {

constexpr std::chrono::hours kDeltaWindow{24};

Result<IndexResult, PipelineError> fail(PipelineError error) {
    return Result<IndexResult, PipelineError>::Err(std::move(error));
}

}  // namespace

IndexService::IndexService(
    const Config& config,
    IndexRegistry registry,
    std::shared_ptr<storage::IndexStore> store,
    std::shared_ptr<ReasoningClient> reasoning,
    const Clock& clock,
    std::shared_ptr<telemetry::Metrics> metrics
)
    : compute_settings_(config.compute)
    , insight_timeout_(config.reasoning.timeout)
    , registry_(std::move(registry))
    , store_(std::move(store))
    , clock_(clock)
    , metrics_(metrics ? std::move(metrics) : std::make_shared<telemetry::Metrics>())
    , composer_(clock)
    , insight_requester_(std::move(reasoning), clock, config.reasoning.max_summary_length,
                         metrics_, config.reasoning.model)
{}

Result<IndexResult, PipelineError> IndexService::compute(const ComputeRequest& request) {
    auto config = registry_.find(request.index_name);
    if (config.is_err()) {
        return fail(config.error());
    }
    const IndexConfig& index = config.value();

    auto reject = [&](PipelineError error) {
        metrics_->record_calculation_failure(index.name);
        return fail(std::move(error));
    };

    ComputeOptions options;
    options.method = compute_settings_.default_method;
    options.min_coverage = request.min_coverage.value_or(compute_settings_.min_coverage);
    options.weight_tolerance = compute_settings_.weight_tolerance;

    if (!request.method.empty()) {
        auto method = parse_method(request.method);
        if (!method) {
            return reject(ComputationError{
                ComputationError::Reason::UnsupportedMethod,
                "unsupported method '" + request.method + "'",
                std::nullopt
            });
        }
        options.method = *method;
    }

    auto prices = PriceNormalizer::normalize_json(request.prices);
    if (prices.is_err()) {
        spdlog::warn("Rejected prices for {}: {}", request.index_name,
                     describe(PipelineError{prices.error()}));
        return reject(prices.error());
    }

    // Drop symbols this index does not weigh
    PriceSet relevant;
    for (const auto& [symbol, price] : prices.value()) {
        if (index.weights.count(symbol) != 0) {
            relevant.emplace(symbol, price);
        }
    }

    if (options.method == Method::ReturnBased) {
        auto prior = resolve_prior(request, index);
        if (prior.is_err()) {
            return reject(prior.error());
        }
        options.prior = std::move(prior).value();
    }

    auto started = std::chrono::steady_clock::now();
    auto result = composer_.compute(index, relevant, options);
    auto duration = std::chrono::steady_clock::now() - started;

    if (result.is_err()) {
        spdlog::warn("Computation of {} failed: {}", request.index_name,
                     describe(PipelineError{result.error()}));
        return reject(result.error());
    }

    const IndexResult& computed = result.value();
    spdlog::info("Index {} = {:.2f} ({}, coverage {:.2f})",
                 computed.index_name, computed.value,
                 method_name(computed.method), computed.coverage_ratio);

    metrics_->record_index_calculation(computed.index_name,
                                       std::string(method_name(computed.method)), duration);
    metrics_->set_index_value(computed.index_name, computed.value);

    if (store_ && !store_->append(computed)) {
        spdlog::warn("Result for {} not persisted", computed.index_name);
    }
    if (auto delta = delta_24h(computed.index_name)) {
        metrics_->set_index_delta_24h(computed.index_name, *delta);
    }

    return Result<IndexResult, PipelineError>::Ok(computed);
}

Result<std::optional<PriorPeriod>, PipelineError> IndexService::resolve_prior(
    const ComputeRequest& request,
    const IndexConfig& index
) const {
    using PriorResult = Result<std::optional<PriorPeriod>, PipelineError>;

    if (!request.prior_value) {
        if (!store_) {
            return PriorResult::Ok(std::nullopt);
        }
        return PriorResult::Ok(storage::prior_period_from(*store_, index.name));
    }

    auto prior_prices = PriceNormalizer::normalize_json(request.prior_prices);
    if (prior_prices.is_err()) {
        spdlog::warn("Rejected prior prices for {}: {}", index.name,
                     describe(PipelineError{prior_prices.error()}));
        return PriorResult::Err(prior_prices.error());
    }

    spdlog::debug("Using caller-supplied prior period for {} (value {})",
                  index.name, *request.prior_value);
    return PriorResult::Ok(PriorPeriod{*request.prior_value, std::move(prior_prices).value()});
}

InsightResult IndexService::insights(
    const std::string& index_name,
    std::optional<std::chrono::milliseconds> deadline,
    const CancellationToken& cancel
) const {
    std::optional<IndexResult> latest;
    if (store_) {
        latest = store_->latest(index_name);
    }
    if (!latest) {
        spdlog::warn("No computed value for {}, returning fallback insight", index_name);
        return InsightRequester::fallback(clock_.now());
    }

    auto request = InsightRequest::from_result(*latest, delta_24h(index_name));
    return insight_requester_.request(request, deadline.value_or(insight_timeout_), cancel);
}

std::optional<double> IndexService::delta_24h(const std::string& index_name) const {
    if (!store_) {
        return std::nullopt;
    }
    auto rows = store_->history(index_name);
    if (rows.size() < 2) {
        return std::nullopt;
    }

    const IndexResult& current = rows.back();
    WallTime cutoff = current.timestamp - kDeltaWindow;

    // Newest row at or before the cutoff
    for (auto it = rows.rbegin() + 1; it != rows.rend(); ++it) {
        if (it->timestamp <= cutoff) {
            return IndexComposer::percent_change(current.value, it->value);
        }
    }
    return std::nullopt;
}

IndexRegistry build_registry(const Config& config) {
    IndexRegistry registry(config.compute.weight_tolerance);

    auto builtin = registry.add(default_index_config());
    if (builtin.is_err()) {
        spdlog::error("Built-in index rejected: {}", builtin.error().detail);
    }

    for (const auto& index : config.indices) {
        auto added = registry.add(index);
        if (added.is_err()) {
            spdlog::error("Skipping index '{}': {}", index.name, added.error().detail);
        } else {
            spdlog::debug("Registered index {}", added.value());
        }
    }
    return registry;
}

}  // namespace sentindex
