#pragma once

#include "core/cancellation.hpp"
#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/status.hpp"
#include "index/index_composer.hpp"
#include "index/index_config.hpp"
#include "insight/insight_requester.hpp"
#include "storage/index_store.hpp"
#include "telemetry/metrics.hpp"
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace sentindex {

/// Compute request in wire shape
struct ComputeRequest {
    std::string index_name;
    nlohmann::json prices;                  // {"GOLD": 1900.12, ...}
    std::string method;                     // Empty selects the configured default
    std::optional<double> min_coverage;     // Overrides the configured threshold

    // Explicit prior period for return_based; when set the store is not consulted
    std::optional<double> prior_value;
    nlohmann::json prior_prices;            // Same shape as prices
};

/// Normalize -> compose -> record -> persist, plus insights on the latest value
/// Holds no per-request state; the store is the only shared collaborator
class IndexService {
public:
    /// @param config Computation and reasoning settings
    /// @param registry Index configurations
    /// @param store Time-series collaborator for prior periods and latest values
    /// @param reasoning Reasoning service, null for fallback-only insights
    /// @param clock Time source, must outlive the service
    /// @param metrics Shared collector, a private one is created when null
    IndexService(
        const Config& config,
        IndexRegistry registry,
        std::shared_ptr<storage::IndexStore> store,
        std::shared_ptr<ReasoningClient> reasoning,
        const Clock& clock,
        std::shared_ptr<telemetry::Metrics> metrics = nullptr
    );

    /// Compute an index value and persist it
    [[nodiscard]] Result<IndexResult, PipelineError> compute(const ComputeRequest& request);

    /// Insight for the latest stored value of an index
    /// Returns the fallback insight when nothing has been computed yet
    /// @param deadline Bound on the reasoning call, configured timeout when unset
    [[nodiscard]] InsightResult insights(
        const std::string& index_name,
        std::optional<std::chrono::milliseconds> deadline = std::nullopt,
        const CancellationToken& cancel = CancellationToken{}
    ) const;

    /// Percentage change of the latest value against the last value at least 24h older
    [[nodiscard]] std::optional<double> delta_24h(const std::string& index_name) const;

    [[nodiscard]] const IndexRegistry& registry() const noexcept { return registry_; }

    [[nodiscard]] const telemetry::Metrics& metrics() const noexcept { return *metrics_; }

private:
    /// Prior period for a return-based request: explicit input, else the store
    [[nodiscard]] Result<std::optional<PriorPeriod>, PipelineError> resolve_prior(
        const ComputeRequest& request,
        const IndexConfig& index
    ) const;

    Config::Compute compute_settings_;
    std::chrono::milliseconds insight_timeout_;
    IndexRegistry registry_;
    std::shared_ptr<storage::IndexStore> store_;
    const Clock& clock_;
    std::shared_ptr<telemetry::Metrics> metrics_;
    IndexComposer composer_;
    InsightRequester insight_requester_;
};

/// Registry with the built-in index plus every configured one
/// Invalid configured indices are skipped with an error log
[[nodiscard]] IndexRegistry build_registry(const Config& config);

}  // namespace sentindex
