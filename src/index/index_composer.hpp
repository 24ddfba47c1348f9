#pragma once

#include "core/clock.hpp"
#include "core/status.hpp"
#include "index/index_config.hpp"
#include "index/index_result.hpp"
#include "provenance/provenance_recorder.hpp"
#include <optional>

namespace sentindex {

/// Default minimum fraction of configured weight that must be priced
constexpr double kDefaultMinCoverage = 0.5;

/// Decimal places of a published index value
constexpr int kIndexValueDecimals = 2;

/// Per-call computation options
struct ComputeOptions {
    Method method = Method::LevelNormalized;
    double min_coverage = kDefaultMinCoverage;
    double weight_tolerance = kDefaultWeightTolerance;
    std::optional<PriorPeriod> prior;   // Required for Method::ReturnBased
};

/// Computes composite index values
///
/// Level-normalized: value = base_level * sum(weight * price / base_price)
/// Return-based:     value = previous_value * (1 + sum(weight * period_return))
///
/// Configured symbols without a price are excluded and reduce coverage.
/// The value is rounded half-to-even to kIndexValueDecimals once, after
/// full-precision accumulation.
class IndexComposer {
public:
    /// @param clock Time source for provenance, must outlive the composer
    explicit IndexComposer(const Clock& clock);

    /// Compute and attach provenance
    [[nodiscard]] Result<IndexResult, ComputationError> compute(
        const IndexConfig& config,
        const PriceSet& prices,
        const ComputeOptions& options = {}
    ) const;

    /// Pure composition step, no provenance and no clock
    [[nodiscard]] static Result<CompositionCore, ComputationError> compose(
        const IndexConfig& config,
        const PriceSet& prices,
        const ComputeOptions& options = {}
    );

    /// Percentage change from previous to current, rounded to 2 decimals
    /// nullopt when previous is not positive
    [[nodiscard]] static std::optional<double> percent_change(double current, double previous);

private:
    ProvenanceRecorder recorder_;
};

}  // namespace sentindex
