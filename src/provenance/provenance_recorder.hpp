#pragma once

#include "core/clock.hpp"
#include "index/index_result.hpp"

namespace sentindex {

/// Assembles a self-describing IndexResult from a composition
/// Never fails, never reads a global clock
class ProvenanceRecorder {
public:
    /// @param clock Time source for computed_at, must outlive the recorder
    explicit ProvenanceRecorder(const Clock& clock);

    /// Attach the audit record
    /// @param core Value, method, coverage and symbol partition from the composer
    /// @param config Configuration the value was computed against
    /// @param prices Price set supplied to the composer
    [[nodiscard]] IndexResult attach(
        CompositionCore core,
        const IndexConfig& config,
        const PriceSet& prices
    ) const;

private:
    const Clock& clock_;
};

}  // namespace sentindex
