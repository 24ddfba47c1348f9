#pragma once

#include "core/types.hpp"
#include "index/index_config.hpp"
#include <optional>
#include <string>
#include <vector>

namespace sentindex {

/// Previous period state required by the return-based method
/// Fetched by the caller from the time-series store
struct PriorPeriod {
    double value = 0.0;
    PriceSet prices;
};

/// Audit trail of exactly which inputs produced a value
struct ProvenanceRecord {
    std::vector<Symbol> symbols_used;       // Config order
    std::vector<Symbol> symbols_missing;    // Config order
    IndexConfig config;                     // Snapshot of weights, base prices, base level/date
    PriceSet prices;                        // Prices actually consumed
    Method method = Method::LevelNormalized;
    WallTime computed_at;
    std::optional<PriorPeriod> prior;       // Return-based only
};

/// Composite index value with provenance, immutable once built
struct IndexResult {
    std::string index_name;
    double value = 0.0;
    Method method = Method::LevelNormalized;
    double coverage_ratio = 0.0;
    WallTime timestamp;
    ProvenanceRecord provenance;
};

/// Output of the composer before provenance is attached
struct CompositionCore {
    double value = 0.0;
    Method method = Method::LevelNormalized;
    double coverage_ratio = 0.0;
    std::vector<Symbol> symbols_used;
    std::vector<Symbol> symbols_missing;
    std::optional<PriorPeriod> prior;
};

}  // namespace sentindex
