#include "provenance/provenance_recorder.hpp"

namespace sentindex {

ProvenanceRecorder::ProvenanceRecorder(const Clock& clock)
    : clock_(clock)
{}

IndexResult ProvenanceRecorder::attach(
    CompositionCore core,
    const IndexConfig& config,
    const PriceSet& prices
) const {
    WallTime now = clock_.now();

    ProvenanceRecord record;
    record.config = config;
    record.method = core.method;
    record.computed_at = now;

    // Keep only what was consumed so the record reconstructs the value alone
    for (const auto& symbol : core.symbols_used) {
        auto it = prices.find(symbol);
        if (it != prices.end()) {
            record.prices.emplace(symbol, it->second);
        }
    }
    if (core.prior) {
        PriorPeriod prior;
        prior.value = core.prior->value;
        for (const auto& symbol : core.symbols_used) {
            auto it = core.prior->prices.find(symbol);
            if (it != core.prior->prices.end()) {
                prior.prices.emplace(symbol, it->second);
            }
        }
        record.prior = std::move(prior);
    }
    record.symbols_used = std::move(core.symbols_used);
    record.symbols_missing = std::move(core.symbols_missing);

    IndexResult result;
    result.index_name = config.name;
    result.value = core.value;
    result.method = core.method;
    result.coverage_ratio = core.coverage_ratio;
    result.timestamp = now;
    result.provenance = std::move(record);
    return result;
}

}  // namespace sentindex
