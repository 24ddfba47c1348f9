#pragma once

#include "core/status.hpp"
#include "core/types.hpp"
#include "index/index_result.hpp"
#include "insight/insight_types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace sentindex::output {

/// Formats pipeline results as JSON response payloads
class JsonFormatter {
public:
    /// {index_name, index_value, method, timestamp, coverage_ratio}
    [[nodiscard]] static nlohmann::json format_compute(const IndexResult& result);

    /// {error_kind, detail, reason} plus symbol / coverage_ratio when known
    [[nodiscard]] static nlohmann::json format_error(const PipelineError& error);

    /// {index_name, insights: {sentiment, summary, notable_events, risk_factors, source}, timestamp}
    [[nodiscard]] static nlohmann::json format_insights(
        const std::string& index_name,
        const InsightResult& insight
    );

    /// Audit payload of a computed value
    [[nodiscard]] static nlohmann::json format_provenance(const ProvenanceRecord& record);

    /// Persisted row {time, index_name, index_value, method, payload}
    [[nodiscard]] static nlohmann::json format_row(const IndexResult& result);

    /// ISO8601 UTC timestamp with milliseconds, e.g. 2025-09-30T07:40:00.000Z
    [[nodiscard]] static std::string iso_timestamp(WallTime time);
};

}  // namespace sentindex::output
