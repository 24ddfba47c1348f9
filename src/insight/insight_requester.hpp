#pragma once

#include "core/cancellation.hpp"
#include "core/clock.hpp"
#include "core/status.hpp"
#include "insight/insight_types.hpp"
#include "insight/reasoning_client.hpp"
#include "telemetry/metrics.hpp"
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace sentindex {

/// Summary returned when no verified insight is available
constexpr const char* kFallbackSummary = "insight unavailable";

/// Longest summary accepted from the reasoning service
constexpr std::size_t kDefaultMaxSummaryLength = 200;

/// Requests AI insights for an index value
/// Never fails: any transport, timeout or schema problem yields the fallback insight
class InsightRequester {
public:
    /// @param client Reasoning service, may be null (always fallback)
    /// @param clock Time source for generated_at, must outlive the requester
    /// @param max_summary_length Longest accepted summary
    /// @param metrics Request counters and latency, may be null
    /// @param model Model label for metrics
    InsightRequester(
        std::shared_ptr<ReasoningClient> client,
        const Clock& clock,
        std::size_t max_summary_length = kDefaultMaxSummaryLength,
        std::shared_ptr<telemetry::Metrics> metrics = nullptr,
        std::string model = "unknown"
    );

    /// One bounded attempt against the reasoning service
    [[nodiscard]] InsightResult request(
        const InsightRequest& req,
        std::chrono::milliseconds deadline,
        const CancellationToken& cancel = CancellationToken{}
    ) const;

    /// Prompt instructing the service to answer with the fixed JSON object
    [[nodiscard]] static std::string build_prompt(const InsightRequest& req);

    /// Strict parse of a completion: the whole text must be one JSON object
    /// with sentiment, summary, notable_events and risk_factors, correctly typed
    [[nodiscard]] static Result<InsightPayload, std::string> parse_payload(
        std::string_view text,
        std::size_t max_summary_length = kDefaultMaxSummaryLength
    );

    /// Degraded insight stamped at the given time
    [[nodiscard]] static InsightResult fallback(WallTime at);

private:
    std::shared_ptr<ReasoningClient> client_;
    const Clock& clock_;
    std::size_t max_summary_length_;
    std::shared_ptr<telemetry::Metrics> metrics_;
    std::string model_;

    void record(telemetry::LlmStatus status, std::chrono::nanoseconds latency) const;
};

}  // namespace sentindex
