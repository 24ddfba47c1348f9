#pragma once

#include "core/types.hpp"
#include "index/index_result.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sentindex {

enum class Sentiment {
    Positive,
    Neutral,
    Negative,
    Unknown
};

/// Where an insight came from
enum class InsightSource {
    Ai,
    Fallback
};

[[nodiscard]] inline std::string_view sentiment_name(Sentiment sentiment) noexcept {
    switch (sentiment) {
        case Sentiment::Positive: return "positive";
        case Sentiment::Neutral:  return "neutral";
        case Sentiment::Negative: return "negative";
        case Sentiment::Unknown:  return "unknown";
    }
    return "unknown";
}

/// Parse a sentiment the reasoning service may return ("unknown" is ours only)
[[nodiscard]] inline std::optional<Sentiment> parse_sentiment(std::string_view name) noexcept {
    if (name == "positive") return Sentiment::Positive;
    if (name == "neutral") return Sentiment::Neutral;
    if (name == "negative") return Sentiment::Negative;
    return std::nullopt;
}

[[nodiscard]] inline std::string_view source_name(InsightSource source) noexcept {
    return source == InsightSource::Ai ? "ai" : "fallback";
}

/// Inputs for one insight
struct InsightRequest {
    std::string index_name;
    double value = 0.0;
    PriceSet prices;

    // Optional context, included in the prompt when present
    WeightMap weights;
    std::optional<double> base_level;
    std::string base_date;
    std::optional<double> delta_24h_pct;

    /// Build a request from a computed result and its provenance
    [[nodiscard]] static InsightRequest from_result(
        const IndexResult& result,
        std::optional<double> delta_24h_pct = std::nullopt
    ) {
        InsightRequest req;
        req.index_name = result.index_name;
        req.value = result.value;
        req.prices = result.provenance.prices;
        req.weights = result.provenance.config.weights;
        req.base_level = result.provenance.config.base_level;
        req.base_date = result.provenance.config.base_date;
        req.delta_24h_pct = delta_24h_pct;
        return req;
    }
};

/// Verified fields of a reasoning-service answer
struct InsightPayload {
    Sentiment sentiment = Sentiment::Unknown;
    std::string summary;
    std::vector<std::string> notable_events;
    std::vector<std::string> risk_factors;
};

/// Insight returned to the caller, always well-formed
struct InsightResult {
    Sentiment sentiment = Sentiment::Unknown;
    std::string summary;
    std::vector<std::string> notable_events;
    std::vector<std::string> risk_factors;
    InsightSource source = InsightSource::Fallback;
    WallTime generated_at;
};

}  // namespace sentindex
