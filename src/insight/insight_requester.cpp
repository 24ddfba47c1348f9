#include "insight/insight_requester.hpp"
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>
#include <spdlog/spdlog.h>

namespace sentindex {

using json = nlohmann::json;

namespace {

/// Read a required array whose elements must all be strings
Result<std::vector<std::string>, std::string> read_string_array(const json& j, const char* field) {
    if (!j.contains(field)) {
        return Result<std::vector<std::string>, std::string>::Err(
            std::string("missing field: ") + field);
    }
    const auto& arr = j[field];
    if (!arr.is_array()) {
        return Result<std::vector<std::string>, std::string>::Err(
            std::string(field) + " must be an array");
    }

    std::vector<std::string> out;
    out.reserve(arr.size());
    for (const auto& item : arr) {
        if (!item.is_string()) {
            return Result<std::vector<std::string>, std::string>::Err(
                std::string(field) + " must contain only strings");
        }
        out.push_back(item.get<std::string>());
    }
    return Result<std::vector<std::string>, std::string>::Ok(std::move(out));
}

/// Number of UTF-8 code points (continuation bytes are not counted)
std::size_t utf8_length(std::string_view text) {
    std::size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

}  // namespace

InsightRequester::InsightRequester(
    std::shared_ptr<ReasoningClient> client,
    const Clock& clock,
    std::size_t max_summary_length,
    std::shared_ptr<telemetry::Metrics> metrics,
    std::string model
)
    : client_(std::move(client))
    , clock_(clock)
    , max_summary_length_(max_summary_length)
    , metrics_(std::move(metrics))
    , model_(std::move(model))
{}

void InsightRequester::record(telemetry::LlmStatus status, std::chrono::nanoseconds latency) const {
    if (metrics_) {
        metrics_->record_llm_request(model_, status, latency);
    }
}

InsightResult InsightRequester::request(
    const InsightRequest& req,
    std::chrono::milliseconds deadline,
    const CancellationToken& cancel
) const {
    if (!client_) {
        spdlog::debug("No reasoning service configured, fallback insight for {}", req.index_name);
        return fallback(clock_.now());
    }
    if (deadline.count() <= 0 || cancel.is_cancelled()) {
        spdlog::warn("Insight for {} skipped: deadline expired or cancelled", req.index_name);
        return fallback(clock_.now());
    }

    auto started = std::chrono::steady_clock::now();

    Result<std::string, std::string> completion = Result<std::string, std::string>::Err("not attempted");
    auto status = telemetry::LlmStatus::ApiError;
    try {
        completion = client_->complete(build_prompt(req), deadline, cancel);
    } catch (const std::exception& e) {
        completion = Result<std::string, std::string>::Err(std::string("client exception: ") + e.what());
        status = telemetry::LlmStatus::Error;
    }

    auto latency = std::chrono::steady_clock::now() - started;
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(latency);

    if (completion.is_err()) {
        spdlog::warn("Insight for {} unavailable after {}ms: {}",
                     req.index_name, elapsed.count(), completion.error());
        record(status, latency);
        return fallback(clock_.now());
    }

    auto payload = parse_payload(completion.value(), max_summary_length_);
    if (payload.is_err()) {
        spdlog::warn("Insight for {} rejected: {}", req.index_name, payload.error());
        record(telemetry::LlmStatus::ValidationError, latency);
        return fallback(clock_.now());
    }

    record(telemetry::LlmStatus::Success, latency);

    spdlog::debug("Insight for {} received in {}ms", req.index_name, elapsed.count());

    InsightPayload verified = std::move(payload).value();
    InsightResult result;
    result.sentiment = verified.sentiment;
    result.summary = std::move(verified.summary);
    result.notable_events = std::move(verified.notable_events);
    result.risk_factors = std::move(verified.risk_factors);
    result.source = InsightSource::Ai;
    result.generated_at = clock_.now();
    return result;
}

std::string InsightRequester::build_prompt(const InsightRequest& req) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    oss << "You are a financial analyst reviewing a composite commodity and crypto index.\n"
        << "Answer with EXACTLY one JSON object and no other text. The object must have keys:\n"
        << "  \"sentiment\": one of \"positive\", \"neutral\", \"negative\"\n"
        << "  \"summary\": string, at most 2 sentences\n"
        << "  \"notable_events\": array of strings\n"
        << "  \"risk_factors\": array of strings\n"
        << "\nIndex: " << req.index_name << "\n"
        << "Current index value: " << req.value << "\n";

    if (req.base_level) {
        oss << "Base index level: " << *req.base_level;
        if (!req.base_date.empty()) {
            oss << " (base date: " << req.base_date << ")";
        }
        oss << "\n";
    }
    if (req.delta_24h_pct) {
        oss << "24h change: " << *req.delta_24h_pct << "%\n";
    }

    oss << "\nLatest prices:\n";
    for (const auto& [symbol, price] : req.prices) {
        oss << "- " << symbol << ": " << price;
        auto w = req.weights.find(symbol);
        if (w != req.weights.end()) {
            oss << " (weight " << std::setprecision(0) << w->second * 100.0 << "%"
                << std::setprecision(2) << ")";
        }
        oss << "\n";
    }

    oss << "\nReturn JSON only.";
    return oss.str();
}

Result<InsightPayload, std::string> InsightRequester::parse_payload(
    std::string_view text,
    std::size_t max_summary_length
) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception& e) {
        return Result<InsightPayload, std::string>::Err(
            std::string("JSON parse error: ") + e.what());
    }

    if (!j.is_object()) {
        return Result<InsightPayload, std::string>::Err("response is not a JSON object");
    }

    InsightPayload payload;

    if (!j.contains("sentiment")) {
        return Result<InsightPayload, std::string>::Err("missing field: sentiment");
    }
    if (!j["sentiment"].is_string()) {
        return Result<InsightPayload, std::string>::Err("sentiment must be a string");
    }
    auto sentiment = parse_sentiment(j["sentiment"].get<std::string>());
    if (!sentiment) {
        return Result<InsightPayload, std::string>::Err(
            "invalid sentiment: " + j["sentiment"].get<std::string>());
    }
    payload.sentiment = *sentiment;

    if (!j.contains("summary")) {
        return Result<InsightPayload, std::string>::Err("missing field: summary");
    }
    if (!j["summary"].is_string()) {
        return Result<InsightPayload, std::string>::Err("summary must be a string");
    }
    payload.summary = j["summary"].get<std::string>();
    if (payload.summary.empty()) {
        return Result<InsightPayload, std::string>::Err("summary is empty");
    }
    if (utf8_length(payload.summary) > max_summary_length) {
        return Result<InsightPayload, std::string>::Err(
            "summary too long (max " + std::to_string(max_summary_length) + " characters)");
    }

    auto events = read_string_array(j, "notable_events");
    if (events.is_err()) {
        return Result<InsightPayload, std::string>::Err(events.error());
    }
    payload.notable_events = std::move(events).value();

    auto risks = read_string_array(j, "risk_factors");
    if (risks.is_err()) {
        return Result<InsightPayload, std::string>::Err(risks.error());
    }
    payload.risk_factors = std::move(risks).value();

    return Result<InsightPayload, std::string>::Ok(std::move(payload));
}

InsightResult InsightRequester::fallback(WallTime at) {
    InsightResult result;
    result.sentiment = Sentiment::Unknown;
    result.summary = kFallbackSummary;
    result.source = InsightSource::Fallback;
    result.generated_at = at;
    return result;
}

}  // namespace sentindex
