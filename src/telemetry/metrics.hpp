#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <utility>

namespace sentindex::telemetry {

/// Outcome label of one reasoning service call
enum class LlmStatus {
    Success,          // Verified insight
    ValidationError,  // Completion failed schema verification
    ApiError,         // Transport, HTTP, timeout or cancellation
    Error             // Client threw
};

[[nodiscard]] std::string_view llm_status_name(LlmStatus status) noexcept;

/// Token kind label for usage counters
enum class TokenType {
    Prompt,
    Completion
};

[[nodiscard]] std::string_view token_type_name(TokenType type) noexcept;

/// Upper bounds (seconds) of the latency histogram buckets; +Inf is implicit
inline constexpr std::array<double, 11> kLatencyBuckets{
    0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0
};

/// Cumulative latency histogram
struct HistogramSnapshot {
    std::uint64_t count = 0;
    double sum = 0.0;                                      // Seconds
    std::array<std::uint64_t, kLatencyBuckets.size()> buckets{};  // Cumulative, <= bound

    void observe(double seconds) noexcept;
};

/// In-process counters, gauges and histograms for index computations and
/// reasoning calls. Thread-safe; exported as JSON or Prometheus text
class Metrics {
public:
    using Labels = std::pair<std::string, std::string>;

    // Index computations, labelled (index_name, method)
    void record_index_calculation(const std::string& index_name, const std::string& method,
                                  std::chrono::nanoseconds duration);
    void record_calculation_failure(const std::string& index_name);
    void set_index_value(const std::string& index_name, double value);
    void set_index_delta_24h(const std::string& index_name, double percent);

    // Reasoning service, labelled by model
    void record_llm_request(const std::string& model, LlmStatus status,
                            std::chrono::nanoseconds latency);
    void add_llm_tokens(const std::string& model, TokenType type, std::uint64_t count);

    [[nodiscard]] std::uint64_t index_calculations(const std::string& index_name,
                                                   const std::string& method) const;
    [[nodiscard]] std::uint64_t calculation_failures(const std::string& index_name) const;
    [[nodiscard]] HistogramSnapshot calculation_duration(const std::string& index_name,
                                                         const std::string& method) const;
    [[nodiscard]] std::uint64_t llm_requests(const std::string& model, LlmStatus status) const;
    [[nodiscard]] HistogramSnapshot llm_latency(const std::string& model) const;
    [[nodiscard]] std::uint64_t llm_tokens(const std::string& model, TokenType type) const;

    /// Calculations of any index, successful or not
    [[nodiscard]] std::uint64_t total_calculations() const noexcept {
        return total_calculations_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] nlohmann::json to_json() const;

    /// Prometheus text exposition format
    [[nodiscard]] std::string to_prometheus() const;

private:
    mutable std::mutex mtx_;

    std::map<Labels, std::uint64_t> index_calculations_;
    std::map<Labels, HistogramSnapshot> calculation_duration_;
    std::map<std::string, std::uint64_t> calculation_failures_;
    std::map<std::string, double> index_value_;
    std::map<std::string, double> index_delta_24h_;

    std::map<Labels, std::uint64_t> llm_requests_;       // (model, status)
    std::map<std::string, HistogramSnapshot> llm_latency_;
    std::map<Labels, std::uint64_t> llm_tokens_;         // (model, type)

    std::atomic<std::uint64_t> total_calculations_{0};
};

}  // namespace sentindex::telemetry
