#include "telemetry/metrics.hpp"
#include <sstream>

namespace sentindex::telemetry {

using json = nlohmann::json;

namespace {

double to_seconds(std::chrono::nanoseconds d) {
    return std::chrono::duration<double>(d).count();
}

template <typename Map, typename Key>
auto lookup(const Map& map, const Key& key) -> typename Map::mapped_type {
    auto it = map.find(key);
    return it == map.end() ? typename Map::mapped_type{} : it->second;
}

json histogram_json(const HistogramSnapshot& h) {
    json buckets = json::object();
    for (std::size_t i = 0; i < kLatencyBuckets.size(); ++i) {
        std::ostringstream bound;
        bound << kLatencyBuckets[i];
        buckets[bound.str()] = h.buckets[i];
    }
    return json{{"count", h.count}, {"sum", h.sum}, {"buckets", buckets}};
}

void write_histogram(std::ostringstream& out, const char* name,
                     const std::string& labels, const HistogramSnapshot& h) {
    std::string sep = labels.empty() ? "" : ",";
    for (std::size_t i = 0; i < kLatencyBuckets.size(); ++i) {
        out << name << "_bucket{" << labels << sep << "le=\"" << kLatencyBuckets[i] << "\"} "
            << h.buckets[i] << "\n";
    }
    out << name << "_bucket{" << labels << sep << "le=\"+Inf\"} " << h.count << "\n";
    out << name << "_sum{" << labels << "} " << h.sum << "\n";
    out << name << "_count{" << labels << "} " << h.count << "\n";
}

}  // namespace

std::string_view llm_status_name(LlmStatus status) noexcept {
    switch (status) {
        case LlmStatus::Success:         return "success";
        case LlmStatus::ValidationError: return "validation_error";
        case LlmStatus::ApiError:        return "api_error";
        case LlmStatus::Error:           return "error";
    }
    return "error";
}

std::string_view token_type_name(TokenType type) noexcept {
    switch (type) {
        case TokenType::Prompt:     return "prompt";
        case TokenType::Completion: return "completion";
    }
    return "prompt";
}

void HistogramSnapshot::observe(double seconds) noexcept {
    ++count;
    sum += seconds;
    for (std::size_t i = 0; i < kLatencyBuckets.size(); ++i) {
        if (seconds <= kLatencyBuckets[i]) {
            ++buckets[i];
        }
    }
}

void Metrics::record_index_calculation(const std::string& index_name, const std::string& method,
                                       std::chrono::nanoseconds duration) {
    total_calculations_.fetch_add(1, std::memory_order_relaxed);
    std::lock_guard<std::mutex> lock(mtx_);
    Labels key{index_name, method};
    ++index_calculations_[key];
    calculation_duration_[key].observe(to_seconds(duration));
}

void Metrics::record_calculation_failure(const std::string& index_name) {
    total_calculations_.fetch_add(1, std::memory_order_relaxed);
    std::lock_guard<std::mutex> lock(mtx_);
    ++calculation_failures_[index_name];
}

void Metrics::set_index_value(const std::string& index_name, double value) {
    std::lock_guard<std::mutex> lock(mtx_);
    index_value_[index_name] = value;
}

void Metrics::set_index_delta_24h(const std::string& index_name, double percent) {
    std::lock_guard<std::mutex> lock(mtx_);
    index_delta_24h_[index_name] = percent;
}

void Metrics::record_llm_request(const std::string& model, LlmStatus status,
                                 std::chrono::nanoseconds latency) {
    std::lock_guard<std::mutex> lock(mtx_);
    ++llm_requests_[Labels{model, std::string(llm_status_name(status))}];
    llm_latency_[model].observe(to_seconds(latency));
}

void Metrics::add_llm_tokens(const std::string& model, TokenType type, std::uint64_t count) {
    std::lock_guard<std::mutex> lock(mtx_);
    llm_tokens_[Labels{model, std::string(token_type_name(type))}] += count;
}

std::uint64_t Metrics::index_calculations(const std::string& index_name,
                                          const std::string& method) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return lookup(index_calculations_, Labels{index_name, method});
}

std::uint64_t Metrics::calculation_failures(const std::string& index_name) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return lookup(calculation_failures_, index_name);
}

HistogramSnapshot Metrics::calculation_duration(const std::string& index_name,
                                                const std::string& method) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return lookup(calculation_duration_, Labels{index_name, method});
}

std::uint64_t Metrics::llm_requests(const std::string& model, LlmStatus status) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return lookup(llm_requests_, Labels{model, std::string(llm_status_name(status))});
}

HistogramSnapshot Metrics::llm_latency(const std::string& model) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return lookup(llm_latency_, model);
}

std::uint64_t Metrics::llm_tokens(const std::string& model, TokenType type) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return lookup(llm_tokens_, Labels{model, std::string(token_type_name(type))});
}

json Metrics::to_json() const {
    std::lock_guard<std::mutex> lock(mtx_);

    json calculations = json::array();
    for (const auto& [key, count] : index_calculations_) {
        calculations.push_back({
            {"index_name", key.first},
            {"method", key.second},
            {"count", count},
            {"duration_seconds", histogram_json(lookup(calculation_duration_, key))}
        });
    }

    json indices = json::object();
    for (const auto& [name, value] : index_value_) {
        indices[name]["value"] = value;
    }
    for (const auto& [name, delta] : index_delta_24h_) {
        indices[name]["delta_24h_percent"] = delta;
    }
    for (const auto& [name, failures] : calculation_failures_) {
        indices[name]["failures"] = failures;
    }

    json llm = json::object();
    for (const auto& [key, count] : llm_requests_) {
        llm[key.first]["requests"][key.second] = count;
    }
    for (const auto& [model, hist] : llm_latency_) {
        llm[model]["latency_seconds"] = histogram_json(hist);
    }
    for (const auto& [key, count] : llm_tokens_) {
        llm[key.first]["tokens"][key.second] = count;
    }

    return json{
        {"total_calculations", total_calculations_.load(std::memory_order_relaxed)},
        {"index_calculations", calculations},
        {"indices", indices},
        {"llm", llm}
    };
}

std::string Metrics::to_prometheus() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::ostringstream out;

    out << "# HELP sentindex_index_calculations_total Total number of index calculations\n"
        << "# TYPE sentindex_index_calculations_total counter\n";
    for (const auto& [key, count] : index_calculations_) {
        out << "sentindex_index_calculations_total{index_name=\"" << key.first
            << "\",method=\"" << key.second << "\"} " << count << "\n";
    }

    out << "# HELP sentindex_index_calculation_duration_seconds Time spent calculating indices\n"
        << "# TYPE sentindex_index_calculation_duration_seconds histogram\n";
    for (const auto& [key, hist] : calculation_duration_) {
        write_histogram(out, "sentindex_index_calculation_duration_seconds",
                        "index_name=\"" + key.first + "\",method=\"" + key.second + "\"", hist);
    }

    out << "# HELP sentindex_index_value Current index value\n"
        << "# TYPE sentindex_index_value gauge\n";
    for (const auto& [name, value] : index_value_) {
        out << "sentindex_index_value{index_name=\"" << name << "\"} " << value << "\n";
    }

    out << "# HELP sentindex_index_delta_24h_percent 24-hour index change percentage\n"
        << "# TYPE sentindex_index_delta_24h_percent gauge\n";
    for (const auto& [name, delta] : index_delta_24h_) {
        out << "sentindex_index_delta_24h_percent{index_name=\"" << name << "\"} " << delta << "\n";
    }

    out << "# HELP sentindex_llm_requests_total Total number of LLM requests\n"
        << "# TYPE sentindex_llm_requests_total counter\n";
    for (const auto& [key, count] : llm_requests_) {
        out << "sentindex_llm_requests_total{model=\"" << key.first
            << "\",status=\"" << key.second << "\"} " << count << "\n";
    }

    out << "# HELP sentindex_llm_latency_seconds LLM request latency\n"
        << "# TYPE sentindex_llm_latency_seconds histogram\n";
    for (const auto& [model, hist] : llm_latency_) {
        write_histogram(out, "sentindex_llm_latency_seconds", "model=\"" + model + "\"", hist);
    }

    out << "# HELP sentindex_llm_tokens_total Total LLM tokens used\n"
        << "# TYPE sentindex_llm_tokens_total counter\n";
    for (const auto& [key, count] : llm_tokens_) {
        out << "sentindex_llm_tokens_total{model=\"" << key.first
            << "\",type=\"" << key.second << "\"} " << count << "\n";
    }

    return out.str();
}

}  // namespace sentindex::telemetry
