#include "output/json_formatter.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace sentindex::output {

using json = nlohmann::json;

json JsonFormatter::format_compute(const IndexResult& result) {
    return json{
        {"index_name", result.index_name},
        {"index_value", result.value},
        {"method", std::string(method_name(result.method))},
        {"timestamp", iso_timestamp(result.timestamp)},
        {"coverage_ratio", result.coverage_ratio}
    };
}

json JsonFormatter::format_error(const PipelineError& error) {
    json out{
        {"error_kind", std::string(error_kind(error))},
        {"detail", describe(error)}
    };

    std::visit([&out](const auto& e) {
        out["reason"] = std::string(reason_name(e.reason));
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, ValidationError>) {
            if (!e.symbol.empty()) {
                out["symbol"] = e.symbol;
            }
        } else {
            if (e.coverage_ratio) {
                out["coverage_ratio"] = *e.coverage_ratio;
            }
        }
    }, error);

    return out;
}

json JsonFormatter::format_insights(const std::string& index_name, const InsightResult& insight) {
    return json{
        {"index_name", index_name},
        {"insights", {
            {"sentiment", std::string(sentiment_name(insight.sentiment))},
            {"summary", insight.summary},
            {"notable_events", insight.notable_events},
            {"risk_factors", insight.risk_factors},
            {"source", std::string(source_name(insight.source))}
        }},
        {"timestamp", iso_timestamp(insight.generated_at)}
    };
}

json JsonFormatter::format_provenance(const ProvenanceRecord& record) {
    json payload{
        {"method", std::string(method_name(record.method))},
        {"computed_at", iso_timestamp(record.computed_at)},
        {"symbols_used", record.symbols_used},
        {"symbols_missing", record.symbols_missing},
        {"prices", record.prices},
        {"config", record.config.to_json()}
    };

    if (record.prior) {
        payload["prior"] = {
            {"value", record.prior->value},
            {"prices", record.prior->prices}
        };
    }
    return payload;
}

json JsonFormatter::format_row(const IndexResult& result) {
    return json{
        {"time", iso_timestamp(result.timestamp)},
        {"index_name", result.index_name},
        {"index_value", result.value},
        {"method", std::string(method_name(result.method))},
        {"payload", format_provenance(result.provenance)}
    };
}

std::string JsonFormatter::iso_timestamp(WallTime time) {
    auto time_t_value = std::chrono::system_clock::to_time_t(time);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()
    ) % 1000;

    std::tm utc{};
    gmtime_r(&time_t_value, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

}  // namespace sentindex::output
