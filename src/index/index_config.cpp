#include "index/index_config.hpp"
#include "index/price_normalizer.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <type_traits>

namespace sentindex {

using json = nlohmann::json;

namespace {

/// Read an object of symbol -> number into an ordered map keyed by canonical symbol
/// Two keys that canonicalize to the same symbol are rejected
template <typename Map>
Result<Map, std::string> read_symbol_map(const json& j, const char* field) {
    if (!j.contains(field) || !j[field].is_object()) {
        return Result<Map, std::string>::Err(std::string("Missing or non-object field: ") + field);
    }

    Map out;
    for (const auto& [symbol, value] : j[field].items()) {
        if (!value.is_number()) {
            return Result<Map, std::string>::Err(
                std::string(field) + "." + symbol + " is not a number"
            );
        }
        Symbol canonical = PriceNormalizer::canonical_symbol(symbol);
        if (canonical.empty()) {
            return Result<Map, std::string>::Err(std::string(field) + " has an empty symbol");
        }
        if (!out.emplace(canonical, value.template get<double>()).second) {
            return Result<Map, std::string>::Err(
                std::string(field) + "." + canonical + " is defined more than once"
            );
        }
    }
    return Result<Map, std::string>::Ok(std::move(out));
}

ComputationError invalid(std::string detail) {
    return ComputationError{ComputationError::Reason::InvalidConfig, std::move(detail), std::nullopt};
}

}  // namespace

Result<IndexConfig, std::string> IndexConfig::from_json(const json& j) {
    if (!j.is_object()) {
        return Result<IndexConfig, std::string>::Err("Index config must be a JSON object");
    }

    try {
        if (!j.contains("name") || !j["name"].is_string()) {
            return Result<IndexConfig, std::string>::Err("Missing or non-string field: name");
        }

        IndexConfig config;
        config.name = j["name"].get<std::string>();
        if (j.contains("base_level")) {
            config.base_level = j["base_level"].get<double>();
        }
        config.base_date = j.value("base_date", std::string{});

        auto weights = read_symbol_map<WeightMap>(j, "weights");
        if (weights.is_err()) {
            return Result<IndexConfig, std::string>::Err(weights.error());
        }
        config.weights = std::move(weights).value();

        auto base_prices = read_symbol_map<PriceSet>(j, "base_prices");
        if (base_prices.is_err()) {
            return Result<IndexConfig, std::string>::Err(base_prices.error());
        }
        config.base_prices = std::move(base_prices).value();

        return Result<IndexConfig, std::string>::Ok(std::move(config));

    } catch (const json::exception& e) {
        return Result<IndexConfig, std::string>::Err(
            std::string("Error reading index config: ") + e.what()
        );
    }
}

json IndexConfig::to_json() const {
    return json{
        {"name", name},
        {"base_level", base_level},
        {"base_date", base_date},
        {"weights", weights},
        {"base_prices", base_prices}
    };
}

IndexConfig default_index_config() {
    IndexConfig config;
    config.name = kDefaultIndexName;
    config.base_level = 1000.0;
    config.base_date = "2025-01-01";
    config.weights = {
        {"GOLD", 0.25},
        {"SILVER", 0.25},
        {"OIL", 0.20},
        {"BTC", 0.15},
        {"ETH", 0.15}
    };
    config.base_prices = {
        {"GOLD", 1800.0},    // USD/oz
        {"SILVER", 23.0},    // USD/oz
        {"OIL", 75.0},       // USD/bbl
        {"BTC", 20000.0},
        {"ETH", 1000.0}
    };
    return config;
}

std::optional<ComputationError> validate_index_config(
    const IndexConfig& config,
    double weight_tolerance
) {
    if (config.name.empty()) {
        return invalid("index name is empty");
    }
    if (!std::isfinite(config.base_level) || config.base_level <= 0.0) {
        return invalid("base_level must be positive");
    }
    if (config.weights.empty()) {
        return ComputationError{ComputationError::Reason::ZeroSumWeights, "no weights configured", std::nullopt};
    }

    // Both maps are ordered, so equal key sets compare element-wise
    bool same_keys = config.weights.size() == config.base_prices.size() &&
        std::equal(config.weights.begin(), config.weights.end(), config.base_prices.begin(),
                   [](const auto& w, const auto& b) { return w.first == b.first; });
    if (!same_keys) {
        return invalid("weights and base_prices must have the same symbols");
    }

    double weight_sum = 0.0;
    for (const auto& [symbol, weight] : config.weights) {
        if (!std::isfinite(weight)) {
            return invalid("weight for " + symbol + " is not finite");
        }
        weight_sum += weight;
    }
    if (weight_sum == 0.0) {
        return ComputationError{ComputationError::Reason::ZeroSumWeights, "weights sum to zero", std::nullopt};
    }
    // A zero weight would let a missing symbol leave coverage at 1.0
    for (const auto& [symbol, weight] : config.weights) {
        if (weight <= 0.0) {
            return invalid("weight for " + symbol + " must be positive");
        }
    }
    if (std::abs(weight_sum - 1.0) > weight_tolerance) {
        std::ostringstream oss;
        oss << "weights must sum to 1.0, got " << weight_sum;
        return invalid(oss.str());
    }

    for (const auto& [symbol, base_price] : config.base_prices) {
        if (!std::isfinite(base_price) || base_price <= 0.0) {
            return invalid("base price for " + symbol + " must be positive");
        }
    }

    return std::nullopt;
}

std::optional<ComputationError> canonicalize_symbols(IndexConfig& config) {
    auto rekey = [](auto& map, const char* field) -> std::optional<ComputationError> {
        std::remove_reference_t<decltype(map)> out;
        for (auto& [symbol, value] : map) {
            Symbol canonical = PriceNormalizer::canonical_symbol(symbol);
            if (canonical.empty()) {
                return invalid(std::string(field) + " has an empty symbol");
            }
            if (!out.emplace(canonical, value).second) {
                return invalid(std::string(field) + " symbol " + canonical + " is defined more than once");
            }
        }
        map = std::move(out);
        return std::nullopt;
    };

    if (auto error = rekey(config.weights, "weights")) {
        return error;
    }
    return rekey(config.base_prices, "base_prices");
}

IndexRegistry::IndexRegistry(double weight_tolerance)
    : weight_tolerance_(weight_tolerance)
{}

Result<std::string, ComputationError> IndexRegistry::add(IndexConfig config) {
    auto error = canonicalize_symbols(config);
    if (!error) {
        error = validate_index_config(config, weight_tolerance_);
    }
    if (error) {
        if (!config.name.empty()) {
            error->detail = config.name + ": " + error->detail;
        }
        return Result<std::string, ComputationError>::Err(std::move(*error));
    }

    std::string name = config.name;
    configs_.insert_or_assign(name, std::move(config));
    return Result<std::string, ComputationError>::Ok(std::move(name));
}

Result<IndexConfig, ComputationError> IndexRegistry::find(const std::string& name) const {
    auto it = configs_.find(name);
    if (it == configs_.end()) {
        return Result<IndexConfig, ComputationError>::Err(ComputationError{
            ComputationError::Reason::MissingConfig,
            "no index configuration named '" + name + "'",
            std::nullopt
        });
    }
    return Result<IndexConfig, ComputationError>::Ok(it->second);
}

bool IndexRegistry::contains(const std::string& name) const {
    return configs_.find(name) != configs_.end();
}

std::vector<std::string> IndexRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(configs_.size());
    for (const auto& [name, config] : configs_) {
        out.push_back(name);
    }
    std::sort(out.begin(), out.end());
    return out;
}

}  // namespace sentindex
