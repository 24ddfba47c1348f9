#pragma once

#include "core/status.hpp"
#include "core/types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sentindex {

/// Default tolerance on |sum(weights) - 1|
constexpr double kDefaultWeightTolerance = 1e-6;

/// Name of the index that is always registered
constexpr const char* kDefaultIndexName = "gold_silver_oil_crypto";

/// Named index definition, read-only during a computation
struct IndexConfig {
    std::string name;
    double base_level = 1000.0;
    std::string base_date;          // ISO date, e.g. "2025-01-01"
    WeightMap weights;
    PriceSet base_prices;

    /// Parse the configuration shape {name, base_level, base_date, weights, base_prices}
    /// Symbols are canonicalized; other invariants are checked by validate_index_config
    [[nodiscard]] static Result<IndexConfig, std::string> from_json(const nlohmann::json& j);

    [[nodiscard]] nlohmann::json to_json() const;
};

/// Built-in Gold-Silver-Oil-Crypto index (base 1000 on 2025-01-01)
[[nodiscard]] IndexConfig default_index_config();

/// Check the config invariants: matching key sets, weights summing to 1,
/// positive base prices and base level
/// @return nullopt when valid
[[nodiscard]] std::optional<ComputationError> validate_index_config(
    const IndexConfig& config,
    double weight_tolerance = kDefaultWeightTolerance
);

/// Rewrite weights and base_prices keys to canonical symbols (trimmed, upper-case)
/// Fails with invalid_config when two keys collide or a key is blank
[[nodiscard]] std::optional<ComputationError> canonicalize_symbols(IndexConfig& config);

/// Named index configurations
/// Populated at startup, then only read
class IndexRegistry {
public:
    explicit IndexRegistry(double weight_tolerance = kDefaultWeightTolerance);

    /// Canonicalize symbols, validate and register
    /// Replaces an existing entry with the same name
    [[nodiscard]] Result<std::string, ComputationError> add(IndexConfig config);

    /// Look up a configuration by name
    [[nodiscard]] Result<IndexConfig, ComputationError> find(const std::string& name) const;

    [[nodiscard]] bool contains(const std::string& name) const;

    /// Registered names, sorted
    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] std::size_t size() const noexcept { return configs_.size(); }

private:
    double weight_tolerance_;
    std::unordered_map<std::string, IndexConfig> configs_;
};

}  // namespace sentindex
