#pragma once

#include "core/status.hpp"
#include "core/types.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <string_view>

namespace sentindex {

/// Prices as supplied by a caller, before validation
using RawPrices = std::map<std::string, double>;

/// Validates raw symbol -> price mappings into a PriceSet
/// Config-agnostic: reconciling symbols against an index is the composer's job
class PriceNormalizer {
public:
    /// Validate every price
    /// Fails with non_positive_price on any value <= 0, NaN or infinite
    [[nodiscard]] static Result<PriceSet, ValidationError> normalize(const RawPrices& raw);

    /// Validate and drop symbols outside known_symbols
    [[nodiscard]] static Result<PriceSet, ValidationError> normalize(
        const RawPrices& raw,
        const std::set<Symbol>& known_symbols
    );

    /// Validate the wire shape {"GOLD": 1900.12, ...}
    [[nodiscard]] static Result<PriceSet, ValidationError> normalize_json(const nlohmann::json& prices);

    /// Parse and validate a JSON text
    [[nodiscard]] static Result<PriceSet, ValidationError> normalize_text(std::string_view text);

    /// Canonical symbol form: trimmed, upper-case
    [[nodiscard]] static Symbol canonical_symbol(std::string_view symbol);
};

}  // namespace sentindex
