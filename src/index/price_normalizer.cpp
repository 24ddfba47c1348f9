#include "index/price_normalizer.hpp"
#include <cctype>
#include <cmath>

namespace sentindex {

using json = nlohmann::json;

namespace {

ValidationError make_error(ValidationError::Reason reason, std::string symbol, std::string detail) {
    return ValidationError{reason, std::move(symbol), std::move(detail)};
}

Result<PriceSet, ValidationError> normalize_impl(
    const RawPrices& raw,
    const std::set<Symbol>* known_symbols
) {
    PriceSet prices;

    for (const auto& [raw_symbol, price] : raw) {
        Symbol symbol = PriceNormalizer::canonical_symbol(raw_symbol);
        if (symbol.empty()) {
            return Result<PriceSet, ValidationError>::Err(make_error(
                ValidationError::Reason::EmptySymbol, raw_symbol, "symbol is empty"));
        }

        // Reject before filtering so a bad value is never silently dropped
        if (!std::isfinite(price) || price <= 0.0) {
            return Result<PriceSet, ValidationError>::Err(make_error(
                ValidationError::Reason::NonPositivePrice, symbol,
                "price must be a positive finite number"));
        }

        if (known_symbols != nullptr && known_symbols->count(symbol) == 0) {
            continue;
        }

        if (!prices.emplace(symbol, price).second) {
            return Result<PriceSet, ValidationError>::Err(make_error(
                ValidationError::Reason::MalformedPrices, symbol,
                "symbol supplied more than once"));
        }
    }

    return Result<PriceSet, ValidationError>::Ok(std::move(prices));
}

}  // namespace

Result<PriceSet, ValidationError> PriceNormalizer::normalize(const RawPrices& raw) {
    return normalize_impl(raw, nullptr);
}

Result<PriceSet, ValidationError> PriceNormalizer::normalize(
    const RawPrices& raw,
    const std::set<Symbol>& known_symbols
) {
    return normalize_impl(raw, &known_symbols);
}

Result<PriceSet, ValidationError> PriceNormalizer::normalize_json(const json& prices) {
    if (!prices.is_object()) {
        return Result<PriceSet, ValidationError>::Err(make_error(
            ValidationError::Reason::MalformedPrices, "", "prices must be a JSON object"));
    }

    RawPrices raw;
    for (const auto& [symbol, value] : prices.items()) {
        if (!value.is_number()) {
            return Result<PriceSet, ValidationError>::Err(make_error(
                ValidationError::Reason::NonNumericPrice, canonical_symbol(symbol),
                "price is not a number"));
        }
        raw.emplace(symbol, value.get<double>());
    }

    return normalize(raw);
}

Result<PriceSet, ValidationError> PriceNormalizer::normalize_text(std::string_view text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception& e) {
        return Result<PriceSet, ValidationError>::Err(make_error(
            ValidationError::Reason::MalformedPrices, "",
            std::string("JSON parse error: ") + e.what()));
    }
    return normalize_json(j);
}

Symbol PriceNormalizer::canonical_symbol(std::string_view symbol) {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };

    while (!symbol.empty() && is_space(symbol.front())) {
        symbol.remove_prefix(1);
    }
    while (!symbol.empty() && is_space(symbol.back())) {
        symbol.remove_suffix(1);
    }

    Symbol out(symbol);
    for (char& c : out) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return out;
}

}  // namespace sentindex
