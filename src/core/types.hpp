#pragma once

#include <chrono>
#include <cmath>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace sentindex {

// Asset symbol (e.g., GOLD, BTC), always upper-case after normalization
using Symbol = std::string;

// Price in quote currency (USD for every built-in asset)
using Price = double;

// Fraction of total index weight (0.0 to 1.0)
using Weight = double;

// Ordered mapping so iteration, prompts and provenance are deterministic
using PriceSet = std::map<Symbol, Price>;
using WeightMap = std::map<Symbol, Weight>;

// Wall clock time for stamping results
using WallTime = std::chrono::system_clock::time_point;

// Percentage (0.0 to 1.0)
using Percentage = double;

/// Index calculation method
enum class Method {
    LevelNormalized,
    ReturnBased
};

/// Wire name of a method ("level_normalized", "return_based")
[[nodiscard]] inline std::string_view method_name(Method method) noexcept {
    switch (method) {
        case Method::LevelNormalized: return "level_normalized";
        case Method::ReturnBased:     return "return_based";
    }
    return "unknown";
}

/// Parse a wire method name, nullopt if unsupported
[[nodiscard]] inline std::optional<Method> parse_method(std::string_view name) noexcept {
    if (name == "level_normalized") {
        return Method::LevelNormalized;
    }
    if (name == "return_based") {
        return Method::ReturnBased;
    }
    return std::nullopt;
}

namespace convert {

/// Round to a number of decimals using round-half-to-even
/// Relies on the default FE_TONEAREST rounding mode of std::nearbyint
[[nodiscard]] inline double round_half_even(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::nearbyint(value * scale) / scale;
}

}  // namespace convert

}  // namespace sentindex
