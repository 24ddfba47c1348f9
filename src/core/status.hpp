#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace sentindex {

/// Result monad for error handling without exceptions
/// Carries either a value or a typed error
template <typename T, typename E = std::string>
class Result {
public:
    /// Create a successful result
    [[nodiscard]] static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    /// Create an error result
    [[nodiscard]] static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    /// Index-based checks so that T == E still works
    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /// Get the value (throws if error)
    [[nodiscard]] const T& value() const& {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result");
        }
        return std::get<0>(data_);
    }

    [[nodiscard]] T value() && {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result");
        }
        return std::get<0>(std::move(data_));
    }

    /// Get the error (throws if ok)
    [[nodiscard]] const E& error() const& {
        if (is_ok()) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (is_ok()) {
            return std::get<0>(data_);
        }
        return default_value;
    }

    /// Transform the value if Ok, preserve error if Err
    template <typename F>
    [[nodiscard]] auto map(F&& func) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>::Ok(func(std::get<0>(data_)));
        }
        return Result<U, E>::Err(std::get<1>(data_));
    }

    /// Transform the error if Err, preserve value if Ok
    /// Used to lift a stage error into the pipeline error type
    template <typename F>
    [[nodiscard]] auto map_error(F&& func) && -> Result<T, std::invoke_result_t<F, const E&>> {
        using NewE = std::invoke_result_t<F, const E&>;
        if (is_err()) {
            return Result<T, NewE>::Err(func(std::get<1>(data_)));
        }
        return Result<T, NewE>::Ok(std::get<0>(std::move(data_)));
    }

    /// Chain operations that may fail
    template <typename F>
    [[nodiscard]] auto and_then(F&& func) const& -> std::invoke_result_t<F, const T&> {
        using ResultType = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return func(std::get<0>(data_));
        }
        return ResultType::Err(std::get<1>(data_));
    }

private:
    template <size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> tag, Args&&... args)
        : data_(tag, std::forward<Args>(args)...) {}

    std::variant<T, E> data_;
};

// ============================================================================
// Pipeline error types
// ============================================================================

/// Input prices rejected before computation
struct ValidationError {
    enum class Reason {
        NonPositivePrice,
        NonNumericPrice,
        EmptySymbol,
        MalformedPrices
    };

    Reason reason;
    std::string symbol;   // Offending symbol, empty when not symbol-specific
    std::string detail;
};

/// Computation rejected, no partial result is produced
struct ComputationError {
    enum class Reason {
        MissingConfig,
        InvalidConfig,
        UnsupportedMethod,
        ZeroSumWeights,
        InsufficientCoverage,
        NoPriorPeriod
    };

    Reason reason;
    std::string detail;
    std::optional<double> coverage_ratio;  // Set for InsufficientCoverage
};

/// Either stage error, as surfaced by the service layer
using PipelineError = std::variant<ValidationError, ComputationError>;

/// Wire names for error reasons (e.g. "non_positive_price")
[[nodiscard]] inline std::string_view reason_name(ValidationError::Reason reason) noexcept {
    switch (reason) {
        case ValidationError::Reason::NonPositivePrice: return "non_positive_price";
        case ValidationError::Reason::NonNumericPrice:  return "non_numeric_price";
        case ValidationError::Reason::EmptySymbol:      return "empty_symbol";
        case ValidationError::Reason::MalformedPrices:  return "malformed_prices";
    }
    return "unknown";
}

[[nodiscard]] inline std::string_view reason_name(ComputationError::Reason reason) noexcept {
    switch (reason) {
        case ComputationError::Reason::MissingConfig:        return "missing_config";
        case ComputationError::Reason::InvalidConfig:        return "invalid_config";
        case ComputationError::Reason::UnsupportedMethod:    return "unsupported_method";
        case ComputationError::Reason::ZeroSumWeights:       return "zero_sum_weights";
        case ComputationError::Reason::InsufficientCoverage: return "insufficient_coverage";
        case ComputationError::Reason::NoPriorPeriod:        return "no_prior_period";
    }
    return "unknown";
}

/// Error kind for the wire payload {error_kind, detail}
[[nodiscard]] inline std::string_view error_kind(const PipelineError& error) noexcept {
    if (std::holds_alternative<ValidationError>(error)) {
        return "validation_error";
    }
    return "computation_error";
}

/// Human-readable one-line description of a pipeline error
[[nodiscard]] inline std::string describe(const PipelineError& error) {
    return std::visit([](const auto& e) {
        std::string text(reason_name(e.reason));
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, ValidationError>) {
            if (!e.symbol.empty()) {
                text += " (" + e.symbol + ")";
            }
        }
        if (!e.detail.empty()) {
            text += ": " + e.detail;
        }
        return text;
    }, error);
}

}  // namespace sentindex
