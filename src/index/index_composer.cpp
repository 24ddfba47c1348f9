#include "index/index_composer.hpp"
#include <cmath>
#include <sstream>
#include <spdlog/spdlog.h>

namespace sentindex {

namespace {

bool usable_price(const PriceSet& prices, const Symbol& symbol, Price& out) {
    auto it = prices.find(symbol);
    if (it == prices.end() || !std::isfinite(it->second) || it->second <= 0.0) {
        return false;
    }
    out = it->second;
    return true;
}

ComputationError error(ComputationError::Reason reason, std::string detail) {
    return ComputationError{reason, std::move(detail), std::nullopt};
}

}  // namespace

IndexComposer::IndexComposer(const Clock& clock)
    : recorder_(clock)
{}

Result<IndexResult, ComputationError> IndexComposer::compute(
    const IndexConfig& config,
    const PriceSet& prices,
    const ComputeOptions& options
) const {
    auto core = compose(config, prices, options);
    if (core.is_err()) {
        return Result<IndexResult, ComputationError>::Err(core.error());
    }
    return Result<IndexResult, ComputationError>::Ok(
        recorder_.attach(std::move(core).value(), config, prices)
    );
}

Result<CompositionCore, ComputationError> IndexComposer::compose(
    const IndexConfig& config,
    const PriceSet& prices,
    const ComputeOptions& options
) {
    if (auto invalid = validate_index_config(config, options.weight_tolerance)) {
        return Result<CompositionCore, ComputationError>::Err(std::move(*invalid));
    }

    const bool return_based = options.method == Method::ReturnBased;
    if (return_based) {
        if (!options.prior) {
            return Result<CompositionCore, ComputationError>::Err(error(
                ComputationError::Reason::NoPriorPeriod,
                "return-based method requires the previous period for " + config.name));
        }
        if (!std::isfinite(options.prior->value) || options.prior->value <= 0.0) {
            return Result<CompositionCore, ComputationError>::Err(error(
                ComputationError::Reason::NoPriorPeriod,
                "previous index value must be positive"));
        }
    }

    CompositionCore core;
    core.method = options.method;

    // Full precision throughout, rounding happens once at the end
    double total_weight = 0.0;
    double used_weight = 0.0;
    double score = 0.0;            // Level-normalized accumulator
    double weighted_return = 0.0;  // Return-based accumulator

    for (const auto& [symbol, weight] : config.weights) {
        total_weight += weight;

        Price now = 0.0;
        Price prev = 0.0;
        bool available = usable_price(prices, symbol, now);
        if (available && return_based) {
            available = usable_price(options.prior->prices, symbol, prev);
        }

        if (!available) {
            core.symbols_missing.push_back(symbol);
            continue;
        }

        used_weight += weight;
        core.symbols_used.push_back(symbol);

        if (return_based) {
            double period_return = (now - prev) / prev;
            weighted_return += weight * period_return;
        } else {
            double normalized = now / config.base_prices.at(symbol);
            score += normalized * weight;
        }
    }

    core.coverage_ratio = used_weight / total_weight;

    if (!core.symbols_missing.empty()) {
        spdlog::warn("{}: {} configured symbol(s) without price, coverage {:.4f}",
                     config.name, core.symbols_missing.size(), core.coverage_ratio);
    }

    if (core.coverage_ratio < options.min_coverage) {
        std::ostringstream oss;
        oss << "coverage " << core.coverage_ratio << " below minimum " << options.min_coverage;
        ComputationError err = error(ComputationError::Reason::InsufficientCoverage, oss.str());
        err.coverage_ratio = core.coverage_ratio;
        return Result<CompositionCore, ComputationError>::Err(std::move(err));
    }

    double raw_value = return_based
        ? options.prior->value * (1.0 + weighted_return)
        : score * config.base_level;
    core.value = convert::round_half_even(raw_value, kIndexValueDecimals);

    if (return_based) {
        core.prior = options.prior;
        spdlog::debug("{}: return-based index {:.2f} (weighted return {:.6f})",
                      config.name, core.value, weighted_return);
    } else {
        spdlog::debug("{}: level-normalized index {:.2f} (score {:.6f})",
                      config.name, core.value, score);
    }

    return Result<CompositionCore, ComputationError>::Ok(std::move(core));
}

std::optional<double> IndexComposer::percent_change(double current, double previous) {
    if (!std::isfinite(previous) || previous <= 0.0 || !std::isfinite(current)) {
        return std::nullopt;
    }
    return convert::round_half_even((current - previous) / previous * 100.0, 2);
}

}  // namespace sentindex
