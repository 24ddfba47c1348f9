#include "core/config.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>

namespace sentindex {

using json = nlohmann::json;

namespace {

/// Get environment variable value, or nullopt if not set
std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

/// Get environment variable as integer (with optional range validation)
std::optional<int> get_env_int(const char* name, int min_val = std::numeric_limits<int>::min(),
                               int max_val = std::numeric_limits<int>::max()) {
    auto value = get_env(name);
    if (!value) {
        return std::nullopt;
    }
    try {
        int result = std::stoi(*value);
        if (result < min_val || result > max_val) {
            std::cerr << "Warning: " << name << " value " << result
                      << " out of range [" << min_val << ", " << max_val
                      << "], ignoring" << std::endl;
            return std::nullopt;
        }
        return result;
    } catch (const std::exception&) {
        std::cerr << "Warning: Invalid integer value for " << name
                  << ": " << *value << ", ignoring" << std::endl;
        return std::nullopt;
    }
}

/// Get environment variable as double within [min_val, max_val]
std::optional<double> get_env_double(const char* name, double min_val, double max_val) {
    auto value = get_env(name);
    if (!value) {
        return std::nullopt;
    }
    try {
        double result = std::stod(*value);
        if (!(result >= min_val && result <= max_val)) {
            std::cerr << "Warning: " << name << " value " << result
                      << " out of range [" << min_val << ", " << max_val
                      << "], ignoring" << std::endl;
            return std::nullopt;
        }
        return result;
    } catch (const std::exception&) {
        std::cerr << "Warning: Invalid numeric value for " << name
                  << ": " << *value << ", ignoring" << std::endl;
        return std::nullopt;
    }
}

/// Apply environment variable overrides to config
void apply_env_overrides(Config& config) {
    // Reasoning service overrides
    if (auto v = get_env("SENTINDEX_REASONING_HOST")) {
        config.reasoning.host = *v;
    }
    if (auto v = get_env("SENTINDEX_REASONING_PORT")) {
        config.reasoning.port = *v;
    }
    if (auto v = get_env("SENTINDEX_REASONING_PATH")) {
        config.reasoning.path = *v;
    }
    if (auto v = get_env("SENTINDEX_REASONING_MODEL")) {
        config.reasoning.model = *v;
    }
    if (auto v = get_env("SENTIENT_API_KEY")) {
        config.reasoning.api_key = *v;
    }
    // Timeout: 100ms to 5 minutes
    if (auto v = get_env_int("SENTINDEX_REASONING_TIMEOUT_MS", 100, 300000)) {
        config.reasoning.timeout = std::chrono::milliseconds(*v);
    }

    // Compute overrides
    if (auto v = get_env_double("SENTINDEX_MIN_COVERAGE", 0.0, 1.0)) {
        config.compute.min_coverage = *v;
    }

    if (auto v = get_env("SENTINDEX_LOG_LEVEL")) {
        config.logging.level = *v;
    }
}

}  // namespace

Result<Config, std::string> Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<Config, std::string>::Err("Failed to open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string content = buffer.str();

    json j;
    try {
        j = json::parse(content);
    } catch (const json::exception& e) {
        return Result<Config, std::string>::Err("Failed to parse JSON: " + std::string(e.what()));
    }

    Config config = Config::defaults();

    try {
        // Reasoning section
        if (j.contains("reasoning")) {
            const auto& rs = j["reasoning"];
            if (rs.contains("host")) {
                config.reasoning.host = rs["host"].get<std::string>();
            }
            if (rs.contains("port")) {
                config.reasoning.port = rs["port"].get<std::string>();
            }
            if (rs.contains("path")) {
                config.reasoning.path = rs["path"].get<std::string>();
            }
            if (rs.contains("model")) {
                config.reasoning.model = rs["model"].get<std::string>();
            }
            if (rs.contains("api_key")) {
                config.reasoning.api_key = rs["api_key"].get<std::string>();
            }
            if (rs.contains("ca_file")) {
                config.reasoning.ca_file = rs["ca_file"].get<std::string>();
            }
            if (rs.contains("max_tokens")) {
                config.reasoning.max_tokens = rs["max_tokens"].get<int>();
            }
            if (rs.contains("temperature")) {
                config.reasoning.temperature = rs["temperature"].get<double>();
            }
            if (rs.contains("timeout_ms")) {
                config.reasoning.timeout = std::chrono::milliseconds(rs["timeout_ms"].get<int>());
            }
            if (rs.contains("max_summary_length")) {
                config.reasoning.max_summary_length = rs["max_summary_length"].get<std::size_t>();
            }
        }

        // Compute section
        if (j.contains("compute")) {
            const auto& cmp = j["compute"];
            if (cmp.contains("min_coverage")) {
                auto value = cmp["min_coverage"].get<double>();
                if (value >= 0.0 && value <= 1.0) {
                    config.compute.min_coverage = value;
                } else {
                    std::cerr << "Warning: compute.min_coverage value " << value
                              << " out of range [0, 1], ignoring" << std::endl;
                }
            }
            if (cmp.contains("weight_tolerance")) {
                auto value = cmp["weight_tolerance"].get<double>();
                if (value > 0.0 && value < 1.0) {
                    config.compute.weight_tolerance = value;
                } else {
                    std::cerr << "Warning: compute.weight_tolerance value " << value
                              << " out of range (0, 1), ignoring" << std::endl;
                }
            }
            if (cmp.contains("default_method")) {
                auto name = cmp["default_method"].get<std::string>();
                auto method = parse_method(name);
                if (!method) {
                    return Result<Config, std::string>::Err("Unsupported default_method: " + name);
                }
                config.compute.default_method = *method;
            }
        }

        // Logging section
        if (j.contains("logging")) {
            const auto& log = j["logging"];
            if (log.contains("level")) {
                config.logging.level = log["level"].get<std::string>();
            }
        }

        // Index definitions
        if (j.contains("indices")) {
            const auto& arr = j["indices"];
            if (!arr.is_array()) {
                return Result<Config, std::string>::Err("indices must be an array");
            }
            for (const auto& entry : arr) {
                auto index = IndexConfig::from_json(entry);
                if (index.is_err()) {
                    return Result<Config, std::string>::Err("Invalid index config: " + index.error());
                }
                config.indices.push_back(std::move(index).value());
            }
        }
    } catch (const json::exception& e) {
        return Result<Config, std::string>::Err("Error reading config field: " + std::string(e.what()));
    }

    return Result<Config, std::string>::Ok(std::move(config));
}

Config Config::load(const std::optional<std::string>& config_path) {
    Config config = Config::defaults();

    if (config_path) {
        auto result = load_from_file(*config_path);
        if (result.is_ok()) {
            config = result.value();
        } else {
            std::cerr << "Warning: Failed to load config from '" << *config_path
                      << "': " << result.error()
                      << " (using defaults with env overrides)" << std::endl;
        }
    }

    // Environment variables have the highest priority
    apply_env_overrides(config);

    return config;
}

}  // namespace sentindex
