#pragma once

#include "core/status.hpp"
#include "core/types.hpp"
#include "index/index_config.hpp"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace sentindex {

/// Immutable configuration for sentindex
struct Config {
    /// External reasoning service (OpenAI-style chat completions over HTTPS)
    struct Reasoning {
        std::string host = "api.sentient.ai";
        std::string port = "443";
        std::string path = "/v1/chat/completions";
        std::string model = "dobby";
        std::string api_key;              // Empty disables the service (fallback insights)
        std::string ca_file;              // Optional PEM bundle
        int max_tokens = 1000;
        double temperature = 0.1;
        std::chrono::milliseconds timeout{30000};
        std::size_t max_summary_length = 200;

        [[nodiscard]] bool enabled() const noexcept {
            return !api_key.empty() && !host.empty();
        }
    };

    /// Index computation defaults
    struct Compute {
        double min_coverage = 0.5;
        double weight_tolerance = 1e-6;
        Method default_method = Method::LevelNormalized;
    };

    struct Logging {
        std::string level = "info";
    };

    Reasoning reasoning;
    Compute compute;
    Logging logging;

    /// Index configurations in addition to the built-in default
    std::vector<IndexConfig> indices;

    /// Create default configuration
    [[nodiscard]] static Config defaults() {
        return Config{};
    }

    /// Load configuration from JSON file
    /// Falls back to defaults for any missing fields
    /// @param path Path to the JSON configuration file
    /// @return Config on success, error message on failure
    [[nodiscard]] static Result<Config, std::string> load_from_file(const std::string& path);

    /// Load configuration with optional file path and environment variable overrides
    /// Priority (highest to lowest): environment variables > config file > defaults
    /// @param config_path Optional path to JSON config file
    /// @return Loaded configuration
    [[nodiscard]] static Config load(const std::optional<std::string>& config_path = std::nullopt);
};

}  // namespace sentindex
