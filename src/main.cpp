#include "core/cancellation.hpp"
#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "engine/index_service.hpp"
#include "network/reasoning_http_client.hpp"
#include "network/ssl_context.hpp"
#include "output/json_formatter.hpp"
#include "storage/index_store.hpp"
#include "telemetry/metrics.hpp"
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <spdlog/spdlog.h>

namespace {

// Cancels an in-flight insight request on Ctrl-C
sentindex::CancellationToken g_cancel;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_cancel.cancel();
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>     Load configuration from JSON file\n"
              << "  -i, --index <name>      Index to compute (default: gold_silver_oil_crypto)\n"
              << "  -p, --prices <json>     Prices as JSON object, or @file to read them\n"
              << "  -m, --method <name>     level_normalized | return_based\n"
              << "      --min-coverage <x>  Minimum fraction of weight that must be priced\n"
              << "      --prior-value <x>   Previous index value for return_based\n"
              << "      --prior-prices <json>  Previous period prices, or @file\n"
              << "      --metrics           Print computation and reasoning metrics\n"
              << "      --insights          Request AI insights for the computed value\n"
              << "  -h, --help              Show this help message\n"
              << "  -v, --version           Show version information\n"
              << "\nEnvironment Variables:\n"
              << "  SENTIENT_API_KEY                 Reasoning service API key\n"
              << "  SENTINDEX_REASONING_HOST         Reasoning service host\n"
              << "  SENTINDEX_REASONING_PORT         Reasoning service port\n"
              << "  SENTINDEX_REASONING_MODEL        Model name\n"
              << "  SENTINDEX_REASONING_TIMEOUT_MS   Insight deadline\n"
              << "  SENTINDEX_MIN_COVERAGE           Default coverage threshold\n"
              << "  SENTINDEX_LOG_LEVEL              trace|debug|info|warn|error\n"
              << "\nPriority: CLI args > Environment > Config file > Defaults\n"
              << std::endl;
}

void print_version() {
    std::cout << "sentindex v1.0.0\n"
              << "Composite commodity and crypto index with AI insights\n"
              << std::endl;
}

struct CliArgs {
    std::optional<std::string> config_path;
    std::string index_name = sentindex::kDefaultIndexName;
    std::optional<std::string> prices;
    std::string method;
    std::optional<double> min_coverage;
    std::optional<double> prior_value;
    std::optional<std::string> prior_prices;
    bool insights = false;
    bool metrics = false;
    bool show_help = false;
    bool show_version = false;
};

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if ((arg == "-i" || arg == "--index") && i + 1 < argc) {
            args.index_name = argv[++i];
        } else if ((arg == "-p" || arg == "--prices") && i + 1 < argc) {
            args.prices = argv[++i];
        } else if ((arg == "-m" || arg == "--method") && i + 1 < argc) {
            args.method = argv[++i];
        } else if (arg == "--min-coverage" && i + 1 < argc) {
            try {
                args.min_coverage = std::stod(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Warning: ignoring invalid --min-coverage value" << std::endl;
            }
        } else if (arg == "--prior-value" && i + 1 < argc) {
            try {
                args.prior_value = std::stod(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Warning: ignoring invalid --prior-value value" << std::endl;
            }
        } else if (arg == "--prior-prices" && i + 1 < argc) {
            args.prior_prices = argv[++i];
        } else if (arg == "--insights") {
            args.insights = true;
        } else if (arg == "--metrics") {
            args.metrics = true;
        }
    }

    return args;
}

/// Inline JSON, or the contents of a file when prefixed with '@'
std::optional<std::string> read_json_text(const std::string& arg) {
    if (arg.empty() || arg.front() != '@') {
        return arg;
    }
    std::ifstream file(arg.substr(1));
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    if (args.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    if (args.show_version) {
        print_version();
        return 0;
    }

    if (!args.prices) {
        print_usage(argv[0]);
        return 1;
    }

    auto config = sentindex::Config::load(args.config_path);
    sentindex::init_logging(config.logging.level);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        sentindex::SystemClock clock;
        auto store = std::make_shared<sentindex::storage::InMemoryIndexStore>();
        auto metrics = std::make_shared<sentindex::telemetry::Metrics>();

        std::shared_ptr<sentindex::ReasoningClient> reasoning;
        if (config.reasoning.enabled()) {
            reasoning = std::make_shared<sentindex::network::ReasoningHttpClient>(
                config.reasoning,
                sentindex::network::create_ssl_context(config.reasoning.ca_file),
                nullptr,
                metrics
            );
        } else {
            spdlog::info("Reasoning service not configured, insights will use the fallback");
        }

        sentindex::IndexService service(
            config, sentindex::build_registry(config), store, reasoning, clock, metrics);

        auto prices_text = read_json_text(*args.prices);
        if (!prices_text) {
            spdlog::error("Cannot read prices from {}", *args.prices);
            spdlog::shutdown();
            return 1;
        }

        std::optional<std::string> prior_text;
        if (args.prior_prices) {
            prior_text = read_json_text(*args.prior_prices);
            if (!prior_text) {
                spdlog::error("Cannot read prior prices from {}", *args.prior_prices);
                spdlog::shutdown();
                return 1;
            }
        }
        if (args.prior_value.has_value() != prior_text.has_value()) {
            spdlog::error("--prior-value and --prior-prices must be given together");
            spdlog::shutdown();
            return 1;
        }

        sentindex::ComputeRequest request;
        request.index_name = args.index_name;
        request.method = args.method;
        request.min_coverage = args.min_coverage;
        request.prior_value = args.prior_value;
        try {
            request.prices = nlohmann::json::parse(*prices_text);
            if (prior_text) {
                request.prior_prices = nlohmann::json::parse(*prior_text);
            }
        } catch (const nlohmann::json::exception& e) {
            sentindex::PipelineError error = sentindex::ValidationError{
                sentindex::ValidationError::Reason::MalformedPrices, "", e.what()};
            std::cout << sentindex::output::JsonFormatter::format_error(error).dump(2) << std::endl;
            spdlog::shutdown();
            return 2;
        }

        auto result = service.compute(request);
        if (result.is_err()) {
            std::cout << sentindex::output::JsonFormatter::format_error(result.error()).dump(2)
                      << std::endl;
            spdlog::shutdown();
            return 2;
        }

        auto response = sentindex::output::JsonFormatter::format_compute(result.value());
        response["provenance"] =
            sentindex::output::JsonFormatter::format_provenance(result.value().provenance);
        std::cout << response.dump(2) << std::endl;

        if (args.insights) {
            auto insight = service.insights(args.index_name, std::nullopt, g_cancel);
            std::cout << sentindex::output::JsonFormatter::format_insights(args.index_name, insight).dump(2)
                      << std::endl;
        }

        if (args.metrics) {
            std::cout << nlohmann::json{{"metrics", metrics->to_json()}}.dump(2) << std::endl;
        }

        spdlog::shutdown();
        return 0;

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        spdlog::shutdown();
        return 1;
    }
}
