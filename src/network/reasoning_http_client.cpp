#include "network/reasoning_http_client.hpp"
#include "network/rest_client.hpp"
#include <algorithm>
#include <boost/asio/io_context.hpp>
#include <condition_variable>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>

namespace sentindex::network {

using json = nlohmann::json;

namespace {

// Granularity of cancellation checks while the exchange is in flight
constexpr std::chrono::milliseconds kPollInterval{10};

/// Hand-off between the resolver thread and the waiting caller
/// Shared so an abandoned lookup can still complete safely
struct PendingLookup {
    std::mutex mutex;
    std::condition_variable ready;
    std::optional<Result<HostResolver::Endpoints, std::string>> result;
};

std::uint64_t token_count(const json& usage, const char* field) {
    if (usage.contains(field) && usage[field].is_number_unsigned()) {
        return usage[field].get<std::uint64_t>();
    }
    return 0;
}

}  // namespace

ReasoningHttpClient::ReasoningHttpClient(
    Config::Reasoning settings,
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
    std::shared_ptr<HostResolver> resolver,
    std::shared_ptr<telemetry::Metrics> metrics
)
    : settings_(std::move(settings))
    , ssl_ctx_(std::move(ssl_ctx))
    , resolver_(resolver ? std::move(resolver) : std::make_shared<ThreadedHostResolver>())
    , metrics_(std::move(metrics))
{}

Result<std::string, std::string> ReasoningHttpClient::complete(
    const std::string& prompt,
    std::chrono::milliseconds deadline,
    const CancellationToken& cancel
) {
    if (settings_.api_key.empty()) {
        return Result<std::string, std::string>::Err("reasoning service API key not configured");
    }

    auto deadline_at = std::chrono::steady_clock::now() + deadline;

    auto endpoints = resolve(deadline_at, cancel);
    if (endpoints.is_err()) {
        return Result<std::string, std::string>::Err(endpoints.error());
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline_at - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
        return Result<std::string, std::string>::Err("timeout");
    }

    boost::asio::io_context ioc;
    auto client = std::make_shared<RestClient>(ioc, ssl_ctx_);

    std::optional<Result<std::string, std::string>> outcome;

    RestClient::Request request{
        settings_.host,
        settings_.port,
        settings_.path,
        build_request_body(settings_, prompt),
        settings_.api_key
    };
    client->post(std::move(request), endpoints.value(), remaining,
        [&outcome](Result<std::string, std::string> result) {
            outcome = std::move(result);
        });

    while (!outcome && !ioc.stopped()) {
        if (cancel.is_cancelled()) {
            client->cancel();
        }
        ioc.run_for(kPollInterval);
    }

    // Run handlers of aborted operations; anything still pending is
    // destroyed with the io_context, which releases the session
    client->cancel();
    ioc.restart();
    ioc.poll();

    if (!outcome) {
        return Result<std::string, std::string>::Err("no response");
    }
    if (outcome->is_err()) {
        return Result<std::string, std::string>::Err(outcome->error());
    }

    auto completion = extract_completion(outcome->value());
    if (completion.is_err()) {
        return Result<std::string, std::string>::Err(completion.error());
    }
    if (metrics_) {
        metrics_->add_llm_tokens(settings_.model, telemetry::TokenType::Prompt,
                                 completion.value().prompt_tokens);
        metrics_->add_llm_tokens(settings_.model, telemetry::TokenType::Completion,
                                 completion.value().completion_tokens);
    }
    return Result<std::string, std::string>::Ok(std::move(completion).value().content);
}

Result<HostResolver::Endpoints, std::string> ReasoningHttpClient::resolve(
    std::chrono::steady_clock::time_point deadline_at,
    const CancellationToken& cancel
) {
    auto pending = std::make_shared<PendingLookup>();
    resolver_->resolve(settings_.host, settings_.port,
        [pending](Result<Endpoints, std::string> result) {
            std::lock_guard<std::mutex> lock(pending->mutex);
            pending->result = std::move(result);
            pending->ready.notify_all();
        });

    std::unique_lock<std::mutex> lock(pending->mutex);
    while (!pending->result) {
        if (cancel.is_cancelled()) {
            return Result<Endpoints, std::string>::Err("cancelled");
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline_at) {
            spdlog::warn("Lookup of {} timed out", settings_.host);
            return Result<Endpoints, std::string>::Err("timeout");
        }
        std::chrono::steady_clock::time_point next_check = now + kPollInterval;
        pending->ready.wait_until(lock, std::min(deadline_at, next_check));
    }
    return std::move(*pending->result);
}

std::string ReasoningHttpClient::build_request_body(
    const Config::Reasoning& settings,
    const std::string& prompt
) {
    json body{
        {"model", settings.model},
        {"messages", json::array({
            {{"role", "user"}, {"content", prompt}}
        })},
        {"max_tokens", settings.max_tokens},
        {"temperature", settings.temperature},
        {"response_format", {{"type", "json_object"}}}
    };
    return body.dump();
}

Result<Completion, std::string> ReasoningHttpClient::extract_completion(std::string_view body) {
    try {
        auto j = json::parse(body);

        if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
            return Result<Completion, std::string>::Err("response has no choices");
        }
        const auto& choice = j["choices"][0];
        if (!choice.contains("message") || !choice["message"].contains("content") ||
            !choice["message"]["content"].is_string()) {
            return Result<Completion, std::string>::Err("response choice has no message content");
        }

        Completion completion;
        completion.content = choice["message"]["content"].get<std::string>();

        if (j.contains("usage") && j["usage"].is_object()) {
            completion.prompt_tokens = token_count(j["usage"], "prompt_tokens");
            completion.completion_tokens = token_count(j["usage"], "completion_tokens");
            spdlog::debug("Reasoning usage: prompt {} tokens, completion {} tokens",
                          completion.prompt_tokens, completion.completion_tokens);
        }

        return Result<Completion, std::string>::Ok(std::move(completion));

    } catch (const json::exception& e) {
        return Result<Completion, std::string>::Err(
            std::string("JSON parse error: ") + e.what()
        );
    }
}

}  // namespace sentindex::network
