#pragma once

#include "core/config.hpp"
#include "insight/reasoning_client.hpp"
#include "network/host_resolver.hpp"
#include "telemetry/metrics.hpp"
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace sentindex::network {

/// Content and token usage of one chat completion
struct Completion {
    std::string content;
    std::uint64_t prompt_tokens = 0;
    std::uint64_t completion_tokens = 0;
};

/// ReasoningClient over an OpenAI-style chat-completions endpoint
/// Each call owns its io_context for the exchange; name lookups run on the
/// resolver, so a stalled lookup is abandoned at the deadline
class ReasoningHttpClient final : public ReasoningClient {
public:
    /// @param resolver Host lookup, a ThreadedHostResolver when null
    /// @param metrics Token usage counters, may be null
    ReasoningHttpClient(
        Config::Reasoning settings,
        std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
        std::shared_ptr<HostResolver> resolver = nullptr,
        std::shared_ptr<telemetry::Metrics> metrics = nullptr
    );

    [[nodiscard]] Result<std::string, std::string> complete(
        const std::string& prompt,
        std::chrono::milliseconds deadline,
        const CancellationToken& cancel
    ) override;

    /// Chat-completions request body for a single user message, JSON response format
    [[nodiscard]] static std::string build_request_body(
        const Config::Reasoning& settings,
        const std::string& prompt
    );

    /// Extract choices[0].message.content and usage from a chat-completions response
    [[nodiscard]] static Result<Completion, std::string> extract_completion(std::string_view body);

private:
    using Endpoints = HostResolver::Endpoints;

    /// Wait for the lookup until it answers, the deadline passes or the call is cancelled
    [[nodiscard]] Result<Endpoints, std::string> resolve(
        std::chrono::steady_clock::time_point deadline_at,
        const CancellationToken& cancel
    );

    Config::Reasoning settings_;
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
    std::shared_ptr<HostResolver> resolver_;
    std::shared_ptr<telemetry::Metrics> metrics_;
};

}  // namespace sentindex::network
