#pragma once

#include "core/cancellation.hpp"
#include "core/status.hpp"
#include <chrono>
#include <string>

namespace sentindex {

/// External text-completion capability
/// Implementations must be safe to call concurrently from different requests
class ReasoningClient {
public:
    virtual ~ReasoningClient() = default;

    /// Submit a prompt and wait for the raw completion text
    /// @param prompt Full prompt text
    /// @param deadline Upper bound on the whole call
    /// @param cancel Aborts the call when cancelled
    /// @return Completion text, or a description of the failure
    [[nodiscard]] virtual Result<std::string, std::string> complete(
        const std::string& prompt,
        std::chrono::milliseconds deadline,
        const CancellationToken& cancel
    ) = 0;
};

}  // namespace sentindex
