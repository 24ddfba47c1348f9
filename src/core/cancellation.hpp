#pragma once

#include <atomic>
#include <memory>

namespace sentindex {

/// Per-request cancellation flag shared between a caller and a blocking call
/// Copies observe the same flag
class CancellationToken {
public:
    CancellationToken()
        : cancelled_(std::make_shared<std::atomic<bool>>(false))
    {}

    /// Request cancellation (thread-safe, idempotent)
    void cancel() noexcept {
        cancelled_->store(true, std::memory_order_release);
    }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return cancelled_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

}  // namespace sentindex
