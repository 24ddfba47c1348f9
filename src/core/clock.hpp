#pragma once

#include "core/types.hpp"

namespace sentindex {

/// Source of wall-clock time
/// Injected wherever a result is stamped so computations stay reproducible
class Clock {
public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual WallTime now() const = 0;
};

/// Clock backed by std::chrono::system_clock
class SystemClock final : public Clock {
public:
    [[nodiscard]] WallTime now() const override {
        return std::chrono::system_clock::now();
    }
};

/// Clock that always returns the same instant until moved
class FixedClock final : public Clock {
public:
    explicit FixedClock(WallTime at) : at_(at) {}

    [[nodiscard]] WallTime now() const override {
        return at_;
    }

    void set(WallTime at) {
        at_ = at;
    }

    void advance(std::chrono::milliseconds delta) {
        at_ += delta;
    }

private:
    WallTime at_;
};

}  // namespace sentindex
