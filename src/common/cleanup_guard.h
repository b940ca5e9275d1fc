#pragma once

#include <functional>

namespace Collector {

/**
 * Scoped guard that runs a cleanup function on every exit path of a scope
 */
class CleanupGuard {
public:
    explicit CleanupGuard(std::function<void()> cleanup) : cleanup_(std::move(cleanup)) {}
    ~CleanupGuard() { if (cleanup_) cleanup_(); }

    // Disable copy
    CleanupGuard(const CleanupGuard&) = delete;
    CleanupGuard& operator=(const CleanupGuard&) = delete;

    // Enable move
    CleanupGuard(CleanupGuard&& other) noexcept : cleanup_(std::move(other.cleanup_)) {
        other.cleanup_ = nullptr;
    }

private:
    std::function<void()> cleanup_;
};

} // namespace Collector
