/*
 * mediasync/src/sync/rate_limiter.cpp
 *
 * Chunk pacing for throttled transfers.
 * - Each chunk of (rate limit) bytes is given a fixed time budget (one second).
 * - pacingDelay() returns what is left of that budget; it never goes negative.
 * - The sleep itself is performed by the caller so tests can substitute a fake clock.
 */

#include <mediasync/sync/sync.hpp>

#include <chrono>

namespace mediasync::sync {

std::chrono::milliseconds pacingDelay(std::chrono::milliseconds elapsed,
                                      std::chrono::milliseconds budget) noexcept {
    if (elapsed >= budget)
        return std::chrono::milliseconds{0};
    return budget - elapsed;
}

} // namespace mediasync::sync
