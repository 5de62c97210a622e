// include/quanttrade/core/cancellation.hpp
#pragma once

#include <atomic>

namespace quanttrade {

/**
 * @brief Cooperative cancellation flag shared between a caller and a long-running driver
 *
 * Drivers poll is_cancelled() between simulations and walk-forward windows.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() noexcept {
        cancelled_.store(true, std::memory_order_release);
    }

    bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    void reset() noexcept {
        cancelled_.store(false, std::memory_order_release);
    }

private:
    std::atomic<bool> cancelled_{false};
};

}  // namespace quanttrade
