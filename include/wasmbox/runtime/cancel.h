#pragma once

#include <atomic>
#include <string_view>

/**
 * @file cancel.h
 * @brief Cooperative cancellation flag shared between a run and whoever may abort it.
 */

namespace wasmbox::runtime
{

enum class CancelReason : int
{
    None = 0,
    ClientDisconnected,
    Shutdown,
    Requested,
};

[[nodiscard]] std::string_view to_string(CancelReason reason);

/**
 * @brief Set once, read at every epoch tick while guest code runs.
 *
 * The first reason wins; later calls to `cancel` are no-ops.
 */
class CancelToken
{
  public:
    void cancel(CancelReason reason) noexcept
    {
        int expected = static_cast<int>(CancelReason::None);
        (void)reason_.compare_exchange_strong(expected, static_cast<int>(reason));
    }

    [[nodiscard]] bool cancelled() const noexcept
    {
        return reason_.load(std::memory_order_acquire) != static_cast<int>(CancelReason::None);
    }

    [[nodiscard]] CancelReason reason() const noexcept
    {
        return static_cast<CancelReason>(reason_.load(std::memory_order_acquire));
    }

  private:
    std::atomic<int> reason_{static_cast<int>(CancelReason::None)};
};

} // namespace wasmbox::runtime
