/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation shared between an operation and its owner.
 *
 * @copyright Copyright (c) 2024 meshscout Contributors
 * @license MIT License
 */

#pragma once

#include "meshscout/export.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace meshscout {
namespace utils {

/**
 * @class CancellationToken
 * @brief One-shot cancellation flag with callbacks.
 *
 * The owner of an operation calls cancel(); the code doing the work
 * either polls isCancelled() / waitFor() or registers a callback that
 * interrupts whatever it is blocked on.
 *
 * Usage:
 * @code
 * auto token = std::make_shared<CancellationToken>();
 * auto id = token->subscribe([&] { context.TryCancel(); });
 * // ... blocking work ...
 * token->unsubscribe(id);
 * @endcode
 */
class MESHSCOUT_UTILS_API CancellationToken {
public:
    using Callback = std::function<void()>;
    using SubscriptionId = uint64_t;

    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /**
     * @brief Request cancellation.
     *
     * Only the first call has an effect: it runs every registered callback
     * once, on the calling thread, and wakes up waitFor().
     */
    void cancel();

    bool isCancelled() const {
        return cancelled_.load(std::memory_order_acquire);
    }

    /**
     * @brief Register a callback to run on cancellation.
     * @return Id for unsubscribe(), or 0 if the token was already
     *         cancelled (the callback has then run synchronously).
     */
    SubscriptionId subscribe(Callback callback);

    /**
     * @brief Remove a callback.
     *
     * When this returns the callback is not running and will not run.
     * Must not be called from inside a callback of the same token.
     */
    void unsubscribe(SubscriptionId id);

    /**
     * @brief Block until cancelled or until @p timeout elapses.
     * @return True if the token is cancelled.
     */
    bool waitFor(std::chrono::milliseconds timeout);

private:
    std::atomic<bool> cancelled_{false};

    std::mutex mutex_;
    std::condition_variable cv_;
    std::map<SubscriptionId, Callback> callbacks_;
    SubscriptionId nextId_ = 1;

    // Held while callbacks run so unsubscribe() can wait them out.
    std::mutex dispatchMutex_;
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

}  // namespace utils
}  // namespace meshscout
