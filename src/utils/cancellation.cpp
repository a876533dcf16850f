/**
 * @file cancellation.cpp
 * @brief CancellationToken implementation.
 *
 * @copyright Copyright (c) 2024 meshscout Contributors
 * @license MIT License
 */

#include "meshscout/utils/cancellation.hpp"

namespace meshscout {
namespace utils {

void CancellationToken::cancel() {
    std::lock_guard<std::mutex> dispatch(dispatchMutex_);

    std::map<SubscriptionId, Callback> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        pending.swap(callbacks_);
    }
    cv_.notify_all();

    for (auto& [id, callback] : pending) {
        if (callback) {
            callback();
        }
    }
}

CancellationToken::SubscriptionId CancellationToken::subscribe(Callback callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cancelled_.load(std::memory_order_acquire)) {
            SubscriptionId id = nextId_++;
            callbacks_.emplace(id, std::move(callback));
            return id;
        }
    }

    if (callback) {
        callback();
    }
    return 0;
}

void CancellationToken::unsubscribe(SubscriptionId id) {
    if (id == 0) {
        return;
    }

    // Waits for an in-progress cancel() to finish its callbacks.
    std::lock_guard<std::mutex> dispatch(dispatchMutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.erase(id);
}

bool CancellationToken::waitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() {
        return cancelled_.load(std::memory_order_acquire);
    });
}

}  // namespace utils
}  // namespace meshscout
