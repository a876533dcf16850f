/**
 * @file feed_queue.cpp
 * @brief QueuedDiscoveryFeed implementation.
 *
 * @copyright Copyright (c) 2024 meshscout Contributors
 * @license MIT License
 */

#include "meshscout/core/feed_queue.hpp"

namespace meshscout {
namespace core {

QueuedDiscoveryFeed::QueuedDiscoveryFeed(utils::CancellationTokenPtr token)
    : token_(std::move(token))
{
    if (token_) {
        subscription_ = token_->subscribe([this]() { onCancelled(); });
    }
}

QueuedDiscoveryFeed::~QueuedDiscoveryFeed() {
    if (token_) {
        token_->unsubscribe(subscription_);
    }
}

bool QueuedDiscoveryFeed::push(std::string descriptor) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_ || cancelled_ || error_) {
            return false;
        }
        queue_.push_back(std::move(descriptor));
    }
    cv_.notify_one();
    return true;
}

void QueuedDiscoveryFeed::finish() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (error_) {
            return;
        }
        finished_ = true;
    }
    cv_.notify_all();
}

void QueuedDiscoveryFeed::fail(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_ || error_) {
            return;
        }
        error_ = message;
    }
    cv_.notify_all();
}

void QueuedDiscoveryFeed::onCancelled() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        queue_.clear();
    }
    cv_.notify_all();
}

bool QueuedDiscoveryFeed::next(std::string& descriptor) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() {
        return cancelled_ || !queue_.empty() || finished_ || error_.has_value();
    });

    if (cancelled_) {
        return false;
    }

    if (!queue_.empty()) {
        descriptor = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    if (error_) {
        throw TransportError(*error_);
    }
    return false;
}

bool QueuedDiscoveryFeed::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_ || cancelled_ || error_.has_value();
}

size_t QueuedDiscoveryFeed::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

}  // namespace core
}  // namespace meshscout
