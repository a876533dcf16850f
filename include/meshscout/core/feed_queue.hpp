/**
 * @file feed_queue.hpp
 * @brief DiscoveryFeed fed from a producer callback.
 *
 * Middleware discovery APIs usually report hellos through a callback on
 * their own thread. QueuedDiscoveryFeed turns those calls into the pull
 * style DiscoveryFeed::next() expected by DiscoveryController.
 *
 * @copyright Copyright (c) 2024 meshscout Contributors
 * @license MIT License
 */

#pragma once

#include "meshscout/core/transport.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace meshscout {
namespace core {

/**
 * @class QueuedDiscoveryFeed
 * @brief Thread-safe FIFO of descriptors with end / failure signalling.
 *
 * Producer side: push(), finish(), fail(). Consumer side: next().
 * Descriptors pushed before finish() or fail() are still delivered;
 * anything pushed afterwards, or after cancellation, is dropped.
 */
class MESHSCOUT_CORE_API QueuedDiscoveryFeed : public DiscoveryFeed {
public:
    /**
     * @param token Cancelling it ends the feed; may be null.
     */
    explicit QueuedDiscoveryFeed(utils::CancellationTokenPtr token = nullptr);

    ~QueuedDiscoveryFeed() override;

    QueuedDiscoveryFeed(const QueuedDiscoveryFeed&) = delete;
    QueuedDiscoveryFeed& operator=(const QueuedDiscoveryFeed&) = delete;

    /**
     * @return False if the descriptor was dropped (feed closed).
     */
    bool push(std::string descriptor);

    /// Natural end of the feed.
    void finish();

    /// End the feed with an error; next() throws it once drained.
    void fail(const std::string& message);

    bool next(std::string& descriptor) override;

    bool isClosed() const;
    size_t pending() const;

private:
    void onCancelled();

    utils::CancellationTokenPtr token_;
    utils::CancellationToken::SubscriptionId subscription_ = 0;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> queue_;
    bool finished_ = false;
    bool cancelled_ = false;
    std::optional<std::string> error_;
};

}  // namespace core
}  // namespace meshscout
