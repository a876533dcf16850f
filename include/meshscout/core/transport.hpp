/**
 * @file transport.hpp
 * @brief Interfaces of the external session / discovery library.
 *
 * DiscoveryController and SessionManager only talk to a SessionTransport.
 * GrpcSessionTransport is the production implementation; tests plug in
 * scripted doubles.
 *
 * @copyright Copyright (c) 2024 meshscout Contributors
 * @license MIT License
 */

#pragma once

#include "meshscout/core/errors.hpp"
#include "meshscout/core/session_config.hpp"
#include "meshscout/utils/cancellation.hpp"

#include <memory>
#include <string>

namespace meshscout {
namespace core {

/**
 * @class DiscoveryFeed
 * @brief Lazy, possibly endless sequence of opaque peer descriptors.
 */
class DiscoveryFeed {
public:
    virtual ~DiscoveryFeed() = default;

    /**
     * @brief Wait for the next descriptor.
     * @param descriptor Receives the descriptor when true is returned.
     * @return False once the feed has ended or has been cancelled.
     * @throws TransportError if the feed failed.
     */
    virtual bool next(std::string& descriptor) = 0;
};

/**
 * @class SessionHandle
 * @brief A live session. Destroying the handle closes it.
 */
class SessionHandle {
public:
    virtual ~SessionHandle() = default;

    virtual std::string id() const = 0;

    /**
     * @brief Release the session. Safe to call any number of times;
     * failures are logged, never thrown.
     */
    virtual void close() = 0;

    virtual bool isClosed() const = 0;
};

/**
 * @class SessionTransport
 * @brief Entry points into the middleware.
 */
class SessionTransport {
public:
    virtual ~SessionTransport() = default;

    /**
     * @brief Start discovering peers matching @p filterExpression
     * ("peer", "router" or "peer|router").
     *
     * Cancelling @p token must make a blocked DiscoveryFeed::next()
     * return false promptly.
     * @throws TransportError if discovery cannot be started.
     */
    virtual std::unique_ptr<DiscoveryFeed> discover(const std::string& filterExpression,
                                                    utils::CancellationTokenPtr token) = 0;

    /**
     * @brief Open a session. Blocks until the session is up or has failed.
     * @throws TransportError with the middleware's message on failure.
     */
    virtual std::unique_ptr<SessionHandle> openSession(const SessionConfig& config) = 0;
};

}  // namespace core
}  // namespace meshscout
