/**
 * @file grpc_transport.hpp
 * @brief SessionTransport backed by a mesh router's gRPC API.
 *
 * GrpcSessionTransport talks to a RouterService endpoint:
 * - Scout streams Hello messages, rendered as JSON descriptors
 * - OpenSession / CloseSession manage sessions held by the router
 *
 * @copyright Copyright (c) 2024 meshscout Contributors
 * @license MIT License
 */

#pragma once

#include "meshscout/export.hpp"
#include "meshscout/core/transport.hpp"

#include "meshscout/proto/router.grpc.pb.h"

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace meshscout {
namespace transport {

/**
 * @struct GrpcTransportOptions
 * @brief Connection settings for GrpcSessionTransport.
 */
struct GrpcTransportOptions {
    std::string router_address = "localhost:7450";
    std::chrono::milliseconds open_timeout{5000};
    std::chrono::milliseconds close_timeout{2000};
    uint32_t scout_timeout_ms = 1000;   ///< Passed to the router per Scout call
};

/**
 * @brief Render a node id as lower-case hex, hyphenated after bytes
 * 4, 6, 8 and 10 (e.g. "0a1b2c3d-4e5f-6071-8293-a4b5c6d7e8f9").
 */
MESHSCOUT_TRANSPORT_API std::string formatZid(const std::string& bytes);

/**
 * @brief Lower-case role name of a Hello ("router", "peer", "client").
 */
MESHSCOUT_TRANSPORT_API std::string whatAmIName(router::WhatAmI whatami);

/**
 * @brief Render a Hello as the JSON discovery descriptor
 * `{"event":"peer_discovered","whatami":..,"zid":..,"locators":[..]}`.
 * @throws core::TransportError if the message cannot be rendered.
 */
MESHSCOUT_TRANSPORT_API std::string renderHello(const router::Hello& hello);

/**
 * @class GrpcSessionHandle
 * @brief Session held by the router; closing it issues CloseSession once.
 */
class MESHSCOUT_TRANSPORT_API GrpcSessionHandle : public core::SessionHandle {
public:
    GrpcSessionHandle(std::shared_ptr<router::RouterService::Stub> stub,
                      std::string zid,
                      std::chrono::milliseconds closeTimeout);

    /**
     * @brief Destructor - closes the session.
     */
    ~GrpcSessionHandle() override;

    GrpcSessionHandle(const GrpcSessionHandle&) = delete;
    GrpcSessionHandle& operator=(const GrpcSessionHandle&) = delete;

    std::string id() const override { return id_; }
    void close() override;
    bool isClosed() const override;

private:
    std::shared_ptr<router::RouterService::Stub> stub_;
    std::string zid_;
    std::string id_;
    std::chrono::milliseconds closeTimeout_;

    mutable std::mutex mutex_;
    bool closed_ = false;
};

/**
 * @class GrpcSessionTransport
 * @brief SessionTransport over a single, lazily created gRPC channel.
 *
 * Usage:
 * @code
 * GrpcTransportOptions options;
 * options.router_address = "192.168.1.10:7450";
 * auto transport = std::make_shared<GrpcSessionTransport>(options);
 * core::DiscoveryController controller(transport);
 * @endcode
 */
class MESHSCOUT_TRANSPORT_API GrpcSessionTransport : public core::SessionTransport {
public:
    explicit GrpcSessionTransport(GrpcTransportOptions options = {});
    ~GrpcSessionTransport() override;

    // Non-copyable
    GrpcSessionTransport(const GrpcSessionTransport&) = delete;
    GrpcSessionTransport& operator=(const GrpcSessionTransport&) = delete;

    std::unique_ptr<core::DiscoveryFeed> discover(const std::string& filterExpression,
                                                  utils::CancellationTokenPtr token) override;

    std::unique_ptr<core::SessionHandle> openSession(const core::SessionConfig& config) override;

    const GrpcTransportOptions& options() const { return options_; }

private:
    GrpcTransportOptions options_;

    std::mutex channelMutex_;
    std::shared_ptr<grpc::Channel> channel_;
    std::shared_ptr<router::RouterService::Stub> stub_;

    std::shared_ptr<router::RouterService::Stub> getStub();
};

}  // namespace transport
}  // namespace meshscout
