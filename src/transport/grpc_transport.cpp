/**
 * @file grpc_transport.cpp
 * @brief GrpcSessionTransport implementation.
 *
 * @copyright Copyright (c) 2024 meshscout Contributors
 * @license MIT License
 */

#include "meshscout/transport/grpc_transport.hpp"
#include "meshscout/core/feed_queue.hpp"
#include "meshscout/core/session_config_proto.hpp"
#include "meshscout/utils/logger.hpp"

#include <google/protobuf/util/json_util.h>

#include <condition_variable>

namespace meshscout {
namespace transport {

std::string formatZid(const std::string& bytes) {
    static const char* kHex = "0123456789abcdef";

    std::string out;
    out.reserve(bytes.size() * 2 + 4);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out += '-';
        }
        const auto byte = static_cast<unsigned char>(bytes[i]);
        out += kHex[byte >> 4];
        out += kHex[byte & 0x0F];
    }
    return out;
}

std::string whatAmIName(router::WhatAmI whatami) {
    switch (whatami) {
        case router::ROUTER: return "router";
        case router::PEER: return "peer";
        case router::CLIENT: return "client";
        default: return "unknown";
    }
}

std::string renderHello(const router::Hello& hello) {
    router::ScoutEvent event;
    event.set_event("peer_discovered");
    event.set_whatami(whatAmIName(hello.whatami()));
    event.set_zid(formatZid(hello.zid()));
    for (const auto& locator : hello.locators()) {
        event.add_locators(locator);
    }

    google::protobuf::util::JsonPrintOptions options;
    options.preserve_proto_field_names = true;

    std::string json;
    auto status = google::protobuf::util::MessageToJsonString(event, &json, options);
    if (!status.ok()) {
        throw core::TransportError("cannot render hello: " + status.ToString());
    }
    return json;
}

namespace {

// =============================================================================
// ScoutReactor - reads one Scout stream into a QueuedDiscoveryFeed
// =============================================================================

class ScoutReactor : public grpc::ClientReadReactor<router::Hello> {
public:
    explicit ScoutReactor(std::shared_ptr<core::QueuedDiscoveryFeed> queue)
        : queue_(std::move(queue))
    {}

    void start(router::RouterService::Stub* stub, const router::ScoutRequest& request) {
        request_ = request;
        stub->async()->Scout(&context_, &request_, this);
        StartRead(&hello_);
        StartCall();
    }

    void OnReadDone(bool ok) override {
        if (!ok) {
            // Stream ended; OnDone follows
            return;
        }

        try {
            queue_->push(renderHello(hello_));
        } catch (const std::exception& e) {
            LOG_WARN("GrpcTransport", "Dropping hello: {}", e.what());
        }
        hello_.Clear();
        StartRead(&hello_);
    }

    void OnDone(const grpc::Status& status) override {
        if (status.ok() || status.error_code() == grpc::StatusCode::CANCELLED) {
            LOG_DEBUG("GrpcTransport", "Scout stream ended");
            queue_->finish();
        } else {
            LOG_WARN("GrpcTransport", "Scout failed: {}", status.error_message());
            queue_->fail(status.error_message());
        }

        // Notify under the lock: the waiter destroys this reactor
        std::lock_guard<std::mutex> lock(mutex_);
        done_ = true;
        cv_.notify_all();
    }

    void cancel() {
        context_.TryCancel();
    }

    void waitDone() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return done_; });
    }

private:
    std::shared_ptr<core::QueuedDiscoveryFeed> queue_;

    grpc::ClientContext context_;
    router::ScoutRequest request_;
    router::Hello hello_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool done_ = false;
};

// =============================================================================
// GrpcScoutFeed - DiscoveryFeed owning a ScoutReactor
// =============================================================================

class GrpcScoutFeed : public core::DiscoveryFeed {
public:
    GrpcScoutFeed(router::RouterService::Stub* stub,
                  const router::ScoutRequest& request,
                  utils::CancellationTokenPtr token)
        : token_(std::move(token))
        , queue_(std::make_shared<core::QueuedDiscoveryFeed>(token_))
        , reactor_(std::make_unique<ScoutReactor>(queue_))
    {
        reactor_->start(stub, request);
        auto* reactor = reactor_.get();
        subscription_ = token_->subscribe([reactor]() { reactor->cancel(); });
    }

    ~GrpcScoutFeed() override {
        token_->unsubscribe(subscription_);
        reactor_->cancel();
        reactor_->waitDone();
    }

    bool next(std::string& descriptor) override {
        return queue_->next(descriptor);
    }

private:
    utils::CancellationTokenPtr token_;
    std::shared_ptr<core::QueuedDiscoveryFeed> queue_;
    std::unique_ptr<ScoutReactor> reactor_;
    utils::CancellationToken::SubscriptionId subscription_ = 0;
};

}  // namespace

// =============================================================================
// GrpcSessionHandle
// =============================================================================

GrpcSessionHandle::GrpcSessionHandle(std::shared_ptr<router::RouterService::Stub> stub,
                                     std::string zid,
                                     std::chrono::milliseconds closeTimeout)
    : stub_(std::move(stub))
    , zid_(std::move(zid))
    , id_(formatZid(zid_))
    , closeTimeout_(closeTimeout)
{}

GrpcSessionHandle::~GrpcSessionHandle() {
    close();
}

void GrpcSessionHandle::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
    }

    router::CloseSessionRequest request;
    request.set_zid(zid_);
    router::CloseSessionResponse response;

    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + closeTimeout_);

    grpc::Status status = stub_->CloseSession(&context, request, &response);
    if (!status.ok()) {
        LOG_WARN("GrpcTransport", "CloseSession {} failed: {}", id_, status.error_message());
        return;
    }
    LOG_DEBUG("GrpcTransport", "Closed session {}", id_);
}

bool GrpcSessionHandle::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

// =============================================================================
// GrpcSessionTransport
// =============================================================================

GrpcSessionTransport::GrpcSessionTransport(GrpcTransportOptions options)
    : options_(std::move(options))
{
    LOG_DEBUG("GrpcTransport", "Created transport for router {}", options_.router_address);
}

GrpcSessionTransport::~GrpcSessionTransport() = default;

std::shared_ptr<router::RouterService::Stub> GrpcSessionTransport::getStub() {
    std::lock_guard<std::mutex> lock(channelMutex_);

    if (stub_) {
        return stub_;
    }

    LOG_DEBUG("GrpcTransport", "Creating channel to {}", options_.router_address);

    grpc::ChannelArguments args;
    args.SetInt(GRPC_ARG_KEEPALIVE_TIME_MS, 10000);
    args.SetInt(GRPC_ARG_KEEPALIVE_TIMEOUT_MS, 5000);
    args.SetInt(GRPC_ARG_HTTP2_MAX_PINGS_WITHOUT_DATA, 0);

    channel_ = grpc::CreateCustomChannel(
        options_.router_address,
        grpc::InsecureChannelCredentials(),
        args);
    stub_ = std::shared_ptr<router::RouterService::Stub>(
        router::RouterService::NewStub(channel_));
    return stub_;
}

std::unique_ptr<core::DiscoveryFeed> GrpcSessionTransport::discover(
    const std::string& filterExpression,
    utils::CancellationTokenPtr token) {
    if (!token) {
        token = std::make_shared<utils::CancellationToken>();
    }

    router::ScoutRequest request;
    request.set_what(filterExpression);
    request.set_timeout_ms(options_.scout_timeout_ms);

    LOG_DEBUG("GrpcTransport", "Scouting for '{}' via {}",
              filterExpression, options_.router_address);

    auto stub = getStub();
    return std::make_unique<GrpcScoutFeed>(stub.get(), request, std::move(token));
}

std::unique_ptr<core::SessionHandle> GrpcSessionTransport::openSession(
    const core::SessionConfig& config) {
    auto stub = getStub();

    router::OpenSessionRequest request;
    core::fillProto(config, request.mutable_config());
    router::OpenSessionResponse response;

    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + options_.open_timeout);

    grpc::Status status = stub->OpenSession(&context, request, &response);
    if (!status.ok()) {
        LOG_WARN("GrpcTransport", "OpenSession via {} failed: {}",
                 options_.router_address, status.error_message());
        throw core::TransportError(status.error_message());
    }

    if (response.zid().empty()) {
        throw core::TransportError("router returned an empty session id");
    }

    auto handle = std::make_unique<GrpcSessionHandle>(stub, response.zid(), options_.close_timeout);
    LOG_INFO("GrpcTransport", "Opened session {}", handle->id());
    return handle;
}

}  // namespace transport
}  // namespace meshscout
