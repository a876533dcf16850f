/**
 * @file discovery_controller.cpp
 * @brief DiscoveryController implementation.
 *
 * @copyright Copyright (c) 2024 meshscout Contributors
 * @license MIT License
 */

#include "meshscout/core/discovery_controller.hpp"
#include "meshscout/utils/logger.hpp"
#include "meshscout/utils/string_utils.hpp"

#include <system_error>

namespace meshscout {
namespace core {

const char* filterExpression(DiscoveryFilter filter) {
    switch (filter) {
        case DiscoveryFilter::PEERS: return "peer";
        case DiscoveryFilter::ROUTERS: return "router";
        case DiscoveryFilter::BOTH: return "peer|router";
    }
    return "peer|router";
}

std::optional<DiscoveryFilter> parseDiscoveryFilter(const std::string& text) {
    const std::string filter = utils::to_lower(utils::trim(text));
    if (filter == "peer" || filter == "peers") return DiscoveryFilter::PEERS;
    if (filter == "router" || filter == "routers") return DiscoveryFilter::ROUTERS;
    if (filter == "peer|router" || filter == "router|peer" ||
        filter == "all" || filter == "both") {
        return DiscoveryFilter::BOTH;
    }
    return std::nullopt;
}

const char* scanOutcomeToString(ScanOutcome outcome) {
    switch (outcome) {
        case ScanOutcome::COMPLETED: return "COMPLETED";
        case ScanOutcome::TIMED_OUT: return "TIMED_OUT";
        case ScanOutcome::CANCELLED: return "CANCELLED";
        case ScanOutcome::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

DiscoveryController::DiscoveryController(std::shared_ptr<SessionTransport> transport,
                                         ScanOptions options)
    : transport_(std::move(transport))
    , options_(options)
{
    if (options_.timeout > ScanOptions::kMaxTimeout) {
        LOG_WARN("Discovery", "Scan timeout {} ms exceeds the limit; using {} ms",
                 options_.timeout.count(),
                 std::chrono::milliseconds(ScanOptions::kMaxTimeout).count());
        options_.timeout = ScanOptions::kMaxTimeout;
    }
    LOG_DEBUG("Discovery", "Controller created (scan timeout {} ms)",
              options_.timeout.count());
}

DiscoveryController::~DiscoveryController() {
    dispose();
}

bool DiscoveryController::startScan(DiscoveryFilter filter,
                                    RecordCallback onRecord,
                                    ScanCompleteCallback onComplete) {
    std::shared_ptr<Scan> previous;
    std::shared_ptr<Scan> failed;
    std::vector<std::thread> pending;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            LOG_DEBUG("Discovery", "Ignoring scan request: controller disposed");
            return false;
        }
        if (scanning_) {
            LOG_DEBUG("Discovery", "Ignoring scan request: scan #{} in progress", generation_);
            return false;
        }

        previous = std::move(current_);

        auto scan = std::make_shared<Scan>();
        scan->generation = ++generation_;
        scan->token = std::make_shared<utils::CancellationToken>();
        scan->onRecord = std::move(onRecord);
        scan->onComplete = std::move(onComplete);
        current_ = scan;

        scanning_ = true;
        results_.clear();
        lastError_.reset();
        lastOutcome_.reset();

        if (feedThread_.joinable()) {
            pending.push_back(std::move(feedThread_));
        }
        if (timerThread_.joinable()) {
            pending.push_back(std::move(timerThread_));
        }
        for (auto& thread : retired_) {
            pending.push_back(std::move(thread));
        }
        retired_.clear();

        try {
            feedThread_ = std::thread(&DiscoveryController::feedLoop, this, scan, filter);
            timerThread_ = std::thread(&DiscoveryController::timerLoop, this, scan);

            LOG_INFO("Discovery", "Scan #{} started (filter '{}', timeout {} ms)",
                     scan->generation, filterExpression(filter), options_.timeout.count());
        } catch (const std::system_error& e) {
            LOG_ERROR("Discovery", "Cannot start scan #{}: {}", scan->generation, e.what());
            scanning_ = false;
            lastOutcome_ = ScanOutcome::FAILED;
            lastError_ = e.what();
            failed = scan;
        }
    }
    cv_.notify_all();

    // A feed thread that did start exits once its token is cancelled
    if (failed) {
        failed->token->cancel();
    }

    // A feed left running after a timeout belongs to the previous scan
    if (previous) {
        previous->token->cancel();
    }
    releaseThreads(pending);
    return !failed;
}

void DiscoveryController::stopScan() {
    std::shared_ptr<Scan> scan;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!scanning_ || !current_) {
            return;
        }
        scan = current_;
    }

    scan->token->cancel();
    finishScan(*scan, ScanOutcome::CANCELLED, "");
}

void DiscoveryController::dispose() {
    std::shared_ptr<Scan> scan;
    std::vector<std::thread> pending;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return;
        }
        disposed_ = true;
        scanning_ = false;
        scan = current_;

        if (feedThread_.joinable()) {
            pending.push_back(std::move(feedThread_));
        }
        if (timerThread_.joinable()) {
            pending.push_back(std::move(timerThread_));
        }
        for (auto& thread : retired_) {
            pending.push_back(std::move(thread));
        }
        retired_.clear();
    }
    cv_.notify_all();

    if (scan) {
        scan->token->cancel();
    }

    for (auto& thread : pending) {
        if (thread.get_id() == std::this_thread::get_id()) {
            LOG_WARN("Discovery", "dispose() called from a scan callback; detaching scan thread");
            thread.detach();
        } else {
            thread.join();
        }
    }

    LOG_DEBUG("Discovery", "Controller disposed");
}

bool DiscoveryController::isScanning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scanning_;
}

ScanState DiscoveryController::state() const {
    return isScanning() ? ScanState::SCANNING : ScanState::IDLE;
}

bool DiscoveryController::isDisposed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disposed_;
}

std::vector<DiscoveryRecord> DiscoveryController::results() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_;
}

size_t DiscoveryController::resultCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_.size();
}

std::optional<std::string> DiscoveryController::lastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

std::optional<ScanOutcome> DiscoveryController::lastOutcome() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastOutcome_;
}

bool DiscoveryController::waitForIdle(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return !scanning_; });
}

// =============================================================================
// Scan threads
// =============================================================================

void DiscoveryController::feedLoop(std::shared_ptr<Scan> scan, DiscoveryFilter filter) {
    LOG_DEBUG("Discovery", "Feed thread for scan #{} started", scan->generation);

    try {
        auto feed = transport_->discover(filterExpression(filter), scan->token);
        if (!feed) {
            throw TransportError("transport returned no discovery feed");
        }

        std::string descriptor;
        while (feed->next(descriptor)) {
            if (!applyRecord(*scan, std::move(descriptor))) {
                break;
            }
            descriptor.clear();
        }
    } catch (const std::exception& e) {
        if (scan->token->isCancelled()) {
            LOG_DEBUG("Discovery", "Scan #{} feed error after cancel: {}",
                      scan->generation, e.what());
            return;
        }
        LOG_WARN("Discovery", "Scan #{} failed: {}", scan->generation, e.what());
        finishScan(*scan, ScanOutcome::FAILED, e.what());
        return;
    }

    // Whoever cancelled the token reports the outcome
    if (!scan->token->isCancelled()) {
        finishScan(*scan, ScanOutcome::COMPLETED, "");
    }

    LOG_DEBUG("Discovery", "Feed thread for scan #{} stopped", scan->generation);
}

void DiscoveryController::timerLoop(std::shared_ptr<Scan> scan) {
    size_t count = 0;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        bool ended = cv_.wait_for(lock, options_.timeout, [this, &scan]() {
            return isStale(*scan) || !scanning_;
        });
        if (ended) {
            return;
        }

        scanning_ = false;
        lastOutcome_ = ScanOutcome::TIMED_OUT;
        count = results_.size();
    }
    cv_.notify_all();

    LOG_INFO("Discovery", "Scan #{} timed out after {} ms with {} result(s)",
             scan->generation, options_.timeout.count(), count);

    if (options_.cancel_feed_on_timeout) {
        scan->token->cancel();
    }
    notifyComplete(*scan, ScanOutcome::TIMED_OUT, "");
}

bool DiscoveryController::isStale(const Scan& scan) const {
    return disposed_ || scan.generation != generation_;
}

bool DiscoveryController::applyRecord(const Scan& scan, std::string descriptor) {
    DiscoveryRecord record;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (isStale(scan) || scan.token->isCancelled()) {
            return false;
        }

        record.descriptor = std::move(descriptor);
        record.discovered_at = std::chrono::system_clock::now();
        record.sequence = results_.size() + 1;
        results_.push_back(record);
    }

    LOG_DEBUG("Discovery", "Scan #{} record {}: {}",
              scan.generation, record.sequence, record.descriptor);

    if (!scan.onRecord) {
        return true;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (isStale(scan)) {
            return false;
        }
    }

    try {
        scan.onRecord(record);
    } catch (const std::exception& e) {
        LOG_WARN("Discovery", "Scan #{} record callback threw: {}", scan.generation, e.what());
    }
    return true;
}

bool DiscoveryController::finishScan(const Scan& scan, ScanOutcome outcome,
                                     const std::string& error) {
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (isStale(scan) || !scanning_) {
            return false;
        }

        scanning_ = false;
        lastOutcome_ = outcome;
        if (outcome == ScanOutcome::FAILED) {
            lastError_ = error;
        }
        count = results_.size();
    }
    cv_.notify_all();

    LOG_INFO("Discovery", "Scan #{} {} with {} result(s)",
             scan.generation, scanOutcomeToString(outcome), count);

    notifyComplete(scan, outcome, error);
    return true;
}

void DiscoveryController::notifyComplete(const Scan& scan, ScanOutcome outcome,
                                         const std::string& error) {
    if (!scan.onComplete) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return;
        }
    }

    try {
        scan.onComplete(outcome, error);
    } catch (const std::exception& e) {
        LOG_WARN("Discovery", "Scan #{} completion callback threw: {}",
                 scan.generation, e.what());
    }
}

void DiscoveryController::releaseThreads(std::vector<std::thread>& pending) {
    for (auto& thread : pending) {
        if (!thread.joinable()) {
            continue;
        }
        if (thread.get_id() == std::this_thread::get_id()) {
            std::lock_guard<std::mutex> lock(mutex_);
            retired_.push_back(std::move(thread));
        } else {
            thread.join();
        }
    }
    pending.clear();
}

}  // namespace core
}  // namespace meshscout
