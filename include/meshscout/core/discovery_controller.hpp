/**
 * @file discovery_controller.hpp
 * @brief Bounded, cancellable scouting of peers and routers.
 *
 * The DiscoveryController handles:
 * - Running at most one scan at a time (overlapping starts are dropped)
 * - Collecting descriptors in arrival order as they stream in
 * - Ending the scan after a fixed timeout
 * - Reporting feed failures without leaving the controller busy
 * - Stopping all updates once disposed
 *
 * @copyright Copyright (c) 2024 meshscout Contributors
 * @license MIT License
 */

#pragma once

#include "meshscout/export.hpp"
#include "meshscout/core/transport.hpp"
#include "meshscout/utils/cancellation.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace meshscout {
namespace core {

/**
 * @enum DiscoveryFilter
 * @brief Which roles a scan looks for.
 */
enum class DiscoveryFilter {
    PEERS,
    ROUTERS,
    BOTH
};

/**
 * @brief Filter expression understood by transports: "peer", "router"
 * or "peer|router".
 */
MESHSCOUT_CORE_API const char* filterExpression(DiscoveryFilter filter);

/**
 * @brief Parse a filter expression or one of "peers", "routers", "all",
 * "both" (case-insensitive).
 */
MESHSCOUT_CORE_API std::optional<DiscoveryFilter> parseDiscoveryFilter(const std::string& text);

/**
 * @struct DiscoveryRecord
 * @brief One discovered endpoint, as observed during a scan.
 */
struct DiscoveryRecord {
    std::string descriptor;                                ///< Opaque payload from the transport
    std::chrono::system_clock::time_point discovered_at;   ///< When the controller received it
    uint64_t sequence = 0;                                 ///< 1-based arrival index within the scan
};

enum class ScanState {
    IDLE,
    SCANNING
};

/**
 * @enum ScanOutcome
 * @brief How the last scan left the SCANNING state.
 */
enum class ScanOutcome {
    COMPLETED,  ///< Feed ended on its own
    TIMED_OUT,  ///< Scan timeout elapsed first
    CANCELLED,  ///< stopScan() was called
    FAILED      ///< Feed reported an error
};

MESHSCOUT_CORE_API const char* scanOutcomeToString(ScanOutcome outcome);

/**
 * @struct ScanOptions
 * @brief Tuning for DiscoveryController.
 */
struct ScanOptions {
    /// Longer timeouts are clamped by DiscoveryController.
    static constexpr std::chrono::hours kMaxTimeout{24};

    std::chrono::milliseconds timeout{5000};

    /// When false the feed keeps running after the timeout and late
    /// records of the same scan are still appended.
    bool cancel_feed_on_timeout = true;
};

/// Called on the scan thread for every appended record.
using RecordCallback = std::function<void(const DiscoveryRecord& record)>;

/// Called on a scan thread when a scan leaves SCANNING. @p error is
/// empty unless @p outcome is FAILED.
using ScanCompleteCallback = std::function<void(ScanOutcome outcome, const std::string& error)>;

/**
 * @class DiscoveryController
 * @brief Runs scans against a SessionTransport.
 *
 * Every scan gets its own CancellationToken and its own pair of threads:
 * one consuming the feed and one enforcing the timeout. Results are
 * guarded by a mutex and handed out as copies.
 *
 * Callbacks run without the controller lock held. They may read the
 * controller and may call startScan() or stopScan(), but must not call
 * dispose() or destroy the controller.
 *
 * Usage:
 * @code
 * DiscoveryController controller(transport);
 * controller.startScan(DiscoveryFilter::BOTH,
 *     [](const DiscoveryRecord& r) { std::cout << r.descriptor << "\n"; },
 *     [](ScanOutcome outcome, const std::string& error) { ... });
 * controller.waitForIdle(std::chrono::seconds(10));
 * @endcode
 */
class MESHSCOUT_CORE_API DiscoveryController {
public:
    explicit DiscoveryController(std::shared_ptr<SessionTransport> transport,
                                 ScanOptions options = {});

    /**
     * @brief Destructor - disposes the controller.
     */
    ~DiscoveryController();

    // Non-copyable
    DiscoveryController(const DiscoveryController&) = delete;
    DiscoveryController& operator=(const DiscoveryController&) = delete;

    /**
     * @brief Start a scan.
     * @return False, without touching results, if a scan is already in
     *         progress or the controller has been disposed. Also false
     *         if the scan threads could not be started; the scan is then
     *         reported as FAILED through lastOutcome() and lastError().
     */
    bool startScan(DiscoveryFilter filter,
                   RecordCallback onRecord = nullptr,
                   ScanCompleteCallback onComplete = nullptr);

    /**
     * @brief Cancel the running scan, if any.
     */
    void stopScan();

    /**
     * @brief Stop applying updates and release the feed.
     *
     * Blocks until the scan threads have exited. Idempotent.
     */
    void dispose();

    bool isScanning() const;
    ScanState state() const;
    const ScanOptions& options() const { return options_; }
    bool isDisposed() const;

    /// Records of the current (or last) scan in arrival order.
    std::vector<DiscoveryRecord> results() const;
    size_t resultCount() const;

    std::optional<std::string> lastError() const;
    std::optional<ScanOutcome> lastOutcome() const;

    /**
     * @brief Wait until no scan is in progress.
     * @return True if idle before @p timeout elapsed.
     */
    bool waitForIdle(std::chrono::milliseconds timeout) const;

private:
    struct Scan {
        uint64_t generation = 0;
        utils::CancellationTokenPtr token;
        RecordCallback onRecord;
        ScanCompleteCallback onComplete;
    };

    std::shared_ptr<SessionTransport> transport_;
    ScanOptions options_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;

    bool scanning_ = false;
    bool disposed_ = false;
    uint64_t generation_ = 0;      // Bumped by every startScan()
    std::shared_ptr<Scan> current_;
    std::vector<DiscoveryRecord> results_;
    std::optional<std::string> lastError_;
    std::optional<ScanOutcome> lastOutcome_;

    std::thread feedThread_;
    std::thread timerThread_;
    std::vector<std::thread> retired_;   // Threads that cannot join themselves

    // Thread functions
    void feedLoop(std::shared_ptr<Scan> scan, DiscoveryFilter filter);
    void timerLoop(std::shared_ptr<Scan> scan);

    // Append one record if the scan is still current
    bool applyRecord(const Scan& scan, std::string descriptor);

    // Leave SCANNING for the given scan; false if it no longer applies
    bool finishScan(const Scan& scan, ScanOutcome outcome, const std::string& error);

    // Run onComplete unless the controller has been disposed
    void notifyComplete(const Scan& scan, ScanOutcome outcome, const std::string& error);

    // @p scan was superseded or the controller disposed (lock held)
    bool isStale(const Scan& scan) const;

    // Join (or retire) the threads of a previous scan
    void releaseThreads(std::vector<std::thread>& pending);
};

}  // namespace core
}  // namespace meshscout
