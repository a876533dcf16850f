/**
 * @file session_manager.hpp
 * @brief Owns at most one live session and tracks its lifecycle.
 *
 * @copyright Copyright (c) 2024 meshscout Contributors
 * @license MIT License
 */

#pragma once

#include "meshscout/export.hpp"
#include "meshscout/core/session_config.hpp"
#include "meshscout/core/transport.hpp"

#include <chrono>
#include <condition_variable>
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
 * @enum SessionState
 * @brief Lifecycle state of the managed session.
 */
enum class SessionState {
    CLOSED,
    OPENING,
    OPEN,
    ERROR
};

MESHSCOUT_CORE_API const char* sessionStateToString(SessionState state);

/**
 * @struct SessionStatus
 * @brief Snapshot returned by SessionManager::currentStatus().
 */
struct SessionStatus {
    SessionState state = SessionState::CLOSED;
    std::optional<std::string> session_id;   ///< Set only when OPEN
    std::optional<std::string> error;        ///< Set only when ERROR
};

using SessionSettledCallback = std::function<void(const SessionStatus& status)>;

/**
 * @class SessionManager
 * @brief Opens, replaces and closes a single session.
 *
 * openWithConfig() returns immediately; the transport call runs on an
 * opener thread. Opening while a session is owned closes that session
 * first, so two sessions are never held at once. A failed open leaves
 * the manager in ERROR with the transport's message and can be retried
 * directly.
 *
 * Calling closeSession() while an open is in flight marks the open as
 * abandoned: the session it produces is closed on arrival.
 */
class MESHSCOUT_CORE_API SessionManager {
public:
    explicit SessionManager(std::shared_ptr<SessionTransport> transport);

    /**
     * @brief Destructor - disposes the manager.
     */
    ~SessionManager();

    // Non-copyable
    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /**
     * @brief Start opening a session with @p config.
     * @param onSettled Called on the opener thread once the open has
     *        succeeded or failed (not called for abandoned opens).
     * @return False if an open is already in flight, the manager has
     *         been disposed, or the opener thread could not be started.
     */
    bool openWithConfig(const SessionConfig& config,
                        SessionSettledCallback onSettled = nullptr);

    /**
     * @brief Close the owned session. Safe to call in any state.
     */
    void closeSession();

    /**
     * @brief Close everything and wait for the opener thread.
     *
     * Must not be called from an onSettled callback. Idempotent.
     */
    void dispose();

    SessionStatus currentStatus() const;
    SessionState state() const;
    bool isOpen() const;
    std::optional<std::string> sessionId() const;

    /// Config the current (or last attempted) session was opened with.
    std::optional<SessionConfig> lastConfig() const;

    /**
     * @brief Wait until no open is in flight.
     * @return True if settled before @p timeout elapsed.
     */
    bool waitUntilSettled(std::chrono::milliseconds timeout) const;

private:
    std::shared_ptr<SessionTransport> transport_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;

    SessionState state_ = SessionState::CLOSED;
    std::unique_ptr<SessionHandle> session_;
    std::optional<std::string> sessionId_;
    std::optional<std::string> error_;
    std::optional<SessionConfig> lastConfig_;

    bool opening_ = false;
    bool abandoned_ = false;    // closeSession() during an open
    bool disposed_ = false;
    uint64_t attempts_ = 0;

    std::thread openerThread_;
    std::vector<std::thread> retired_;   // Threads that cannot join themselves

    void openLoop(SessionConfig config, SessionSettledCallback onSettled, uint64_t attempt);

    SessionStatus statusLocked() const;

    static void closeHandle(std::unique_ptr<SessionHandle> handle);
};

}  // namespace core
}  // namespace meshscout
