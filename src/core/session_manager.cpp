/**
 * @file session_manager.cpp
 * @brief SessionManager implementation.
 *
 * @copyright Copyright (c) 2024 meshscout Contributors
 * @license MIT License
 */

#include "meshscout/core/session_manager.hpp"
#include "meshscout/utils/logger.hpp"

#include <system_error>

namespace meshscout {
namespace core {

const char* sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::CLOSED: return "CLOSED";
        case SessionState::OPENING: return "OPENING";
        case SessionState::OPEN: return "OPEN";
        case SessionState::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

SessionManager::SessionManager(std::shared_ptr<SessionTransport> transport)
    : transport_(std::move(transport))
{}

SessionManager::~SessionManager() {
    dispose();
}

bool SessionManager::openWithConfig(const SessionConfig& config,
                                    SessionSettledCallback onSettled) {
    std::vector<std::thread> pending;
    bool started = true;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            LOG_DEBUG("Session", "Ignoring open request: manager disposed");
            return false;
        }
        if (opening_) {
            LOG_DEBUG("Session", "Ignoring open request: attempt #{} in flight", attempts_);
            return false;
        }

        const SessionState previousState = state_;
        std::optional<std::string> previousError = error_;

        opening_ = true;
        abandoned_ = false;
        state_ = SessionState::OPENING;
        error_.reset();
        lastConfig_ = config;
        const uint64_t attempt = ++attempts_;

        if (openerThread_.joinable()) {
            pending.push_back(std::move(openerThread_));
        }
        for (auto& thread : retired_) {
            pending.push_back(std::move(thread));
        }
        retired_.clear();

        try {
            openerThread_ = std::thread(&SessionManager::openLoop, this,
                                        config, std::move(onSettled), attempt);

            LOG_INFO("Session", "Opening session #{} (mode {}, {} endpoint(s))",
                     attempt, sessionModeToString(config.mode()),
                     config.connectEndpoints().size());
        } catch (const std::system_error& e) {
            LOG_ERROR("Session", "Cannot start open #{}: {}", attempt, e.what());
            opening_ = false;
            state_ = previousState;
            error_ = std::move(previousError);
            started = false;
        }
    }
    cv_.notify_all();

    for (auto& thread : pending) {
        if (thread.get_id() == std::this_thread::get_id()) {
            std::lock_guard<std::mutex> lock(mutex_);
            retired_.push_back(std::move(thread));
        } else if (thread.joinable()) {
            thread.join();
        }
    }
    return started;
}

void SessionManager::closeSession() {
    std::unique_ptr<SessionHandle> handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (opening_) {
            if (!abandoned_) {
                abandoned_ = true;
                LOG_INFO("Session", "Close requested during open #{}; "
                         "the new session will be closed on arrival", attempts_);
            }
            return;
        }

        handle = std::move(session_);
        sessionId_.reset();
        error_.reset();
        state_ = SessionState::CLOSED;
    }
    cv_.notify_all();

    if (handle) {
        LOG_INFO("Session", "Closing session {}", handle->id());
        closeHandle(std::move(handle));
    }
}

void SessionManager::dispose() {
    std::unique_ptr<SessionHandle> handle;
    std::vector<std::thread> pending;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return;
        }
        disposed_ = true;
        handle = std::move(session_);
        sessionId_.reset();
        if (!opening_) {
            state_ = SessionState::CLOSED;
        }

        if (openerThread_.joinable()) {
            pending.push_back(std::move(openerThread_));
        }
        for (auto& thread : retired_) {
            pending.push_back(std::move(thread));
        }
        retired_.clear();
    }
    cv_.notify_all();

    if (handle) {
        LOG_INFO("Session", "Closing session {} on dispose", handle->id());
        closeHandle(std::move(handle));
    }

    for (auto& thread : pending) {
        if (thread.get_id() == std::this_thread::get_id()) {
            LOG_WARN("Session", "dispose() called from a settle callback; detaching opener");
            thread.detach();
        } else if (thread.joinable()) {
            thread.join();
        }
    }
}

SessionStatus SessionManager::currentStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return statusLocked();
}

SessionState SessionManager::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool SessionManager::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == SessionState::OPEN;
}

std::optional<std::string> SessionManager::sessionId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessionId_;
}

std::optional<SessionConfig> SessionManager::lastConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastConfig_;
}

bool SessionManager::waitUntilSettled(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return !opening_; });
}

SessionStatus SessionManager::statusLocked() const {
    SessionStatus status;
    status.state = state_;
    if (state_ == SessionState::OPEN) {
        status.session_id = sessionId_;
    }
    if (state_ == SessionState::ERROR) {
        status.error = error_;
    }
    return status;
}

void SessionManager::closeHandle(std::unique_ptr<SessionHandle> handle) {
    try {
        handle->close();
    } catch (const std::exception& e) {
        LOG_WARN("Session", "Error while closing session: {}", e.what());
    }
}

// =============================================================================
// Opener thread
// =============================================================================

void SessionManager::openLoop(SessionConfig config, SessionSettledCallback onSettled,
                              uint64_t attempt) {
    // Never hold two sessions at once
    std::unique_ptr<SessionHandle> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = std::move(session_);
        sessionId_.reset();
    }
    if (previous) {
        LOG_INFO("Session", "Closing session {} before reopening", previous->id());
        closeHandle(std::move(previous));
    }

    std::unique_ptr<SessionHandle> handle;
    std::string error;
    try {
        handle = transport_->openSession(config);
        if (!handle) {
            throw TransportError("transport returned no session");
        }
    } catch (const std::exception& e) {
        error = e.what();
    }

    std::unique_ptr<SessionHandle> discard;
    SessionStatus status;
    bool settled = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_ || abandoned_) {
            discard = std::move(handle);
            if (!discard) {
                opening_ = false;
                abandoned_ = false;
                state_ = SessionState::CLOSED;
            }
        } else if (handle) {
            session_ = std::move(handle);
            sessionId_ = session_->id();
            error_.reset();
            state_ = SessionState::OPEN;
            opening_ = false;
            settled = true;
            status = statusLocked();
        } else {
            error_ = error;
            state_ = SessionState::ERROR;
            opening_ = false;
            settled = true;
            status = statusLocked();
        }
    }

    if (discard) {
        LOG_INFO("Session", "Closing session {} from abandoned open #{}",
                 discard->id(), attempt);
        closeHandle(std::move(discard));

        std::lock_guard<std::mutex> lock(mutex_);
        opening_ = false;
        abandoned_ = false;
        state_ = SessionState::CLOSED;
    }
    cv_.notify_all();

    if (!settled) {
        if (!error.empty()) {
            LOG_DEBUG("Session", "Abandoned open #{} failed: {}", attempt, error);
        }
        return;
    }

    if (status.state == SessionState::OPEN) {
        LOG_INFO("Session", "Session #{} open with id {}", attempt, *status.session_id);
    } else {
        LOG_ERROR("Session", "Session #{} failed to open: {}", attempt, error);
    }

    if (onSettled) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (disposed_) {
                return;
            }
        }
        try {
            onSettled(status);
        } catch (const std::exception& e) {
            LOG_WARN("Session", "Settle callback for open #{} threw: {}", attempt, e.what());
        }
    }
}

}  // namespace core
}  // namespace meshscout
