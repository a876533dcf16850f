/**
 * @file errors.hpp
 * @brief Exception types raised by meshscout components and transports.
 *
 * @copyright Copyright (c) 2024 meshscout Contributors
 * @license MIT License
 */

#pragma once

#include <stdexcept>
#include <string>

namespace meshscout {
namespace core {

/**
 * @brief A transport failed to discover or to open a session.
 *
 * what() carries the transport's message unchanged; managers expose it
 * verbatim as the error of a failed scan or open.
 */
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief A session configuration was rejected before reaching a transport.
 */
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& message)
        : std::invalid_argument(message) {}
};

}  // namespace core
}  // namespace meshscout
