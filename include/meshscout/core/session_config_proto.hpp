/**
 * @file session_config_proto.hpp
 * @brief Conversion of SessionConfig to its protobuf message.
 *
 * Kept apart from session_config.hpp so that only code talking to the
 * wire pulls in the generated protobuf headers.
 *
 * @copyright Copyright (c) 2024 meshscout Contributors
 * @license MIT License
 */

#pragma once

#include "meshscout/core/session_config.hpp"

#include "meshscout/proto/session_config.pb.h"

namespace meshscout {
namespace core {

/**
 * @brief Typed value of a custom entry: the JSON literal @p text denotes,
 * or @p text itself as a string when it is not one.
 */
MESHSCOUT_CORE_API google::protobuf::Value customValue(const std::string& text);

MESHSCOUT_CORE_API void fillProto(const SessionConfig& config,
                                  meshscout::config::SessionConfig* out);

}  // namespace core
}  // namespace meshscout
