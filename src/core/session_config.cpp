/**
 * @file session_config.cpp
 * @brief SessionConfig, ConfigBuilder and their renderings.
 *
 * @copyright Copyright (c) 2024 meshscout Contributors
 * @license MIT License
 */

#include "meshscout/core/session_config.hpp"
#include "meshscout/core/session_config_proto.hpp"
#include "meshscout/core/errors.hpp"
#include "meshscout/utils/string_utils.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <sstream>

namespace meshscout {
namespace core {

namespace {

std::string quotedList(const std::vector<std::string>& items) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << "'" << items[i] << "'";
    }
    oss << "]";
    return oss.str();
}

std::vector<std::string> trimmedEndpoints(const std::vector<std::string>& endpoints,
                                          const char* kind) {
    std::vector<std::string> result;
    result.reserve(endpoints.size());
    for (size_t i = 0; i < endpoints.size(); ++i) {
        std::string endpoint = utils::trim(endpoints[i]);
        if (endpoint.empty()) {
            throw ConfigError(std::string(kind) + " endpoint #" +
                              std::to_string(i + 1) + " is blank");
        }
        result.push_back(std::move(endpoint));
    }
    return result;
}

}  // namespace

google::protobuf::Value customValue(const std::string& text) {
    google::protobuf::Value value;
    if (!google::protobuf::util::JsonStringToMessage(text, &value).ok()) {
        value.Clear();
        value.set_string_value(text);
    }
    return value;
}

const char* sessionModeToString(SessionMode mode) {
    switch (mode) {
        case SessionMode::CLIENT: return "client";
        case SessionMode::PEER: return "peer";
        case SessionMode::ROUTER: return "router";
    }
    return "unknown";
}

std::optional<SessionMode> parseSessionMode(const std::string& text) {
    const std::string mode = utils::to_lower(utils::trim(text));
    if (mode == "client") return SessionMode::CLIENT;
    if (mode == "peer") return SessionMode::PEER;
    if (mode == "router") return SessionMode::ROUTER;
    return std::nullopt;
}

// =============================================================================
// SessionConfig
// =============================================================================

SessionConfig::SessionConfig(SessionMode mode,
                             std::vector<std::string> connect,
                             std::vector<std::string> listen,
                             bool multicastScouting,
                             bool gossipScouting,
                             CustomEntries custom)
    : mode_(mode)
    , connect_(std::move(connect))
    , listen_(std::move(listen))
    , multicastScouting_(multicastScouting)
    , gossipScouting_(gossipScouting)
    , custom_(std::move(custom))
{}

void fillProto(const SessionConfig& config, meshscout::config::SessionConfig* out) {
    out->Clear();
    out->set_mode(sessionModeToString(config.mode()));

    for (const auto& endpoint : config.connectEndpoints()) {
        out->mutable_connect()->add_endpoints(endpoint);
    }
    for (const auto& endpoint : config.listenEndpoints()) {
        out->mutable_listen()->add_endpoints(endpoint);
    }

    auto* scouting = out->mutable_scouting();
    scouting->mutable_multicast()->set_enabled(config.multicastScouting());
    scouting->mutable_gossip()->set_enabled(config.gossipScouting());

    for (const auto& [key, value] : config.customEntries()) {
        (*out->mutable_custom())[key] = customValue(value);
    }
}

std::string SessionConfig::toJson() const {
    meshscout::config::SessionConfig message;
    fillProto(*this, &message);

    google::protobuf::util::JsonPrintOptions options;
    options.preserve_proto_field_names = true;

    std::string json;
    auto status = google::protobuf::util::MessageToJsonString(message, &json, options);
    if (!status.ok()) {
        throw ConfigError("cannot render config as JSON: " + status.ToString());
    }
    return json;
}

std::string SessionConfig::describe() const {
    std::ostringstream oss;
    oss << "ConfigBuilder()\n"
        << "  .mode('" << sessionModeToString(mode_) << "')\n"
        << "  .connect(" << quotedList(connect_) << ")\n";
    if (!listen_.empty()) {
        oss << "  .listen(" << quotedList(listen_) << ")\n";
    }
    oss << "  .multicastScouting(" << (multicastScouting_ ? "true" : "false") << ")\n"
        << "  .gossipScouting(" << (gossipScouting_ ? "true" : "false") << ")";
    for (const auto& [key, value] : custom_) {
        const auto typed = customValue(value);
        oss << "\n  .custom('" << key << "', ";
        if (typed.kind_case() == google::protobuf::Value::kStringValue) {
            oss << "'" << typed.string_value() << "'";
        } else {
            oss << utils::trim(value);
        }
        oss << ")";
    }
    return oss.str();
}

// =============================================================================
// ConfigBuilder
// =============================================================================

ConfigBuilder& ConfigBuilder::mode(SessionMode mode) {
    mode_ = mode;
    return *this;
}

ConfigBuilder& ConfigBuilder::connect(std::vector<std::string> endpoints) {
    connect_ = std::move(endpoints);
    return *this;
}

ConfigBuilder& ConfigBuilder::addConnect(std::string endpoint) {
    connect_.push_back(std::move(endpoint));
    return *this;
}

ConfigBuilder& ConfigBuilder::listen(std::vector<std::string> endpoints) {
    listen_ = std::move(endpoints);
    return *this;
}

ConfigBuilder& ConfigBuilder::multicastScouting(bool enabled) {
    multicastScouting_ = enabled;
    return *this;
}

ConfigBuilder& ConfigBuilder::gossipScouting(bool enabled) {
    gossipScouting_ = enabled;
    return *this;
}

ConfigBuilder& ConfigBuilder::custom(const std::string& key, std::string value) {
    auto it = std::find_if(custom_.begin(), custom_.end(),
                           [&key](const auto& entry) { return entry.first == key; });
    if (it != custom_.end()) {
        it->second = std::move(value);
    } else {
        custom_.emplace_back(key, std::move(value));
    }
    return *this;
}

ConfigBuilder& ConfigBuilder::reset() {
    *this = ConfigBuilder();
    return *this;
}

SessionConfig ConfigBuilder::build() const {
    if (connect_.empty()) {
        throw ConfigError("at least one connect endpoint is required");
    }

    auto connect = trimmedEndpoints(connect_, "connect");
    auto listen = trimmedEndpoints(listen_, "listen");

    for (const auto& entry : custom_) {
        if (utils::is_blank(entry.first)) {
            throw ConfigError("custom config key must not be empty");
        }
    }

    return SessionConfig(mode_, std::move(connect), std::move(listen),
                         multicastScouting_, gossipScouting_, custom_);
}

SessionConfig buildConfig(SessionMode mode,
                          const std::vector<std::string>& endpoints,
                          bool multicastScouting,
                          bool gossipScouting) {
    return ConfigBuilder()
        .mode(mode)
        .connect(endpoints)
        .multicastScouting(multicastScouting)
        .gossipScouting(gossipScouting)
        .build();
}

}  // namespace core
}  // namespace meshscout
