/**
 * @file session_config.hpp
 * @brief Immutable session configuration and the builder that produces it.
 *
 * UI or CLI code keeps its editable fields in a ConfigBuilder and takes a
 * SessionConfig snapshot at the moment a session is opened. Snapshots
 * are plain values: later edits to the builder never reach them.
 *
 * @copyright Copyright (c) 2024 meshscout Contributors
 * @license MIT License
 */

#pragma once

#include "meshscout/export.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace meshscout {
namespace core {

/**
 * @enum SessionMode
 * @brief Topology role a session takes in the mesh.
 */
enum class SessionMode {
    CLIENT,
    PEER,
    ROUTER
};

MESHSCOUT_CORE_API const char* sessionModeToString(SessionMode mode);

/**
 * @brief Parse "client", "peer" or "router" (case-insensitive).
 */
MESHSCOUT_CORE_API std::optional<SessionMode> parseSessionMode(const std::string& text);

/**
 * @class SessionConfig
 * @brief Snapshot of connection parameters handed to a transport.
 *
 * Only ConfigBuilder::build() creates instances; there are no setters.
 */
class MESHSCOUT_CORE_API SessionConfig {
public:
    /// Extra keys in insertion order (key, value).
    using CustomEntries = std::vector<std::pair<std::string, std::string>>;

    SessionMode mode() const { return mode_; }
    const std::vector<std::string>& connectEndpoints() const { return connect_; }
    const std::vector<std::string>& listenEndpoints() const { return listen_; }
    bool multicastScouting() const { return multicastScouting_; }
    bool gossipScouting() const { return gossipScouting_; }
    const CustomEntries& customEntries() const { return custom_; }

    /**
     * @brief Render as JSON, e.g.
     * `{"mode":"peer","connect":{"endpoints":["tcp/localhost:7447"]},
     *   "scouting":{"multicast":{"enabled":true},"gossip":{"enabled":true}}}`.
     *
     * `listen` and `custom` only appear when non-empty. Custom keys
     * follow protobuf map order, which may differ from describe().
     * @throws ConfigError if the protobuf JSON printer fails.
     */
    std::string toJson() const;

    /**
     * @brief Render the builder chain that reproduces this config.
     */
    std::string describe() const;

    bool operator==(const SessionConfig& other) const = default;

private:
    friend class ConfigBuilder;

    SessionConfig(SessionMode mode,
                  std::vector<std::string> connect,
                  std::vector<std::string> listen,
                  bool multicastScouting,
                  bool gossipScouting,
                  CustomEntries custom);

    SessionMode mode_;
    std::vector<std::string> connect_;
    std::vector<std::string> listen_;
    bool multicastScouting_;
    bool gossipScouting_;
    CustomEntries custom_;
};

/**
 * @class ConfigBuilder
 * @brief Mutable accumulator for SessionConfig fields.
 *
 * Usage:
 * @code
 * SessionConfig config = ConfigBuilder()
 *     .mode(SessionMode::CLIENT)
 *     .connect({"tcp/192.168.1.10:7447"})
 *     .multicastScouting(false)
 *     .build();
 * @endcode
 *
 * Defaults: PEER mode, no endpoints, multicast and gossip scouting on.
 */
class MESHSCOUT_CORE_API ConfigBuilder {
public:
    ConfigBuilder() = default;

    ConfigBuilder& mode(SessionMode mode);

    /// Replace the connect endpoints.
    ConfigBuilder& connect(std::vector<std::string> endpoints);
    ConfigBuilder& addConnect(std::string endpoint);

    /// Replace the listen endpoints.
    ConfigBuilder& listen(std::vector<std::string> endpoints);

    ConfigBuilder& multicastScouting(bool enabled);
    ConfigBuilder& gossipScouting(bool enabled);

    /**
     * @brief Set a custom key; an existing key keeps its position.
     *
     * @p value is sent as a typed value when it is a JSON literal
     * (`true`, `10000`, `[1,2]`, `"quoted"`); any other text is sent as a
     * plain string.
     */
    ConfigBuilder& custom(const std::string& key, std::string value);

    /// Back to the defaults.
    ConfigBuilder& reset();

    SessionMode currentMode() const { return mode_; }
    const std::vector<std::string>& currentConnect() const { return connect_; }

    /**
     * @brief Snapshot the current fields.
     *
     * Endpoints are trimmed. Fails when there is no connect endpoint,
     * when an endpoint is blank, or when a custom key is empty.
     * @throws ConfigError describing the first problem found.
     */
    SessionConfig build() const;

private:
    SessionMode mode_ = SessionMode::PEER;
    std::vector<std::string> connect_;
    std::vector<std::string> listen_;
    bool multicastScouting_ = true;
    bool gossipScouting_ = true;
    SessionConfig::CustomEntries custom_;
};

/**
 * @brief Build a config from the four fields a session screen edits.
 * @throws ConfigError as ConfigBuilder::build().
 */
MESHSCOUT_CORE_API SessionConfig buildConfig(SessionMode mode,
                                             const std::vector<std::string>& endpoints,
                                             bool multicastScouting,
                                             bool gossipScouting);

}  // namespace core
}  // namespace meshscout
