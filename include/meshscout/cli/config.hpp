/**
 * @file config.hpp
 * @brief meshscout command-line configuration and argument parsing
 */

#pragma once

#include <meshscout/core/discovery_controller.hpp>
#include <meshscout/core/session_config.hpp>
#include <meshscout/utils/logger.hpp>
#include <meshscout/utils/string_utils.hpp>

#include <chrono>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace meshscout {
namespace cli {

inline constexpr const char* kDefaultConnectEndpoint = "tcp/localhost:7447";
inline constexpr int64_t kMaxScanTimeoutMs =
    std::chrono::duration_cast<std::chrono::milliseconds>(core::ScanOptions::kMaxTimeout).count();

/**
 * @brief CLI configuration structure
 */
struct Config {
    std::string command;                          ///< "config", "scout" or "open"
    std::string router_address = "localhost:7450";
    std::string what = "peer|router";
    int64_t scan_timeout_ms = 5000;

    // Session configuration fields
    std::string mode = "peer";
    std::vector<std::string> connect;             ///< Empty means kDefaultConnectEndpoint
    std::vector<std::string> listen;
    bool multicast = true;
    bool gossip = true;
    std::vector<std::pair<std::string, std::string>> custom;

    std::string log_level = "INFO";
    bool help = false;
    std::string error;                            ///< Set when parsing failed
};

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name) {
    std::cout << "meshscout - Mesh scouting and session tool\n\n"
              << "Usage: " << program_name << " [OPTIONS] <command>\n\n"
              << "Commands:\n"
              << "  config                Print the session config as JSON and as a builder chain\n"
              << "  scout                 Scout for peers and routers and list what answers\n"
              << "  open                  Open a session and hold it until interrupted\n"
              << "\nRouter Options:\n"
              << "  --router <host:port>  RouterService endpoint (default: localhost:7450)\n"
              << "  --what <filter>       peer, router or peer|router (default: peer|router)\n"
              << "  --scan-timeout <ms>   Scan duration, at most " << kMaxScanTimeoutMs
              << " (default: 5000)\n"
              << "\nSession Options:\n"
              << "  --mode <mode>         client, peer or router (default: peer)\n"
              << "  --connect <locator>   Endpoint to connect to, repeatable (default: "
              << kDefaultConnectEndpoint << ")\n"
              << "  --listen <locator>    Endpoint to listen on, repeatable\n"
              << "  --multicast <on|off>  Multicast scouting (default: on)\n"
              << "  --gossip <on|off>     Gossip scouting (default: on)\n"
              << "  --set <key=value>     Extra config entry, repeatable\n"
              << "\n  --log-level <level>   TRACE, DEBUG, INFO, WARN, ERROR, FATAL, OFF (default: INFO)\n"
              << "  --help                Show this help message\n\n"
              << "Example:\n"
              << "  " << program_name << " --what router --scan-timeout 3000 scout\n"
              << "  " << program_name << " --mode client --connect tcp/192.168.1.10:7447 open\n";
}

/**
 * @brief Parse "on"/"off" style switches
 */
inline bool parseSwitch(const std::string& text, bool& out) {
    const std::string value = utils::to_lower(utils::trim(text));
    if (value == "on" || value == "true" || value == "yes" || value == "1") {
        out = true;
        return true;
    }
    if (value == "off" || value == "false" || value == "no" || value == "0") {
        out = false;
        return true;
    }
    return false;
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration; on error help is set and error describes it
 */
inline Config parseArgs(int argc, char* argv[]) {
    Config config;

    auto fail = [&config](const std::string& message) {
        config.error = message;
        config.help = true;
        return config;
    };

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }

        // Positional: the command
        if (std::strncmp(arg, "-", 1) != 0) {
            if (!config.command.empty()) {
                return fail("Unexpected argument " + std::string(arg));
            }
            config.command = arg;
            continue;
        }

        // Options that require a value
        if (i + 1 >= argc) {
            return fail("Option " + std::string(arg) + " requires a value");
        }

        const std::string value = argv[++i];

        if (std::strcmp(arg, "--router") == 0) {
            config.router_address = value;
        } else if (std::strcmp(arg, "--what") == 0) {
            if (!core::parseDiscoveryFilter(value)) {
                return fail("Invalid filter '" + value + "'");
            }
            config.what = value;
        } else if (std::strcmp(arg, "--scan-timeout") == 0) {
            try {
                config.scan_timeout_ms = std::stoll(value);
            } catch (const std::exception&) {
                return fail("Invalid scan timeout '" + value + "'");
            }
            if (config.scan_timeout_ms <= 0) {
                return fail("Scan timeout must be positive");
            }
            if (config.scan_timeout_ms > kMaxScanTimeoutMs) {
                return fail("Scan timeout must not exceed " +
                            std::to_string(kMaxScanTimeoutMs) + " ms");
            }
        } else if (std::strcmp(arg, "--mode") == 0) {
            if (!core::parseSessionMode(value)) {
                return fail("Invalid mode '" + value + "'");
            }
            config.mode = value;
        } else if (std::strcmp(arg, "--connect") == 0) {
            config.connect.push_back(value);
        } else if (std::strcmp(arg, "--listen") == 0) {
            config.listen.push_back(value);
        } else if (std::strcmp(arg, "--multicast") == 0) {
            if (!parseSwitch(value, config.multicast)) {
                return fail("Invalid value '" + value + "' for --multicast");
            }
        } else if (std::strcmp(arg, "--gossip") == 0) {
            if (!parseSwitch(value, config.gossip)) {
                return fail("Invalid value '" + value + "' for --gossip");
            }
        } else if (std::strcmp(arg, "--set") == 0) {
            auto entry = utils::split_pair(value, '=');
            if (!entry) {
                return fail("Expected key=value for --set, got '" + value + "'");
            }
            config.custom.push_back(std::move(*entry));
        } else if (std::strcmp(arg, "--log-level") == 0) {
            if (!utils::parseLogLevel(value)) {
                return fail("Invalid log level '" + value + "'");
            }
            config.log_level = value;
        } else {
            return fail("Unknown option " + std::string(arg));
        }
    }

    if (config.command.empty()) {
        return fail("No command given");
    }
    if (config.command != "config" && config.command != "scout" && config.command != "open") {
        return fail("Unknown command '" + config.command + "'");
    }

    return config;
}

/**
 * @brief Load the session fields of a parsed configuration into a builder
 */
inline core::ConfigBuilder toBuilder(const Config& config) {
    core::ConfigBuilder builder;
    builder.mode(core::parseSessionMode(config.mode).value_or(core::SessionMode::PEER))
           .listen(config.listen)
           .multicastScouting(config.multicast)
           .gossipScouting(config.gossip);

    if (config.connect.empty()) {
        builder.addConnect(kDefaultConnectEndpoint);
    } else {
        builder.connect(config.connect);
    }

    for (const auto& [key, value] : config.custom) {
        builder.custom(key, value);
    }
    return builder;
}

}  // namespace cli
}  // namespace meshscout
