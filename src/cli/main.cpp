/**
 * @file main.cpp
 * @brief meshscout command-line entry point
 *
 * Thin executable wiring the library components together:
 * - config: render the session configuration
 * - scout:  DiscoveryController over the gRPC router transport
 * - open:   SessionManager holding one session until interrupted
 */

#include <meshscout/cli/config.hpp>
#include <meshscout/core/discovery_controller.hpp>
#include <meshscout/core/errors.hpp>
#include <meshscout/core/session_manager.hpp>
#include <meshscout/transport/grpc_transport.hpp>
#include <meshscout/utils/logger.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>

using namespace meshscout;
using namespace meshscout::cli;

// Global shutdown flag
static std::atomic<bool> g_shutdown{false};

// Signal handler
void signalHandler(int /*signal*/) {
    g_shutdown.store(true);
}

namespace {

std::string clockTime(std::chrono::system_clock::time_point when) {
    auto time_t_when = std::chrono::system_clock::to_time_t(when);
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_when);
#else
    localtime_r(&time_t_when, &tm_buf);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S");
    return oss.str();
}

int runScout(const Config& config, std::shared_ptr<core::SessionTransport> transport) {
    const auto filter = core::parseDiscoveryFilter(config.what).value_or(core::DiscoveryFilter::BOTH);

    core::ScanOptions options;
    options.timeout = std::chrono::milliseconds(config.scan_timeout_ms);
    core::DiscoveryController controller(std::move(transport), options);

    std::mutex outputMutex;
    bool started = controller.startScan(
        filter,
        [&outputMutex](const core::DiscoveryRecord& record) {
            std::lock_guard<std::mutex> lock(outputMutex);
            std::cout << "Node #" << record.sequence << " discovered at "
                      << clockTime(record.discovered_at) << "\n"
                      << "  " << record.descriptor << "\n";
        });
    if (!started) {
        std::cerr << "Error: could not start scan\n";
        return 1;
    }

    std::cout << "Scouting for " << core::filterExpression(filter) << " ("
              << config.scan_timeout_ms << " ms)...\n";

    while (!controller.waitForIdle(std::chrono::milliseconds(100))) {
        if (g_shutdown.load()) {
            controller.stopScan();
        }
    }

    const auto outcome = controller.lastOutcome();
    if (outcome == core::ScanOutcome::FAILED) {
        std::cerr << "Scan failed: " << controller.lastError().value_or("unknown error") << "\n";
        return 1;
    }

    std::lock_guard<std::mutex> lock(outputMutex);
    std::cout << "Found " << controller.resultCount() << " node(s)";
    if (outcome == core::ScanOutcome::CANCELLED) {
        std::cout << " before the scan was cancelled";
    }
    std::cout << "\n";
    return 0;
}

int runOpen(const core::SessionConfig& sessionConfig,
            std::shared_ptr<core::SessionTransport> transport) {
    core::SessionManager manager(std::move(transport));

    std::cout << "Opening session...\n";
    if (!manager.openWithConfig(sessionConfig)) {
        std::cerr << "Error: could not start opening the session\n";
        return 1;
    }

    while (!manager.waitUntilSettled(std::chrono::milliseconds(100))) {
        if (g_shutdown.load()) {
            manager.closeSession();
        }
    }

    const auto status = manager.currentStatus();
    if (status.state == core::SessionState::ERROR) {
        std::cerr << "Failed to open session: " << status.error.value_or("unknown error") << "\n";
        return 1;
    }
    if (status.state != core::SessionState::OPEN) {
        std::cout << "Session closed\n";
        return 0;
    }

    std::cout << "Session open: " << status.session_id.value_or("") << "\n"
              << "Press Ctrl+C to close it\n";

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    manager.closeSession();
    std::cout << "Session closed\n";
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse command line arguments
    Config config = parseArgs(argc, argv);

    if (config.help) {
        if (!config.error.empty()) {
            std::cerr << "Error: " << config.error << "\n\n";
        }
        printUsage(argv[0]);
        return config.error.empty() ? 0 : 1;
    }

    // Configure logging
    utils::Logger::instance().setLevel(
        utils::parseLogLevel(config.log_level).value_or(utils::LogLevel::INFO));

    // Install signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        const core::SessionConfig sessionConfig = toBuilder(config).build();

        if (config.command == "config") {
            std::cout << sessionConfig.toJson() << "\n\n"
                      << sessionConfig.describe() << "\n";
            return 0;
        }

        transport::GrpcTransportOptions options;
        options.router_address = config.router_address;
        auto transport = std::make_shared<transport::GrpcSessionTransport>(options);

        LOG_DEBUG("Main", "Using router {}", config.router_address);

        if (config.command == "scout") {
            return runScout(config, transport);
        }
        return runOpen(sessionConfig, transport);

    } catch (const core::ConfigError& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        LOG_FATAL("Main", "Fatal error: {}", e.what());
        return 1;
    }
}
