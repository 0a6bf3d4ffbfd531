#include "config_loader.hpp"
#include "libmodbus_transport.hpp"
#include "poll_coordinator.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {

std::atomic<bool> g_shutdown_requested(false);

/**
 * @brief Signal handler for graceful shutdown (e.g., on Ctrl+C).
 */
void signal_handler(int) {
    g_shutdown_requested = true;
}

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <profile.yaml> [--set key=value]..." << std::endl;
}

Value parseValue(const std::string& text) {
    if (text == "on" || text == "true") return true;
    if (text == "off" || text == "false") return false;
    return std::stod(text);
}

void printSnapshot(const Catalog& catalog, const Snapshot& snapshot) {
    for (const auto& entry : snapshot.values) {
        const RegisterDescriptor& d = catalog.lookup(entry.first);
        std::cout << "  " << std::left << std::setw(30) << d.name << " ";
        if (const bool* on = std::get_if<bool>(&entry.second)) {
            std::cout << (*on ? "on" : "off");
        } else {
            std::cout << std::get<double>(entry.second) << (d.unit.empty() ? "" : " ") << d.unit;
        }
        std::cout << std::endl;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::vector<std::pair<std::string, Value>> writes;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg != "--set" || i + 1 >= argc) {
            printUsage(argv[0]);
            return 1;
        }
        std::string assignment = argv[++i];
        auto eq = assignment.find('=');
        if (eq == std::string::npos || eq == 0) {
            std::cerr << "Expected key=value, got: " << assignment << std::endl;
            return 1;
        }
        try {
            writes.emplace_back(assignment.substr(0, eq), parseValue(assignment.substr(eq + 1)));
        } catch (const std::exception& e) {
            std::cerr << "Invalid value in " << assignment << ": " << e.what() << std::endl;
            return 1;
        }
    }

    // --- 1. Load Configuration ---
    std::cout << "Loading profile from: " << argv[1] << std::endl;
    Profile profile;
    try {
        profile = ConfigLoader::loadProfile(argv[1]);
    } catch (const std::exception& e) {
        std::cerr << "Error loading profile: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "Polling " << profile.catalog->size() << " registers on " << profile.config.host << ":"
              << profile.config.port << " (unit " << static_cast<int>(profile.config.unit_id) << ", "
              << (profile.config.read_only ? "read-only" : "write-enabled") << ")" << std::endl;

    // --- 2. Create the coordinator ---
    std::unique_ptr<PollCoordinator> coordinator;
    try {
        coordinator = std::make_unique<PollCoordinator>(profile.config, profile.catalog,
                                                        std::make_unique<LibmodbusTransport>(profile.config));
    } catch (const std::exception& e) {
        std::cerr << "Failed to set up Modbus client: " << e.what() << std::endl;
        return 1;
    }

    auto catalog = profile.catalog;
    coordinator->subscribe([catalog](const Notification& n) {
        switch (n.kind) {
            case NotificationKind::SnapshotUpdated:
                std::cout << "Snapshot #" << n.snapshot->sequence << (n.recovered ? " (recovered)" : "") << std::endl;
                printSnapshot(*catalog, *n.snapshot);
                break;
            case NotificationKind::PollFailed:
                std::cerr << "Poll failed (" << errorKindName(n.error) << "), serving snapshot #"
                          << n.snapshot->sequence << ", state " << connectionStateName(n.state) << std::endl;
                break;
            case NotificationKind::PersistentFailure:
                std::cerr << "Device unavailable after " << n.consecutive_failures << " failed cycles" << std::endl;
                break;
        }
    });

    // --- 3. First refresh, then requested writes ---
    OperationResult first = coordinator->pollNow();
    if (!first.ok()) {
        std::cerr << "First refresh failed, continuing: " << first.message << std::endl;
    }

    coordinator->start();

    for (const auto& w : writes) {
        OperationResult result = coordinator->write(w.first, w.second).get();
        if (result.ok()) {
            std::cout << "Set " << w.first << (result.message.empty() ? "" : " (" + result.message + ")") << std::endl;
        } else {
            std::cerr << "Set " << w.first << " failed: " << errorKindName(result.error) << ": " << result.message
                      << std::endl;
        }
    }

    // --- 4. Set up Signal Handler and Wait ---
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    std::cout << "\nPoller is running. Press Ctrl+C to exit." << std::endl;

    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "\nShutting down gracefully..." << std::endl;
    coordinator->stop();
    return 0;
}
