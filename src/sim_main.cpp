#include "config_loader.hpp"
#include "modbus_server.hpp"
#include "register_bank.hpp"
#include "simulation_engine.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_shutdown_requested(false);

void signal_handler(int) {
    g_shutdown_requested = true;
}

// Plausible start values for the built-in catalog.
const std::map<std::string, double> kHeliothermStartValues = {
    {"supply_temperature", 35.0},        {"return_temperature", 30.0},     {"setpoint_temperature", 21.5},
    {"outside_temperature", 6.0},        {"pump_status", 1.0},             {"operating_mode", 0.0},
    {"system_pressure", 2.5},            {"power_output", 8.5},            {"coefficient_of_performance", 4.0},
    {"compressor_power_input", 2.1},     {"flow_rate", 18.0},              {"operating_hours", 1234.0},
    {"circulation_pump", 1.0},           {"compressor_enable", 1.0},       {"target_supply_temperature", 35.0},
    {"target_room_temperature", 21.0},   {"target_dhw_temperature", 50.0}, {"compressor_frequency_target", 60.0},
    {"max_pressure_setpoint", 3.0},      {"min_pressure_setpoint", 1.0},
};

} // namespace

int main(int argc, char* argv[]) {
    // --- 1. Load Configuration ---
    Profile profile;
    try {
        if (argc > 1) {
            std::cout << "Loading profile from: " << argv[1] << std::endl;
            profile = ConfigLoader::loadProfile(argv[1]);
        } else {
            profile.config.host = "127.0.0.1";
            profile.catalog = Catalog::heliothermDefaults();
        }
    } catch (const std::exception& e) {
        std::cerr << "Error loading profile: " << e.what() << std::endl;
        return 1;
    }

    int port = 1502; // Use a non-privileged port
    if (argc > 2) {
        try {
            port = std::stoi(argv[2]);
        } catch (const std::exception& e) {
            std::cerr << "Invalid port " << argv[2] << ": " << e.what() << std::endl;
            return 1;
        }
    }

    // --- 2. Initialize the register image ---
    auto bank = std::make_shared<RegisterBank>(profile.catalog);
    bank->seed(profile.catalog == Catalog::heliothermDefaults() ? kHeliothermStartValues : profile.initial_values);
    std::cout << "Register image initialized with " << profile.catalog->size() << " registers." << std::endl;

    // --- 3. Start the simulation and the server ---
    SimulationEngine engine(bank, std::chrono::milliseconds(1000));
    engine.start();

    ModbusServer server(bank, profile.config.unit_id);
    if (!server.start("0.0.0.0", port)) {
        std::cerr << "Failed to start Modbus server." << std::endl;
        engine.stop();
        return 1;
    }
    std::cout << "Modbus TCP server started on port " << port << "." << std::endl;

    // --- 4. Set up Signal Handler and Wait ---
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    std::cout << "\nSimulator is running. Press Ctrl+C to exit." << std::endl;

    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "\nShutting down gracefully..." << std::endl;
    server.stop();
    engine.stop();
    return 0;
}
