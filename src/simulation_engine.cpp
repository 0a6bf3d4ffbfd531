#include "simulation_engine.hpp"
#include "modbus_error.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

SimulationEngine::SimulationEngine(std::shared_ptr<RegisterBank> registers, std::chrono::milliseconds interval)
    : bank(std::move(registers)), update_interval(interval), running(false) {
    for (const auto& entry : bank->catalog().all()) {
        const RegisterDescriptor& d = entry.second;
        if (d.access == RegisterAccess::ReadOnly && d.type == DataType::Float32) {
            baseline[entry.first] = number(entry.first).value_or(0.0);
        }
    }

    std::random_device rd;
    rng.seed(rd());
}

SimulationEngine::~SimulationEngine() {
    stop();
}

void SimulationEngine::start() {
    if (running) return;
    running = true;
    simulation_thread = std::thread(&SimulationEngine::run, this);
}

void SimulationEngine::stop() {
    if (!running) return;
    running = false;
    if (simulation_thread.joinable()) {
        simulation_thread.join();
    }
}

void SimulationEngine::run() {
    std::cout << "Simulation thread started." << std::endl;
    while (running) {
        auto start_time = std::chrono::steady_clock::now();

        step();

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time);
        auto sleep_duration = update_interval - elapsed;
        if (sleep_duration.count() > 0) {
            std::this_thread::sleep_for(sleep_duration);
        }
    }
    std::cout << "Simulation thread stopped." << std::endl;
}

std::optional<double> SimulationEngine::number(const std::string& key) {
    auto v = bank->value(key);
    if (!v) return std::nullopt;
    if (const bool* b = std::get_if<bool>(&*v)) return *b ? 1.0 : 0.0;
    return std::get<double>(*v);
}

void SimulationEngine::set(const std::string& key, double value) {
    try {
        bank->setValue(key, value);
    } catch (const ModbusError& e) {
        std::cerr << "Simulation could not update " << key << ": " << e.what() << std::endl;
    }
}

double SimulationEngine::wander(const std::string& key, double current) {
    double base = baseline[key];
    double spread = std::max(0.5, std::fabs(base) * 0.05);
    std::normal_distribution<> noise(0.0, spread * 0.1);
    double next = current + noise(rng);
    // Pull back towards the baseline so values stay plausible.
    next += (base - next) * 0.1;
    return next;
}

void SimulationEngine::step() {
    bool compressor_on = number("compressor_enable").value_or(1.0) != 0.0;

    for (const auto& entry : baseline) {
        const std::string& key = entry.first;
        double current = number(key).value_or(entry.second);

        if (!compressor_on && (key == "power_output" || key == "compressor_power_input")) {
            set(key, 0.0);
            continue;
        }
        if (key == "supply_temperature") {
            auto target = number("target_supply_temperature");
            if (compressor_on && target && *target > 0.0) {
                baseline[key] = *target;
            }
        }
        set(key, wander(key, current));
    }

    auto power = number("power_output");
    auto input = number("compressor_power_input");
    if (power && input && *input > 0.01 && bank->catalog().contains("coefficient_of_performance")) {
        set("coefficient_of_performance", *power / *input);
    }
}
