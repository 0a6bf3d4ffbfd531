#ifndef SIMULATION_ENGINE_H
#define SIMULATION_ENGINE_H

#include "register_bank.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <optional>
#include <memory>
#include <random>
#include <string>
#include <thread>

/**
 * @class SimulationEngine
 * @brief Moves the simulated heat pump's sensor registers over time.
 *
 * Float sensors wander around their starting value. When the catalog has the
 * Heliotherm keys, the supply temperature follows the target while the
 * compressor is enabled, and power readings drop to zero when it is not.
 */
class SimulationEngine {
public:
    SimulationEngine(std::shared_ptr<RegisterBank> bank, std::chrono::milliseconds update_interval);
    ~SimulationEngine();

    void start();
    void stop();

    /// @brief Advances the model by one step.
    void step();

private:
    void run();
    double wander(const std::string& key, double current);
    std::optional<double> number(const std::string& key);
    void set(const std::string& key, double value);

    std::shared_ptr<RegisterBank> bank;
    std::chrono::milliseconds update_interval;
    std::map<std::string, double> baseline;
    std::thread simulation_thread;
    std::atomic<bool> running;

    std::mt19937 rng;
};

#endif // SIMULATION_ENGINE_H
