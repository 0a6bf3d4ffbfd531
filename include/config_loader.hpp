#ifndef CONFIG_LOADER_H
#define CONFIG_LOADER_H

#include "heat_pump_types.hpp"
#include "register_catalog.hpp"
#include <map>
#include <memory>
#include <string>

/**
 * @struct Profile
 * @brief Everything needed to poll one device.
 */
struct Profile {
    PollerConfig config;
    std::shared_ptr<const Catalog> catalog;
    std::map<std::string, double> initial_values; ///< Optional per-register start values for the simulator
};

/**
 * @class ConfigLoader
 * @brief Parses the YAML device profile.
 *
 * This class uses the yaml-cpp library to read the connection options and,
 * optionally, the register table. Without a `registers` list the built-in
 * Heliotherm catalog is used.
 */
class ConfigLoader {
public:
    /**
     * @brief Loads and parses the YAML profile.
     * @param filename The path to the YAML file.
     * @return A Profile populated with data from the file.
     * @throw std::runtime_error if the file cannot be opened, parsed or validated.
     */
    static Profile loadProfile(const std::string& filename);

    /**
     * @brief Parses a YAML profile held in memory.
     * @throw std::runtime_error if the text cannot be parsed or validated.
     */
    static Profile parseProfile(const std::string& yaml);
};

#endif // CONFIG_LOADER_H
