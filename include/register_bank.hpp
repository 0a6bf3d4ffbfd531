#ifndef REGISTER_BANK_H
#define REGISTER_BANK_H

#include "heat_pump_types.hpp"
#include "register_catalog.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @class RegisterBank
 * @brief Thread-safe holding-register image of a simulated heat-pump controller.
 *
 * Only addresses covered by the catalog exist. Words start at zero; initial
 * display values can be applied with setValue().
 */
class RegisterBank {
public:
    explicit RegisterBank(std::shared_ptr<const Catalog> catalog);

    /**
     * @brief Copies count words starting at address.
     * @return False if any address in the range is unmapped.
     */
    bool readWords(uint16_t address, uint16_t count, std::vector<uint16_t>& out);

    /**
     * @brief Stores words as a Modbus client write would.
     * @return False if any address is unmapped or belongs to a read-only register.
     */
    bool writeWords(uint16_t address, const std::vector<uint16_t>& words);

    /**
     * @brief Sets a register from the device side, ignoring its access mode.
     * @throw ModbusError for an unknown key or a value the codec rejects.
     */
    void setValue(const std::string& key, const Value& value);

    /// @brief Applies a set of initial values, logging and skipping the ones the codec rejects.
    void seed(const std::map<std::string, double>& values);

    std::optional<Value> value(const std::string& key);
    std::optional<uint16_t> word(uint16_t address);

    const Catalog& catalog() const { return *registers; }

private:
    std::mutex data_mutex;
    std::shared_ptr<const Catalog> registers;
    std::unordered_map<uint16_t, uint16_t> words;
    std::unordered_map<uint16_t, const RegisterDescriptor*> owners;
};

#endif // REGISTER_BANK_H
