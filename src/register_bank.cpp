#include "register_bank.hpp"
#include "modbus_error.hpp"
#include "value_codec.hpp"
#include <iostream>

RegisterBank::RegisterBank(std::shared_ptr<const Catalog> catalog) : registers(std::move(catalog)) {
    for (const auto& entry : registers->all()) {
        const RegisterDescriptor& d = entry.second;
        for (uint16_t i = 0; i < d.word_count; ++i) {
            words[static_cast<uint16_t>(d.address + i)] = 0;
            owners[static_cast<uint16_t>(d.address + i)] = &d;
        }
    }
}

bool RegisterBank::readWords(uint16_t address, uint16_t count, std::vector<uint16_t>& out) {
    std::lock_guard<std::mutex> lock(data_mutex);
    std::vector<uint16_t> result;
    result.reserve(count);
    for (uint32_t a = address; a < static_cast<uint32_t>(address) + count; ++a) {
        auto it = words.find(static_cast<uint16_t>(a));
        if (it == words.end()) {
            return false;
        }
        result.push_back(it->second);
    }
    out.swap(result);
    return true;
}

bool RegisterBank::writeWords(uint16_t address, const std::vector<uint16_t>& values) {
    std::lock_guard<std::mutex> lock(data_mutex);

    // Validate the whole range before touching anything.
    for (uint32_t i = 0; i < values.size(); ++i) {
        auto it = owners.find(static_cast<uint16_t>(address + i));
        if (it == owners.end()) {
            std::cerr << "Warning: Write to unmapped address 0x" << std::hex << (address + i) << std::dec << std::endl;
            return false;
        }
        if (it->second->access == RegisterAccess::ReadOnly) {
            std::cerr << "Warning: Denied write to read-only register 0x" << std::hex << it->second->address
                      << std::dec << std::endl;
            return false;
        }
    }
    for (uint32_t i = 0; i < values.size(); ++i) {
        words[static_cast<uint16_t>(address + i)] = values[i];
    }
    return true;
}

void RegisterBank::setValue(const std::string& key, const Value& value) {
    const RegisterDescriptor& d = registers->lookup(key);
    std::vector<uint16_t> encoded = ValueCodec::encode(value, d);

    std::lock_guard<std::mutex> lock(data_mutex);
    for (uint16_t i = 0; i < d.word_count; ++i) {
        words[static_cast<uint16_t>(d.address + i)] = encoded[i];
    }
}

void RegisterBank::seed(const std::map<std::string, double>& values) {
    for (const auto& entry : values) {
        try {
            setValue(entry.first, entry.second);
        } catch (const ModbusError& e) {
            std::cerr << "Skipping initial value for " << entry.first << ": " << e.what() << std::endl;
        }
    }
}

std::optional<Value> RegisterBank::value(const std::string& key) {
    auto d = registers->find(key);
    if (!d) return std::nullopt;

    std::vector<uint16_t> raw;
    if (!readWords(d->address, d->word_count, raw)) return std::nullopt;
    return ValueCodec::decode(raw, *d);
}

std::optional<uint16_t> RegisterBank::word(uint16_t address) {
    std::lock_guard<std::mutex> lock(data_mutex);
    auto it = words.find(address);
    if (it == words.end()) return std::nullopt;
    return it->second;
}
