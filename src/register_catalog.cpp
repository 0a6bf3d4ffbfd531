#include "register_catalog.hpp"
#include "modbus_error.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {

RegisterDescriptor sensor(uint16_t address, DataType type, double scale,
                          const char* name, const char* unit) {
    RegisterDescriptor d;
    d.address = address;
    d.type = type;
    d.word_count = wordCountFor(type);
    d.scale = scale;
    d.access = RegisterAccess::ReadOnly;
    d.name = name;
    d.unit = unit;
    return d;
}

RegisterDescriptor control(uint16_t address, const char* name) {
    RegisterDescriptor d;
    d.address = address;
    d.type = DataType::UInt16;
    d.word_count = 1;
    d.access = RegisterAccess::ReadWrite;
    d.kind = ValueKind::Switch;
    d.name = name;
    return d;
}

RegisterDescriptor setpoint(uint16_t address, DataType type, double scale, double min, double max,
                            const char* name, const char* unit) {
    RegisterDescriptor d = sensor(address, type, scale, name, unit);
    d.access = RegisterAccess::ReadWrite;
    d.range = ValidRange{min, max};
    return d;
}

} // namespace

const char* dataTypeName(DataType type) {
    switch (type) {
        case DataType::Int16: return "int16";
        case DataType::UInt16: return "uint16";
        case DataType::Int32: return "int32";
        case DataType::UInt32: return "uint32";
        case DataType::Float32: return "float32";
    }
    return "unknown";
}

const char* connectionStateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Degraded: return "degraded";
    }
    return "unknown";
}

Catalog::Catalog(std::vector<Entry> input) {
    for (auto& entry : input) {
        const std::string& key = entry.first;
        const RegisterDescriptor& d = entry.second;

        if (key.empty()) {
            throw std::invalid_argument("Register key must not be empty");
        }
        if (d.word_count != wordCountFor(d.type)) {
            throw std::invalid_argument("Register " + key + ": word count " + std::to_string(d.word_count) +
                                        " does not match type " + dataTypeName(d.type));
        }
        if (!std::isfinite(d.scale) || d.scale == 0.0) {
            throw std::invalid_argument("Register " + key + ": scale must be finite and non-zero");
        }
        if (!std::isfinite(d.offset)) {
            throw std::invalid_argument("Register " + key + ": offset must be finite");
        }
        if (d.range && !(std::isfinite(d.range->min) && std::isfinite(d.range->max))) {
            throw std::invalid_argument("Register " + key + ": range bounds must be finite");
        }
        // A switch is a single word holding 0 or 1.
        if (d.kind == ValueKind::Switch && d.word_count != 1) {
            throw std::invalid_argument("Register " + key + ": a switch must be a 16-bit register, not " +
                                        dataTypeName(d.type));
        }
        if (d.range && d.range->min > d.range->max) {
            throw std::invalid_argument("Register " + key + ": min is greater than max");
        }
        if (static_cast<uint32_t>(d.address) + d.word_count > 0x10000) {
            throw std::invalid_argument("Register " + key + ": extends past address 0xFFFF");
        }
        if (!entries.emplace(key, d).second) {
            throw std::invalid_argument("Duplicate register key: " + key);
        }
    }

    // Reject two keys decoding the same physical register.
    std::vector<std::map<std::string, RegisterDescriptor>::const_iterator> sorted;
    for (auto it = entries.cbegin(); it != entries.cend(); ++it) sorted.push_back(it);
    std::sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
        return a->second.address < b->second.address;
    });
    for (size_t i = 1; i < sorted.size(); ++i) {
        const auto& prev = sorted[i - 1];
        const auto& cur = sorted[i];
        if (cur->second.address <= prev->second.lastAddress()) {
            throw std::invalid_argument("Registers " + prev->first + " and " + cur->first + " overlap");
        }
    }
}

const RegisterDescriptor& Catalog::lookup(const std::string& key) const {
    auto it = entries.find(key);
    if (it == entries.end()) {
        throw ModbusError(ErrorKind::UnknownKey, "Unknown register key: " + key);
    }
    return it->second;
}

std::optional<RegisterDescriptor> Catalog::find(const std::string& key) const {
    auto it = entries.find(key);
    if (it == entries.end()) return std::nullopt;
    return it->second;
}

std::shared_ptr<const Catalog> Catalog::heliothermDefaults() {
    static const std::shared_ptr<const Catalog> catalog = std::make_shared<const Catalog>(std::vector<Entry>{
        // Temperatures (100-107)
        {"supply_temperature", sensor(100, DataType::Float32, 1.0, "Supply Temperature", "°C")},
        {"return_temperature", sensor(102, DataType::Float32, 1.0, "Return Temperature", "°C")},
        {"setpoint_temperature", sensor(104, DataType::Int16, 0.1, "Setpoint Temperature", "°C")},
        {"outside_temperature", sensor(106, DataType::Float32, 1.0, "Outside Temperature", "°C")},

        // Status (110-112)
        {"pump_status", sensor(110, DataType::Int16, 1.0, "Pump Status", "")},
        {"operating_mode", sensor(111, DataType::Int16, 1.0, "Operating Mode", "")},
        {"device_status", sensor(112, DataType::Int16, 1.0, "Device Status", "")},

        // Pressure and power (120-143)
        {"system_pressure", sensor(120, DataType::Float32, 1.0, "System Pressure", "bar")},
        {"power_output", sensor(130, DataType::Float32, 1.0, "Power Output", "kW")},
        {"coefficient_of_performance", sensor(132, DataType::Float32, 1.0, "Coefficient of Performance", "")},
        {"compressor_power_input", sensor(140, DataType::Float32, 1.0, "Compressor Power Input", "kW")},
        {"flow_rate", sensor(142, DataType::Float32, 1.0, "Flow Rate", "l/min")},

        // Diagnostics (150-151)
        {"operating_hours", sensor(150, DataType::Int16, 1.0, "Operating Hours", "h")},
        {"error_code", sensor(151, DataType::Int16, 1.0, "Error Code", "")},

        // Switches (200-203)
        {"circulation_pump", control(200, "Circulation Pump")},
        {"auxiliary_heater", control(201, "Auxiliary Heater")},
        {"compressor_enable", control(202, "Compressor Enable")},
        {"hot_water_pump", control(203, "Hot Water Circulation Pump")},

        // Setpoints (300-311)
        {"target_supply_temperature", setpoint(300, DataType::Float32, 1.0, 10.0, 60.0, "Target Supply Temperature", "°C")},
        {"target_room_temperature", setpoint(302, DataType::Int16, 0.1, 10.0, 30.0, "Target Room Temperature", "°C")},
        {"target_dhw_temperature", setpoint(304, DataType::Int16, 0.1, 30.0, 65.0, "Target DHW Temperature", "°C")},
        {"compressor_frequency_target", setpoint(306, DataType::Int16, 1.0, 0.0, 120.0, "Compressor Frequency Target", "Hz")},
        {"max_pressure_setpoint", setpoint(308, DataType::Float32, 1.0, 1.0, 35.0, "Maximum Pressure Setpoint", "bar")},
        {"min_pressure_setpoint", setpoint(310, DataType::Float32, 1.0, 1.0, 35.0, "Minimum Pressure Setpoint", "bar")},
    });
    return catalog;
}
