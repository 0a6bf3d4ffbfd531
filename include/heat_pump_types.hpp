#ifndef HEAT_PUMP_TYPES_H
#define HEAT_PUMP_TYPES_H

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

/// @brief Defines the access type for a holding register.
enum class RegisterAccess {
    ReadOnly,  ///< Polled, never written
    ReadWrite  ///< Polled and writable when the coordinator is write-enabled
};

/// @brief Defines the raw data type stored in one or two holding registers.
enum class DataType {
    Int16,
    UInt16,
    Int32,
    UInt32,
    Float32
};

/// @brief Defines how a decoded register is presented to consumers.
enum class ValueKind {
    Number, ///< Scaled numeric value
    Switch  ///< On/off state, raw value != 0
};

/// @brief Connection state of the polling coordinator.
enum class ConnectionState {
    Disconnected, ///< No cycle has succeeded yet
    Connected,    ///< The last cycle succeeded
    Degraded      ///< The last cycle failed, the previous snapshot is still served
};

/// @brief A decoded register value in display units.
using Value = std::variant<double, bool>;

/**
 * @struct ValidRange
 * @brief Inclusive bounds in display units.
 */
struct ValidRange {
    double min;
    double max;

    bool contains(double v) const { return v >= min && v <= max; }
};

/**
 * @struct RegisterDescriptor
 * @brief Holds all properties of a single semantic parameter on the device.
 *
 * Display value = raw * scale + offset.
 */
struct RegisterDescriptor {
    uint16_t address = 0;
    uint16_t word_count = 1;
    DataType type = DataType::UInt16;
    double scale = 1.0;
    double offset = 0.0;
    RegisterAccess access = RegisterAccess::ReadOnly;
    std::optional<ValidRange> range;
    ValueKind kind = ValueKind::Number;
    std::string name;
    std::string unit;

    /// @brief Address of the last register covered by this descriptor.
    uint16_t lastAddress() const { return static_cast<uint16_t>(address + word_count - 1); }
};

/**
 * @struct Snapshot
 * @brief Immutable view of every decoded value as of one successful poll cycle.
 */
struct Snapshot {
    std::map<std::string, Value> values;
    uint64_t sequence = 0;
    std::chrono::system_clock::time_point timestamp;

    std::optional<Value> get(const std::string& key) const {
        auto it = values.find(key);
        if (it == values.end()) return std::nullopt;
        return it->second;
    }

    /// @brief Numeric view of a value; switches read as 1.0/0.0.
    std::optional<double> number(const std::string& key) const {
        auto v = get(key);
        if (!v) return std::nullopt;
        if (const bool* b = std::get_if<bool>(&*v)) return *b ? 1.0 : 0.0;
        return std::get<double>(*v);
    }
};

/**
 * @struct PollerConfig
 * @brief Connection and scheduling options for one heat-pump controller.
 */
struct PollerConfig {
    std::string host;
    uint16_t port = 502;
    uint8_t unit_id = 1;
    bool read_only = true;
    std::chrono::seconds scan_interval{30};
    std::chrono::milliseconds timeout{5000};
    int failure_threshold = 3;
};

/// @brief Number of registers a data type occupies.
inline uint16_t wordCountFor(DataType type) {
    switch (type) {
        case DataType::Int32:
        case DataType::UInt32:
        case DataType::Float32:
            return 2;
        default:
            return 1;
    }
}

const char* dataTypeName(DataType type);
const char* connectionStateName(ConnectionState state);

#endif // HEAT_PUMP_TYPES_H
