#ifndef MODBUS_TRANSPORT_H
#define MODBUS_TRANSPORT_H

#include <cstdint>
#include <vector>

/**
 * @class ModbusTransport
 * @brief Raw holding-register access over one device connection.
 *
 * Implementations throw ModbusError (ConnectionError, Timeout or
 * ProtocolError) on failure. They are not thread-safe; TransportSession
 * serializes every call.
 */
class ModbusTransport {
public:
    virtual ~ModbusTransport() = default;

    virtual void connect() = 0;
    virtual void close() = 0;
    virtual bool isConnected() const = 0;

    /// @brief Function code 0x03.
    virtual std::vector<uint16_t> readHoldingRegisters(uint16_t address, uint16_t count) = 0;

    /// @brief Function code 0x06.
    virtual void writeRegister(uint16_t address, uint16_t value) = 0;

    /// @brief Function code 0x10.
    virtual void writeRegisters(uint16_t address, const std::vector<uint16_t>& values) = 0;
};

#endif // MODBUS_TRANSPORT_H
