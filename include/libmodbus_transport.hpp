#ifndef LIBMODBUS_TRANSPORT_H
#define LIBMODBUS_TRANSPORT_H

#include "modbus_transport.hpp"
#include "heat_pump_types.hpp"
#include "modbus_error.hpp"
#include <string>
#include <modbus/modbus.h>

/**
 * @class LibmodbusTransport
 * @brief Modbus TCP client on a libmodbus context.
 *
 * The context is created in the constructor; the socket is opened by
 * connect() and can be closed and reopened any number of times.
 */
class LibmodbusTransport : public ModbusTransport {
public:
    /**
     * @param config Host, port, unit id and response timeout.
     * @throw std::runtime_error if the libmodbus context cannot be created.
     */
    explicit LibmodbusTransport(const PollerConfig& config);
    ~LibmodbusTransport() override;

    LibmodbusTransport(const LibmodbusTransport&) = delete;
    LibmodbusTransport& operator=(const LibmodbusTransport&) = delete;

    void connect() override;
    void close() override;
    bool isConnected() const override { return connected; }

    std::vector<uint16_t> readHoldingRegisters(uint16_t address, uint16_t count) override;
    void writeRegister(uint16_t address, uint16_t value) override;
    void writeRegisters(uint16_t address, const std::vector<uint16_t>& values) override;

    /// @brief Maps a libmodbus errno value onto the error taxonomy.
    static ErrorKind classifyErrno(int err);

    /**
     * @brief True for errno values standing for a Modbus exception response
     * (EMBXILFUN..EMBXGTAR). Malformed frames such as EMBBADDATA are not.
     */
    static bool isExceptionCode(int err);

private:
    [[noreturn]] void fail(const std::string& operation, uint16_t address, int err);

    std::string host;
    int port;
    modbus_t* ctx;
    bool connected;
};

#endif // LIBMODBUS_TRANSPORT_H
