#include "libmodbus_transport.hpp"
#include <cerrno>
#include <iostream>
#include <sstream>
#include <stdexcept>

LibmodbusTransport::LibmodbusTransport(const PollerConfig& config)
    : host(config.host), port(config.port), ctx(nullptr), connected(false) {
    ctx = modbus_new_tcp(host.c_str(), port);
    if (ctx == nullptr) {
        throw std::runtime_error(std::string("Failed to create modbus context: ") + modbus_strerror(errno));
    }

    if (modbus_set_slave(ctx, config.unit_id) == -1) {
        std::string reason = modbus_strerror(errno);
        modbus_free(ctx);
        throw std::runtime_error("Invalid unit id " + std::to_string(config.unit_id) + ": " + reason);
    }

    auto ms = config.timeout.count();
    modbus_set_response_timeout(ctx, static_cast<uint32_t>(ms / 1000), static_cast<uint32_t>((ms % 1000) * 1000));
}

LibmodbusTransport::~LibmodbusTransport() {
    close();
    if (ctx) {
        modbus_free(ctx);
        ctx = nullptr;
    }
}

ErrorKind LibmodbusTransport::classifyErrno(int err) {
    if (err == ETIMEDOUT) {
        return ErrorKind::Timeout;
    }
    // Exception responses and malformed frames
    if (err > MODBUS_ENOBASE && err <= EMBBADSLAVE) {
        return ErrorKind::ProtocolError;
    }
    return ErrorKind::ConnectionError;
}

bool LibmodbusTransport::isExceptionCode(int err) {
    return err >= EMBXILFUN && err <= EMBXGTAR;
}

void LibmodbusTransport::fail(const std::string& operation, uint16_t address, int err) {
    std::ostringstream msg;
    msg << operation << " at 0x" << std::hex << address << " on " << host << ":" << std::dec << port
        << " failed: " << modbus_strerror(err);
    throw ModbusError(classifyErrno(err), msg.str(), isExceptionCode(err));
}

void LibmodbusTransport::connect() {
    if (connected) return;

    if (modbus_connect(ctx) == -1) {
        int err = errno;
        modbus_close(ctx);
        ErrorKind kind = err == ETIMEDOUT ? ErrorKind::Timeout : ErrorKind::ConnectionError;
        throw ModbusError(kind, "Connection to " + host + ":" + std::to_string(port) + " failed: " + modbus_strerror(err));
    }
    connected = true;
    std::cout << "Connected to Modbus device at " << host << ":" << port << std::endl;
}

void LibmodbusTransport::close() {
    if (!connected) return;
    modbus_close(ctx);
    connected = false;
    std::cout << "Closed connection to " << host << ":" << port << std::endl;
}

std::vector<uint16_t> LibmodbusTransport::readHoldingRegisters(uint16_t address, uint16_t count) {
    std::vector<uint16_t> dest(count);
    int rc = modbus_read_registers(ctx, address, count, dest.data());
    if (rc == -1) {
        fail("Read of " + std::to_string(count) + " registers", address, errno);
    }
    if (rc != count) {
        std::ostringstream msg;
        msg << "Read at 0x" << std::hex << address << std::dec << " returned " << rc << " of " << count << " registers";
        throw ModbusError(ErrorKind::ProtocolError, msg.str());
    }
    return dest;
}

void LibmodbusTransport::writeRegister(uint16_t address, uint16_t value) {
    if (modbus_write_register(ctx, address, value) == -1) {
        fail("Write register", address, errno);
    }
}

void LibmodbusTransport::writeRegisters(uint16_t address, const std::vector<uint16_t>& values) {
    int rc = modbus_write_registers(ctx, address, static_cast<int>(values.size()), values.data());
    if (rc == -1) {
        fail("Write of " + std::to_string(values.size()) + " registers", address, errno);
    }
    if (rc != static_cast<int>(values.size())) {
        std::ostringstream msg;
        msg << "Write at 0x" << std::hex << address << std::dec << " acknowledged " << rc << " of " << values.size()
            << " registers";
        throw ModbusError(ErrorKind::ProtocolError, msg.str());
    }
}
