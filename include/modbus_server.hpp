#ifndef MODBUS_SERVER_H
#define MODBUS_SERVER_H

#include "register_bank.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <modbus/modbus.h>

/**
 * @class ModbusServer
 * @brief Serves a RegisterBank over Modbus TCP in a dedicated thread.
 *
 * Answers read holding registers (0x03) and write single/multiple registers
 * (0x06, 0x10). Unmapped or read-only targets get an illegal data address
 * exception; every other function code gets an illegal function exception.
 */
class ModbusServer {
public:
    /**
     * @param bank The register image to serve.
     * @param unit_id The Modbus unit ID for the server.
     */
    ModbusServer(std::shared_ptr<RegisterBank> bank, int unit_id);

    /**
     * @brief Destructor, ensures the server is stopped.
     */
    ~ModbusServer();

    /**
     * @brief Starts the listening loop in a new thread.
     * @param address The local address to bind.
     * @param port The TCP port to listen on.
     * @return True on success, false on failure.
     */
    bool start(const std::string& address, int port);

    /**
     * @brief Stops the server and joins its thread.
     */
    void stop();

private:
    void run();
    void handleRequest(const uint8_t* query, int length);

    std::shared_ptr<RegisterBank> bank;
    int unit_id;
    modbus_t *ctx;
    modbus_mapping_t *mb_mapping;
    std::thread server_thread;
    std::atomic<bool> running;
    std::atomic<int> server_socket;
};

#endif // MODBUS_SERVER_H
