#include "modbus_server.hpp"
#include <cerrno>
#include <iostream>
#include <unistd.h>
#include <sys/socket.h>
#include <vector>

ModbusServer::ModbusServer(std::shared_ptr<RegisterBank> registers, int id)
    : bank(std::move(registers)), unit_id(id), ctx(nullptr), mb_mapping(nullptr), running(false), server_socket(-1) {}

ModbusServer::~ModbusServer() {
    stop();
}

bool ModbusServer::start(const std::string& address, int port) {
    if (running) return true;

    ctx = modbus_new_tcp(address.c_str(), port);
    if (ctx == nullptr) {
        std::cerr << "Failed to create modbus context: " << modbus_strerror(errno) << std::endl;
        return false;
    }

    // Holding registers across the whole address space
    mb_mapping = modbus_mapping_new(0, 0, 65536, 0);
    if (mb_mapping == nullptr) {
        std::cerr << "Failed to allocate modbus mapping: " << modbus_strerror(errno) << std::endl;
        modbus_free(ctx);
        ctx = nullptr;
        return false;
    }

    modbus_set_slave(ctx, unit_id);
    // Wake up once a second so stop() is noticed while a client is idle.
    modbus_set_indication_timeout(ctx, 1, 0);

    server_socket = modbus_tcp_listen(ctx, 1);
    if (server_socket == -1) {
        std::cerr << "Unable to listen on TCP port " << port << ": " << modbus_strerror(errno) << std::endl;
        modbus_mapping_free(mb_mapping);
        mb_mapping = nullptr;
        modbus_free(ctx);
        ctx = nullptr;
        return false;
    }

    running = true;
    server_thread = std::thread(&ModbusServer::run, this);
    return true;
}

void ModbusServer::stop() {
    if (!running) return;
    running = false;

    // Shutdown wakes a blocked accept; the descriptor is closed once the thread is gone.
    int listen_socket = server_socket.exchange(-1);
    if (listen_socket != -1) {
        shutdown(listen_socket, SHUT_RDWR);
    }

    if (server_thread.joinable()) {
        server_thread.join();
    }
    if (listen_socket != -1) {
        close(listen_socket);
    }

    if (ctx) {
        modbus_close(ctx);
        modbus_free(ctx);
        ctx = nullptr;
    }
    if (mb_mapping) {
        modbus_mapping_free(mb_mapping);
        mb_mapping = nullptr;
    }
}

void ModbusServer::handleRequest(const uint8_t* query, int length) {
    int offset = modbus_get_header_length(ctx);
    int function_code = query[offset];
    uint16_t addr = static_cast<uint16_t>((query[offset + 1] << 8) | query[offset + 2]);

    switch (function_code) {
        case MODBUS_FC_READ_HOLDING_REGISTERS: {
            int nb = (query[offset + 3] << 8) | query[offset + 4];
            std::vector<uint16_t> words;
            if (nb < 1 || nb > MODBUS_MAX_READ_REGISTERS ||
                !bank->readWords(addr, static_cast<uint16_t>(nb), words)) {
                std::cout << "Read of " << nb << " registers at " << addr << " rejected" << std::endl;
                modbus_reply_exception(ctx, query, MODBUS_EXCEPTION_ILLEGAL_DATA_ADDRESS);
                return;
            }
            for (int i = 0; i < nb; ++i) {
                mb_mapping->tab_registers[addr + i] = words[i];
            }
            break;
        }
        case MODBUS_FC_WRITE_SINGLE_REGISTER: {
            uint16_t value = static_cast<uint16_t>((query[offset + 3] << 8) | query[offset + 4]);
            if (!bank->writeWords(addr, {value})) {
                modbus_reply_exception(ctx, query, MODBUS_EXCEPTION_ILLEGAL_DATA_ADDRESS);
                return;
            }
            std::cout << "Wrote register " << addr << " = " << value << std::endl;
            break;
        }
        case MODBUS_FC_WRITE_MULTIPLE_REGISTERS: {
            int nb = (query[offset + 3] << 8) | query[offset + 4];
            if (nb < 1 || nb > MODBUS_MAX_WRITE_REGISTERS || length < offset + 6 + nb * 2) {
                modbus_reply_exception(ctx, query, MODBUS_EXCEPTION_ILLEGAL_DATA_VALUE);
                return;
            }
            std::vector<uint16_t> values(nb);
            for (int i = 0; i < nb; ++i) {
                values[i] = static_cast<uint16_t>((query[offset + 6 + i * 2] << 8) | query[offset + 7 + i * 2]);
            }
            if (!bank->writeWords(addr, values)) {
                modbus_reply_exception(ctx, query, MODBUS_EXCEPTION_ILLEGAL_DATA_ADDRESS);
                return;
            }
            std::cout << "Wrote " << nb << " registers at " << addr << std::endl;
            break;
        }
        default:
            modbus_reply_exception(ctx, query, MODBUS_EXCEPTION_ILLEGAL_FUNCTION);
            return;
    }

    if (modbus_reply(ctx, query, length, mb_mapping) == -1) {
        std::cerr << "Modbus reply failed: " << modbus_strerror(errno) << std::endl;
    }
}

void ModbusServer::run() {
    std::cout << "Modbus server thread started." << std::endl;
    uint8_t query[MODBUS_TCP_MAX_ADU_LENGTH];

    while (running) {
        int listen_socket = server_socket.load();
        if (listen_socket == -1) break;
        int rc = modbus_tcp_accept(ctx, &listen_socket);
        if (rc == -1) {
            if (running) {
                std::cerr << "Modbus accept failed: " << modbus_strerror(errno) << std::endl;
            }
            continue;
        }

        std::cout << "Client connected" << std::endl;

        while (running) {
            rc = modbus_receive(ctx, query);
            if (rc > 0) {
                handleRequest(query, rc);
            } else if (rc == -1) {
                if (errno == ETIMEDOUT) {
                    continue;
                }
                std::cout << "Client disconnected" << std::endl;
                break;
            }
        }
        modbus_close(ctx);
    }
    std::cout << "Modbus server thread stopped." << std::endl;
}
