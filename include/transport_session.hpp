#ifndef TRANSPORT_SESSION_H
#define TRANSPORT_SESSION_H

#include "modbus_transport.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

/// Modbus limits per request.
constexpr uint16_t kMaxReadWords = 125;
constexpr uint16_t kMaxWriteWords = 123;

/**
 * @struct SessionStats
 * @brief Counters for diagnostics.
 */
struct SessionStats {
    uint64_t requests = 0;
    uint64_t failures = 0;
    uint64_t reconnects = 0;
    uint64_t queued = 0; ///< Requests on the link or waiting for it
};

/**
 * @class TransportSession
 * @brief Owns the single device connection and serializes every request on it.
 *
 * The connection is opened on first use and reused. When a request fails on
 * the link, the connection is closed and the request is retried once after a
 * reconnect; an exception response from the device is retried on the same
 * connection. A second failure propagates to the caller. Callers are served
 * one at a time in arrival order.
 */
class TransportSession {
public:
    explicit TransportSession(std::unique_ptr<ModbusTransport> transport);
    ~TransportSession();

    TransportSession(const TransportSession&) = delete;
    TransportSession& operator=(const TransportSession&) = delete;

    /**
     * @brief Reads holding registers.
     * @throw ModbusError (ConnectionError, Timeout, ProtocolError).
     */
    std::vector<uint16_t> readWords(uint16_t address, uint16_t count);

    /**
     * @brief Writes one register (0x06) or several (0x10).
     * @throw ModbusError (ConnectionError, Timeout, ProtocolError).
     */
    void writeWords(uint16_t address, const std::vector<uint16_t>& words);

    /// @brief Closes the connection; the next request reopens it.
    void close();

    bool isConnected();
    SessionStats stats() const;

private:
    /// FIFO slot on the link, held for the duration of one request.
    class Turn {
    public:
        explicit Turn(TransportSession& session);
        ~Turn();
    private:
        TransportSession& session;
    };

    template <typename Op>
    auto execute(Op&& op) -> decltype(op(std::declval<ModbusTransport&>()));

    std::unique_ptr<ModbusTransport> transport;

    mutable std::mutex turn_mutex;
    std::condition_variable turn_cv;
    uint64_t next_ticket;
    uint64_t now_serving;
    bool ever_connected;

    std::atomic<uint64_t> request_count;
    std::atomic<uint64_t> failure_count;
    std::atomic<uint64_t> reconnect_count;
};

#endif // TRANSPORT_SESSION_H
