#ifndef IN_MEMORY_TRANSPORT_H
#define IN_MEMORY_TRANSPORT_H

#include "modbus_transport.hpp"
#include "register_bank.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * @class InMemoryTransport
 * @brief ModbusTransport served directly from a RegisterBank.
 *
 * Supports fault injection and records every request so callers can verify
 * that requests never overlap.
 */
class InMemoryTransport : public ModbusTransport {
public:
    enum class Fault {
        None,
        Disconnect, ///< Request fails with ConnectionError and the link drops
        Timeout,    ///< Request fails with Timeout
        Exception,  ///< Device answers with an exception response (ProtocolError)
        Garbled     ///< Response frame is malformed (ProtocolError, stream out of step)
    };

    explicit InMemoryTransport(std::shared_ptr<RegisterBank> bank);

    void connect() override;
    void close() override;
    bool isConnected() const override { return connected; }

    std::vector<uint16_t> readHoldingRegisters(uint16_t address, uint16_t count) override;
    void writeRegister(uint16_t address, uint16_t value) override;
    void writeRegisters(uint16_t address, const std::vector<uint16_t>& values) override;

    /// @brief The next count requests fail with fault; a negative count means every request.
    void injectFault(Fault fault, int count = 1);
    /// @brief Every request starting at address fails with fault until cleared.
    void failAddress(uint16_t address, Fault fault);
    void clearFaults();

    /// @brief While set, connect() fails with ConnectionError.
    void refuseConnections(bool refuse) { refusing = refuse; }

    /// @brief Delay applied inside every request.
    void setLatency(std::chrono::milliseconds latency) { delay = latency; }

    /// @brief Requests block after being logged until releaseRequests().
    void holdRequests();
    void releaseRequests();

    int connectCount() const { return connects; }
    int maxConcurrentRequests() const { return max_in_flight; }

    /// @brief One line per request, e.g. "read 100 6" or "write 302 1".
    std::vector<std::string> requestLog();

private:
    /// Tracks one request for overlap detection.
    class InFlight {
    public:
        explicit InFlight(InMemoryTransport& transport);
        ~InFlight();
    private:
        InMemoryTransport& transport;
    };

    void checkFault(uint16_t address);
    void record(const std::string& entry);
    void waitWhileHeld();

    std::shared_ptr<RegisterBank> bank;
    std::atomic<bool> connected;
    std::atomic<bool> refusing;
    std::atomic<int> connects;

    std::mutex fault_mutex;
    Fault pending_fault;
    int fault_budget;
    std::map<uint16_t, Fault> address_faults;

    std::chrono::milliseconds delay;
    std::atomic<int> in_flight;
    std::atomic<int> max_in_flight;

    std::mutex log_mutex;
    std::vector<std::string> log;

    std::mutex hold_mutex;
    std::condition_variable hold_cv;
    bool holding;
};

#endif // IN_MEMORY_TRANSPORT_H
