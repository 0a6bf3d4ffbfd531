#include "in_memory_transport.hpp"
#include "modbus_error.hpp"
#include <thread>

InMemoryTransport::InFlight::InFlight(InMemoryTransport& t) : transport(t) {
    int now = ++transport.in_flight;
    int seen = transport.max_in_flight.load();
    while (now > seen && !transport.max_in_flight.compare_exchange_weak(seen, now)) {
    }
}

InMemoryTransport::InFlight::~InFlight() {
    --transport.in_flight;
}

InMemoryTransport::InMemoryTransport(std::shared_ptr<RegisterBank> b)
    : bank(std::move(b)), connected(false), refusing(false), connects(0), pending_fault(Fault::None),
      fault_budget(0), delay(0), in_flight(0), max_in_flight(0), holding(false) {}

void InMemoryTransport::connect() {
    if (refusing) {
        throw ModbusError(ErrorKind::ConnectionError, "Connection refused");
    }
    connected = true;
    ++connects;
}

void InMemoryTransport::close() {
    connected = false;
}

void InMemoryTransport::injectFault(Fault fault, int count) {
    std::lock_guard<std::mutex> lock(fault_mutex);
    pending_fault = fault;
    fault_budget = count;
}

void InMemoryTransport::failAddress(uint16_t address, Fault fault) {
    std::lock_guard<std::mutex> lock(fault_mutex);
    address_faults[address] = fault;
}

void InMemoryTransport::clearFaults() {
    std::lock_guard<std::mutex> lock(fault_mutex);
    pending_fault = Fault::None;
    fault_budget = 0;
    address_faults.clear();
}

void InMemoryTransport::checkFault(uint16_t address) {
    Fault fault = Fault::None;
    {
        std::lock_guard<std::mutex> lock(fault_mutex);
        auto it = address_faults.find(address);
        if (it != address_faults.end()) {
            fault = it->second;
        } else if (pending_fault != Fault::None && fault_budget != 0) {
            fault = pending_fault;
            if (fault_budget > 0 && --fault_budget == 0) {
                pending_fault = Fault::None;
            }
        }
    }

    switch (fault) {
        case Fault::Disconnect:
            connected = false;
            throw ModbusError(ErrorKind::ConnectionError, "Connection reset by peer");
        case Fault::Timeout:
            throw ModbusError(ErrorKind::Timeout, "Connection timed out");
        case Fault::Exception:
            throw ModbusError(ErrorKind::ProtocolError, "Slave device or server failure", true);
        case Fault::Garbled:
            throw ModbusError(ErrorKind::ProtocolError, "Invalid data");
        case Fault::None:
            break;
    }
}

void InMemoryTransport::holdRequests() {
    std::lock_guard<std::mutex> lock(hold_mutex);
    holding = true;
}

void InMemoryTransport::releaseRequests() {
    {
        std::lock_guard<std::mutex> lock(hold_mutex);
        holding = false;
    }
    hold_cv.notify_all();
}

void InMemoryTransport::waitWhileHeld() {
    std::unique_lock<std::mutex> lock(hold_mutex);
    hold_cv.wait(lock, [this] { return !holding; });
}

void InMemoryTransport::record(const std::string& entry) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log.push_back(entry);
}

std::vector<std::string> InMemoryTransport::requestLog() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return log;
}

std::vector<uint16_t> InMemoryTransport::readHoldingRegisters(uint16_t address, uint16_t count) {
    InFlight guard(*this);
    if (!connected) {
        throw ModbusError(ErrorKind::ConnectionError, "Not connected");
    }
    record("read " + std::to_string(address) + " " + std::to_string(count));
    waitWhileHeld();
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }
    checkFault(address);

    std::vector<uint16_t> words;
    if (!bank->readWords(address, count, words)) {
        throw ModbusError(ErrorKind::ProtocolError, "Illegal data address " + std::to_string(address), true);
    }
    return words;
}

void InMemoryTransport::writeRegister(uint16_t address, uint16_t value) {
    writeRegisters(address, std::vector<uint16_t>{value});
}

void InMemoryTransport::writeRegisters(uint16_t address, const std::vector<uint16_t>& values) {
    InFlight guard(*this);
    if (!connected) {
        throw ModbusError(ErrorKind::ConnectionError, "Not connected");
    }
    record("write " + std::to_string(address) + " " + std::to_string(values.size()));
    waitWhileHeld();
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }
    checkFault(address);

    if (!bank->writeWords(address, values)) {
        throw ModbusError(ErrorKind::ProtocolError, "Illegal data address " + std::to_string(address), true);
    }
}
