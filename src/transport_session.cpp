#include "transport_session.hpp"
#include "modbus_error.hpp"
#include <iostream>
#include <sstream>

TransportSession::Turn::Turn(TransportSession& s) : session(s) {
    std::unique_lock<std::mutex> lock(session.turn_mutex);
    uint64_t ticket = session.next_ticket++;
    session.turn_cv.wait(lock, [&] { return session.now_serving == ticket; });
}

TransportSession::Turn::~Turn() {
    {
        std::lock_guard<std::mutex> lock(session.turn_mutex);
        ++session.now_serving;
    }
    session.turn_cv.notify_all();
}

TransportSession::TransportSession(std::unique_ptr<ModbusTransport> t)
    : transport(std::move(t)), next_ticket(0), now_serving(0), ever_connected(false),
      request_count(0), failure_count(0), reconnect_count(0) {}

TransportSession::~TransportSession() {
    close();
}

template <typename Op>
auto TransportSession::execute(Op&& op) -> decltype(op(std::declval<ModbusTransport&>())) {
    Turn turn(*this);
    ++request_count;

    for (int attempt = 0;; ++attempt) {
        try {
            if (!transport->isConnected()) {
                if (ever_connected) {
                    ++reconnect_count;
                }
                transport->connect();
                ever_connected = true;
            }
            return op(*transport);
        } catch (const ModbusError& e) {
            if (!isTransportError(e.kind())) {
                ++failure_count;
                throw;
            }
            // Only an exception response leaves the stream in step.
            if (!e.isExceptionResponse()) {
                transport->close();
            }
            if (attempt > 0) {
                ++failure_count;
                throw;
            }
            std::cerr << "Modbus request failed (" << errorKindName(e.kind()) << "): " << e.what()
                      << ", retrying once" << std::endl;
        }
    }
}

std::vector<uint16_t> TransportSession::readWords(uint16_t address, uint16_t count) {
    if (count == 0 || count > kMaxReadWords) {
        throw ModbusError(ErrorKind::ProtocolError,
                          "Read of " + std::to_string(count) + " registers exceeds the request limit");
    }
    return execute([&](ModbusTransport& t) {
        std::vector<uint16_t> words = t.readHoldingRegisters(address, count);
        if (words.size() != count) {
            std::ostringstream msg;
            msg << "Read at 0x" << std::hex << address << std::dec << " returned " << words.size() << " of "
                << count << " registers";
            throw ModbusError(ErrorKind::ProtocolError, msg.str());
        }
        return words;
    });
}

void TransportSession::writeWords(uint16_t address, const std::vector<uint16_t>& words) {
    if (words.empty() || words.size() > kMaxWriteWords) {
        throw ModbusError(ErrorKind::ProtocolError,
                          "Write of " + std::to_string(words.size()) + " registers exceeds the request limit");
    }
    execute([&](ModbusTransport& t) {
        if (words.size() == 1) {
            t.writeRegister(address, words.front());
        } else {
            t.writeRegisters(address, words);
        }
    });
}

void TransportSession::close() {
    Turn turn(*this);
    transport->close();
}

bool TransportSession::isConnected() {
    Turn turn(*this);
    return transport->isConnected();
}

SessionStats TransportSession::stats() const {
    SessionStats s;
    s.requests = request_count.load();
    s.failures = failure_count.load();
    s.reconnects = reconnect_count.load();
    std::lock_guard<std::mutex> lock(turn_mutex);
    s.queued = next_ticket - now_serving;
    return s;
}
