#include "transport_session.hpp"
#include "in_memory_transport.hpp"
#include "modbus_error.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <functional>
#include <thread>

namespace {

std::shared_ptr<const Catalog> smallCatalog() {
    RegisterDescriptor supply;
    supply.address = 100;
    supply.type = DataType::Float32;
    supply.word_count = 2;

    RegisterDescriptor setpoint;
    setpoint.address = 102;
    setpoint.type = DataType::Int16;
    setpoint.scale = 0.1;
    setpoint.access = RegisterAccess::ReadWrite;

    RegisterDescriptor target;
    target.address = 300;
    target.type = DataType::Float32;
    target.word_count = 2;
    target.access = RegisterAccess::ReadWrite;

    return std::make_shared<const Catalog>(std::vector<Catalog::Entry>{
        {"supply_temperature", supply}, {"setpoint_temperature", setpoint}, {"target_supply_temperature", target}});
}

template <typename F>
ErrorKind errorOf(F&& f) {
    try {
        f();
    } catch (const ModbusError& e) {
        return e.kind();
    }
    return ErrorKind::None;
}

class TransportSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        bank = std::make_shared<RegisterBank>(smallCatalog());
        bank->setValue("supply_temperature", 50.0);
        auto t = std::make_unique<InMemoryTransport>(bank);
        transport = t.get();
        session = std::make_unique<TransportSession>(std::move(t));
    }

    std::shared_ptr<RegisterBank> bank;
    InMemoryTransport* transport = nullptr;
    std::unique_ptr<TransportSession> session;
};

} // namespace

TEST_F(TransportSessionTest, ConnectsLazilyAndReusesTheConnection) {
    EXPECT_EQ(0, transport->connectCount());
    EXPECT_FALSE(transport->isConnected());

    std::vector<uint16_t> words = session->readWords(100, 2);
    EXPECT_EQ((std::vector<uint16_t>{0x4248, 0x0000}), words);
    session->readWords(100, 3);

    EXPECT_EQ(1, transport->connectCount());
    EXPECT_EQ(2u, session->stats().requests);
    EXPECT_EQ(0u, session->stats().reconnects);
}

TEST_F(TransportSessionTest, ReconnectsOnceAfterConnectionLoss) {
    session->readWords(100, 2);
    transport->injectFault(InMemoryTransport::Fault::Disconnect, 1);

    EXPECT_EQ((std::vector<uint16_t>{0x4248, 0x0000}), session->readWords(100, 2));
    EXPECT_EQ(2, transport->connectCount());
    EXPECT_EQ(1u, session->stats().reconnects);
    EXPECT_EQ(0u, session->stats().failures);
}

TEST_F(TransportSessionTest, SecondConsecutiveFailurePropagates) {
    transport->injectFault(InMemoryTransport::Fault::Timeout, 2);

    EXPECT_EQ(ErrorKind::Timeout, errorOf([&] { session->readWords(100, 2); }));
    EXPECT_EQ(2u, transport->requestLog().size());
    EXPECT_EQ(1u, session->stats().failures);

    // The fault budget is spent; the next call succeeds.
    EXPECT_NO_THROW(session->readWords(100, 2));
}

TEST_F(TransportSessionTest, ExceptionResponseKeepsTheConnection) {
    session->readWords(100, 2);
    transport->injectFault(InMemoryTransport::Fault::Exception, 1);

    EXPECT_NO_THROW(session->readWords(100, 2));
    EXPECT_EQ(1, transport->connectCount());

    transport->failAddress(102, InMemoryTransport::Fault::Exception);
    EXPECT_EQ(ErrorKind::ProtocolError, errorOf([&] { session->readWords(102, 1); }));
    EXPECT_TRUE(transport->isConnected());
}

TEST_F(TransportSessionTest, MalformedResponseForcesReconnect) {
    session->readWords(100, 2);
    transport->injectFault(InMemoryTransport::Fault::Garbled, 1);

    EXPECT_EQ((std::vector<uint16_t>{0x4248, 0x0000}), session->readWords(100, 2));
    EXPECT_EQ(2, transport->connectCount());
    EXPECT_EQ(1u, session->stats().reconnects);
}

TEST_F(TransportSessionTest, RefusedConnectionIsAConnectionError) {
    transport->refuseConnections(true);
    EXPECT_EQ(ErrorKind::ConnectionError, errorOf([&] { session->readWords(100, 2); }));
    EXPECT_TRUE(transport->requestLog().empty());

    transport->refuseConnections(false);
    EXPECT_NO_THROW(session->readWords(100, 2));
}

TEST_F(TransportSessionTest, UnmappedAddressIsAProtocolError) {
    EXPECT_EQ(ErrorKind::ProtocolError, errorOf([&] { session->readWords(104, 1); }));
}

TEST_F(TransportSessionTest, WritesSingleAndMultipleRegisters) {
    session->writeWords(102, {225});
    session->writeWords(300, {0x4228, 0x0000});

    std::vector<std::string> log = transport->requestLog();
    ASSERT_EQ(2u, log.size());
    EXPECT_EQ("write 102 1", log[0]);
    EXPECT_EQ("write 300 2", log[1]);
    EXPECT_EQ(225, bank->word(102).value());
    EXPECT_DOUBLE_EQ(42.0, std::get<double>(bank->value("target_supply_temperature").value()));
}

TEST_F(TransportSessionTest, WriteToReadOnlyRegisterIsRejectedByTheDevice) {
    EXPECT_EQ(ErrorKind::ProtocolError, errorOf([&] { session->writeWords(100, {1, 2}); }));
}

TEST_F(TransportSessionTest, RejectsOversizedRequestsLocally) {
    EXPECT_EQ(ErrorKind::ProtocolError, errorOf([&] { session->readWords(100, kMaxReadWords + 1); }));
    EXPECT_EQ(ErrorKind::ProtocolError, errorOf([&] { session->readWords(100, 0); }));
    EXPECT_EQ(ErrorKind::ProtocolError,
              errorOf([&] { session->writeWords(100, std::vector<uint16_t>(kMaxWriteWords + 1, 0)); }));
    EXPECT_EQ(ErrorKind::ProtocolError, errorOf([&] { session->writeWords(100, {}); }));
    EXPECT_TRUE(transport->requestLog().empty());
    EXPECT_EQ(0, transport->connectCount());
}

TEST_F(TransportSessionTest, SerializesConcurrentCallers) {
    transport->setLatency(std::chrono::milliseconds(2));

    std::vector<std::thread> callers;
    for (int i = 0; i < 8; ++i) {
        callers.emplace_back([this, i] {
            for (int n = 0; n < 5; ++n) {
                if (i % 2 == 0) {
                    session->readWords(100, 3);
                } else {
                    session->writeWords(102, {static_cast<uint16_t>(i * 10 + n)});
                }
            }
        });
    }
    for (auto& t : callers) {
        t.join();
    }

    EXPECT_EQ(1, transport->maxConcurrentRequests());
    EXPECT_EQ(40u, transport->requestLog().size());
    EXPECT_EQ(40u, session->stats().requests);
}

TEST_F(TransportSessionTest, ServesCallersInArrivalOrder) {
    const std::vector<std::function<void()>> requests = {
        [this] { session->readWords(100, 1); },
        [this] { session->writeWords(102, {210}); },
        [this] { session->readWords(100, 3); },
        [this] { session->writeWords(300, {0x4228, 0x0000}); },
        [this] { session->readWords(100, 2); },
    };

    // The first caller takes the link and stays on it until released.
    transport->holdRequests();
    std::vector<std::thread> callers;
    for (size_t i = 0; i < requests.size(); ++i) {
        callers.emplace_back(requests[i]);
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (session->stats().queued < i + 1 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        EXPECT_EQ(i + 1, session->stats().queued);
    }
    EXPECT_LE(transport->requestLog().size(), 1u);

    transport->releaseRequests();
    for (auto& t : callers) {
        t.join();
    }

    EXPECT_EQ((std::vector<std::string>{"read 100 1", "write 102 1", "read 100 3", "write 300 2", "read 100 2"}),
              transport->requestLog());
    EXPECT_EQ(0u, session->stats().queued);
}

TEST_F(TransportSessionTest, CloseForcesReconnect) {
    session->readWords(100, 2);
    session->close();
    EXPECT_FALSE(session->isConnected());

    session->readWords(100, 2);
    EXPECT_EQ(2, transport->connectCount());
    EXPECT_EQ(1u, session->stats().reconnects);
}
