#include "register_bank.hpp"
#include "simulation_engine.hpp"
#include "modbus_error.hpp"
#include <gtest/gtest.h>

namespace {

std::shared_ptr<const Catalog> simulatorCatalog() {
    RegisterDescriptor supply;
    supply.address = 100;
    supply.type = DataType::Float32;
    supply.word_count = 2;

    RegisterDescriptor setpoint;
    setpoint.address = 102;
    setpoint.type = DataType::Int16;
    setpoint.scale = 0.1;
    setpoint.access = RegisterAccess::ReadWrite;
    setpoint.range = ValidRange{5.0, 30.0};

    RegisterDescriptor pump;
    pump.address = 200;
    pump.access = RegisterAccess::ReadWrite;
    pump.kind = ValueKind::Switch;

    return std::make_shared<const Catalog>(std::vector<Catalog::Entry>{
        {"supply_temperature", supply}, {"setpoint_temperature", setpoint}, {"circulation_pump", pump}});
}

} // namespace

TEST(RegisterBankTest, OnlyCatalogAddressesExist) {
    RegisterBank bank(simulatorCatalog());
    std::vector<uint16_t> out;

    EXPECT_TRUE(bank.readWords(100, 3, out));
    EXPECT_EQ((std::vector<uint16_t>{0, 0, 0}), out);
    EXPECT_FALSE(bank.readWords(100, 4, out));
    EXPECT_FALSE(bank.readWords(150, 1, out));
    EXPECT_FALSE(bank.word(103).has_value());
    EXPECT_FALSE(bank.value("flow_rate").has_value());
}

TEST(RegisterBankTest, ClientWritesRespectAccess) {
    RegisterBank bank(simulatorCatalog());

    EXPECT_TRUE(bank.writeWords(102, {215}));
    EXPECT_NEAR(21.5, std::get<double>(bank.value("setpoint_temperature").value()), 1e-9);

    EXPECT_FALSE(bank.writeWords(100, {0x4248, 0}));
    EXPECT_EQ(0, bank.word(100).value());

    // A range that runs into unmapped space is rejected as a whole.
    EXPECT_FALSE(bank.writeWords(102, {1, 2}));
    EXPECT_EQ(215, bank.word(102).value());
}

TEST(RegisterBankTest, DeviceSideUpdatesIgnoreAccess) {
    RegisterBank bank(simulatorCatalog());

    bank.setValue("supply_temperature", 50.0);
    EXPECT_EQ(0x4248, bank.word(100).value());
    EXPECT_DOUBLE_EQ(50.0, std::get<double>(bank.value("supply_temperature").value()));

    bank.setValue("circulation_pump", true);
    EXPECT_TRUE(std::get<bool>(bank.value("circulation_pump").value()));

    EXPECT_THROW(bank.setValue("flow_rate", 1.0), ModbusError);
    EXPECT_THROW(bank.setValue("setpoint_temperature", 45.0), ModbusError);
}

TEST(RegisterBankTest, SeedSkipsRejectedValues) {
    RegisterBank bank(simulatorCatalog());

    EXPECT_NO_THROW(bank.seed({{"supply_temperature", 48.5}, {"setpoint_temperature", 99.0}, {"unknown", 1.0}}));
    EXPECT_DOUBLE_EQ(48.5, std::get<double>(bank.value("supply_temperature").value()));
    EXPECT_EQ(0, bank.word(102).value());
}

TEST(SimulationEngineTest, CompressorOffDropsPowerReadings) {
    auto bank = std::make_shared<RegisterBank>(Catalog::heliothermDefaults());
    bank->seed({{"power_output", 8.5},
                {"compressor_power_input", 2.1},
                {"supply_temperature", 45.0},
                {"target_supply_temperature", 45.0},
                {"compressor_enable", 0.0}});

    SimulationEngine engine(bank, std::chrono::milliseconds(1000));
    engine.step();

    EXPECT_DOUBLE_EQ(0.0, std::get<double>(bank->value("power_output").value()));
    EXPECT_DOUBLE_EQ(0.0, std::get<double>(bank->value("compressor_power_input").value()));
    EXPECT_DOUBLE_EQ(45.0, std::get<double>(bank->value("target_supply_temperature").value()));
    EXPECT_FALSE(std::get<bool>(bank->value("compressor_enable").value()));
}

TEST(SimulationEngineTest, SensorsStayNearTheirBaseline) {
    auto bank = std::make_shared<RegisterBank>(Catalog::heliothermDefaults());
    bank->seed({{"outside_temperature", 8.0}, {"compressor_enable", 1.0}});

    SimulationEngine engine(bank, std::chrono::milliseconds(1000));
    for (int i = 0; i < 50; ++i) {
        engine.step();
    }
    EXPECT_NEAR(8.0, std::get<double>(bank->value("outside_temperature").value()), 3.0);
}
