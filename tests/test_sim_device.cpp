#include "../src/hw/sim_device.hpp"
#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <thread>

/**
 * @brief Test SimulatedDevice register bank, flow physics and faults
 *
 * Also exercises SimulatedConnection against the IDeviceConnection contract.
 */
int main() {
    std::cout << "Testing SimulatedDevice functionality..." << std::endl;
    using namespace std::chrono;

    // Test 1: Register bank access through a connection
    {
        std::cout << "Test 1: Register bank" << std::endl;

        auto dev = std::make_shared<SimulatedDevice>("SIM_T1", 42);
        dev->define_words(RegisterClass::HOLDING, 100, {0x447A, 0x0000});
        dev->define_value(RegisterClass::INPUT, 10, -5, Encoding::INT16);
        dev->define_bit(RegisterClass::COIL, 1, true);
        dev->define_bit(RegisterClass::DISCRETE, 2, false);

        SimulatedConnection conn(dev, milliseconds(200));
        assert(!conn.is_connected());
        conn.connect();
        assert(conn.is_connected());
        assert(conn.describe() == "sim://SIM_T1");

        auto words = conn.read_block(100, 2);
        assert(RegisterCodec::decode(words, Encoding::FLOAT32) == 1000.0);
        assert(RegisterCodec::decode(conn.read_block(10, 1, RegisterClass::INPUT), Encoding::INT16) == -5.0);
        assert(conn.read_bit(1));
        assert(!conn.read_bit(2, RegisterClass::DISCRETE));

        conn.write_block(100, RegisterCodec::encode(250.5, Encoding::FLOAT32));
        assert(dev->value(RegisterClass::HOLDING, 100, Encoding::FLOAT32) == 250.5);
        conn.write_bit(1, false);
        assert(!dev->coil(1));

        auto stats = conn.statistics();
        assert(stats.connects == 1);
        assert(stats.transactions == 6);
        assert(stats.errors == 0);

        std::cout << "  Register bank test passed" << std::endl;
    }

    // Test 2: Undefined addresses are rejected
    {
        std::cout << "Test 2: Illegal addresses" << std::endl;

        auto dev = std::make_shared<SimulatedDevice>("SIM_T2", 42);
        dev->define_words(RegisterClass::HOLDING, 100, {1});
        SimulatedConnection conn(dev, milliseconds(200));
        conn.connect();

        int naks = 0;
        try { conn.read_block(100, 2); } catch (const IoError& e) { naks += e.kind() == IoError::Kind::DEVICE_NAK; }
        try { conn.write_bit(7, true); } catch (const IoError& e) { naks += e.kind() == IoError::Kind::DEVICE_NAK; }
        try { conn.write_block(300, {1}); } catch (const IoError& e) { naks += e.kind() == IoError::Kind::DEVICE_NAK; }
        assert(naks == 3);
        assert(conn.statistics().errors == 3);
        // a NAK does not drop the connection
        assert(conn.is_connected());

        std::cout << "  Illegal addresses test passed" << std::endl;
    }

    // Test 3: Flow line physics
    {
        std::cout << "Test 3: Flow line physics" << std::endl;

        auto dev = std::make_shared<SimulatedDevice>("SIM_T3", 42);
        SimulatedDevice::FlowLine line;
        line.valve_coil = 1;
        line.speed_register = 200;
        line.flow_register = 300;
        line.time_constant_s = 0.0;
        dev->add_flow_line(line);

        SimulatedConnection conn(dev, milliseconds(200));
        conn.connect();

        // pump running against a closed valve delivers nothing
        conn.write_block(200, RegisterCodec::encode(120.0, Encoding::FLOAT32));
        assert(RegisterCodec::decode(conn.read_block(300, 2, RegisterClass::INPUT), Encoding::FLOAT32) == 0.0);

        conn.write_bit(1, true);
        assert(RegisterCodec::decode(conn.read_block(300, 2, RegisterClass::INPUT), Encoding::FLOAT32) == 120.0);

        conn.write_bit(1, false);
        assert(RegisterCodec::decode(conn.read_block(300, 2, RegisterClass::INPUT), Encoding::FLOAT32) == 0.0);

        std::cout << "  Flow line physics test passed" << std::endl;
    }

    // Test 4: First-order lag approaches the setpoint
    {
        std::cout << "Test 4: Flow lag" << std::endl;

        auto dev = std::make_shared<SimulatedDevice>("SIM_T4", 42);
        SimulatedDevice::FlowLine line;
        line.valve_coil = 1;
        line.speed_register = 200;
        line.flow_register = 300;
        line.time_constant_s = 0.05;
        dev->add_flow_line(line);

        SimulatedConnection conn(dev, milliseconds(200));
        conn.connect();
        conn.write_block(200, RegisterCodec::encode(100.0, Encoding::FLOAT32));
        conn.write_bit(1, true);

        std::this_thread::sleep_for(milliseconds(10));
        double early = RegisterCodec::decode(conn.read_block(300, 2, RegisterClass::INPUT), Encoding::FLOAT32);
        assert(early > 0.0 && early < 100.0);

        std::this_thread::sleep_for(milliseconds(500));
        double late = RegisterCodec::decode(conn.read_block(300, 2, RegisterClass::INPUT), Encoding::FLOAT32);
        assert(late > early);
        assert(std::abs(late - 100.0) < 15.0);

        std::cout << "  Flow lag test passed (early=" << early << ", late=" << late << ")" << std::endl;
    }

    // Test 5: Fault injection
    {
        std::cout << "Test 5: Fault injection" << std::endl;

        auto dev = std::make_shared<SimulatedDevice>("SIM_T5", 42);
        dev->define_words(RegisterClass::HOLDING, 100, {1, 2});
        SimulatedConnection conn(dev, milliseconds(50));

        // reads before connect
        bool threw = false;
        try {
            conn.read_block(100, 1);
        } catch (const IoError& e) {
            threw = e.kind() == IoError::Kind::DISCONNECTED;
        }
        assert(threw);

        dev->set_reachable(false);
        threw = false;
        try {
            conn.connect();
        } catch (const ConnectionError& e) {
            threw = e.kind() == ConnectionError::Kind::TIMEOUT;
        }
        assert(threw);
        assert(!conn.is_connected());

        dev->set_reachable(true);
        conn.connect();
        dev->set_latency(milliseconds(100));
        auto start = steady_clock::now();
        threw = false;
        try {
            conn.read_block(100, 2);
        } catch (const IoError& e) {
            threw = e.kind() == IoError::Kind::TIMEOUT;
        }
        assert(threw);
        // bounded by the timeout, not the device latency
        assert(steady_clock::now() - start < milliseconds(95));
        assert(conn.statistics().timeouts == 1);

        dev->clear_faults();
        dev->reject_writes_to(101);
        threw = false;
        try {
            conn.write_block(100, {5, 6});
        } catch (const IoError& e) {
            threw = e.kind() == IoError::Kind::DEVICE_NAK;
        }
        assert(threw);
        // rejected write changes nothing
        assert(conn.read_block(100, 2) == std::vector<std::uint16_t>({1, 2}));

        dev->clear_faults();
        conn.write_block(100, {5, 6});
        assert(conn.read_block(100, 2) == std::vector<std::uint16_t>({5, 6}));

        std::cout << "  Fault injection test passed" << std::endl;
    }

    std::cout << "✅ All SimulatedDevice tests passed!" << std::endl;
    return 0;
}
