#include "../src/config/site_config.hpp"
#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

/**
 * @brief Test SiteConfig parsing, defaults and validation
 */

static nlohmann::json base_config() {
    return nlohmann::json::parse(R"({
      "devices": [
        {"id": "PLC-1", "transport": "tcp", "host": "10.0.0.5", "port": 1502, "unit_id": 3,
         "timeout_ms": 800, "backoff_ms": 2000,
         "registers": [
           {"name": "level", "address": 100, "class": "holding", "encoding": "float32", "interval_ms": 500},
           {"address": 110, "class": "input", "encoding": "int16", "scale": 0.1},
           {"address": 1, "class": "coil"}
         ]},
        {"id": "SIM-1", "transport": "sim", "active": false, "sim_time_constant_s": 2.0}
      ],
      "tanks": [
        {"id": "T-101", "device": "PLC-1", "valve_coil": 1, "pump_speed_register": 200, "flow_rate_register": 300}
      ],
      "products": [
        {"id": "ULSD", "api_gravity": 40.0, "viscosity": 2.8}
      ],
      "blend": {"control_interval_ms": 50, "percentage_tolerance": 1.0}
    })");
}

static bool rejects(const nlohmann::json& j) {
    try {
        SiteConfig::from_json(j);
    } catch (const ConfigError& e) {
        std::cout << "  rejected: " << e.what() << std::endl;
        return true;
    }
    return false;
}

int main() {
    std::cout << "Testing SiteConfig functionality..." << std::endl;

    // Test 1: Full document
    {
        std::cout << "Test 1: Parsing" << std::endl;

        SiteConfig cfg = SiteConfig::from_json(base_config());
        assert(cfg.devices.size() == 2);

        const DeviceConfig* plc = cfg.find_device("PLC-1");
        assert(plc);
        assert(plc->transport == TransportKind::STREAM);
        assert(plc->host == "10.0.0.5");
        assert(plc->port == 1502);
        assert(plc->unit_id == 3);
        assert(plc->timeout == std::chrono::milliseconds(800));
        assert(plc->backoff == std::chrono::milliseconds(2000));
        assert(plc->active);
        assert(plc->registers.size() == 3);

        const RegisterConfig* level = plc->find_register(100);
        assert(level && level->name == "level");
        assert(level->encoding == Encoding::FLOAT32);
        assert(level->interval == std::chrono::milliseconds(500));

        const RegisterConfig* temp = plc->find_register(110);
        assert(temp->cls == RegisterClass::INPUT);
        assert(temp->scale == 0.1);
        assert(temp->interval == std::chrono::milliseconds(1000));

        const RegisterConfig* coil = plc->find_register(1);
        assert(coil->encoding == Encoding::BOOL);

        const DeviceConfig* sim = cfg.find_device("SIM-1");
        assert(sim->transport == TransportKind::SIMULATED);
        assert(!sim->active);
        assert(sim->sim_time_constant_s == 2.0);

        assert(cfg.find_tank("T-101")->flow_rate_register == 300);
        assert(cfg.find_product("ULSD")->api_gravity == 40.0);
        assert(!cfg.find_product("HSFO"));

        assert(cfg.blend.control_interval == std::chrono::milliseconds(50));
        assert(cfg.blend.monitor_interval == std::chrono::milliseconds(250));
        assert(cfg.blend.percentage_tolerance == 1.0);

        std::cout << "  Parsing test passed" << std::endl;
    }

    // Test 2: Validation failures
    {
        std::cout << "Test 2: Validation" << std::endl;

        auto dup_device = base_config();
        dup_device["devices"][1]["id"] = "PLC-1";
        assert(rejects(dup_device));

        auto dup_register = base_config();
        dup_register["devices"][0]["registers"][1]["address"] = 100;
        assert(rejects(dup_register));

        auto bool_word = base_config();
        bool_word["devices"][0]["registers"][0]["encoding"] = "bool";
        assert(rejects(bool_word));

        auto word_coil = base_config();
        word_coil["devices"][0]["registers"][2]["encoding"] = "int16";
        assert(rejects(word_coil));

        auto bad_tank = base_config();
        bad_tank["tanks"][0]["device"] = "PLC-9";
        assert(rejects(bad_tank));

        auto bad_transport = base_config();
        bad_transport["devices"][0]["transport"] = "serial";
        assert(rejects(bad_transport));

        auto missing_field = base_config();
        missing_field["products"][0].erase("api_gravity");
        assert(rejects(missing_field));

        auto wrong_type = base_config();
        wrong_type["tanks"][0]["valve_coil"] = "one";
        assert(rejects(wrong_type));

        std::cout << "  Validation test passed" << std::endl;
    }

    // Test 3: Out-of-range integers are rejected, not wrapped
    {
        std::cout << "Test 3: Integer ranges" << std::endl;

        auto big_coil = base_config();
        big_coil["tanks"][0]["valve_coil"] = 65537;
        assert(rejects(big_coil));

        auto negative_address = base_config();
        negative_address["devices"][0]["registers"][1]["address"] = -1;
        assert(rejects(negative_address));

        auto big_port = base_config();
        big_port["devices"][0]["port"] = 70000;
        assert(rejects(big_port));

        auto big_unit = base_config();
        big_unit["devices"][0]["unit_id"] = 256;
        assert(rejects(big_unit));

        auto fractional = base_config();
        fractional["tanks"][0]["flow_rate_register"] = 300.5;
        assert(rejects(fractional));

        auto top = base_config();
        top["devices"][0]["port"] = 65535;
        top["devices"][0]["unit_id"] = 255;
        top["blend"]["archive_limit"] = 8;
        SiteConfig cfg = SiteConfig::from_json(top);
        assert(cfg.devices[0].port == 65535);
        assert(cfg.devices[0].unit_id == 255);
        assert(cfg.blend.archive_limit == 8);
        assert(SiteConfig::from_json(base_config()).blend.archive_limit == 256);

        auto negative_limit = base_config();
        negative_limit["blend"]["archive_limit"] = -1;
        assert(rejects(negative_limit));

        std::cout << "  Integer ranges test passed" << std::endl;
    }

    // Test 4: Register spans and tank line registers
    {
        std::cout << "Test 4: Register layout" << std::endl;

        // float32 at 100 covers 101
        auto overlap = base_config();
        overlap["devices"][0]["registers"][1] = {{"address", 101}, {"class", "holding"}, {"encoding", "uint16"}};
        assert(rejects(overlap));

        // same address in another class is a different point
        auto other_class = base_config();
        other_class["devices"][0]["registers"][1] = {{"address", 101}, {"class", "input"}, {"encoding", "uint16"}};
        assert(!rejects(other_class));

        auto wrong_flow = base_config();
        wrong_flow["devices"][0]["registers"].push_back(
            {{"address", 300}, {"class", "input"}, {"encoding", "int16"}});
        assert(rejects(wrong_flow));

        auto split_flow = base_config();
        split_flow["devices"][0]["registers"].push_back(
            {{"address", 301}, {"class", "input"}, {"encoding", "uint16"}});
        assert(rejects(split_flow));

        auto straddle_pump = base_config();
        straddle_pump["devices"][0]["registers"].push_back(
            {{"address", 199}, {"class", "holding"}, {"encoding", "int32"}});
        assert(rejects(straddle_pump));

        auto declared_line = base_config();
        declared_line["devices"][0]["registers"].push_back(
            {{"address", 200}, {"class", "holding"}, {"encoding", "float32"}});
        declared_line["devices"][0]["registers"].push_back(
            {{"address", 300}, {"class", "input"}, {"encoding", "float32"}});
        assert(!rejects(declared_line));

        auto shared_coil = base_config();
        shared_coil["tanks"].push_back({{"id", "T-102"}, {"device", "PLC-1"}, {"valve_coil", 1},
                                        {"pump_speed_register", 210}, {"flow_rate_register", 310}});
        assert(rejects(shared_coil));

        auto shared_pump = base_config();
        shared_pump["tanks"].push_back({{"id", "T-102"}, {"device", "PLC-1"}, {"valve_coil", 2},
                                        {"pump_speed_register", 201}, {"flow_rate_register", 310}});
        assert(rejects(shared_pump));

        auto shared_flow = base_config();
        shared_flow["tanks"].push_back({{"id", "T-102"}, {"device", "PLC-1"}, {"valve_coil", 2},
                                        {"pump_speed_register", 210}, {"flow_rate_register", 300}});
        assert(rejects(shared_flow));

        auto separate = base_config();
        separate["tanks"].push_back({{"id", "T-102"}, {"device", "PLC-1"}, {"valve_coil", 2},
                                     {"pump_speed_register", 202}, {"flow_rate_register", 302}});
        assert(!rejects(separate));

        // same registers on another device do not clash
        auto other_device = base_config();
        other_device["tanks"].push_back({{"id", "T-900"}, {"device", "SIM-1"}, {"valve_coil", 1},
                                         {"pump_speed_register", 200}, {"flow_rate_register", 300}});
        assert(!rejects(other_device));

        SiteConfig example = SiteConfig::load_file(BLENDLINE_EXAMPLE_CONFIG);
        assert(example.tanks.size() == 3);

        std::cout << "  Register layout test passed" << std::endl;
    }

    // Test 5: Loading from disk
    {
        std::cout << "Test 5: File loading" << std::endl;

        const std::string path = "test_site_config.tmp.json";
        {
            std::ofstream out(path);
            out << base_config().dump(2);
        }
        SiteConfig cfg = SiteConfig::load_file(path);
        assert(cfg.tanks.size() == 1);

        {
            std::ofstream out(path);
            out << "{ not json";
        }
        bool threw = false;
        try {
            SiteConfig::load_file(path);
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw);
        std::remove(path.c_str());

        threw = false;
        try {
            SiteConfig::load_file("/nonexistent/site.json");
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw);

        std::cout << "  File loading test passed" << std::endl;
    }

    std::cout << "✅ All SiteConfig tests passed!" << std::endl;
    return 0;
}
