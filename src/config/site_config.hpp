#pragma once
#include "../core/errors.hpp"
#include "../protocol/register_codec.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <limits>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Static terminal configuration supplied by the surrounding system
 *
 * Devices with their register maps, tanks with the device registers that
 * drive their flow path, and product properties used for blend quality.
 * Read-only once loaded.
 */

/**
 * @brief Read an unsigned integer field without wrapping
 * @throws std::out_of_range if @p v is not an integer or does not fit in T
 */
template<class T>
T json_unsigned(const nlohmann::json& v, const std::string& what) {
  constexpr auto max = static_cast<std::uint64_t>(std::numeric_limits<T>::max());
  if (v.is_number_unsigned()) {
    if (v.get<std::uint64_t>() <= max) return static_cast<T>(v.get<std::uint64_t>());
  } else if (v.is_number_integer()) {
    auto n = v.get<std::int64_t>();
    if (n >= 0 && static_cast<std::uint64_t>(n) <= max) return static_cast<T>(n);
  }
  throw std::out_of_range(what + " must be an integer in 0.." + std::to_string(max) + ", got " + v.dump());
}

enum class TransportKind {
  STREAM,     ///< Modbus/TCP
  PACKET,     ///< Modbus/UDP
  SIMULATED   ///< in-process simulated device
};

struct RegisterConfig {
  std::string name;
  std::uint16_t address{0};
  RegisterClass cls{RegisterClass::HOLDING};
  Encoding encoding{Encoding::UINT16};
  double scale{1.0};
  std::chrono::milliseconds interval{1000};
  bool enabled{true};
};

struct DeviceConfig {
  std::string id;
  TransportKind transport{TransportKind::STREAM};
  std::string host{"127.0.0.1"};
  std::uint16_t port{502};
  std::uint8_t unit_id{1};
  std::chrono::milliseconds timeout{1000};
  std::chrono::milliseconds backoff{3000};
  bool active{true};
  std::vector<RegisterConfig> registers;

  // simulated plant parameters (transport == SIMULATED)
  double sim_time_constant_s{0.0};
  double sim_noise_std{0.0};

  const RegisterConfig* find_register(std::uint16_t address) const {
    for (const auto& r : registers) {
      if (r.address == address) return &r;
    }
    return nullptr;
  }
};

struct TankConfig {
  std::string id;
  std::string device;
  std::uint16_t valve_coil{0};
  std::uint16_t pump_speed_register{0};   ///< holding, float32, volume/min
  std::uint16_t flow_rate_register{0};    ///< input, float32, volume/min
};

struct ProductConfig {
  std::string id;
  double api_gravity{0.0};
  double viscosity{0.0};
};

struct BlendSettings {
  std::chrono::milliseconds control_interval{100};
  std::chrono::milliseconds monitor_interval{250};
  double percentage_tolerance{0.5};   ///< allowed deviation of the recipe sum from 100 %
  std::size_t archive_limit{256};      ///< finished operations kept for status queries
};

struct SiteConfig {
  std::vector<DeviceConfig> devices;
  std::vector<TankConfig> tanks;
  std::vector<ProductConfig> products;
  BlendSettings blend;

  const DeviceConfig* find_device(const std::string& id) const { return find_by_id(devices, id); }
  const TankConfig* find_tank(const std::string& id) const { return find_by_id(tanks, id); }
  const ProductConfig* find_product(const std::string& id) const { return find_by_id(products, id); }

  /**
   * @brief Check internal consistency
   * @throws ConfigError on the first inconsistency found
   */
  void validate() const {
    std::set<std::string> device_ids;
    for (const auto& d : devices) {
      if (d.id.empty()) throw ConfigError("device without id");
      if (!device_ids.insert(d.id).second) throw ConfigError("duplicate device " + d.id);
      if (d.timeout.count() <= 0) throw ConfigError(d.id + ": timeout must be positive");

      std::set<std::uint16_t> addresses;
      for (const auto& r : d.registers) {
        if (!addresses.insert(r.address).second) {
          throw ConfigError(d.id + ": duplicate register " + std::to_string(r.address));
        }
        if (is_bit_class(r.cls) != (r.encoding == Encoding::BOOL)) {
          throw ConfigError(d.id + ": register " + std::to_string(r.address) + " class " +
                            register_class_name(r.cls) + " cannot use " + encoding_name(r.encoding));
        }
        if (r.interval.count() <= 0) {
          throw ConfigError(d.id + ": register " + std::to_string(r.address) + " needs a positive interval");
        }
        for (const auto& other : d.registers) {
          if (&other != &r && other.cls == r.cls && other.address > r.address &&
              other.address < span_end(r)) {
            throw ConfigError(d.id + ": register " + std::to_string(other.address) + " overlaps " +
                              encoding_name(r.encoding) + " register " + std::to_string(r.address));
          }
        }
      }
    }

    std::set<std::string> tank_ids;
    for (const auto& t : tanks) {
      if (!tank_ids.insert(t.id).second) throw ConfigError("duplicate tank " + t.id);
      const DeviceConfig* d = find_device(t.device);
      if (!d) throw ConfigError("tank " + t.id + " references unknown device " + t.device);
      check_line_register(*d, t, t.valve_coil, RegisterClass::COIL, Encoding::BOOL, "valve_coil");
      check_line_register(*d, t, t.pump_speed_register, RegisterClass::HOLDING, Encoding::FLOAT32,
                          "pump_speed_register");
      check_line_register(*d, t, t.flow_rate_register, RegisterClass::INPUT, Encoding::FLOAT32,
                          "flow_rate_register");

      for (const auto& other : tanks) {
        if (&other == &t || other.device != t.device) continue;
        if (other.valve_coil == t.valve_coil) {
          throw ConfigError("tanks " + t.id + " and " + other.id + " share valve coil " + std::to_string(t.valve_coil));
        }
        if (spans_overlap(other.pump_speed_register, t.pump_speed_register)) {
          throw ConfigError("tanks " + t.id + " and " + other.id + " share pump register " +
                            std::to_string(t.pump_speed_register));
        }
        if (spans_overlap(other.flow_rate_register, t.flow_rate_register)) {
          throw ConfigError("tanks " + t.id + " and " + other.id + " share flow register " +
                            std::to_string(t.flow_rate_register));
        }
      }
    }

    std::set<std::string> product_ids;
    for (const auto& p : products) {
      if (!product_ids.insert(p.id).second) throw ConfigError("duplicate product " + p.id);
    }

    if (blend.control_interval.count() <= 0 || blend.monitor_interval.count() <= 0) {
      throw ConfigError("blend intervals must be positive");
    }
  }

  static SiteConfig from_json(const nlohmann::json& j) {
    try {
      SiteConfig cfg;
      for (const auto& jd : j.value("devices", nlohmann::json::array())) {
        cfg.devices.push_back(parse_device(jd));
      }
      for (const auto& jt : j.value("tanks", nlohmann::json::array())) {
        TankConfig t;
        t.id = jt.at("id").get<std::string>();
        t.device = jt.at("device").get<std::string>();
        t.valve_coil = json_unsigned<std::uint16_t>(jt.at("valve_coil"), t.id + " valve_coil");
        t.pump_speed_register = json_unsigned<std::uint16_t>(jt.at("pump_speed_register"), t.id + " pump_speed_register");
        t.flow_rate_register = json_unsigned<std::uint16_t>(jt.at("flow_rate_register"), t.id + " flow_rate_register");
        cfg.tanks.push_back(t);
      }
      for (const auto& jp : j.value("products", nlohmann::json::array())) {
        ProductConfig p;
        p.id = jp.at("id").get<std::string>();
        p.api_gravity = jp.at("api_gravity").get<double>();
        p.viscosity = jp.value("viscosity", 0.0);
        cfg.products.push_back(p);
      }
      if (j.contains("blend")) {
        const auto& jb = j.at("blend");
        cfg.blend.control_interval = std::chrono::milliseconds(
            jb.value("control_interval_ms", cfg.blend.control_interval.count()));
        cfg.blend.monitor_interval = std::chrono::milliseconds(
            jb.value("monitor_interval_ms", cfg.blend.monitor_interval.count()));
        cfg.blend.percentage_tolerance = jb.value("percentage_tolerance", cfg.blend.percentage_tolerance);
        if (jb.contains("archive_limit")) {
          cfg.blend.archive_limit = json_unsigned<std::size_t>(jb.at("archive_limit"), "archive_limit");
        }
      }
      cfg.validate();
      return cfg;
    } catch (const nlohmann::json::exception& e) {
      throw ConfigError(e.what());
    } catch (const std::out_of_range& e) {
      throw ConfigError(e.what());
    }
  }

  static SiteConfig load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("cannot open " + path);
    auto j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) throw ConfigError(path + " is not valid JSON");
    return from_json(j);
  }

private:
  static std::uint32_t span_end(const RegisterConfig& r) {
    return static_cast<std::uint32_t>(r.address) + static_cast<std::uint32_t>(RegisterCodec::word_width(r.encoding));
  }

  /// Two float32 line registers starting at @p a and @p b share a word
  static bool spans_overlap(std::uint16_t a, std::uint16_t b) {
    return (a > b ? a - b : b - a) < 2;
  }

  /**
   * @brief A declared register on a tank's line address must match how the line uses it
   *
   * The line register itself need not be declared; a declared register that
   * only partially covers a float32 line span is rejected.
   */
  static void check_line_register(const DeviceConfig& d, const TankConfig& t, std::uint16_t address,
                                  RegisterClass cls, Encoding encoding, const char* field) {
    std::uint32_t end = static_cast<std::uint32_t>(address) + static_cast<std::uint32_t>(RegisterCodec::word_width(encoding));
    for (const auto& r : d.registers) {
      if (r.cls != cls) continue;
      if (r.address == address) {
        if (r.encoding != encoding) {
          throw ConfigError("tank " + t.id + " " + field + " " + std::to_string(address) + " is declared " +
                            encoding_name(r.encoding) + ", needs " + encoding_name(encoding));
        }
      } else if (r.address < end && span_end(r) > address) {
        throw ConfigError("tank " + t.id + " " + field + " " + std::to_string(address) +
                          " overlaps register " + std::to_string(r.address));
      }
    }
  }

  template<class T>
  static const T* find_by_id(const std::vector<T>& items, const std::string& id) {
    for (const auto& item : items) {
      if (item.id == id) return &item;
    }
    return nullptr;
  }

  static RegisterClass parse_class(const std::string& s) {
    if (s == "input") return RegisterClass::INPUT;
    if (s == "holding") return RegisterClass::HOLDING;
    if (s == "coil") return RegisterClass::COIL;
    if (s == "discrete") return RegisterClass::DISCRETE;
    throw ConfigError("unknown register class " + s);
  }

  static Encoding parse_encoding(const std::string& s) {
    if (s == "int16") return Encoding::INT16;
    if (s == "uint16") return Encoding::UINT16;
    if (s == "int32") return Encoding::INT32;
    if (s == "float32") return Encoding::FLOAT32;
    if (s == "bool") return Encoding::BOOL;
    throw ConfigError("unknown encoding " + s);
  }

  static TransportKind parse_transport(const std::string& s) {
    if (s == "tcp") return TransportKind::STREAM;
    if (s == "udp") return TransportKind::PACKET;
    if (s == "sim") return TransportKind::SIMULATED;
    throw ConfigError("unknown transport " + s);
  }

  static DeviceConfig parse_device(const nlohmann::json& jd) {
    DeviceConfig d;
    d.id = jd.at("id").get<std::string>();
    d.transport = parse_transport(jd.value("transport", std::string("tcp")));
    d.host = jd.value("host", d.host);
    if (jd.contains("port")) d.port = json_unsigned<std::uint16_t>(jd.at("port"), d.id + " port");
    if (jd.contains("unit_id")) d.unit_id = json_unsigned<std::uint8_t>(jd.at("unit_id"), d.id + " unit_id");
    d.timeout = std::chrono::milliseconds(jd.value("timeout_ms", d.timeout.count()));
    d.backoff = std::chrono::milliseconds(jd.value("backoff_ms", d.backoff.count()));
    d.active = jd.value("active", true);
    d.sim_time_constant_s = jd.value("sim_time_constant_s", 0.0);
    d.sim_noise_std = jd.value("sim_noise_std", 0.0);

    for (const auto& jr : jd.value("registers", nlohmann::json::array())) {
      RegisterConfig r;
      r.address = json_unsigned<std::uint16_t>(jr.at("address"), d.id + " register address");
      r.name = jr.value("name", "r" + std::to_string(r.address));
      r.cls = parse_class(jr.value("class", std::string("holding")));
      r.encoding = parse_encoding(jr.value("encoding", std::string(is_bit_class(r.cls) ? "bool" : "uint16")));
      r.scale = jr.value("scale", 1.0);
      r.interval = std::chrono::milliseconds(jr.value("interval_ms", 1000));
      r.enabled = jr.value("enabled", true);
      d.registers.push_back(r);
    }
    return d;
  }
};
