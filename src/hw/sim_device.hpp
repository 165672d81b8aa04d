#pragma once
#include "idevice_connection.hpp"
#include "../protocol/register_codec.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Simulated field device (PLC / RTU) with flow line physics
 *
 * Holds the four register banks of a Modbus server in memory and models
 * any number of flow lines:
 * - a valve coil that gates flow
 * - a pump speed setpoint (holding register, float32, volume/min)
 * - a measured flow (input register, float32, volume/min) following the
 *   setpoint through a first-order lag with optional gaussian noise
 *
 * Fault injection (reachability, latency, NAK addresses) lets tests and the
 * daemon exercise every failure path of the connection contract.
 *
 * Thread-safe: any number of SimulatedConnection instances may share one
 * device.
 */
class SimulatedDevice {
public:
  struct FlowLine {
    std::uint16_t valve_coil{0};
    std::uint16_t speed_register{0};
    std::uint16_t flow_register{0};
    double time_constant_s{0.0};   ///< 0 = flow follows setpoint instantly
    double gain{1.0};              ///< measured flow per unit of pump speed
    double noise_std{0.0};         ///< measurement noise (volume/min)
    double flow{0.0};              ///< current physical flow
  };

  explicit SimulatedDevice(std::string id = "SIM_01", std::uint64_t noise_seed = 0)
      : id_(std::move(id))
      , rng_(noise_seed == 0 ? std::random_device{}() : noise_seed)
      , last_update_(std::chrono::steady_clock::now()) {}

  const std::string& id() const { return id_; }

  // Register bank setup -------------------------------------------------

  void define_words(RegisterClass cls, std::uint16_t address, const std::vector<std::uint16_t>& words) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& bank = cls == RegisterClass::INPUT ? input_ : holding_;
    for (std::size_t i = 0; i < words.size(); ++i) {
      bank[static_cast<std::uint16_t>(address + i)] = words[i];
    }
  }

  void define_value(RegisterClass cls, std::uint16_t address, double value, Encoding enc) {
    define_words(cls, address, RegisterCodec::encode(value, enc));
  }

  void define_bit(RegisterClass cls, std::uint16_t address, bool value) {
    std::lock_guard<std::mutex> lock(mutex_);
    (cls == RegisterClass::DISCRETE ? discrete_ : coils_)[address] = value;
  }

  /**
   * @brief Add a flow line and define its three registers
   */
  void add_flow_line(const FlowLine& line) {
    define_bit(RegisterClass::COIL, line.valve_coil, false);
    define_value(RegisterClass::HOLDING, line.speed_register, 0.0, Encoding::FLOAT32);
    define_value(RegisterClass::INPUT, line.flow_register, 0.0, Encoding::FLOAT32);
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.push_back(line);
  }

  // Fault injection -----------------------------------------------------

  void set_reachable(bool reachable) { reachable_.store(reachable); }
  bool is_reachable() const { return reachable_.load(); }

  void set_latency(std::chrono::milliseconds latency) { latency_ms_.store(latency.count()); }
  std::chrono::milliseconds latency() const { return std::chrono::milliseconds(latency_ms_.load()); }

  /// Writes to @p address are answered with an exception response
  void reject_writes_to(std::uint16_t address) {
    std::lock_guard<std::mutex> lock(mutex_);
    nak_writes_.insert(address);
  }

  void clear_faults() {
    std::lock_guard<std::mutex> lock(mutex_);
    nak_writes_.clear();
    reachable_.store(true);
    latency_ms_.store(0);
  }

  // Server side access (used by SimulatedConnection) ----------------------

  std::vector<std::uint16_t> read_words(RegisterClass cls, std::uint16_t address, std::uint16_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    update_physics_locked();
    auto& bank = cls == RegisterClass::INPUT ? input_ : holding_;
    std::vector<std::uint16_t> out;
    out.reserve(count);
    for (std::uint16_t i = 0; i < count; ++i) {
      auto it = bank.find(static_cast<std::uint16_t>(address + i));
      if (it == bank.end()) {
        throw IoError(IoError::Kind::DEVICE_NAK, id_ + ": illegal data address " + std::to_string(address + i));
      }
      out.push_back(it->second);
    }
    reads_++;
    return out;
  }

  void write_words(std::uint16_t address, const std::vector<std::uint16_t>& words) {
    std::lock_guard<std::mutex> lock(mutex_);
    update_physics_locked();
    for (std::size_t i = 0; i < words.size(); ++i) {
      auto a = static_cast<std::uint16_t>(address + i);
      if (holding_.find(a) == holding_.end()) {
        throw IoError(IoError::Kind::DEVICE_NAK, id_ + ": illegal data address " + std::to_string(a));
      }
      if (nak_writes_.count(a)) {
        throw IoError(IoError::Kind::DEVICE_NAK, id_ + ": server device failure at " + std::to_string(a));
      }
    }
    for (std::size_t i = 0; i < words.size(); ++i) {
      holding_[static_cast<std::uint16_t>(address + i)] = words[i];
    }
    writes_++;
  }

  bool read_bit(RegisterClass cls, std::uint16_t address) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& bank = cls == RegisterClass::DISCRETE ? discrete_ : coils_;
    auto it = bank.find(address);
    if (it == bank.end()) {
      throw IoError(IoError::Kind::DEVICE_NAK, id_ + ": illegal data address " + std::to_string(address));
    }
    reads_++;
    return it->second;
  }

  void write_bit(std::uint16_t address, bool value) {
    std::lock_guard<std::mutex> lock(mutex_);
    update_physics_locked();
    if (coils_.find(address) == coils_.end()) {
      throw IoError(IoError::Kind::DEVICE_NAK, id_ + ": illegal data address " + std::to_string(address));
    }
    if (nak_writes_.count(address)) {
      throw IoError(IoError::Kind::DEVICE_NAK, id_ + ": server device failure at " + std::to_string(address));
    }
    coils_[address] = value;
    writes_++;
  }

  // Inspection ------------------------------------------------------------

  double value(RegisterClass cls, std::uint16_t address, Encoding enc) {
    std::uint16_t width = static_cast<std::uint16_t>(RegisterCodec::word_width(enc));
    return RegisterCodec::decode(read_words(cls, address, width), enc);
  }

  bool coil(std::uint16_t address) { return read_bit(RegisterClass::COIL, address); }

  uint64_t read_count() const { return reads_.load(); }
  uint64_t write_count() const { return writes_.load(); }

private:
  void update_physics_locked() {
    auto now = std::chrono::steady_clock::now();
    double dt = std::chrono::duration<double>(now - last_update_).count();
    last_update_ = now;

    for (auto& line : lines_) {
      double speed = RegisterCodec::decode({holding_[line.speed_register],
                                            holding_[static_cast<std::uint16_t>(line.speed_register + 1)]},
                                           Encoding::FLOAT32);
      double target = coils_[line.valve_coil] ? speed * line.gain : 0.0;

      // first-order lag toward the commanded flow
      double alpha = line.time_constant_s <= 0.0 ? 1.0 : dt / (line.time_constant_s + dt);
      line.flow = alpha * target + (1.0 - alpha) * line.flow;

      double measured = line.flow;
      if (line.noise_std > 0.0 && line.flow != 0.0) {
        measured += std::normal_distribution<double>(0.0, line.noise_std)(rng_);
      }
      auto words = RegisterCodec::encode(measured, Encoding::FLOAT32);
      input_[line.flow_register] = words[0];
      input_[static_cast<std::uint16_t>(line.flow_register + 1)] = words[1];
    }
  }

  std::string id_;
  std::mutex mutex_;
  std::map<std::uint16_t, std::uint16_t> holding_;
  std::map<std::uint16_t, std::uint16_t> input_;
  std::map<std::uint16_t, bool> coils_;
  std::map<std::uint16_t, bool> discrete_;
  std::vector<FlowLine> lines_;
  std::set<std::uint16_t> nak_writes_;
  std::mt19937_64 rng_;
  std::chrono::steady_clock::time_point last_update_;

  std::atomic<bool> reachable_{true};
  std::atomic<long long> latency_ms_{0};
  std::atomic<uint64_t> reads_{0};
  std::atomic<uint64_t> writes_{0};
};

/**
 * @brief In-process connection to a SimulatedDevice
 *
 * Honours the connection contract: no retries, every call bounded by the
 * timeout, unreachable devices surface as ConnectionError / IoError.
 */
class SimulatedConnection : public IDeviceConnection {
public:
  SimulatedConnection(std::shared_ptr<SimulatedDevice> device, std::chrono::milliseconds timeout)
      : device_(std::move(device)), timeout_(timeout) {}

  void connect() override {
    if (!device_->is_reachable()) {
      std::this_thread::sleep_for(std::min(timeout_, std::chrono::milliseconds(50)));
      throw ConnectionError(ConnectionError::Kind::TIMEOUT, describe() + ": device unreachable");
    }
    connected_.store(true);
    record_connect();
  }

  void close() override { connected_.store(false); }

  bool is_connected() const override { return connected_.load(); }

  std::vector<std::uint16_t> read_block(std::uint16_t address, std::uint16_t count,
                                        RegisterClass cls = RegisterClass::HOLDING) override {
    return exchange([&] { return device_->read_words(cls, address, count); });
  }

  void write_block(std::uint16_t address, const std::vector<std::uint16_t>& values) override {
    exchange([&] { device_->write_words(address, values); return 0; });
  }

  bool read_bit(std::uint16_t address, RegisterClass cls = RegisterClass::COIL) override {
    return exchange([&] { return device_->read_bit(cls, address); });
  }

  void write_bit(std::uint16_t address, bool value) override {
    exchange([&] { device_->write_bit(address, value); return 0; });
  }

  std::string describe() const override { return "sim://" + device_->id(); }

private:
  template<class F>
  auto exchange(F f) -> decltype(f()) {
    if (!connected_.load()) {
      throw IoError(IoError::Kind::DISCONNECTED, describe() + ": not connected");
    }
    auto start = std::chrono::steady_clock::now();
    auto latency = device_->latency();
    if (!device_->is_reachable() || latency >= timeout_) {
      std::this_thread::sleep_for(timeout_);
      record_error(true);
      throw IoError(IoError::Kind::TIMEOUT, describe() + ": no response within timeout");
    }
    if (latency.count() > 0) {
      std::this_thread::sleep_for(latency);
    }
    try {
      auto result = f();
      record_success(
          std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count());
      return result;
    } catch (const IoError&) {
      record_error(false);
      throw;
    }
  }

  std::shared_ptr<SimulatedDevice> device_;
  std::chrono::milliseconds timeout_;
  std::atomic<bool> connected_{false};
};
