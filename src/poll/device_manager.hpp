#pragma once
#include "poller.hpp"
#include "register_cache.hpp"
#include "../config/site_config.hpp"
#include "../core/errors.hpp"
#include "../hw/idevice_connection.hpp"
#include "../hw/modbus_connection.hpp"
#include "../hw/sim_device.hpp"
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

/**
 * @brief Owned collection of devices, their pollers and the register cache
 *
 * Passed by reference to the blend orchestrator instead of being reached
 * through global state. Every call to open_connection() yields a new
 * connection that belongs to the caller alone.
 */
class DeviceManager {
public:
  using ConnectionFactory = std::function<std::unique_ptr<IDeviceConnection>(const DeviceConfig&)>;

  /**
   * @param factory Overrides how connections are built (tests); by default
   *                TCP/UDP devices get a ModbusConnection and "sim" devices a
   *                SimulatedConnection to an in-process SimulatedDevice.
   */
  DeviceManager(SiteConfig config, ITriggerSink* triggers = nullptr, ITelemetrySink* telemetry = nullptr,
                ConnectionFactory factory = {})
      : config_(std::move(config))
      , triggers_(triggers)
      , telemetry_(telemetry)
      , factory_(std::move(factory)) {
    for (const auto& d : config_.devices) {
      if (d.transport == TransportKind::SIMULATED) {
        simulated_[d.id] = build_simulated_device(d);
      }
    }
    for (const auto& d : config_.devices) {
      if (!d.active) {
        std::cout << "[devices] " << d.id << " inactive, not polled" << std::endl;
        continue;
      }
      pollers_[d.id] = std::make_unique<Poller>(d, open_connection(d.id), cache_, triggers_, telemetry_);
    }
  }

  ~DeviceManager() { stop_all(); }

  DeviceManager(const DeviceManager&) = delete;
  DeviceManager& operator=(const DeviceManager&) = delete;

  void start_all() {
    for (auto& [id, poller] : pollers_) poller->start();
  }

  void stop_all() {
    for (auto& [id, poller] : pollers_) poller->stop();
  }

  /**
   * @brief New exclusively-owned connection to a configured device
   * @throws ConfigError for unknown devices
   */
  std::unique_ptr<IDeviceConnection> open_connection(const std::string& device_id) {
    const DeviceConfig* d = config_.find_device(device_id);
    if (!d) throw ConfigError("unknown device " + device_id);
    if (factory_) return factory_(*d);

    switch (d->transport) {
      case TransportKind::STREAM:
        return std::make_unique<ModbusConnection>(d->host, d->port, d->unit_id, d->timeout,
                                                  ModbusConnection::Transport::STREAM);
      case TransportKind::PACKET:
        return std::make_unique<ModbusConnection>(d->host, d->port, d->unit_id, d->timeout,
                                                  ModbusConnection::Transport::PACKET);
      case TransportKind::SIMULATED:
        return std::make_unique<SimulatedConnection>(simulated_.at(d->id), d->timeout);
    }
    throw ConfigError("unsupported transport for " + device_id);
  }

  /**
   * @brief Stop a device's poller and forget its cached values
   */
  void remove_device(const std::string& device_id) {
    auto it = pollers_.find(device_id);
    if (it != pollers_.end()) {
      it->second->stop();
      pollers_.erase(it);
    }
    cache_.remove_device(device_id);
  }

  RegisterCache& cache() { return cache_; }
  const RegisterCache& cache() const { return cache_; }
  const SiteConfig& config() const { return config_; }

  Poller* poller(const std::string& device_id) {
    auto it = pollers_.find(device_id);
    return it == pollers_.end() ? nullptr : it->second.get();
  }

  std::shared_ptr<SimulatedDevice> simulated_device(const std::string& device_id) const {
    auto it = simulated_.find(device_id);
    return it == simulated_.end() ? nullptr : it->second;
  }

  std::vector<PollHealthEvent> health_all() const {
    std::vector<PollHealthEvent> out;
    for (const auto& [id, poller] : pollers_) out.push_back(poller->health());
    return out;
  }

private:
  std::shared_ptr<SimulatedDevice> build_simulated_device(const DeviceConfig& d) const {
    auto dev = std::make_shared<SimulatedDevice>(d.id);
    for (const auto& r : d.registers) {
      if (is_bit_class(r.cls)) {
        dev->define_bit(r.cls, r.address, false);
      } else {
        dev->define_value(r.cls, r.address, 0.0, r.encoding);
      }
    }
    for (const auto& t : config_.tanks) {
      if (t.device != d.id) continue;
      SimulatedDevice::FlowLine line;
      line.valve_coil = t.valve_coil;
      line.speed_register = t.pump_speed_register;
      line.flow_register = t.flow_rate_register;
      line.time_constant_s = d.sim_time_constant_s;
      line.noise_std = d.sim_noise_std;
      dev->add_flow_line(line);
    }
    return dev;
  }

  SiteConfig config_;
  ITriggerSink* triggers_;
  ITelemetrySink* telemetry_;
  ConnectionFactory factory_;

  RegisterCache cache_;
  std::map<std::string, std::shared_ptr<SimulatedDevice>> simulated_;
  std::map<std::string, std::unique_ptr<Poller>> pollers_;
};
