#pragma once
#include "../config/site_config.hpp"
#include "../core/errors.hpp"
#include "../hw/idevice_connection.hpp"
#include "../protocol/register_codec.hpp"
#include <algorithm>
#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

/**
 * @brief Valve + pump actuation for one source tank flow path
 *
 * Every command is a device write or read through the controller's own
 * connection. Any device failure surfaces as ActuationError and is not
 * retried; the caller decides between retry and abort.
 *
 * emergency_stop() preempts: it latches the stop flag, aborts a command
 * blocked on the device, writes pump = 0 and valve = closed at once, then
 * waits for that command to drain and writes the stop again so the in-flight
 * command cannot leave the line running. Once latched, every other command
 * is rejected.
 */
class FlowController {
public:
  struct State {
    bool valve_open{false};
    double commanded_speed{0.0};   ///< last pump speed written (volume/min)
    double last_flow_rate{0.0};    ///< last measured flow (volume/min)
    bool emergency_stopped{false};
  };

  FlowController(TankConfig tank, std::unique_ptr<IDeviceConnection> connection)
      : tank_(std::move(tank)), connection_(std::move(connection)) {}

  ~FlowController() {
    if (connection_) connection_->close();
  }

  FlowController(const FlowController&) = delete;
  FlowController& operator=(const FlowController&) = delete;

  const std::string& tank_id() const { return tank_.id; }

  /**
   * @brief Connect and read the flow meter once without actuating anything
   * @throws ActuationError if the flow path cannot be reached
   */
  void check_ready() {
    read_flow_rate();
  }

  void open_valve() { set_valve(true); }

  void close_valve() { set_valve(false); }

  void set_pump_speed(double rate) {
    if (rate < 0.0) {
      throw ActuationError(tank_.id, "negative pump speed " + std::to_string(rate));
    }
    command([&] {
      connection_->write_block(tank_.pump_speed_register, RegisterCodec::encode(rate, Encoding::FLOAT32));
      std::lock_guard<std::mutex> lock(state_mutex_);
      state_.commanded_speed = rate;
    });
  }

  double read_flow_rate() {
    double rate = 0.0;
    command([&] {
      auto words = connection_->read_block(tank_.flow_rate_register, 2, RegisterClass::INPUT);
      rate = RegisterCodec::decode(words, Encoding::FLOAT32);
      std::lock_guard<std::mutex> lock(state_mutex_);
      state_.last_flow_rate = rate;
    });
    return rate;
  }

  /**
   * @brief Trim the pump setpoint so the measured flow moves to @p target
   *
   * The setpoint is shifted by the observed error (target - last measured
   * flow) and never goes negative.
   * @return the setpoint written
   */
  double adjust_flow_rate(double target) {
    State s = state();
    double corrected = std::max(0.0, s.commanded_speed + (target - s.last_flow_rate));
    set_pump_speed(corrected);
    return corrected;
  }

  /**
   * @brief Close the valve and zero the pump, preempting any command in flight
   *
   * Idempotent. Safe to call from any thread.
   * @throws ActuationError if the stop could not be written at all
   */
  void emergency_stop() {
    bool was_stopped = estop_.exchange(true);
    if (!was_stopped) {
      std::cerr << "[flow " << tank_.id << "] EMERGENCY STOP" << std::endl;
    }
    bool raced = in_flight_.load();
    if (raced) connection_->abort();

    std::string first_error;
    bool ok = write_stop(first_error);

    if (!ok || raced) {
      // let the in-flight command drain, then make sure the stop is the last write
      std::lock_guard<std::mutex> lock(command_mutex_);
      std::string second_error;
      ok = write_stop(second_error);
      if (!ok) {
        throw ActuationError(tank_.id, "emergency stop failed: " + second_error);
      }
    }
  }

  bool is_emergency_stopped() const { return estop_.load(); }

  State state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    State s = state_;
    s.emergency_stopped = estop_.load();
    return s;
  }

private:
  template<class F>
  void command(F f) {
    std::lock_guard<std::mutex> lock(command_mutex_);
    // in_flight_ is raised before the stop flag is checked; emergency_stop()
    // does the reverse, so at least one side sees the other
    in_flight_.store(true);
    if (estop_.load()) {
      in_flight_.store(false);
      throw ActuationError(tank_.id, "emergency stop active");
    }
    try {
      ensure_connected();
      f();
      in_flight_.store(false);
    } catch (const ConnectionError& e) {
      in_flight_.store(false);
      throw ActuationError(tank_.id, e.what());
    } catch (const IoError& e) {
      in_flight_.store(false);
      if (e.kind() == IoError::Kind::TIMEOUT || e.kind() == IoError::Kind::DISCONNECTED) {
        connection_->close();
      }
      throw ActuationError(tank_.id, e.what());
    } catch (const CodecError& e) {
      in_flight_.store(false);
      throw ActuationError(tank_.id, e.what());
    }
  }

  void ensure_connected() {
    if (!connection_->is_connected()) {
      connection_->connect();
    }
  }

  void set_valve(bool open) {
    command([&] {
      connection_->write_bit(tank_.valve_coil, open);
      std::lock_guard<std::mutex> lock(state_mutex_);
      state_.valve_open = open;
    });
  }

  /// Pump is zeroed before the valve closes; a failed pump write does not skip the valve
  bool write_stop(std::string& error) {
    bool pump_ok = attempt(error, [&] {
      connection_->write_block(tank_.pump_speed_register, RegisterCodec::encode(0.0, Encoding::FLOAT32));
      std::lock_guard<std::mutex> lock(state_mutex_);
      state_.commanded_speed = 0.0;
    });
    bool valve_ok = attempt(error, [&] {
      connection_->write_bit(tank_.valve_coil, false);
      std::lock_guard<std::mutex> lock(state_mutex_);
      state_.valve_open = false;
    });
    return pump_ok && valve_ok;
  }

  template<class F>
  bool attempt(std::string& error, F f) {
    try {
      ensure_connected();
      f();
      return true;
    } catch (const ConnectionError& e) {
      error = e.what();
    } catch (const IoError& e) {
      error = e.what();
    }
    std::cerr << "[flow " << tank_.id << "] stop write failed: " << error << std::endl;
    return false;
  }

  TankConfig tank_;
  std::unique_ptr<IDeviceConnection> connection_;

  std::mutex command_mutex_;
  std::atomic<bool> estop_{false};
  std::atomic<bool> in_flight_{false};

  mutable std::mutex state_mutex_;
  State state_;
};
