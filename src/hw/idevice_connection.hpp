#pragma once
#include "../core/errors.hpp"
#include "../protocol/register_codec.hpp"
#include <chrono>
#include <mutex>
#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Abstract link to one field device
 *
 * A connection is owned by exactly one consumer (a Poller or a
 * FlowController). It never retries internally: every failure is
 * reported to the caller, which decides on backoff, retry or abort.
 *
 * Failures:
 * - connect() throws ConnectionError
 * - block and bit operations throw IoError
 *
 * Every I/O call is bounded by the connection timeout.
 */
class IDeviceConnection {
public:
  /**
   * @brief Connection statistics
   */
  struct Statistics {
    uint64_t connects{0};           ///< successful connect() calls
    uint64_t transactions{0};       ///< completed request/response exchanges
    uint64_t errors{0};             ///< failed exchanges
    uint64_t timeouts{0};           ///< exchanges that hit the timeout
    double max_latency_ms{0.0};     ///< slowest completed exchange

    void update_on_success(double latency_ms) {
      transactions++;
      if (latency_ms > max_latency_ms) max_latency_ms = latency_ms;
    }

    void update_on_error(bool timeout) {
      errors++;
      if (timeout) timeouts++;
    }
  };

  virtual ~IDeviceConnection() = default;

  virtual void connect() = 0;
  virtual void close() = 0;
  virtual bool is_connected() const = 0;

  /**
   * @brief Read @p count consecutive 16-bit words
   * @param cls INPUT or HOLDING
   */
  virtual std::vector<std::uint16_t> read_block(std::uint16_t address, std::uint16_t count,
                                                RegisterClass cls = RegisterClass::HOLDING) = 0;

  /**
   * @brief Write consecutive holding registers
   */
  virtual void write_block(std::uint16_t address, const std::vector<std::uint16_t>& values) = 0;

  /**
   * @brief Read one bit
   * @param cls COIL or DISCRETE
   */
  virtual bool read_bit(std::uint16_t address, RegisterClass cls = RegisterClass::COIL) = 0;

  virtual void write_bit(std::uint16_t address, bool value) = 0;

  virtual std::string describe() const = 0;

  /**
   * @brief Cancel an exchange blocked in another thread
   *
   * The cancelled call fails with IoError. Transports that cannot be
   * interrupted keep the default, which does nothing.
   */
  virtual void abort() {}

  Statistics statistics() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
  }

protected:
  void record_connect() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.connects++;
  }

  void record_success(double latency_ms) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.update_on_success(latency_ms);
  }

  void record_error(bool timeout) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.update_on_error(timeout);
  }

private:
  mutable std::mutex stats_mutex_;
  Statistics stats_;
};
