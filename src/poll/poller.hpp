#pragma once
#include "register_cache.hpp"
#include "../config/site_config.hpp"
#include "../core/clock.hpp"
#include "../core/errors.hpp"
#include "../core/telemetry.hpp"
#include "../hw/idevice_connection.hpp"
#include "../protocol/modbus_frame.hpp"
#include "../protocol/register_codec.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Keeps the register cache fresh for one device
 *
 * Owns the device connection exclusively. Each enabled register carries its
 * own next-due time; a cycle reads every due register, coalescing
 * contiguous word registers of the same class into one block read, decodes
 * through RegisterCodec, applies the scale factor and upserts the cache.
 *
 * Any ConnectionError / IoError ends the cycle, records the poll status and
 * holds the whole device off for the configured backoff. Cached values are
 * never touched on failure; registers that were never read successfully
 * stay absent from the cache.
 */
class Poller {
public:
  struct Batch {
    RegisterClass cls{RegisterClass::HOLDING};
    std::uint16_t address{0};
    std::uint16_t count{0};
    std::vector<std::size_t> registers;   ///< indices into the device register list
  };

  Poller(DeviceConfig device, std::unique_ptr<IDeviceConnection> connection, RegisterCache& cache,
         ITriggerSink* triggers = nullptr, ITelemetrySink* telemetry = nullptr)
      : device_(std::move(device))
      , connection_(std::move(connection))
      , cache_(cache)
      , triggers_(triggers)
      , telemetry_(telemetry) {
    auto now = clock::now();
    for (std::size_t i = 0; i < device_.registers.size(); ++i) {
      if (device_.registers[i].enabled) {
        worklist_.push_back(WorkItem{now, i});
      }
    }
    health_.device_id = device_.id;
  }

  ~Poller() { stop(); }

  Poller(const Poller&) = delete;
  Poller& operator=(const Poller&) = delete;

  void start() {
    if (thread_.joinable()) return;
    thread_ = std::thread([this] { run(); });
  }

  /**
   * @brief Stop the polling thread and close the connection
   */
  void stop() {
    stop_.request_stop();
    if (thread_.joinable()) {
      thread_.join();
    }
    if (connection_) {
      connection_->close();
    }
  }

  bool is_running() const { return thread_.joinable() && !stop_.stop_requested(); }

  /**
   * @brief Run one poll cycle now (not while the thread is running)
   * @return number of registers read successfully
   */
  std::size_t poll_once() { return poll_cycle(clock::now()); }

  const DeviceConfig& device() const { return device_; }

  PollHealthEvent health() const {
    std::lock_guard<std::mutex> lock(health_mutex_);
    return health_;
  }

  PollStatus last_poll_status() const { return health().status; }

  /**
   * @brief Group register indices into block reads
   *
   * Word registers of the same class whose address ranges touch are merged
   * (up to the protocol block limit); bit registers are read one by one.
   */
  static std::vector<Batch> coalesce(const std::vector<RegisterConfig>& regs, std::vector<std::size_t> due) {
    std::sort(due.begin(), due.end(), [&](std::size_t a, std::size_t b) {
      if (regs[a].cls != regs[b].cls) return regs[a].cls < regs[b].cls;
      return regs[a].address < regs[b].address;
    });

    std::vector<Batch> batches;
    for (std::size_t idx : due) {
      const auto& r = regs[idx];
      auto width = static_cast<std::uint16_t>(RegisterCodec::word_width(r.encoding));
      if (!is_bit_class(r.cls) && !batches.empty()) {
        auto& last = batches.back();
        if (last.cls == r.cls && last.address + last.count == r.address &&
            last.count + width <= modbus::MAX_READ_REGISTERS) {
          last.count = static_cast<std::uint16_t>(last.count + width);
          last.registers.push_back(idx);
          continue;
        }
      }
      batches.push_back(Batch{r.cls, r.address, is_bit_class(r.cls) ? std::uint16_t(1) : width, {idx}});
    }
    return batches;
  }

private:
  using clock = std::chrono::steady_clock;

  struct WorkItem {
    clock::time_point due;
    std::size_t reg;
  };

  void run() {
    std::cout << "[poller " << device_.id << "] started on " << connection_->describe()
              << " (" << worklist_.size() << " registers)" << std::endl;
    while (!stop_.stop_requested()) {
      clock::time_point wake = next_wake();
      if (stop_.wait_until(wake)) break;
      poll_cycle(clock::now());
    }
    std::cout << "[poller " << device_.id << "] stopped" << std::endl;
  }

  clock::time_point next_wake() const {
    if (worklist_.empty()) return clock::now() + std::chrono::seconds(1);
    return std::max(worklist_.front().due, backoff_until_);
  }

  std::size_t poll_cycle(clock::time_point now) {
    if (now < backoff_until_) return 0;

    // worklist_ is kept sorted by due time
    std::vector<std::size_t> due;
    for (const auto& item : worklist_) {
      if (item.due > now) break;
      due.push_back(item.reg);
    }
    if (due.empty()) return 0;

    std::vector<TriggerEvent> changes;
    std::size_t read = 0;
    try {
      if (!connection_->is_connected()) {
        connection_->connect();
        std::cout << "[poller " << device_.id << "] connected to " << connection_->describe() << std::endl;
      }

      for (const auto& batch : coalesce(device_.registers, due)) {
        read += read_batch(batch, changes);
      }
      record_success();
    } catch (const ConnectionError& e) {
      record_failure(e.kind() == ConnectionError::Kind::TIMEOUT ? PollStatus::TIMEOUT : PollStatus::DISCONNECTED,
                     e.what());
    } catch (const IoError& e) {
      PollStatus status = PollStatus::PROTOCOL_ERROR;
      if (e.kind() == IoError::Kind::TIMEOUT) status = PollStatus::TIMEOUT;
      if (e.kind() == IoError::Kind::DISCONNECTED) status = PollStatus::DISCONNECTED;
      if (status != PollStatus::PROTOCOL_ERROR) connection_->close();
      record_failure(status, e.what());
    } catch (const CodecError& e) {
      record_failure(PollStatus::PROTOCOL_ERROR, e.what());
    }

    std::sort(worklist_.begin(), worklist_.end(),
              [](const WorkItem& a, const WorkItem& b) { return a.due < b.due; });

    if (triggers_ && !changes.empty()) {
      triggers_->on_register_changes(changes);
    }
    if (telemetry_) {
      telemetry_->on_poll_health(health());
    }
    return read;
  }

  std::size_t read_batch(const Batch& batch, std::vector<TriggerEvent>& changes) {
    std::vector<std::uint16_t> words;
    if (is_bit_class(batch.cls)) {
      words.push_back(connection_->read_bit(batch.address, batch.cls) ? 1 : 0);
    } else {
      words = connection_->read_block(batch.address, batch.count, batch.cls);
    }
    auto read_at = std::chrono::system_clock::now();
    auto next_due_base = clock::now();

    for (std::size_t idx : batch.registers) {
      const auto& r = device_.registers[idx];
      std::size_t offset = r.address - batch.address;
      std::size_t width = RegisterCodec::word_width(r.encoding);
      std::vector<std::uint16_t> slice(words.begin() + offset, words.begin() + offset + width);
      double value = RegisterCodec::decode(slice, r.encoding) * r.scale;

      if (cache_.upsert(device_.id, r.address, value, read_at)) {
        changes.push_back(TriggerEvent{device_.id, r.address, value, read_at});
      }
      reschedule(idx, next_due_base + r.interval);
    }
    return batch.registers.size();
  }

  void reschedule(std::size_t reg, clock::time_point due) {
    for (auto& item : worklist_) {
      if (item.reg == reg) {
        item.due = due;
        return;
      }
    }
  }

  void record_success() {
    std::lock_guard<std::mutex> lock(health_mutex_);
    if (health_.consecutive_failures > 0) {
      std::cout << "[poller " << device_.id << "] recovered after " << health_.consecutive_failures
                << " failed cycle(s)" << std::endl;
    }
    health_.status = PollStatus::OK;
    health_.last_poll_time = std::chrono::system_clock::now();
    health_.cycles++;
    health_.consecutive_failures = 0;
  }

  void record_failure(PollStatus status, const std::string& error) {
    backoff_until_ = clock::now() + device_.backoff;
    std::lock_guard<std::mutex> lock(health_mutex_);
    if (health_.consecutive_failures == 0 || health_.status != status) {
      std::cerr << "[poller " << device_.id << "] " << poll_status_name(status) << ": " << error
                << ", backing off " << device_.backoff.count() << " ms" << std::endl;
    }
    health_.status = status;
    health_.cycles++;
    health_.failures++;
    health_.consecutive_failures++;
    health_.last_error = error;
  }

  DeviceConfig device_;
  std::unique_ptr<IDeviceConnection> connection_;
  RegisterCache& cache_;
  ITriggerSink* triggers_;
  ITelemetrySink* telemetry_;

  std::vector<WorkItem> worklist_;
  clock::time_point backoff_until_{};

  mutable std::mutex health_mutex_;
  PollHealthEvent health_;

  StopSignal stop_;
  std::thread thread_;
};
