#pragma once
#include "blend_operation.hpp"
#include "blend_types.hpp"
#include "../config/site_config.hpp"
#include "../core/errors.hpp"
#include "../core/telemetry.hpp"
#include "../poll/device_manager.hpp"
#include <chrono>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Registry and entry point for blend operations
 *
 * start_blend() validates a request against the site configuration and the
 * operations already running, then launches a BlendOperation. A rejected
 * request leaves nothing behind. Source and target tanks of a live
 * operation are reserved until it reaches a terminal state and is reaped;
 * reaped operations keep their final snapshot in the archive, which holds
 * the newest blend.archive_limit operations.
 */
class BlendOrchestrator {
public:
  explicit BlendOrchestrator(DeviceManager& devices, ITelemetrySink* telemetry = nullptr)
      : devices_(devices), telemetry_(telemetry) {}

  ~BlendOrchestrator() { shutdown(); }

  BlendOrchestrator(const BlendOrchestrator&) = delete;
  BlendOrchestrator& operator=(const BlendOrchestrator&) = delete;

  /**
   * @brief Validate and launch a blend
   * @return Snapshot of the new operation, taken in PLANNING
   * @throws ValidationError listing every offending component
   */
  BlendSnapshot start_blend(const BlendRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    reap_locked();

    auto components = validate_locked(request);
    std::uint64_t id = next_id_++;
    auto op = std::make_shared<BlendOperation>(id, request.target_tank, std::move(components),
                                               devices_.config().blend, devices_, telemetry_);
    BlendSnapshot planned = op->snapshot();
    live_[id] = op;

    std::cout << "[blend " << id << "] planned " << planned.target_volume << " into " << request.target_tank
              << " from " << planned.components.size() << " source(s)" << std::endl;
    op->launch();
    return planned;
  }

  /**
   * @brief Stop every flow path of an operation
   * @throws std::out_of_range for unknown ids
   */
  BlendSnapshot emergency_stop(std::uint64_t id, const std::string& reason = "emergency stop requested") {
    std::shared_ptr<BlendOperation> op;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = live_.find(id);
      if (it == live_.end()) {
        if (archive_.count(id)) return archive_.at(id);
        throw std::out_of_range("unknown blend operation " + std::to_string(id));
      }
      op = it->second;
    }
    op->emergency_stop(reason);
    return op->snapshot();
  }

  /// Stop every live operation; returns how many were stopped
  std::size_t emergency_stop_all(const std::string& reason) {
    std::vector<std::shared_ptr<BlendOperation>> ops;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (auto& [id, op] : live_) ops.push_back(op);
    }
    for (auto& op : ops) op->emergency_stop(reason);
    return ops.size();
  }

  std::optional<BlendSnapshot> get_operation_status(std::uint64_t id) const {
    std::shared_ptr<BlendOperation> op;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = live_.find(id);
      if (it == live_.end()) {
        auto archived = archive_.find(id);
        if (archived == archive_.end()) return std::nullopt;
        return archived->second;
      }
      op = it->second;
    }
    return op->snapshot();
  }

  /// Snapshots of live and archived operations, ordered by id
  std::vector<BlendSnapshot> list_operations() const {
    std::map<std::uint64_t, BlendSnapshot> all;
    std::vector<std::shared_ptr<BlendOperation>> ops;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      all = archive_;
      for (const auto& [id, op] : live_) ops.push_back(op);
    }
    for (const auto& op : ops) all[op->id()] = op->snapshot();

    std::vector<BlendSnapshot> out;
    for (auto& [id, s] : all) out.push_back(std::move(s));
    return out;
  }

  /**
   * @brief Join finished operations and move them to the archive
   * @return number of operations archived
   */
  std::size_t reap() {
    std::lock_guard<std::mutex> lock(mutex_);
    return reap_locked();
  }

  /// Block until operation @p id has finished (test and shutdown helper)
  bool wait(std::uint64_t id, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
      auto s = get_operation_status(id);
      if (!s) return false;
      if (is_terminal(s->status)) {
        std::shared_ptr<BlendOperation> op;
        {
          std::lock_guard<std::mutex> lock(mutex_);
          auto it = live_.find(id);
          if (it == live_.end()) return true;
          op = it->second;
        }
        if (op->finished()) return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
  }

  std::size_t live_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_.size();
  }

  /// Emergency-stop whatever is still running and join every operation
  void shutdown() {
    std::size_t stopped = 0;
    std::map<std::uint64_t, std::shared_ptr<BlendOperation>> live;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      live.swap(live_);
    }
    for (auto& [id, op] : live) {
      if (!is_terminal(op->status())) {
        op->emergency_stop("controller shutdown");
        stopped++;
      }
      op->join();
      std::lock_guard<std::mutex> lock(mutex_);
      archive_[id] = op->snapshot();
      trim_archive_locked();
    }
    if (stopped > 0) {
      std::cerr << "[blend] shutdown stopped " << stopped << " active operation(s)" << std::endl;
    }
  }

private:
  std::vector<std::unique_ptr<BlendComponent>> validate_locked(const BlendRequest& request) const {
    const SiteConfig& site = devices_.config();

    if (request.components.empty()) {
      throw ValidationError("blend request has no components");
    }
    if (!site.find_tank(request.target_tank)) {
      throw ValidationError("unknown target tank " + request.target_tank);
    }
    for (const auto& [id, op] : live_) {
      if (op->uses_tank(request.target_tank)) {
        throw ValidationError("target tank " + request.target_tank + " is in use by operation " +
                              std::to_string(id));
      }
    }

    std::vector<ValidationError::Issue> issues;
    std::map<std::string, std::size_t> seen;
    bool any_percentage = false;
    double percentage_sum = 0.0;

    for (std::size_t i = 0; i < request.components.size(); ++i) {
      const auto& c = request.components[i];

      if (!site.find_tank(c.source_tank)) {
        issues.push_back({i, "unknown source tank " + c.source_tank});
      }
      if (c.source_tank == request.target_tank) {
        issues.push_back({i, "source tank " + c.source_tank + " is the target tank"});
      }
      auto dup = seen.find(c.source_tank);
      if (dup != seen.end()) {
        issues.push_back({i, "source tank " + c.source_tank + " already used by component " +
                                 std::to_string(dup->second)});
      } else {
        seen[c.source_tank] = i;
      }
      for (const auto& [id, op] : live_) {
        if (op->uses_tank(c.source_tank)) {
          issues.push_back({i, "source tank " + c.source_tank + " is in use by operation " + std::to_string(id)});
        }
      }
      if (!site.find_product(c.product)) {
        issues.push_back({i, "unknown product " + c.product});
      }
      if (!(c.target_volume > 0.0)) {
        issues.push_back({i, "target volume must be positive"});
      }
      if (!(c.target_flow_rate > 0.0)) {
        issues.push_back({i, "target flow rate must be positive"});
      }
      if (c.flow_tolerance < 0.0) {
        issues.push_back({i, "flow tolerance must not be negative"});
      }
      if (c.percentage) {
        any_percentage = true;
        percentage_sum += *c.percentage;
      }
    }

    if (any_percentage && std::abs(percentage_sum - 100.0) > site.blend.percentage_tolerance) {
      for (std::size_t i = 0; i < request.components.size(); ++i) {
        if (request.components[i].percentage) {
          issues.push_back({i, "percentages sum to " + std::to_string(percentage_sum) + ", not 100"});
        }
      }
    }

    if (!issues.empty()) {
      throw ValidationError(std::move(issues));
    }

    std::vector<std::unique_ptr<BlendComponent>> components;
    for (const auto& c : request.components) {
      components.push_back(
          std::make_unique<BlendComponent>(c, *site.find_tank(c.source_tank), *site.find_product(c.product)));
    }
    return components;
  }

  std::size_t reap_locked() {
    std::size_t reaped = 0;
    for (auto it = live_.begin(); it != live_.end();) {
      if (it->second->finished()) {
        it->second->join();
        archive_[it->first] = it->second->snapshot();
        it = live_.erase(it);
        reaped++;
      } else {
        ++it;
      }
    }
    trim_archive_locked();
    return reaped;
  }

  /// Ids grow monotonically, so the oldest records are at the front
  void trim_archive_locked() {
    const std::size_t limit = devices_.config().blend.archive_limit;
    while (archive_.size() > limit) {
      archive_.erase(archive_.begin());
    }
  }

  DeviceManager& devices_;
  ITelemetrySink* telemetry_;

  mutable std::mutex mutex_;
  std::uint64_t next_id_{1};
  std::map<std::uint64_t, std::shared_ptr<BlendOperation>> live_;
  std::map<std::uint64_t, BlendSnapshot> archive_;
};
