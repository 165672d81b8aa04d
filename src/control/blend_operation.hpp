#pragma once
#include "blend_types.hpp"
#include "flow_controller.hpp"
#include "../config/site_config.hpp"
#include "../core/clock.hpp"
#include "../core/errors.hpp"
#include "../core/telemetry.hpp"
#include "../poll/device_manager.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Runtime state of one blend component
 *
 * transferred is written only by the component's own control loop and read
 * by the monitor and status queries. state only leaves PENDING or ACTIVE;
 * a final state is never overwritten.
 */
struct BlendComponent {
  ComponentRequest request;
  TankConfig tank;
  ProductConfig product;

  std::atomic<double> transferred{0.0};
  std::atomic<double> last_flow{0.0};
  std::atomic<std::uint64_t> corrections{0};
  std::atomic<ComponentState> state{ComponentState::PENDING};

  mutable std::mutex time_mutex;
  std::optional<SystemTime> start_time;
  std::optional<SystemTime> end_time;

  BlendComponent(ComponentRequest r, TankConfig t, ProductConfig p)
      : request(std::move(r)), tank(std::move(t)), product(std::move(p)) {}

  void mark_started() {
    std::lock_guard<std::mutex> lock(time_mutex);
    start_time = std::chrono::system_clock::now();
  }

  void mark_ended() {
    std::lock_guard<std::mutex> lock(time_mutex);
    if (!end_time) end_time = std::chrono::system_clock::now();
  }

  /// Move to @p to unless a final state was already reached
  bool transition(ComponentState to) {
    ComponentState current = state.load();
    while (current == ComponentState::PENDING || current == ComponentState::ACTIVE) {
      if (state.compare_exchange_weak(current, to)) return true;
    }
    return false;
  }
};

/**
 * @brief One blend operation: its flow controllers, control loops and monitor
 *
 * launch() starts a coordinating thread that walks the operation through
 * PREPARING (one FlowController per component, readiness read only),
 * BLENDING (one control thread per component, while the coordinator itself
 * runs the monitoring task) and COMPLETING -> COMPLETED once every loop has
 * exited cleanly.
 *
 * emergency_stop() and internal failures go through terminate(): the stop
 * signal is raised, every flow controller is stopped in parallel and only
 * then is the terminal status recorded. Status never moves backward.
 */
class BlendOperation {
public:
  BlendOperation(std::uint64_t id, std::string target_tank, std::vector<std::unique_ptr<BlendComponent>> components,
                 BlendSettings settings, DeviceManager& devices, ITelemetrySink* telemetry = nullptr)
      : id_(id)
      , target_tank_(std::move(target_tank))
      , components_(std::move(components))
      , settings_(settings)
      , devices_(devices)
      , telemetry_(telemetry)
      , created_(std::chrono::system_clock::now()) {
    for (const auto& c : components_) target_volume_ += c->request.target_volume;
  }

  ~BlendOperation() {
    if (!is_terminal(status())) {
      emergency_stop("operation destroyed while active");
    }
    join();
  }

  BlendOperation(const BlendOperation&) = delete;
  BlendOperation& operator=(const BlendOperation&) = delete;

  std::uint64_t id() const { return id_; }

  void launch() {
    coordinator_ = std::thread([this] { run(); });
  }

  /// Wait for the coordinator (and through it every control loop) to exit
  void join() {
    if (coordinator_.joinable()) coordinator_.join();
  }

  bool finished() const { return finished_.load(); }

  BlendStatus status() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return status_;
  }

  bool uses_tank(const std::string& tank_id) const {
    if (tank_id == target_tank_) return true;
    for (const auto& c : components_) {
      if (c->tank.id == tank_id) return true;
    }
    return false;
  }

  const std::string& target_tank() const { return target_tank_; }

  /**
   * @brief Stop every flow path and end the operation as STOPPED
   *
   * Safe from any thread and any state. On an already terminal operation the
   * physical stop is issued again and the status is left unchanged.
   */
  void emergency_stop(const std::string& reason = "emergency stop requested") {
    terminate(BlendStatus::STOPPED, reason);
  }

  BlendSnapshot snapshot() const {
    BlendSnapshot s;
    s.id = id_;
    s.target_tank = target_tank_;
    s.target_volume = target_volume_;
    s.created = created_;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      s.status = status_;
      s.start_time = start_time_;
      s.end_time = end_time_;
      s.error = error_;
      s.stop_errors = stop_errors_;
    }

    for (const auto& c : components_) {
      ComponentSnapshot cs;
      cs.source_tank = c->tank.id;
      cs.product = c->product.id;
      cs.api_gravity = c->product.api_gravity;
      cs.viscosity = c->product.viscosity;
      cs.target_volume = c->request.target_volume;
      cs.transferred_volume = c->transferred.load();
      cs.target_flow_rate = c->request.target_flow_rate;
      cs.flow_tolerance = c->request.flow_tolerance;
      cs.last_flow_rate = c->last_flow.load();
      cs.corrections = c->corrections.load();
      cs.state = c->state.load();
      {
        std::lock_guard<std::mutex> lock(c->time_mutex);
        cs.start_time = c->start_time;
        cs.end_time = c->end_time;
      }
      s.accumulated_volume += cs.transferred_volume;
      s.components.push_back(std::move(cs));
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (frozen_) {
      s.api_gravity = final_api_gravity_;
      s.viscosity = final_viscosity_;
    } else {
      s.api_gravity = volume_weighted(s.components, [](const ComponentSnapshot& c) { return c.api_gravity; });
      s.viscosity = volume_weighted(s.components, [](const ComponentSnapshot& c) { return c.viscosity; });
    }
    return s;
  }

private:
  static int rank(BlendStatus s) { return static_cast<int>(s); }

  void run() {
    if (advance(BlendStatus::PREPARING) && prepare() && advance(BlendStatus::BLENDING)) {
      {
        std::lock_guard<std::mutex> lock(state_mutex_);
        start_time_ = std::chrono::system_clock::now();
      }
      publish();

      std::vector<std::thread> loops;
      for (std::size_t i = 0; i < components_.size(); ++i) {
        loops.emplace_back([this, i] { control_loop(i); });
      }
      monitor();
      for (auto& t : loops) t.join();

      if (status() == BlendStatus::COMPLETING) {
        complete();
      }
    }
    publish();
    finished_.store(true);
  }

  /// Allocate one controller per component and confirm each is reachable
  bool prepare() {
    for (auto& c : components_) {
      try {
        auto fc = std::make_unique<FlowController>(c->tank, devices_.open_connection(c->tank.device));
        FlowController* raw = fc.get();
        {
          std::lock_guard<std::mutex> lock(controllers_mutex_);
          controllers_.push_back(std::move(fc));
        }
        raw->check_ready();
      } catch (const ActuationError& e) {
        c->transition(ComponentState::FAILED);
        fail(e.what());
        return false;
      } catch (const ConfigError& e) {
        c->transition(ComponentState::FAILED);
        fail(e.what());
        return false;
      }
      if (stop_.stop_requested()) return false;
    }
    std::cout << "[blend " << id_ << "] " << components_.size() << " flow path(s) ready" << std::endl;
    return true;
  }

  void control_loop(std::size_t index) {
    BlendComponent& c = *components_[index];
    FlowController* fc = controller(index);
    const double target = c.request.target_volume;

    try {
      fc->open_valve();
      fc->set_pump_speed(c.request.target_flow_rate);
      c.mark_started();
      c.transition(ComponentState::ACTIVE);

      PeriodicClock clock(settings_.control_interval);
      while (clock.wait_next(stop_)) {
        double flow = fc->read_flow_rate();
        double elapsed_min = clock.tick() / 60.0;
        c.last_flow.store(flow);

        // the last increment is cut off at the target
        double done = c.transferred.load();
        double increment = std::max(flow, 0.0) * elapsed_min;
        bool reached = increment >= target - done;
        c.transferred.store(reached ? target : done + increment);

        if (reached) {
          fc->set_pump_speed(0.0);
          fc->close_valve();
          c.transition(ComponentState::DONE);
          c.mark_ended();
          std::cout << "[blend " << id_ << "] " << c.tank.id << " reached " << target << std::endl;
          return;
        }

        if (std::abs(flow - c.request.target_flow_rate) > c.request.flow_tolerance) {
          fc->adjust_flow_rate(c.request.target_flow_rate);
          c.corrections++;
        }
      }
    } catch (const ActuationError& e) {
      if (!stop_.stop_requested()) {
        c.transition(ComponentState::FAILED);
        c.mark_ended();
        fail(e.what());
        return;
      }
    }
    // cancelled
    c.transition(ComponentState::STOPPED);
    c.mark_ended();
  }

  void monitor() {
    PeriodicClock clock(settings_.monitor_interval);
    while (clock.wait_next(stop_)) {
      BlendSnapshot s = snapshot();
      publish(s);

      bool all_done = std::all_of(components_.begin(), components_.end(),
                                  [](const std::unique_ptr<BlendComponent>& c) {
                                    return c->state.load() == ComponentState::DONE;
                                  });
      if (all_done || s.accumulated_volume >= target_volume_) {
        advance(BlendStatus::COMPLETING);
        return;
      }
    }
  }

  void complete() {
    BlendSnapshot s = snapshot();
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (aborting_ || is_terminal(status_)) return;
    status_ = BlendStatus::COMPLETED;
    end_time_ = std::chrono::system_clock::now();
    final_api_gravity_ = s.api_gravity;
    final_viscosity_ = s.viscosity;
    frozen_ = true;
    std::cout << "[blend " << id_ << "] completed: " << s.accumulated_volume << " into " << target_tank_
              << ", API " << s.api_gravity << ", viscosity " << s.viscosity << std::endl;
  }

  /// Forward-only, non-terminal transition; refused once a stop is in progress
  bool advance(BlendStatus to) {
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      if (aborting_ || is_terminal(status_) || rank(to) <= rank(status_)) return false;
      status_ = to;
    }
    std::cout << "[blend " << id_ << "] -> " << blend_status_name(to) << std::endl;
    publish();
    return true;
  }

  void fail(const std::string& reason) {
    terminate(BlendStatus::FAILED, reason);
  }

  void terminate(BlendStatus terminal, const std::string& reason) {
    bool first = false;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      if (!aborting_ && !is_terminal(status_)) {
        aborting_ = true;
        first = true;
      }
    }
    if (first) {
      std::cerr << "[blend " << id_ << "] " << (terminal == BlendStatus::FAILED ? "FAILED: " : "STOPPING: ")
                << reason << std::endl;
    }

    stop_.request_stop();
    auto errors = stop_all_lines();
    // components that never reached a final state were cut short
    for (auto& c : components_) {
      if (c->transition(ComponentState::STOPPED)) c->mark_ended();
    }

    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      stop_errors_.insert(stop_errors_.end(), errors.begin(), errors.end());
      if (!first) return;
      status_ = terminal;
      error_ = reason;
      end_time_ = std::chrono::system_clock::now();
    }
    freeze();
    std::cerr << "[blend " << id_ << "] -> " << blend_status_name(terminal) << std::endl;
    publish();
  }

  /// Emergency-stop every allocated controller concurrently
  std::vector<std::string> stop_all_lines() {
    std::vector<FlowController*> lines;
    {
      std::lock_guard<std::mutex> lock(controllers_mutex_);
      for (auto& fc : controllers_) lines.push_back(fc.get());
    }

    std::mutex errors_mutex;
    std::vector<std::string> errors;
    std::vector<std::thread> workers;
    for (FlowController* fc : lines) {
      workers.emplace_back([fc, &errors, &errors_mutex] {
        try {
          fc->emergency_stop();
        } catch (const ActuationError& e) {
          std::lock_guard<std::mutex> lock(errors_mutex);
          errors.push_back(e.what());
        }
      });
    }
    for (auto& w : workers) w.join();
    return errors;
  }

  void freeze() {
    BlendSnapshot s = snapshot();
    std::lock_guard<std::mutex> lock(state_mutex_);
    final_api_gravity_ = s.api_gravity;
    final_viscosity_ = s.viscosity;
    frozen_ = true;
  }

  FlowController* controller(std::size_t index) {
    std::lock_guard<std::mutex> lock(controllers_mutex_);
    return controllers_.at(index).get();
  }

  void publish() { publish(snapshot()); }

  void publish(const BlendSnapshot& s) {
    if (telemetry_) telemetry_->on_blend_progress(s.to_progress_event());
  }

  const std::uint64_t id_;
  const std::string target_tank_;
  std::vector<std::unique_ptr<BlendComponent>> components_;
  double target_volume_{0.0};
  BlendSettings settings_;
  DeviceManager& devices_;
  ITelemetrySink* telemetry_;
  const SystemTime created_;

  std::mutex controllers_mutex_;
  std::vector<std::unique_ptr<FlowController>> controllers_;

  mutable std::mutex state_mutex_;
  BlendStatus status_{BlendStatus::PLANNING};
  bool aborting_{false};
  std::optional<SystemTime> start_time_;
  std::optional<SystemTime> end_time_;
  std::string error_;
  std::vector<std::string> stop_errors_;
  bool frozen_{false};
  double final_api_gravity_{0.0};
  double final_viscosity_{0.0};

  StopSignal stop_;
  std::atomic<bool> finished_{false};
  std::thread coordinator_;
};
