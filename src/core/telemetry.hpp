#pragma once
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

/**
 * @brief Outbound event samples emitted by the core
 *
 * Pollers emit TriggerEvent (one per changed register) and PollHealthEvent
 * (one per poll cycle); blend operations emit BlendProgressEvent from their
 * monitoring task. Fan-out to transports is done outside the core.
 */

using SystemTime = std::chrono::system_clock::time_point;

enum class PollStatus {
  NEVER_POLLED,
  OK,
  TIMEOUT,
  PROTOCOL_ERROR,
  DISCONNECTED
};

inline const char* poll_status_name(PollStatus s) {
  switch (s) {
    case PollStatus::NEVER_POLLED: return "never_polled";
    case PollStatus::OK: return "ok";
    case PollStatus::TIMEOUT: return "timeout";
    case PollStatus::PROTOCOL_ERROR: return "protocol_error";
    case PollStatus::DISCONNECTED: return "disconnected";
  }
  return "unknown";
}

/**
 * @brief Blend operation state machine
 *
 * PLANNING -> PREPARING -> BLENDING -> COMPLETING -> COMPLETED, with FAILED
 * and STOPPED reachable from every non-terminal state.
 */
enum class BlendStatus {
  PLANNING,
  PREPARING,
  BLENDING,
  COMPLETING,
  COMPLETED,
  FAILED,
  STOPPED
};

inline const char* blend_status_name(BlendStatus s) {
  switch (s) {
    case BlendStatus::PLANNING: return "planning";
    case BlendStatus::PREPARING: return "preparing";
    case BlendStatus::BLENDING: return "blending";
    case BlendStatus::COMPLETING: return "completing";
    case BlendStatus::COMPLETED: return "completed";
    case BlendStatus::FAILED: return "failed";
    case BlendStatus::STOPPED: return "stopped";
  }
  return "unknown";
}

inline bool is_terminal(BlendStatus s) {
  return s == BlendStatus::COMPLETED || s == BlendStatus::FAILED || s == BlendStatus::STOPPED;
}

/**
 * @brief Lifecycle of one component inside a blend
 *
 * PENDING -> ACTIVE -> DONE on a clean transfer. FAILED marks the component
 * whose flow path failed; STOPPED marks components cut short by a stop or
 * by another component's failure. DONE, FAILED and STOPPED are final.
 */
enum class ComponentState {
  PENDING,
  ACTIVE,
  DONE,
  FAILED,
  STOPPED
};

inline const char* component_state_name(ComponentState s) {
  switch (s) {
    case ComponentState::PENDING: return "pending";
    case ComponentState::ACTIVE: return "active";
    case ComponentState::DONE: return "done";
    case ComponentState::FAILED: return "failed";
    case ComponentState::STOPPED: return "stopped";
  }
  return "unknown";
}

inline double to_epoch_seconds(SystemTime t) {
  return std::chrono::duration<double>(t.time_since_epoch()).count();
}

/**
 * @brief Decoded register value after a poll cycle
 */
struct TriggerEvent {
  std::string device_id;
  std::uint16_t address{0};
  double value{0.0};
  SystemTime timestamp;
};

/**
 * @brief Per-device poll health
 */
struct PollHealthEvent {
  std::string device_id;
  PollStatus status{PollStatus::NEVER_POLLED};
  SystemTime last_poll_time;
  std::uint64_t cycles{0};
  std::uint64_t failures{0};
  std::uint32_t consecutive_failures{0};
  std::string last_error;

  std::string to_string() const {
    char buffer[256];
    std::snprintf(buffer, sizeof(buffer),
                  "PollHealth{device=%s, status=%s, cycles=%llu, failures=%llu, consecutive=%u}",
                  device_id.c_str(), poll_status_name(status),
                  static_cast<unsigned long long>(cycles),
                  static_cast<unsigned long long>(failures), consecutive_failures);
    return std::string(buffer);
  }
};

struct ComponentProgress {
  std::string source_tank;
  std::string product;
  double target_volume{0.0};
  double transferred_volume{0.0};
  double flow_rate{0.0};        ///< last observed flow (volume/min)
  ComponentState state{ComponentState::PENDING};
};

/**
 * @brief Blend progress snapshot published by the monitoring task
 */
struct BlendProgressEvent {
  std::uint64_t operation_id{0};
  BlendStatus status{BlendStatus::PLANNING};
  double accumulated_volume{0.0};
  double target_volume{0.0};
  double api_gravity{0.0};
  double viscosity{0.0};
  std::vector<ComponentProgress> components;

  double percent_complete() const {
    return target_volume > 0.0 ? 100.0 * accumulated_volume / target_volume : 0.0;
  }

  std::string to_string() const {
    char buffer[256];
    std::snprintf(buffer, sizeof(buffer),
                  "BlendProgress{op=%llu, status=%s, volume=%.2f/%.2f (%.1f%%), api=%.3f, visc=%.3f}",
                  static_cast<unsigned long long>(operation_id), blend_status_name(status),
                  accumulated_volume, target_volume, percent_complete(), api_gravity, viscosity);
    return std::string(buffer);
  }
};

/**
 * @brief Receiver of register change notifications
 */
struct ITriggerSink {
  virtual ~ITriggerSink() = default;
  virtual void on_register_changes(const std::vector<TriggerEvent>& changes) = 0;
};

/**
 * @brief Receiver of poll health and blend progress snapshots
 */
struct ITelemetrySink {
  virtual ~ITelemetrySink() = default;
  virtual void on_poll_health(const PollHealthEvent& health) = 0;
  virtual void on_blend_progress(const BlendProgressEvent& progress) = 0;
};
