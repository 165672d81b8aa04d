#pragma once
#include "../core/telemetry.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief One source stream of a blend request
 */
struct ComponentRequest {
  std::string source_tank;
  std::string product;
  double target_volume{0.0};
  double target_flow_rate{0.0};         ///< volume/min
  double flow_tolerance{0.0};           ///< allowed |measured - target| before a correction
  std::optional<double> percentage;     ///< recipe share, if the caller supplies one
};

struct BlendRequest {
  std::string target_tank;
  std::vector<ComponentRequest> components;
};

struct ComponentSnapshot {
  std::string source_tank;
  std::string product;
  double api_gravity{0.0};
  double viscosity{0.0};
  double target_volume{0.0};
  double transferred_volume{0.0};
  double target_flow_rate{0.0};
  double flow_tolerance{0.0};
  double last_flow_rate{0.0};
  std::uint64_t corrections{0};
  ComponentState state{ComponentState::PENDING};
  std::optional<SystemTime> start_time;
  std::optional<SystemTime> end_time;
};

/**
 * @brief Consistent view of a blend operation at one instant
 *
 * accumulated_volume is the sum of the component transferred volumes in
 * this same snapshot.
 */
struct BlendSnapshot {
  std::uint64_t id{0};
  std::string target_tank;
  BlendStatus status{BlendStatus::PLANNING};
  double target_volume{0.0};
  double accumulated_volume{0.0};
  double api_gravity{0.0};
  double viscosity{0.0};
  SystemTime created;
  std::optional<SystemTime> start_time;
  std::optional<SystemTime> end_time;
  std::string error;                       ///< terminal reason for FAILED / STOPPED
  std::vector<std::string> stop_errors;    ///< flow paths that could not be stopped cleanly
  std::vector<ComponentSnapshot> components;

  BlendProgressEvent to_progress_event() const {
    BlendProgressEvent e;
    e.operation_id = id;
    e.status = status;
    e.accumulated_volume = accumulated_volume;
    e.target_volume = target_volume;
    e.api_gravity = api_gravity;
    e.viscosity = viscosity;
    for (const auto& c : components) {
      e.components.push_back(ComponentProgress{c.source_tank, c.product, c.target_volume,
                                               c.transferred_volume, c.last_flow_rate, c.state});
    }
    return e;
  }
};

/**
 * @brief Volume-weighted average of a static product property
 *
 * sum(property_i * volume_i) / sum(volume_i), or 0 when nothing was transferred.
 */
template<class Components, class Property>
double volume_weighted(const Components& components, Property property) {
  double weighted = 0.0;
  double volume = 0.0;
  for (const auto& c : components) {
    weighted += property(c) * c.transferred_volume;
    volume += c.transferred_volume;
  }
  return volume > 0.0 ? weighted / volume : 0.0;
}
