#pragma once
#include "../control/blend_types.hpp"
#include "../core/event_channel.hpp"
#include "../core/telemetry.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

/**
 * @brief JSON shapes for everything that leaves the process
 *
 * Timestamps are epoch seconds (double). Topics for the publisher:
 * "trigger", "poll_health", "blend_progress".
 */

using json = nlohmann::json;

inline json time_or_null(const std::optional<SystemTime>& t) {
  return t ? json(to_epoch_seconds(*t)) : json(nullptr);
}

inline void to_json(json& j, const TriggerEvent& e) {
  j = {{"device", e.device_id}, {"address", e.address}, {"value", e.value}, {"t", to_epoch_seconds(e.timestamp)}};
}

inline void to_json(json& j, const PollHealthEvent& e) {
  j = {{"device", e.device_id},
       {"status", poll_status_name(e.status)},
       {"last_poll_time", e.last_poll_time == SystemTime{} ? json(nullptr) : json(to_epoch_seconds(e.last_poll_time))},
       {"cycles", e.cycles},
       {"failures", e.failures},
       {"consecutive_failures", e.consecutive_failures},
       {"last_error", e.last_error}};
}

inline void to_json(json& j, const ComponentProgress& c) {
  j = {{"source_tank", c.source_tank}, {"product", c.product}, {"target_volume", c.target_volume},
       {"transferred_volume", c.transferred_volume}, {"flow_rate", c.flow_rate},
       {"state", component_state_name(c.state)},
       {"active", c.state == ComponentState::ACTIVE}, {"failed", c.state == ComponentState::FAILED}};
}

inline void to_json(json& j, const BlendProgressEvent& e) {
  j = {{"operation_id", e.operation_id},
       {"status", blend_status_name(e.status)},
       {"accumulated_volume", e.accumulated_volume},
       {"target_volume", e.target_volume},
       {"percent_complete", e.percent_complete()},
       {"api_gravity", e.api_gravity},
       {"viscosity", e.viscosity},
       {"components", e.components}};
}

inline void to_json(json& j, const ComponentSnapshot& c) {
  j = {{"source_tank", c.source_tank},
       {"product", c.product},
       {"api_gravity", c.api_gravity},
       {"viscosity", c.viscosity},
       {"target_volume", c.target_volume},
       {"transferred_volume", c.transferred_volume},
       {"target_flow_rate", c.target_flow_rate},
       {"flow_tolerance", c.flow_tolerance},
       {"flow_rate", c.last_flow_rate},
       {"corrections", c.corrections},
       {"state", component_state_name(c.state)},
       {"active", c.state == ComponentState::ACTIVE},
       {"failed", c.state == ComponentState::FAILED},
       {"start_time", time_or_null(c.start_time)},
       {"end_time", time_or_null(c.end_time)}};
}

inline void to_json(json& j, const BlendSnapshot& s) {
  j = {{"id", s.id},
       {"target_tank", s.target_tank},
       {"status", blend_status_name(s.status)},
       {"target_volume", s.target_volume},
       {"accumulated_volume", s.accumulated_volume},
       {"api_gravity", s.api_gravity},
       {"viscosity", s.viscosity},
       {"created", to_epoch_seconds(s.created)},
       {"start_time", time_or_null(s.start_time)},
       {"end_time", time_or_null(s.end_time)},
       {"error", s.error},
       {"stop_errors", s.stop_errors},
       {"components", s.components}};
}

inline const char* event_topic(const Event& e) {
  if (std::holds_alternative<TriggerEvent>(e)) return "trigger";
  if (std::holds_alternative<PollHealthEvent>(e)) return "poll_health";
  return "blend_progress";
}

inline json event_to_json(const Event& e) {
  return std::visit([](const auto& v) { return json(v); }, e);
}

/**
 * @brief Parse a blend request from a start_blend command
 *
 * {"target_tank":"T-200","components":[{"source_tank":"T-101","product":"ULSD",
 *  "target_volume":600,"target_flow_rate":120,"flow_tolerance":5,"percentage":60}, ...]}
 */
inline BlendRequest blend_request_from_json(const json& j) {
  BlendRequest r;
  r.target_tank = j.at("target_tank").get<std::string>();
  for (const auto& jc : j.at("components")) {
    ComponentRequest c;
    c.source_tank = jc.at("source_tank").get<std::string>();
    c.product = jc.at("product").get<std::string>();
    c.target_volume = jc.at("target_volume").get<double>();
    c.target_flow_rate = jc.at("target_flow_rate").get<double>();
    c.flow_tolerance = jc.value("flow_tolerance", 0.0);
    if (jc.contains("percentage") && !jc.at("percentage").is_null()) {
      c.percentage = jc.at("percentage").get<double>();
    }
    r.components.push_back(c);
  }
  return r;
}
