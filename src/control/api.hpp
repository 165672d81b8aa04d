#pragma once
#include "blend_orchestrator.hpp"
#include "../config/site_config.hpp"
#include "../core/errors.hpp"
#include "../ipc/messages.hpp"
#include "../poll/device_manager.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

/**
 * @brief Command surface of the blend line controller
 *
 * Typed calls for in-process users, plus handle_cmd() which accepts one JSON
 * command and always returns a JSON reply. Supported commands:
 * - {"cmd":"start_blend","target_tank":...,"components":[...]}
 * - {"cmd":"emergency_stop","id":3}        (omit id to stop every operation)
 * - {"cmd":"get_status","id":3}
 * - {"cmd":"list_operations"}
 * - {"cmd":"get_cache_value","device":"PLC-1","address":100}
 * - {"cmd":"poll_health"}
 *
 * Failures are replied as {"ok":false,"error":"..."}; validation failures
 * also carry "issues":[{"component":i,"reason":...}].
 */
struct TerminalAPI {
  DeviceManager& devices;       ///< Devices, pollers and register cache
  BlendOrchestrator& blends;    ///< Blend operation registry

  BlendSnapshot start_blend(const BlendRequest& request) { return blends.start_blend(request); }

  BlendSnapshot emergency_stop(std::uint64_t id) { return blends.emergency_stop(id); }

  std::optional<BlendSnapshot> get_operation_status(std::uint64_t id) const {
    return blends.get_operation_status(id);
  }

  /**
   * @brief Last cached value of a register
   * @return nullopt if the register was never read successfully
   */
  std::optional<CacheEntry> get_cache_value(const std::string& device_id, std::uint16_t address) const {
    return devices.cache().get(device_id, address);
  }

  /**
   * @brief Handle one JSON command
   * @param s JSON command string
   * @return JSON response string
   */
  std::string handle_cmd(const std::string& s) {
    auto j = json::parse(s, nullptr, false);
    if (!j.is_object() || !j.contains("cmd") || !j["cmd"].is_string()) {
      return error_reply("malformed command");
    }
    const std::string cmd = j["cmd"].get<std::string>();

    try {
      if (cmd == "start_blend") {
        BlendSnapshot planned = start_blend(blend_request_from_json(j));
        return json{{"ok", true}, {"id", planned.id}, {"operation", planned}}.dump();
      } else if (cmd == "emergency_stop") {
        if (j.contains("id")) {
          BlendSnapshot s2 = emergency_stop(json_unsigned<std::uint64_t>(j.at("id"), "id"));
          return json{{"ok", true}, {"operation", s2}}.dump();
        }
        std::size_t n = blends.emergency_stop_all("emergency stop requested");
        return json{{"ok", true}, {"stopped", n}}.dump();
      } else if (cmd == "get_status") {
        auto status = get_operation_status(json_unsigned<std::uint64_t>(j.at("id"), "id"));
        if (!status) return error_reply("unknown blend operation");
        return json{{"ok", true}, {"operation", *status}}.dump();
      } else if (cmd == "list_operations") {
        return json{{"ok", true}, {"operations", blends.list_operations()}}.dump();
      } else if (cmd == "get_cache_value") {
        std::string device = j.at("device").get<std::string>();
        auto address = json_unsigned<std::uint16_t>(j.at("address"), "address");
        auto entry = get_cache_value(device, address);
        if (!entry) return error_reply("no value cached for " + device + ":" + std::to_string(address));
        return json{{"ok", true}, {"device", device}, {"address", address},
                    {"value", entry->value}, {"t", to_epoch_seconds(entry->timestamp)}}.dump();
      } else if (cmd == "poll_health") {
        return json{{"ok", true}, {"devices", devices.health_all()}}.dump();
      }
    } catch (const ValidationError& e) {
      json reply = {{"ok", false}, {"error", e.what()}, {"issues", json::array()}};
      for (const auto& issue : e.issues()) {
        reply["issues"].push_back({{"component", issue.component}, {"reason", issue.reason}});
      }
      return reply.dump();
    } catch (const json::exception& e) {
      return error_reply(std::string("bad arguments: ") + e.what());
    } catch (const std::out_of_range& e) {
      return error_reply(e.what());
    } catch (const std::runtime_error& e) {
      return error_reply(e.what());
    }
    return error_reply("unknown command " + cmd);
  }

private:
  static std::string error_reply(const std::string& error) {
    return json{{"ok", false}, {"error", error}}.dump();
  }
};
