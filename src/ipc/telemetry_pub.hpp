#pragma once
#include "messages.hpp"
#include "../core/event_channel.hpp"
#include <zmq.h>
#include <cstdint>
#include <iostream>
#include <string>

/**
 * @brief ZeroMQ event publisher
 *
 * Publishes outbound events as two-frame messages: topic, then JSON body.
 * Topics are "trigger", "poll_health" and "blend_progress", so subscribers
 * can filter on the first frame.
 *
 * Message format (blend_progress):
 * {"operation_id": 3, "status": "blending", "accumulated_volume": 412.5, "target_volume": 1000, ...}
 */
struct TelemetryPub {
  void* ctx{nullptr};  ///< ZeroMQ context
  void* pub{nullptr};  ///< ZeroMQ PUB socket

  /**
   * @brief Constructor - creates and binds publisher socket
   * @param address ZeroMQ endpoint, e.g. tcp://127.0.0.1:5556
   */
  explicit TelemetryPub(const std::string& address = "tcp://127.0.0.1:5556") : address_(address) {
    ctx = zmq_ctx_new();
    pub = zmq_socket(ctx, ZMQ_PUB);
    int linger = 0;
    zmq_setsockopt(pub, ZMQ_LINGER, &linger, sizeof(linger));
    bound_ = zmq_bind(pub, address_.c_str()) == 0;
    if (!bound_) {
      std::cerr << "[telemetry] bind " << address_ << " failed: " << zmq_strerror(zmq_errno()) << std::endl;
    }
  }

  /**
   * @brief Destructor - cleanup ZeroMQ resources
   */
  ~TelemetryPub() {
    zmq_close(pub);
    zmq_ctx_term(ctx);
  }

  TelemetryPub(const TelemetryPub&) = delete;
  TelemetryPub& operator=(const TelemetryPub&) = delete;

  bool is_connected() const { return bound_; }

  const std::string& get_bind_address() const { return address_; }

  /**
   * @brief Send one message on @p topic
   * @return false if ZeroMQ refused either frame
   */
  bool send(const std::string& topic, const std::string& body) {
    if (zmq_send(pub, topic.data(), topic.size(), ZMQ_SNDMORE) < 0) return false;
    if (zmq_send(pub, body.data(), body.size(), 0) < 0) return false;
    sent_++;
    return true;
  }

  bool publish(const Event& e) {
    return send(event_topic(e), event_to_json(e).dump());
  }

  std::uint64_t sent() const { return sent_; }

private:
  std::string address_;
  bool bound_{false};
  std::uint64_t sent_{0};
};
