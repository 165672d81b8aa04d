#pragma once
#include <zmq.h>
#include <iostream>
#include <optional>
#include <string>

/**
 * @brief ZeroMQ command responder
 *
 * Receives JSON commands (see TerminalAPI::handle_cmd) and sends one reply
 * per command, REQ/REP style. recv() waits at most the receive timeout so a
 * serving loop can notice shutdown between commands.
 */
struct ControlRep {
  void* ctx{nullptr};  ///< ZeroMQ context
  void* rep{nullptr};  ///< ZeroMQ REP socket

  /**
   * @brief Constructor - creates and binds responder socket
   * @param address ZeroMQ endpoint, e.g. tcp://127.0.0.1:5555
   * @param recv_timeout_ms receive timeout in milliseconds
   */
  explicit ControlRep(const std::string& address = "tcp://127.0.0.1:5555", int recv_timeout_ms = 200)
      : address_(address) {
    ctx = zmq_ctx_new();
    rep = zmq_socket(ctx, ZMQ_REP);
    int linger = 0;
    zmq_setsockopt(rep, ZMQ_LINGER, &linger, sizeof(linger));
    zmq_setsockopt(rep, ZMQ_RCVTIMEO, &recv_timeout_ms, sizeof(recv_timeout_ms));
    bound_ = zmq_bind(rep, address_.c_str()) == 0;
    if (!bound_) {
      std::cerr << "[control] bind " << address_ << " failed: " << zmq_strerror(zmq_errno()) << std::endl;
    }
  }

  /**
   * @brief Destructor - cleanup ZeroMQ resources
   */
  ~ControlRep() {
    zmq_close(rep);
    zmq_ctx_term(ctx);
  }

  ControlRep(const ControlRep&) = delete;
  ControlRep& operator=(const ControlRep&) = delete;

  bool is_connected() const { return bound_; }

  const std::string& get_bind_address() const { return address_; }

  /**
   * @brief Receive one command
   * @return The command, or nullopt on timeout. Caller must reply to a command.
   */
  std::optional<std::string> recv() {
    zmq_msg_t msg;
    zmq_msg_init(&msg);
    int n = zmq_msg_recv(&msg, rep, 0);
    if (n < 0) {
      zmq_msg_close(&msg);
      return std::nullopt;
    }
    std::string s(static_cast<const char*>(zmq_msg_data(&msg)), zmq_msg_size(&msg));
    zmq_msg_close(&msg);
    return s;
  }

  /**
   * @brief Send reply to received command
   * @param s Response string (JSON)
   */
  bool reply(const std::string& s) {
    return zmq_send(rep, s.data(), s.size(), 0) >= 0;
  }

private:
  std::string address_;
  bool bound_{false};
};
