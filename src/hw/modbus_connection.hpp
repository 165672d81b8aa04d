#pragma once
#include "idevice_connection.hpp"
#include "../protocol/modbus_frame.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Modbus client connection over a stream (TCP) or packet (UDP) socket
 *
 * Both transports carry the same MBAP frames. Every socket operation is an
 * asio async operation run on the connection's own io_context until the
 * exchange deadline; on expiry the operation is cancelled.
 *
 * A timed-out or aborted exchange on a stream socket leaves the byte stream
 * in an unknown position, so the socket is closed and the next call reports
 * DISCONNECTED until connect() is called again.
 */
class ModbusConnection : public IDeviceConnection {
public:
  enum class Transport {
    STREAM,
    PACKET
  };

  ModbusConnection(std::string host, std::uint16_t port, std::uint8_t unit,
                   std::chrono::milliseconds timeout, Transport transport = Transport::STREAM)
      : host_(std::move(host))
      , port_(port)
      , unit_(unit)
      , timeout_(timeout)
      , transport_(transport)
      , stream_(io_)
      , packet_(io_) {}

  ~ModbusConnection() override { close(); }

  ModbusConnection(const ModbusConnection&) = delete;
  ModbusConnection& operator=(const ModbusConnection&) = delete;

  void connect() override {
    std::lock_guard<std::mutex> lock(io_mutex_);
    close_locked();

    boost::system::error_code ec;
    if (transport_ == Transport::STREAM) {
      tcp::resolver resolver(io_);
      auto endpoints = resolver.resolve(host_, std::to_string(port_), ec);
      if (ec) {
        throw ConnectionError(ConnectionError::Kind::REFUSED, describe() + ": " + ec.message());
      }
      ec = boost::asio::error::would_block;
      boost::asio::async_connect(stream_, endpoints,
                                 [&](const boost::system::error_code& result, const tcp::endpoint&) { ec = result; });
      if (!run_until(clock::now() + timeout_)) {
        close_locked();
        throw ConnectionError(ConnectionError::Kind::TIMEOUT, describe() + ": connect timed out");
      }
      if (ec) {
        close_locked();
        throw ConnectionError(ConnectionError::Kind::REFUSED, describe() + ": " + ec.message());
      }
      stream_.set_option(tcp::no_delay(true), ec);
    } else {
      udp::resolver resolver(io_);
      auto endpoints = resolver.resolve(host_, std::to_string(port_), ec);
      if (!ec) packet_.connect(*endpoints.begin(), ec);
      if (ec) {
        close_locked();
        throw ConnectionError(ConnectionError::Kind::REFUSED, describe() + ": " + ec.message());
      }
    }
    open_.store(true);
    record_connect();
  }

  void close() override {
    std::lock_guard<std::mutex> lock(io_mutex_);
    close_locked();
  }

  bool is_connected() const override { return open_.load(); }

  /**
   * @brief Cancel the exchange in progress from another thread
   *
   * The cancellation is posted to the io_context the exchange is running
   * on; the exchange fails with IoError DISCONNECTED. No effect when idle.
   */
  void abort() override {
    if (!busy_.load()) return;
    std::uint64_t exchange = exchange_id_.load();
    boost::asio::post(io_, [this, exchange] {
      // runs on the thread inside transact()
      if (!busy_.load() || exchange != exchange_id_.load()) return;
      aborted_ = true;
      boost::system::error_code ignored;
      stream_.cancel(ignored);
      packet_.cancel(ignored);
    });
  }

  std::vector<std::uint16_t> read_block(std::uint16_t address, std::uint16_t count,
                                        RegisterClass cls = RegisterClass::HOLDING) override {
    if (count == 0 || count > modbus::MAX_READ_REGISTERS) {
      throw IoError(IoError::Kind::PROTOCOL_ERROR, "read count " + std::to_string(count) + " out of range");
    }
    modbus::Request req;
    req.function = cls == RegisterClass::INPUT ? modbus::FunctionCode::READ_INPUT_REGISTERS
                                               : modbus::FunctionCode::READ_HOLDING_REGISTERS;
    req.address = address;
    req.count = count;
    return modbus::response_words(transact(req), count);
  }

  void write_block(std::uint16_t address, const std::vector<std::uint16_t>& values) override {
    if (values.empty() || values.size() > modbus::MAX_WRITE_REGISTERS) {
      throw IoError(IoError::Kind::PROTOCOL_ERROR, "write count out of range");
    }
    modbus::Request req;
    req.function = values.size() == 1 ? modbus::FunctionCode::WRITE_SINGLE_REGISTER
                                      : modbus::FunctionCode::WRITE_MULTIPLE_REGISTERS;
    req.address = address;
    req.values = values;
    transact(req);
  }

  bool read_bit(std::uint16_t address, RegisterClass cls = RegisterClass::COIL) override {
    modbus::Request req;
    req.function = cls == RegisterClass::DISCRETE ? modbus::FunctionCode::READ_DISCRETE_INPUTS
                                                  : modbus::FunctionCode::READ_COILS;
    req.address = address;
    req.count = 1;
    return modbus::response_bits(transact(req), 1)[0];
  }

  void write_bit(std::uint16_t address, bool value) override {
    modbus::Request req;
    req.function = modbus::FunctionCode::WRITE_SINGLE_COIL;
    req.address = address;
    req.values = {static_cast<std::uint16_t>(value ? 1 : 0)};
    transact(req);
  }

  std::string describe() const override {
    return std::string(transport_ == Transport::STREAM ? "modbus-tcp://" : "modbus-udp://") +
           host_ + ":" + std::to_string(port_) + "/" + std::to_string(unit_);
  }

private:
  using clock = std::chrono::steady_clock;
  using tcp = boost::asio::ip::tcp;
  using udp = boost::asio::ip::udp;

  void close_locked() {
    boost::system::error_code ignored;
    if (stream_.is_open()) {
      stream_.shutdown(tcp::socket::shutdown_both, ignored);
      stream_.close(ignored);
    }
    if (packet_.is_open()) packet_.close(ignored);
    open_.store(false);
  }

  /**
   * @brief Run the pending async operation until it completes or @p deadline passes
   * @return false if the deadline passed; the operation has then been cancelled
   */
  bool run_until(clock::time_point deadline) {
    io_.restart();
    io_.run_until(deadline);
    if (io_.stopped()) return true;

    boost::system::error_code ignored;
    stream_.cancel(ignored);
    packet_.cancel(ignored);
    // let the cancelled handlers complete
    io_.restart();
    io_.run();
    return false;
  }

  [[noreturn]] void fail(IoError::Kind kind, const std::string& what) {
    record_error(kind == IoError::Kind::TIMEOUT);
    if (transport_ == Transport::STREAM &&
        (kind == IoError::Kind::TIMEOUT || kind == IoError::Kind::DISCONNECTED ||
         kind == IoError::Kind::PROTOCOL_ERROR)) {
      close_locked();
    }
    throw IoError(kind, describe() + ": " + what);
  }

  void complete(const boost::system::error_code& ec, clock::time_point deadline) {
    bool done = run_until(deadline);
    if (aborted_) fail(IoError::Kind::DISCONNECTED, "exchange aborted");
    if (!done) fail(IoError::Kind::TIMEOUT, "no response within timeout");
    if (ec == boost::asio::error::eof) fail(IoError::Kind::DISCONNECTED, "peer closed connection");
    if (ec) fail(IoError::Kind::DISCONNECTED, ec.message());
  }

  void send_frame(const std::vector<std::uint8_t>& frame, clock::time_point deadline) {
    boost::system::error_code ec = boost::asio::error::would_block;
    auto handler = [&](const boost::system::error_code& result, std::size_t) { ec = result; };
    if (transport_ == Transport::STREAM) {
      boost::asio::async_write(stream_, boost::asio::buffer(frame), handler);
    } else {
      packet_.async_send(boost::asio::buffer(frame), handler);
    }
    complete(ec, deadline);
  }

  void recv_exact(std::uint8_t* out, std::size_t len, clock::time_point deadline) {
    boost::system::error_code ec = boost::asio::error::would_block;
    boost::asio::async_read(stream_, boost::asio::buffer(out, len),
                            [&](const boost::system::error_code& result, std::size_t) { ec = result; });
    complete(ec, deadline);
  }

  std::vector<std::uint8_t> recv_frame(clock::time_point deadline) {
    if (transport_ == Transport::PACKET) {
      std::vector<std::uint8_t> datagram(260);
      boost::system::error_code ec = boost::asio::error::would_block;
      std::size_t received = 0;
      packet_.async_receive(boost::asio::buffer(datagram),
                            [&](const boost::system::error_code& result, std::size_t n) {
                              ec = result;
                              received = n;
                            });
      complete(ec, deadline);
      datagram.resize(received);
      return datagram;
    }

    std::vector<std::uint8_t> frame(6);
    recv_exact(frame.data(), 6, deadline);
    std::size_t body = modbus::body_length(frame.data());
    frame.resize(6 + body);
    recv_exact(frame.data() + 6, body, deadline);
    return frame;
  }

  modbus::Response transact(modbus::Request& req) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (!open_.load()) {
      throw IoError(IoError::Kind::DISCONNECTED, describe() + ": not connected");
    }

    auto start = clock::now();
    auto deadline = start + timeout_;
    req.unit = unit_;
    req.transaction = next_transaction_++;

    exchange_id_.fetch_add(1);
    aborted_ = false;
    busy_.store(true);
    struct Idle {
      std::atomic<bool>& busy;
      ~Idle() { busy.store(false); }
    } idle{busy_};

    send_frame(modbus::encode_request(req), deadline);

    for (;;) {
      modbus::Response rsp;
      try {
        rsp = modbus::decode_response(recv_frame(deadline));
      } catch (const IoError& e) {
        // malformed header: the stream position is lost
        if (e.kind() == IoError::Kind::PROTOCOL_ERROR) {
          record_error(false);
          if (transport_ == Transport::STREAM) close_locked();
        }
        throw;
      }
      // late answer to an earlier timed-out request
      if (rsp.transaction != req.transaction) continue;

      if (rsp.exception) {
        record_error(false);
        throw IoError(IoError::Kind::DEVICE_NAK, describe() + ": " + modbus::exception_text(rsp.exception_code));
      }
      if (rsp.function != static_cast<std::uint8_t>(req.function)) {
        fail(IoError::Kind::PROTOCOL_ERROR, "function code mismatch");
      }
      record_success(std::chrono::duration<double, std::milli>(clock::now() - start).count());
      return rsp;
    }
  }

  std::string host_;
  std::uint16_t port_;
  std::uint8_t unit_;
  std::chrono::milliseconds timeout_;
  Transport transport_;

  boost::asio::io_context io_;
  tcp::socket stream_;
  udp::socket packet_;

  std::mutex io_mutex_;
  std::atomic<bool> open_{false};
  std::atomic<bool> busy_{false};
  std::atomic<std::uint64_t> exchange_id_{0};
  bool aborted_{false};   ///< set by the posted abort handler, read on the same thread
  std::uint16_t next_transaction_{1};
};
