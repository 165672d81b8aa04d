#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include <cstddef>

/**
 * @brief Error taxonomy for the blend line controller
 *
 * - CodecError: malformed word count or out-of-range value (config/programming error)
 * - ConnectionError / IoError: transient device communication failures
 * - ActuationError: a flow controller command failed
 * - ValidationError: a blend request was rejected before any physical action
 * - ConfigError: the static site configuration is malformed
 */

struct CodecError : std::runtime_error {
  explicit CodecError(const std::string& what) : std::runtime_error("codec: " + what) {}
};

struct ConfigError : std::runtime_error {
  explicit ConfigError(const std::string& what) : std::runtime_error("config: " + what) {}
};

class ConnectionError : public std::runtime_error {
public:
  enum class Kind {
    TIMEOUT,
    REFUSED,
    PROTOCOL_MISMATCH
  };

  ConnectionError(Kind kind, const std::string& what)
      : std::runtime_error("connect " + std::string(kind_name(kind)) + ": " + what)
      , kind_(kind) {}

  Kind kind() const { return kind_; }

  static const char* kind_name(Kind k) {
    switch (k) {
      case Kind::TIMEOUT: return "timeout";
      case Kind::REFUSED: return "refused";
      case Kind::PROTOCOL_MISMATCH: return "protocol-mismatch";
    }
    return "unknown";
  }

private:
  Kind kind_;
};

class IoError : public std::runtime_error {
public:
  enum class Kind {
    TIMEOUT,
    DEVICE_NAK,
    DISCONNECTED,
    PROTOCOL_ERROR
  };

  IoError(Kind kind, const std::string& what)
      : std::runtime_error("io " + std::string(kind_name(kind)) + ": " + what)
      , kind_(kind) {}

  Kind kind() const { return kind_; }

  static const char* kind_name(Kind k) {
    switch (k) {
      case Kind::TIMEOUT: return "timeout";
      case Kind::DEVICE_NAK: return "nak";
      case Kind::DISCONNECTED: return "disconnected";
      case Kind::PROTOCOL_ERROR: return "protocol-error";
    }
    return "unknown";
  }

private:
  Kind kind_;
};

class ActuationError : public std::runtime_error {
public:
  ActuationError(const std::string& tank_id, const std::string& what)
      : std::runtime_error("actuation " + tank_id + ": " + what)
      , tank_id_(tank_id) {}

  const std::string& tank_id() const { return tank_id_; }

private:
  std::string tank_id_;
};

class ValidationError : public std::runtime_error {
public:
  /// One offending blend component (index into the request) and why
  struct Issue {
    std::size_t component;
    std::string reason;
  };

  /// Request-level problem that is not tied to a single component
  explicit ValidationError(const std::string& what)
      : std::runtime_error("validation: " + what) {}

  explicit ValidationError(std::vector<Issue> issues)
      : std::runtime_error("validation: " + describe(issues))
      , issues_(std::move(issues)) {}

  const std::vector<Issue>& issues() const { return issues_; }

private:
  static std::string describe(const std::vector<Issue>& issues) {
    std::string s;
    for (const auto& i : issues) {
      if (!s.empty()) s += "; ";
      s += "component " + std::to_string(i.component) + ": " + i.reason;
    }
    return s;
  }

  std::vector<Issue> issues_;
};
