#pragma once
#include "../core/errors.hpp"
#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Modbus application protocol framing (MBAP header + PDU)
 *
 * The same frame layout is used over stream (Modbus/TCP) and packet
 * (Modbus/UDP) transports:
 *
 *   [txn hi][txn lo][proto 0][proto 0][len hi][len lo][unit][fc][data...]
 *
 * where len counts the unit id plus the PDU.
 */
namespace modbus {

enum class FunctionCode : std::uint8_t {
  READ_COILS = 0x01,
  READ_DISCRETE_INPUTS = 0x02,
  READ_HOLDING_REGISTERS = 0x03,
  READ_INPUT_REGISTERS = 0x04,
  WRITE_SINGLE_COIL = 0x05,
  WRITE_SINGLE_REGISTER = 0x06,
  WRITE_MULTIPLE_REGISTERS = 0x10
};

constexpr std::size_t MBAP_SIZE = 7;           ///< header including unit id
constexpr std::uint16_t MAX_READ_REGISTERS = 125;
constexpr std::uint16_t MAX_WRITE_REGISTERS = 123;
constexpr std::uint16_t MAX_READ_BITS = 2000;

struct Request {
  std::uint16_t transaction{0};
  std::uint8_t unit{1};
  FunctionCode function{FunctionCode::READ_HOLDING_REGISTERS};
  std::uint16_t address{0};
  std::uint16_t count{1};                ///< registers or bits to read
  std::vector<std::uint16_t> values;     ///< payload for writes
};

struct Response {
  std::uint16_t transaction{0};
  std::uint8_t unit{0};
  std::uint8_t function{0};
  bool exception{false};
  std::uint8_t exception_code{0};
  std::vector<std::uint8_t> data;        ///< PDU data after the function code
};

inline void put16(std::vector<std::uint8_t>& out, std::uint16_t v) {
  out.push_back(static_cast<std::uint8_t>(v >> 8));
  out.push_back(static_cast<std::uint8_t>(v & 0xFF));
}

inline std::uint16_t get16(const std::uint8_t* p) {
  return static_cast<std::uint16_t>((p[0] << 8) | p[1]);
}

/**
 * @brief Build a complete request frame
 */
inline std::vector<std::uint8_t> encode_request(const Request& r) {
  std::vector<std::uint8_t> pdu;
  pdu.push_back(static_cast<std::uint8_t>(r.function));
  put16(pdu, r.address);

  switch (r.function) {
    case FunctionCode::READ_COILS:
    case FunctionCode::READ_DISCRETE_INPUTS:
    case FunctionCode::READ_HOLDING_REGISTERS:
    case FunctionCode::READ_INPUT_REGISTERS:
      put16(pdu, r.count);
      break;
    case FunctionCode::WRITE_SINGLE_COIL:
      put16(pdu, (!r.values.empty() && r.values[0]) ? 0xFF00 : 0x0000);
      break;
    case FunctionCode::WRITE_SINGLE_REGISTER:
      put16(pdu, r.values.empty() ? 0 : r.values[0]);
      break;
    case FunctionCode::WRITE_MULTIPLE_REGISTERS:
      put16(pdu, static_cast<std::uint16_t>(r.values.size()));
      pdu.push_back(static_cast<std::uint8_t>(r.values.size() * 2));
      for (auto v : r.values) put16(pdu, v);
      break;
  }

  std::vector<std::uint8_t> frame;
  frame.reserve(MBAP_SIZE + pdu.size());
  put16(frame, r.transaction);
  put16(frame, 0);  // protocol id
  put16(frame, static_cast<std::uint16_t>(pdu.size() + 1));
  frame.push_back(r.unit);
  frame.insert(frame.end(), pdu.begin(), pdu.end());
  return frame;
}

/**
 * @brief Length of the frame body still to be read after the 6-byte prefix
 * @throws IoError if the header is not a Modbus header
 */
inline std::size_t body_length(const std::uint8_t* header6) {
  if (get16(header6 + 2) != 0) {
    throw IoError(IoError::Kind::PROTOCOL_ERROR, "non-zero protocol id");
  }
  std::size_t len = get16(header6 + 4);
  if (len < 2 || len > 254) {
    throw IoError(IoError::Kind::PROTOCOL_ERROR, "bad MBAP length " + std::to_string(len));
  }
  return len;
}

/**
 * @brief Parse a complete response frame
 * @throws IoError on malformed frames
 */
inline Response decode_response(const std::vector<std::uint8_t>& frame) {
  if (frame.size() < MBAP_SIZE + 1) {
    throw IoError(IoError::Kind::PROTOCOL_ERROR, "short frame");
  }
  std::size_t len = body_length(frame.data());
  if (frame.size() != 6 + len) {
    throw IoError(IoError::Kind::PROTOCOL_ERROR, "frame length mismatch");
  }

  Response r;
  r.transaction = get16(frame.data());
  r.unit = frame[6];
  r.function = frame[7];
  if (r.function & 0x80) {
    r.exception = true;
    r.function &= 0x7F;
    r.exception_code = frame.size() > 8 ? frame[8] : 0;
    return r;
  }
  r.data.assign(frame.begin() + 8, frame.end());
  return r;
}

/**
 * @brief Extract register words from a read-registers response
 */
inline std::vector<std::uint16_t> response_words(const Response& r, std::uint16_t count) {
  if (r.data.empty() || r.data[0] != count * 2 || r.data.size() != 1u + count * 2u) {
    throw IoError(IoError::Kind::PROTOCOL_ERROR, "register byte count mismatch");
  }
  std::vector<std::uint16_t> words;
  words.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    words.push_back(get16(&r.data[1 + i * 2]));
  }
  return words;
}

/**
 * @brief Extract bits from a read-coils/discrete-inputs response
 */
inline std::vector<bool> response_bits(const Response& r, std::uint16_t count) {
  std::size_t bytes = (count + 7) / 8;
  if (r.data.empty() || r.data[0] != bytes || r.data.size() != 1 + bytes) {
    throw IoError(IoError::Kind::PROTOCOL_ERROR, "bit byte count mismatch");
  }
  std::vector<bool> bits(count);
  for (std::size_t i = 0; i < count; ++i) {
    bits[i] = (r.data[1 + i / 8] >> (i % 8)) & 0x01;
  }
  return bits;
}

inline std::string exception_text(std::uint8_t code) {
  switch (code) {
    case 0x01: return "illegal function";
    case 0x02: return "illegal data address";
    case 0x03: return "illegal data value";
    case 0x04: return "server device failure";
    case 0x06: return "server device busy";
    default: return "exception " + std::to_string(code);
  }
}

}  // namespace modbus
