#pragma once
#include "../core/errors.hpp"
#include <cstdint>
#include <cstring>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

/**
 * @brief Value encodings for register groups
 *
 * 32-bit encodings span two consecutive 16-bit words, high word first.
 */
enum class Encoding {
  INT16,
  UINT16,
  INT32,
  FLOAT32,
  BOOL
};

/**
 * @brief Register classes as exposed by the field device
 */
enum class RegisterClass {
  INPUT,     ///< read-only 16-bit input register
  HOLDING,   ///< read/write 16-bit holding register
  COIL,      ///< read/write bit
  DISCRETE   ///< read-only bit
};

inline bool is_bit_class(RegisterClass c) {
  return c == RegisterClass::COIL || c == RegisterClass::DISCRETE;
}

inline const char* encoding_name(Encoding e) {
  switch (e) {
    case Encoding::INT16: return "int16";
    case Encoding::UINT16: return "uint16";
    case Encoding::INT32: return "int32";
    case Encoding::FLOAT32: return "float32";
    case Encoding::BOOL: return "bool";
  }
  return "unknown";
}

inline const char* register_class_name(RegisterClass c) {
  switch (c) {
    case RegisterClass::INPUT: return "input";
    case RegisterClass::HOLDING: return "holding";
    case RegisterClass::COIL: return "coil";
    case RegisterClass::DISCRETE: return "discrete";
  }
  return "unknown";
}

/**
 * @brief Stateless conversions between 16-bit word groups and numbers
 *
 * Scale factors are applied by the caller, never here. Integer paths
 * round-trip exactly; FLOAT32 round-trips at single precision.
 */
struct RegisterCodec {
  /**
   * @brief Number of 16-bit words an encoding occupies
   */
  static std::size_t word_width(Encoding e) {
    return (e == Encoding::INT32 || e == Encoding::FLOAT32) ? 2 : 1;
  }

  /**
   * @brief Decode a word group into a numeric value
   * @throws CodecError if the word count does not match the encoding
   */
  static double decode(const std::vector<std::uint16_t>& words, Encoding e) {
    if (words.size() != word_width(e)) {
      throw CodecError(std::string(encoding_name(e)) + " needs " +
                       std::to_string(word_width(e)) + " word(s), got " +
                       std::to_string(words.size()));
    }

    switch (e) {
      case Encoding::INT16:
        return static_cast<double>(static_cast<std::int16_t>(words[0]));
      case Encoding::UINT16:
        return static_cast<double>(words[0]);
      case Encoding::BOOL:
        return words[0] != 0 ? 1.0 : 0.0;
      case Encoding::INT32:
        return static_cast<double>(static_cast<std::int32_t>(join(words[0], words[1])));
      case Encoding::FLOAT32: {
        std::uint32_t bits = join(words[0], words[1]);
        float f;
        std::memcpy(&f, &bits, sizeof(f));
        return static_cast<double>(f);
      }
    }
    throw CodecError("unsupported encoding");
  }

  /**
   * @brief Encode a numeric value into its word group
   * @throws CodecError if an integer value is not representable
   */
  static std::vector<std::uint16_t> encode(double value, Encoding e) {
    switch (e) {
      case Encoding::INT16: {
        auto v = checked_integer<std::int16_t>(value, e);
        return {static_cast<std::uint16_t>(v)};
      }
      case Encoding::UINT16: {
        auto v = checked_integer<std::uint16_t>(value, e);
        return {v};
      }
      case Encoding::BOOL:
        if (value != 0.0 && value != 1.0) {
          throw CodecError("bool accepts 0 or 1, got " + std::to_string(value));
        }
        return {static_cast<std::uint16_t>(value != 0.0 ? 1 : 0)};
      case Encoding::INT32: {
        auto v = checked_integer<std::int32_t>(value, e);
        return split(static_cast<std::uint32_t>(v));
      }
      case Encoding::FLOAT32: {
        if (std::isfinite(value) &&
            std::abs(value) > static_cast<double>(std::numeric_limits<float>::max())) {
          throw CodecError("float32 out of range: " + std::to_string(value));
        }
        float f = static_cast<float>(value);
        std::uint32_t bits;
        std::memcpy(&bits, &f, sizeof(bits));
        return split(bits);
      }
    }
    throw CodecError("unsupported encoding");
  }

private:
  static std::uint32_t join(std::uint16_t hi, std::uint16_t lo) {
    return (static_cast<std::uint32_t>(hi) << 16) | lo;
  }

  static std::vector<std::uint16_t> split(std::uint32_t v) {
    return {static_cast<std::uint16_t>(v >> 16), static_cast<std::uint16_t>(v & 0xFFFF)};
  }

  template<typename T>
  static T checked_integer(double value, Encoding e) {
    if (!std::isfinite(value) || value != std::trunc(value) ||
        value < static_cast<double>(std::numeric_limits<T>::min()) ||
        value > static_cast<double>(std::numeric_limits<T>::max())) {
      throw CodecError(std::string(encoding_name(e)) + " cannot represent " + std::to_string(value));
    }
    return static_cast<T>(value);
  }
};
